#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace folio::log
{

namespace
{

std::mutex s_mutex;
std::ofstream s_ofs;
std::optional<std::filesystem::path> s_path;
std::atomic<int> s_threshold{static_cast<int>(Level::Info)};

} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_path = std::move(path);
}

void set_threshold(Level level) noexcept
{
    s_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level threshold() noexcept
{
    return static_cast<Level>(s_threshold.load(std::memory_order_relaxed));
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = folio::utils::data_root() / "folio.log";
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace folio::log
