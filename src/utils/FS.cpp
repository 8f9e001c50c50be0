#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace folio::utils
{

namespace
{
std::optional<std::filesystem::path>
ensure_root(std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}

bool write_bytes_atomic(std::filesystem::path const &path, char const *data,
                        std::size_t size)
{
    auto parent = path.parent_path();
    if (!parent.empty() && !ensure_directory(parent))
    {
        return false;
    }
    auto tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream output(tmp_path, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            return false;
        }
        output.write(data, static_cast<std::streamsize>(size));
        output.flush();
        if (!output)
        {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec)
    {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
}

std::optional<std::filesystem::path> folio_appdata_root()
{
    if (auto const *xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    {
        if (auto ensured = ensure_root(std::filesystem::path(xdg) / "folio"))
        {
            return ensured;
        }
    }
    if (auto const *home = std::getenv("HOME"); home && *home)
    {
        auto path =
            std::filesystem::path(home) / ".local" / "share" / "folio";
        if (auto ensured = ensure_root(path))
        {
            return ensured;
        }
    }
    return std::nullopt;
}

std::filesystem::path data_root()
{
    if (auto appdata = folio_appdata_root())
    {
        return *appdata;
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_root(fallback))
    {
        return *ensured;
    }
    return fallback;
}

std::optional<std::string> read_text_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::string contents((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
    if (input.bad())
    {
        return std::nullopt;
    }
    return contents;
}

std::optional<std::vector<std::uint8_t>>
read_binary_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> buffer((std::istreambuf_iterator<char>(input)),
                                     std::istreambuf_iterator<char>());
    if (input.bad())
    {
        return std::nullopt;
    }
    return buffer;
}

bool write_file_atomic(std::filesystem::path const &path,
                       std::string_view contents)
{
    return write_bytes_atomic(path, contents.data(), contents.size());
}

bool write_file_atomic(std::filesystem::path const &path,
                       std::vector<std::uint8_t> const &contents)
{
    return write_bytes_atomic(
        path, reinterpret_cast<char const *>(contents.data()),
        contents.size());
}

bool ensure_directory(std::filesystem::path const &path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec || std::filesystem::is_directory(path);
}

bool is_nonempty_file(std::filesystem::path const &path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        return false;
    }
    auto size = std::filesystem::file_size(path, ec);
    return !ec && size > 0;
}

} // namespace folio::utils
