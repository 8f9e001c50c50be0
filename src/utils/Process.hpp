#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace folio::utils
{

struct CommandResult
{
    bool launched = false;
    int exit_code = -1;
    // Interleaved stdout and stderr of the child.
    std::string output;
    // The child's process group was stopped before it finished.
    bool timed_out = false;
    bool cancelled = false;
};

// Runs argv[0] (looked up on PATH) to completion and captures its output.
// A non-zero timeout, or a shutdown request, stops the child's whole process
// group (SIGTERM, then SIGKILL after a grace period).
CommandResult run_command(std::vector<std::string> const &argv,
                          std::filesystem::path const &working_dir = {},
                          std::chrono::milliseconds timeout =
                              std::chrono::milliseconds::zero());

std::optional<std::filesystem::path> find_executable(std::string const &name);
bool tool_available(std::string const &name);

// Binds an ephemeral loopback port, releases it and reports the number.
std::optional<std::uint16_t> reserve_loopback_port();

// Long-running helper process (chromedriver). The child runs in its own
// process group so the whole tree is signalled on terminate().
class ChildProcess
{
  public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(ChildProcess const &) = delete;
    ChildProcess &operator=(ChildProcess const &) = delete;
    ChildProcess(ChildProcess &&other) noexcept;
    ChildProcess &operator=(ChildProcess &&other) noexcept;

    bool spawn(std::vector<std::string> const &argv,
               std::filesystem::path const &output_log = {});
    bool running();
    // SIGTERM, then SIGKILL once the grace period runs out. Safe to call on
    // an already reaped or never started process.
    void terminate(std::chrono::milliseconds grace =
                       std::chrono::milliseconds(2000));
    pid_t pid() const noexcept
    {
        return pid_;
    }

  private:
    pid_t pid_ = -1;
};

} // namespace folio::utils
