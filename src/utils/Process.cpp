#include "utils/Process.hpp"

#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <string_view>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace folio::utils
{

namespace
{

std::vector<char *> make_exec_argv(std::vector<std::string> const &argv)
{
    std::vector<char *> out;
    out.reserve(argv.size() + 1);
    for (auto const &arg : argv)
    {
        out.push_back(const_cast<char *>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int wait_for_child(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    return decode_wait_status(status);
}

constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kStopGrace{2000};

// SIGTERM to the group, SIGKILL once the grace period runs out; reaps `pid`.
void stop_group(pid_t pid, std::chrono::milliseconds grace)
{
    kill(-pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline)
    {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid || (rc < 0 && errno == ECHILD))
        {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    FOLIO_LOG_WARN("pid {} ignored SIGTERM; killing", pid);
    kill(-pid, SIGKILL);
    wait_for_child(pid);
}

} // namespace

CommandResult run_command(std::vector<std::string> const &argv,
                          std::filesystem::path const &working_dir,
                          std::chrono::milliseconds timeout)
{
    CommandResult result;
    if (argv.empty())
    {
        result.output = "empty command line";
        return result;
    }
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0)
    {
        result.output = std::format("pipe failed: {}", std::strerror(errno));
        return result;
    }
    // Everything the child touches is prepared before fork.
    auto exec_argv = make_exec_argv(argv);
    std::string const cwd = working_dir.string();

    pid_t pid = fork();
    if (pid < 0)
    {
        result.output = std::format("fork failed: {}", std::strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return result;
    }
    if (pid == 0)
    {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0)
        {
            _exit(126);
        }
        execvp(exec_argv[0], exec_argv.data());
        _exit(127);
    }

    setpgid(pid, pid);
    close(fds[1]);
    auto const started = std::chrono::steady_clock::now();
    std::array<char, 4096> chunk{};
    while (true)
    {
        pollfd watch{fds[0], POLLIN, 0};
        int ready = poll(&watch, 1, static_cast<int>(kPollSlice.count()));
        if (ready < 0 && errno != EINTR)
        {
            break;
        }
        if (ready > 0)
        {
            ssize_t got = read(fds[0], chunk.data(), chunk.size());
            if (got > 0)
            {
                result.output.append(chunk.data(),
                                     static_cast<std::size_t>(got));
            }
            else if (got == 0 || errno != EINTR)
            {
                break;
            }
        }
        if (timeout > std::chrono::milliseconds::zero() &&
            std::chrono::steady_clock::now() - started >= timeout)
        {
            result.timed_out = true;
            break;
        }
        if (folio::runtime::should_shutdown())
        {
            result.cancelled = true;
            break;
        }
    }
    close(fds[0]);
    // The pipe can close while the child keeps running.
    std::optional<int> exit_code;
    while (!result.timed_out && !result.cancelled)
    {
        int status = 0;
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid)
        {
            exit_code = decode_wait_status(status);
            break;
        }
        if (rc < 0 && errno != EINTR)
        {
            exit_code = -1;
            break;
        }
        if (timeout > std::chrono::milliseconds::zero() &&
            std::chrono::steady_clock::now() - started >= timeout)
        {
            result.timed_out = true;
        }
        else if (folio::runtime::should_shutdown())
        {
            result.cancelled = true;
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    if (result.timed_out || result.cancelled)
    {
        FOLIO_LOG_WARN("stopping {} (pid {}): {}", argv.front(), pid,
                       result.timed_out ? "deadline passed" : "shutdown");
        stop_group(pid, kStopGrace);
        result.launched = true;
        return result;
    }
    result.exit_code = *exit_code;
    result.launched = result.exit_code != 127;
    if (!result.launched && result.output.empty())
    {
        result.output = std::format("{}: command not found", argv.front());
    }
    FOLIO_LOG_DEBUG("{} exited with {}", argv.front(), result.exit_code);
    return result;
}

std::optional<std::filesystem::path> find_executable(std::string const &name)
{
    if (name.empty())
    {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos)
    {
        if (access(name.c_str(), X_OK) == 0)
        {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    auto const *path_env = std::getenv("PATH");
    if (path_env == nullptr)
    {
        return std::nullopt;
    }
    std::string_view remaining(path_env);
    while (true)
    {
        auto sep = remaining.find(':');
        auto dir = remaining.substr(0, sep);
        if (!dir.empty())
        {
            auto candidate = std::filesystem::path(dir) / name;
            if (access(candidate.c_str(), X_OK) == 0)
            {
                return candidate;
            }
        }
        if (sep == std::string_view::npos)
        {
            break;
        }
        remaining.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

bool tool_available(std::string const &name)
{
    return find_executable(name).has_value();
}

std::optional<std::uint16_t> reserve_loopback_port()
{
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return std::nullopt;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    std::optional<std::uint16_t> port;
    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0)
    {
        socklen_t len = sizeof(addr);
        if (getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
        {
            port = ntohs(addr.sin_port);
        }
    }
    close(fd);
    return port;
}

ChildProcess::~ChildProcess()
{
    terminate();
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept : pid_(other.pid_)
{
    other.pid_ = -1;
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept
{
    if (this != &other)
    {
        terminate();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ChildProcess::spawn(std::vector<std::string> const &argv,
                         std::filesystem::path const &output_log)
{
    if (argv.empty() || pid_ > 0)
    {
        return false;
    }
    auto exec_argv = make_exec_argv(argv);
    std::string const log_path =
        output_log.empty() ? std::string("/dev/null") : output_log.string();

    pid_t pid = fork();
    if (pid < 0)
    {
        FOLIO_LOG_ERROR("fork for {} failed: {}", argv.front(),
                        std::strerror(errno));
        return false;
    }
    if (pid == 0)
    {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
        }
        int out = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out >= 0)
        {
            dup2(out, STDOUT_FILENO);
            dup2(out, STDERR_FILENO);
        }
        execvp(exec_argv[0], exec_argv.data());
        _exit(127);
    }
    // Mirror the child's setpgid to close the race with an early terminate.
    setpgid(pid, pid);
    pid_ = pid;
    FOLIO_LOG_DEBUG("spawned {} (pid {})", argv.front(), pid_);
    return true;
}

bool ChildProcess::running()
{
    if (pid_ <= 0)
    {
        return false;
    }
    int status = 0;
    pid_t rc = waitpid(pid_, &status, WNOHANG);
    if (rc == 0)
    {
        return true;
    }
    pid_ = -1;
    return false;
}

void ChildProcess::terminate(std::chrono::milliseconds grace)
{
    if (pid_ <= 0)
    {
        return;
    }
    auto const pid = pid_;
    pid_ = -1;
    stop_group(pid, grace);
}

} // namespace folio::utils
