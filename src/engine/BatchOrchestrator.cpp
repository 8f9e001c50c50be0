#include "engine/BatchOrchestrator.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <deque>
#include <format>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace folio::engine
{

namespace
{

constexpr int kPollTimeoutMs = 250;
constexpr std::string_view kCancelledMessage = "cancelled";

// Builds the worker's context, then converts every index `next` hands out.
// A context that cannot be built fails each document it takes instead.
template <typename Next, typename Report>
void serve_documents(ConversionSettings const &settings,
                     WorkerServices const &services,
                     std::vector<std::filesystem::path> const &documents,
                     Next &&next, Report &&report)
{
    std::unique_ptr<WorkerContext> context;
    std::string setup_error;
    try
    {
        context = std::make_unique<WorkerContext>(settings, services);
    }
    catch (std::exception const &ex)
    {
        setup_error = ex.what();
        FOLIO_LOG_ERROR("worker setup failed: {}", setup_error);
    }
    std::optional<ConversionPipeline> pipeline;
    if (context)
    {
        pipeline.emplace(*context);
    }
    while (auto index = next())
    {
        auto const &document = documents[*index];
        if (!pipeline)
        {
            report(*index, DocumentOutcome::failed(
                               document.filename().string(), Stage::Loaded,
                               "worker setup failed: " + setup_error));
            continue;
        }
        report(*index, pipeline->convert(document));
    }
}

bool write_all(int fd, std::string_view data)
{
    while (!data.empty())
    {
        auto written = ::write(fd, data.data(), data.size());
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return true;
}

void close_fd(int &fd) noexcept
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

std::string describe_exit(int status)
{
    if (WIFSIGNALED(status))
    {
        return std::format("killed by signal {}", WTERMSIG(status));
    }
    if (WIFEXITED(status))
    {
        return std::format("exited with status {}", WEXITSTATUS(status));
    }
    return "ended unexpectedly";
}

// Writes to a pipe whose reader died must fail with EPIPE, not kill us.
class SigpipeGuard
{
  public:
    SigpipeGuard() : previous_(std::signal(SIGPIPE, SIG_IGN)) {}
    ~SigpipeGuard()
    {
        std::signal(SIGPIPE, previous_);
    }
    SigpipeGuard(SigpipeGuard const &) = delete;
    SigpipeGuard &operator=(SigpipeGuard const &) = delete;

  private:
    void (*previous_)(int);
};

struct ProcessWorker
{
    pid_t pid = -1;
    int task_fd = -1;
    int result_fd = -1;
    std::string buffer;
    std::optional<std::size_t> in_flight;

    bool alive() const noexcept
    {
        return pid > 0;
    }
};

// Child side of a forked worker: reads document indices line by line and
// answers each with one encoded outcome.
[[noreturn]] void run_child(int task_fd, int result_fd,
                            ConversionSettings const &settings,
                            WorkerServices const &services,
                            std::vector<std::filesystem::path> const &documents)
{
    std::signal(SIGINT, SIG_IGN);
    std::signal(SIGTERM, SIG_DFL);
    int code = 0;
    try
    {
        std::string pending;
        auto next = [&]() -> std::optional<std::size_t>
        {
            while (true)
            {
                auto newline = pending.find('\n');
                if (newline != std::string::npos)
                {
                    std::size_t index = 0;
                    auto [ptr, ec] = std::from_chars(
                        pending.data(), pending.data() + newline, index);
                    pending.erase(0, newline + 1);
                    if (ec != std::errc{} || index >= documents.size())
                    {
                        continue;
                    }
                    return index;
                }
                char chunk[256];
                auto got = ::read(task_fd, chunk, sizeof(chunk));
                if (got < 0 && errno == EINTR)
                {
                    continue;
                }
                if (got <= 0)
                {
                    return std::nullopt;
                }
                pending.append(chunk, static_cast<std::size_t>(got));
            }
        };
        auto report = [&](std::size_t index, DocumentOutcome const &outcome)
        {
            if (!write_all(result_fd, encode_outcome(index, outcome) + "\n"))
            {
                FOLIO_LOG_ERROR("worker {} lost its result channel", ::getpid());
            }
        };
        serve_documents(settings, services, documents, next, report);
    }
    catch (std::exception const &ex)
    {
        FOLIO_LOG_ERROR("worker {} aborted: {}", ::getpid(), ex.what());
        code = 1;
    }
    ::close(task_fd);
    ::close(result_fd);
    std::fflush(stderr);
    ::_exit(code);
}

} // namespace

std::vector<std::filesystem::path>
discover_documents(std::filesystem::path const &source_dir)
{
    std::vector<std::filesystem::path> documents;
    std::error_code ec;
    std::filesystem::directory_iterator it(source_dir, ec);
    if (ec)
    {
        FOLIO_LOG_ERROR("cannot list {}: {}", source_dir.string(), ec.message());
        return documents;
    }
    for (auto const &entry : it)
    {
        if (!entry.is_regular_file(ec))
        {
            continue;
        }
        auto const &path = entry.path();
        if (path.extension() == ".md" && path.filename() != "README.md")
        {
            documents.push_back(path);
        }
    }
    std::sort(documents.begin(), documents.end());
    return documents;
}

std::string encode_outcome(std::size_t index, DocumentOutcome const &outcome)
{
    folio::json::MutableDocument doc;
    auto *root = doc.object_root();
    auto *native = doc.doc();
    auto const kind = to_string(outcome.kind);
    auto const stage = to_string(outcome.stage);
    yyjson_mut_obj_add_uint(native, root, "index", index);
    yyjson_mut_obj_add_strncpy(native, root, "key", outcome.key.data(),
                               outcome.key.size());
    yyjson_mut_obj_add_strncpy(native, root, "kind", kind.data(), kind.size());
    yyjson_mut_obj_add_strncpy(native, root, "stage", stage.data(),
                               stage.size());
    yyjson_mut_obj_add_strncpy(native, root, "message", outcome.message.data(),
                               outcome.message.size());
    return doc.write();
}

std::optional<std::pair<std::size_t, DocumentOutcome>>
decode_outcome(std::string_view line)
{
    auto doc = folio::json::Document::parse(line);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *root = doc.root();
    auto index = folio::json::int_member(root, "index");
    auto key = folio::json::string_member(root, "key");
    auto kind_text = folio::json::string_member(root, "kind");
    auto stage_text = folio::json::string_member(root, "stage");
    auto message = folio::json::string_member(root, "message");
    if (!index || *index < 0 || !key || !kind_text || !stage_text || !message)
    {
        return std::nullopt;
    }
    auto kind = parse_outcome_kind(*kind_text);
    auto stage = parse_stage(*stage_text);
    if (!kind || !stage)
    {
        return std::nullopt;
    }
    return std::make_pair(
        static_cast<std::size_t>(*index),
        DocumentOutcome{std::move(*key), *kind, std::move(*message), *stage});
}

BatchOrchestrator::BatchOrchestrator(ConversionSettings settings,
                                     WorkerServices services)
    : settings_(std::move(settings)), services_(std::move(services))
{
}

std::size_t BatchOrchestrator::worker_count(std::size_t documents) const noexcept
{
    if (!settings_.parallel || settings_.max_workers <= 1 || documents <= 1)
    {
        return 1;
    }
    return std::min(settings_.max_workers, documents);
}

BatchSummary BatchOrchestrator::run(
    std::vector<std::filesystem::path> const &documents)
{
    std::vector<std::optional<DocumentOutcome>> outcomes(documents.size());
    BatchSummary summary;
    summary.workers = worker_count(documents.size());
    if (summary.workers == 1)
    {
        FOLIO_LOG_INFO("converting {} document(s) sequentially",
                       documents.size());
        run_inline(documents, outcomes);
    }
    else if (settings_.isolation == IsolationMode::Thread)
    {
        FOLIO_LOG_INFO("converting {} document(s) on {} worker threads",
                       documents.size(), summary.workers);
        run_threads(documents, summary.workers, outcomes);
    }
    else
    {
        FOLIO_LOG_INFO("converting {} document(s) on {} worker processes",
                       documents.size(), summary.workers);
        run_processes(documents, summary.workers, outcomes);
    }

    bool const cancelled = folio::runtime::should_shutdown();
    summary.outcomes.reserve(documents.size());
    for (std::size_t i = 0; i < documents.size(); ++i)
    {
        auto outcome = outcomes[i].value_or(DocumentOutcome::failed(
            documents[i].filename().string(), Stage::Loaded,
            cancelled ? std::string(kCancelledMessage)
                      : std::string("no worker available")));
        switch (outcome.kind)
        {
        case OutcomeKind::Converted:
            ++summary.converted;
            break;
        case OutcomeKind::Skipped:
            ++summary.skipped;
            break;
        case OutcomeKind::Failed:
            ++summary.failed;
            break;
        }
        summary.outcomes.push_back(std::move(outcome));
    }
    return summary;
}

void BatchOrchestrator::run_inline(
    std::vector<std::filesystem::path> const &documents,
    std::vector<std::optional<DocumentOutcome>> &outcomes)
{
    std::size_t next = 0;
    serve_documents(
        settings_, services_, documents,
        [&]() -> std::optional<std::size_t>
        {
            while (next < documents.size() && outcomes[next])
            {
                ++next;
            }
            if (next >= documents.size() || folio::runtime::should_shutdown())
            {
                return std::nullopt;
            }
            return next++;
        },
        [&](std::size_t index, DocumentOutcome outcome)
        { outcomes[index] = std::move(outcome); });
}

void BatchOrchestrator::run_threads(
    std::vector<std::filesystem::path> const &documents, std::size_t workers,
    std::vector<std::optional<DocumentOutcome>> &outcomes)
{
    std::mutex mutex;
    std::size_t next = 0;
    auto take = [&]() -> std::optional<std::size_t>
    {
        std::lock_guard<std::mutex> guard(mutex);
        if (next >= documents.size() || folio::runtime::should_shutdown())
        {
            return std::nullopt;
        }
        return next++;
    };
    auto report = [&](std::size_t index, DocumentOutcome outcome)
    {
        std::lock_guard<std::mutex> guard(mutex);
        outcomes[index] = std::move(outcome);
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i)
    {
        pool.emplace_back(
            [&]
            { serve_documents(settings_, services_, documents, take, report); });
    }
    for (auto &thread : pool)
    {
        thread.join();
    }
}

void BatchOrchestrator::run_processes(
    std::vector<std::filesystem::path> const &documents, std::size_t workers,
    std::vector<std::optional<DocumentOutcome>> &outcomes)
{
    SigpipeGuard sigpipe;
    std::vector<ProcessWorker> pool(workers);
    std::deque<std::size_t> pending;
    for (std::size_t i = 0; i < documents.size(); ++i)
    {
        pending.push_back(i);
    }

    auto spawn = [&](ProcessWorker &worker) -> bool
    {
        int task[2] = {-1, -1};
        int result[2] = {-1, -1};
        if (::pipe2(task, O_CLOEXEC) != 0)
        {
            return false;
        }
        if (::pipe2(result, O_CLOEXEC) != 0)
        {
            ::close(task[0]);
            ::close(task[1]);
            return false;
        }
        std::fflush(stdout);
        std::fflush(stderr);
        pid_t pid = ::fork();
        if (pid < 0)
        {
            for (int fd : {task[0], task[1], result[0], result[1]})
            {
                ::close(fd);
            }
            return false;
        }
        if (pid == 0)
        {
            ::close(task[1]);
            ::close(result[0]);
            for (auto &other : pool)
            {
                close_fd(other.task_fd);
                close_fd(other.result_fd);
            }
            run_child(task[0], result[1], settings_, services_, documents);
        }
        ::close(task[0]);
        ::close(result[1]);
        worker.pid = pid;
        worker.task_fd = task[1];
        worker.result_fd = result[0];
        worker.buffer.clear();
        worker.in_flight.reset();
        FOLIO_LOG_DEBUG("started worker process {}", pid);
        return true;
    };

    bool cancelled = false;
    auto reap = [&](ProcessWorker &worker)
    {
        close_fd(worker.task_fd);
        close_fd(worker.result_fd);
        int status = 0;
        while (::waitpid(worker.pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        auto const how = describe_exit(status);
        if (worker.in_flight)
        {
            auto const index = *worker.in_flight;
            FOLIO_LOG_ERROR("worker {} {} while converting {}", worker.pid, how,
                            documents[index].filename().string());
            outcomes[index] = DocumentOutcome::failed(
                documents[index].filename().string(), Stage::Failed,
                std::format("worker process {}", how));
        }
        worker = ProcessWorker{};
        if (!pending.empty() && !cancelled && !spawn(worker))
        {
            FOLIO_LOG_ERROR("could not replace a dead worker process");
        }
    };

    auto dispatch = [&](ProcessWorker &worker)
    {
        if (!worker.alive() || worker.in_flight || pending.empty())
        {
            return;
        }
        auto const index = pending.front();
        pending.pop_front();
        if (!write_all(worker.task_fd, std::format("{}\n", index)))
        {
            pending.push_front(index);
            reap(worker);
            return;
        }
        worker.in_flight = index;
    };

    auto drain = [&](ProcessWorker &worker)
    {
        char chunk[4096];
        auto got = ::read(worker.result_fd, chunk, sizeof(chunk));
        if (got < 0 && errno == EINTR)
        {
            return;
        }
        if (got <= 0)
        {
            reap(worker);
            return;
        }
        worker.buffer.append(chunk, static_cast<std::size_t>(got));
        std::size_t newline;
        while ((newline = worker.buffer.find('\n')) != std::string::npos)
        {
            auto line = worker.buffer.substr(0, newline);
            worker.buffer.erase(0, newline + 1);
            auto decoded = decode_outcome(line);
            if (!decoded || decoded->first >= documents.size())
            {
                FOLIO_LOG_WARN("ignoring malformed worker output: {}", line);
                continue;
            }
            outcomes[decoded->first] = std::move(decoded->second);
            if (worker.in_flight == decoded->first)
            {
                worker.in_flight.reset();
            }
        }
    };

    std::size_t started = 0;
    for (auto &worker : pool)
    {
        if (spawn(worker))
        {
            ++started;
        }
    }
    if (started == 0)
    {
        FOLIO_LOG_WARN("could not start worker processes; converting inline");
        run_inline(documents, outcomes);
        return;
    }

    while (true)
    {
        if (!cancelled && folio::runtime::should_shutdown())
        {
            FOLIO_LOG_WARN("shutdown requested; {} document(s) not dispatched",
                           pending.size());
            cancelled = true;
        }
        if (!cancelled)
        {
            for (auto &worker : pool)
            {
                dispatch(worker);
            }
        }
        std::vector<pollfd> fds;
        std::vector<ProcessWorker *> owners;
        for (auto &worker : pool)
        {
            if (worker.alive() && worker.in_flight)
            {
                fds.push_back(pollfd{worker.result_fd, POLLIN, 0});
                owners.push_back(&worker);
            }
        }
        if (fds.empty())
        {
            break;
        }
        int ready = ::poll(fds.data(), fds.size(), kPollTimeoutMs);
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            FOLIO_LOG_ERROR("poll failed: {}", std::strerror(errno));
            break;
        }
        for (std::size_t i = 0; i < fds.size(); ++i)
        {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
            {
                drain(*owners[i]);
            }
        }
    }

    // Closing the task pipes lets idle workers run off the end of their loop.
    for (auto &worker : pool)
    {
        close_fd(worker.task_fd);
    }
    for (auto &worker : pool)
    {
        if (!worker.alive())
        {
            continue;
        }
        int status = 0;
        while (::waitpid(worker.pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        close_fd(worker.result_fd);
        if (worker.in_flight)
        {
            auto const index = *worker.in_flight;
            outcomes[index] = DocumentOutcome::failed(
                documents[index].filename().string(), Stage::Failed,
                std::format("worker process {}", describe_exit(status)));
        }
    }
}

} // namespace folio::engine
