#include "engine/BrowserSession.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace folio::engine
{

namespace
{

constexpr std::array<std::string_view, 8> kCrashIndicators = {
    "connection closed", "browser has been closed", "target closed",
    "crashed",           "protocol error",          "invalid session id",
    "chrome not reachable", "disconnected",
};

std::string lowercase(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return out;
}

} // namespace

std::string_view to_string(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::Unstarted:
        return "unstarted";
    case SessionState::Ready:
        return "ready";
    case SessionState::Stale:
        return "stale";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

bool is_crash_indicator(std::string_view message)
{
    auto lowered = lowercase(message);
    return std::any_of(kCrashIndicators.begin(), kCrashIndicators.end(),
                       [&lowered](std::string_view indicator)
                       { return lowered.find(indicator) != std::string::npos; });
}

BrowserSession::BrowserSession(EngineFactory factory)
    : factory_(std::move(factory))
{
}

BrowserSession::~BrowserSession()
{
    close();
}

void BrowserSession::launch()
{
    engine_ = factory_();
    if (!engine_)
    {
        throw BrowserError("browser engine factory returned nothing");
    }
    ++launches_;
    try
    {
        engine_->start();
    }
    catch (BrowserError const &)
    {
        set_state(SessionState::Stale);
        throw;
    }
    set_state(SessionState::Ready);
    FOLIO_LOG_DEBUG("browser session launched (launch #{})", launches_);
}

std::unique_ptr<BrowserPage> BrowserSession::open_page()
{
    auto page = engine_->new_page();
    if (!page)
    {
        throw BrowserError("target closed: page creation returned nothing");
    }
    return page;
}

BrowserPage &BrowserSession::ensure_ready()
{
    if (state_ == SessionState::Ready && !engine_->is_connected())
    {
        FOLIO_LOG_WARN("browser session failed its liveness probe");
        set_state(SessionState::Stale);
    }
    if (state_ != SessionState::Ready)
    {
        if (state_ == SessionState::Stale)
        {
            close();
        }
        launch();
    }

    std::unique_ptr<BrowserPage> fresh;
    try
    {
        fresh = open_page();
    }
    catch (BrowserError const &ex)
    {
        if (!engine_->is_connected())
        {
            set_state(SessionState::Stale);
            throw;
        }
        // Connected yet unable to open a page: the probe lied.
        FOLIO_LOG_WARN("page creation failed on a live session ({}); "
                       "relaunching",
                       ex.what());
        close();
        launch();
        fresh = open_page();
    }

    auto previous = std::exchange(page_, std::move(fresh));
    if (previous && !previous->is_closed())
    {
        try
        {
            previous->close();
        }
        catch (BrowserError const &ex)
        {
            FOLIO_LOG_DEBUG("closing previous page failed: {}", ex.what());
        }
    }
    page_->activate();
    return *page_;
}

void BrowserSession::close() noexcept
{
    auto page = std::move(page_);
    auto engine = std::move(engine_);
    if (state_ == SessionState::Unstarted && !engine)
    {
        return;
    }
    set_state(SessionState::Closed);
    if (page && !page->is_closed())
    {
        try
        {
            page->close();
        }
        catch (std::exception const &ex)
        {
            FOLIO_LOG_DEBUG("page teardown failed: {}", ex.what());
        }
    }
    page.reset();
    if (!engine)
    {
        return;
    }
    try
    {
        engine->close_session();
    }
    catch (std::exception const &ex)
    {
        FOLIO_LOG_DEBUG("session teardown failed: {}", ex.what());
    }
    try
    {
        engine->stop_host();
    }
    catch (std::exception const &ex)
    {
        FOLIO_LOG_WARN("browser host teardown failed: {}", ex.what());
    }
}

void BrowserSession::set_state(SessionState next) noexcept
{
    if (next != state_)
    {
        FOLIO_LOG_DEBUG("browser session {} -> {}", to_string(state_),
                        to_string(next));
    }
    state_ = next;
}

bool BrowserSession::should_retry_production(BrowserError const &error,
                                             int attempt)
{
    if (attempt >= kProductionAttempts || !is_crash_indicator(error.what()))
    {
        return false;
    }
    FOLIO_LOG_WARN("browser crashed during production ({}); relaunching",
                   error.what());
    close();
    return true;
}

} // namespace folio::engine
