#pragma once

namespace folio::runtime
{

// Set from SIGINT/SIGTERM handlers; the orchestrator stops dispatching new
// documents once it is raised. Forked workers inherit a cleared flag.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;
void reset_shutdown() noexcept;
void install_signal_handlers();

} // namespace folio::runtime
