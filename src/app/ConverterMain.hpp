#pragma once

namespace folio::app
{

// Runs one conversion batch (or a maintenance command) and returns the
// process exit status: 0 when nothing failed, 1 when a document or the run
// failed, 2 on invalid usage.
int converter_main(int argc, char *argv[]);

} // namespace folio::app
