#pragma once

namespace common
{

// Installs the stderr message handler for the command-line runner.
void initLogging(bool verbose = false);

} // namespace common
