#pragma once

#include <ostream>
#include <string>

#include "../common/configuration.h"
#include "../sequencer/execution_context.h"
#include "../sequencer/step.h"

namespace Bootstrap {

constexpr char kDefaultConfigPath[] = "config/bootstrap.yaml";
constexpr int kExitUsageError = 2;

/**
 * Loads the configuration file. A missing file is only an error when the
 * path was given explicitly; otherwise the built-in defaults are validated.
 */
bool LoadConfiguration(Configuration& configuration,
                       const std::string& path, bool explicitly_requested);

// Numbered step list with command lines, for --dry-run.
void PrintPlan(const Sequence& sequence, const ExecutionContext& context, std::ostream& out);

/**
 * Parses the command line, loads configuration and runs the bootstrap.
 * Returns the process exit status: 0 completed or dry run, 1 aborted,
 * kExitUsageError for bad arguments or configuration.
 */
int RunBootstrap(int argc, char* argv[], std::ostream& out);

} // namespace Bootstrap
