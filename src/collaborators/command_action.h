#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../sequencer/step.h"
#include "process_runner.h"

namespace Bootstrap {

/**
 * Step action that runs one external command and maps its termination to a
 * StepOutcome. Exit status 0 is success; anything else, including a command
 * that stopped half way, fails the step.
 */
class CommandAction : public IStepAction {
public:
    CommandAction(std::vector<std::string> command,
                  std::shared_ptr<IProcessRunner> runner,
                  size_t stderr_tail_bytes = 4096);

    // Per-step variables, applied over the context's variables.
    void SetEnvironment(std::map<std::string, std::string> environment) { environment_ = std::move(environment); }
    // Relative to the context working directory unless absolute.
    void SetWorkingDirectory(std::string working_directory) { working_directory_ = std::move(working_directory); }

    StepOutcome Execute(const ExecutionContext& context) override;
    std::string Describe() const override;

    const std::vector<std::string>& command() const { return command_; }
    const std::map<std::string, std::string>& environment() const { return environment_; }
    const std::string& working_directory() const { return working_directory_; }

private:
    std::vector<std::string> command_;
    std::shared_ptr<IProcessRunner> runner_;
    size_t stderr_tail_bytes_;
    std::map<std::string, std::string> environment_;
    std::string working_directory_;
};

// Shell-style rendering of a command line for logs.
std::string FormatCommandLine(const std::vector<std::string>& command);

} // namespace Bootstrap
