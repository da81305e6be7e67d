#include "command_action.h"

#include <stdexcept>

#include <glog/logging.h>

#include "../sequencer/execution_context.h"

namespace Bootstrap {

namespace {

std::string TrimTrailingWhitespace(std::string text) {
	size_t end = text.find_last_not_of(" \t\r\n");
	if (end == std::string::npos) {
		return "";
	}
	text.erase(end + 1);
	return text;
}

FailureCause ToFailureCause(const ProcessExit& exit) {
	FailureCause cause;
	switch (exit.kind) {
		case ProcessExit::Kind::kExited:
			cause.kind = FailureCause::Kind::kExitStatus;
			cause.exit_code = exit.exit_code;
			cause.message = TrimTrailingWhitespace(exit.stderr_tail);
			break;
		case ProcessExit::Kind::kSignaled:
			cause.kind = FailureCause::Kind::kSignal;
			cause.exit_code = exit.exit_code;
			cause.signal = exit.signal;
			cause.message = TrimTrailingWhitespace(exit.stderr_tail);
			break;
		case ProcessExit::Kind::kSpawnFailed:
			cause.kind = FailureCause::Kind::kSpawnError;
			cause.exit_code = exit.exit_code;
			cause.message = exit.Describe();
			break;
	}
	return cause;
}

} // namespace

std::string FormatCommandLine(const std::vector<std::string>& command) {
	std::string line;
	for (const std::string& arg : command) {
		if (!line.empty()) {
			line += ' ';
		}
		if (!arg.empty() && arg.find_first_of(" \t\"'\\$") == std::string::npos) {
			line += arg;
			continue;
		}
		line += '\'';
		for (char c : arg) {
			if (c == '\'') {
				line += "'\\''";
			} else {
				line += c;
			}
		}
		line += '\'';
	}
	return line;
}

CommandAction::CommandAction(std::vector<std::string> command,
                             std::shared_ptr<IProcessRunner> runner,
                             size_t stderr_tail_bytes)
	: command_(std::move(command)),
	  runner_(std::move(runner)),
	  stderr_tail_bytes_(stderr_tail_bytes) {
	if (command_.empty()) {
		throw std::invalid_argument("CommandAction requires a command");
	}
	if (!runner_) {
		throw std::invalid_argument("CommandAction requires a process runner");
	}
}

StepOutcome CommandAction::Execute(const ExecutionContext& context) {
	ProcessSpec spec;
	spec.argv = command_;
	spec.working_directory = context.ResolveWorkingDirectory(working_directory_);
	spec.environment = context.BuildEnvironment(environment_);
	spec.stderr_tail_bytes = stderr_tail_bytes_;

	ProcessExit exit = runner_->Run(spec);
	if (exit.success()) {
		return StepOutcome::Success();
	}

	VLOG(1) << Describe() << " " << exit.Describe();
	return StepOutcome::Failure(ToFailureCause(exit));
}

std::string CommandAction::Describe() const {
	return FormatCommandLine(command_);
}

} // namespace Bootstrap
