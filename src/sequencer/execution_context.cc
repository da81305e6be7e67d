#include "execution_context.h"

#include <unistd.h>

extern char** environ;

namespace Bootstrap {

ExecutionContext::ExecutionContext(std::string working_directory, std::string target_environment)
	: working_directory_(std::move(working_directory)),
	  target_environment_(std::move(target_environment)) {}

void ExecutionContext::SetVariable(const std::string& name, const std::string& value) {
	variables_[name] = value;
}

void ExecutionContext::InheritProcessEnvironment() {
	for (char** entry = environ; entry && *entry; ++entry) {
		std::string item(*entry);
		size_t eq = item.find('=');
		if (eq == std::string::npos || eq == 0) {
			continue;
		}
		// Explicitly configured variables take precedence over the snapshot.
		variables_.emplace(item.substr(0, eq), item.substr(eq + 1));
	}
}

std::vector<std::string> ExecutionContext::BuildEnvironment(
		const std::map<std::string, std::string>& step_overrides) const {
	std::map<std::string, std::string> merged = variables_;
	for (const auto& [name, value] : step_overrides) {
		merged[name] = value;
	}
	merged[kTargetEnvironmentVariable] = target_environment_;

	std::vector<std::string> entries;
	entries.reserve(merged.size());
	for (const auto& [name, value] : merged) {
		entries.push_back(name + "=" + value);
	}
	return entries;
}

std::string ExecutionContext::ResolveWorkingDirectory(const std::string& step_directory) const {
	if (step_directory.empty()) {
		return working_directory_;
	}
	if (step_directory.front() == '/') {
		return step_directory;
	}
	if (working_directory_.empty() || working_directory_ == ".") {
		return step_directory;
	}
	if (working_directory_.back() == '/') {
		return working_directory_ + step_directory;
	}
	return working_directory_ + "/" + step_directory;
}

} // namespace Bootstrap
