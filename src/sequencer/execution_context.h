#pragma once

#include <map>
#include <string>
#include <vector>

namespace Bootstrap {

// Variable every step sees naming the environment being bootstrapped.
constexpr char kTargetEnvironmentVariable[] = "BOOTSTRAP_TARGET_ENV";

/**
 * Shared configuration handed explicitly to every step: where steps run,
 * which environment they target and which variables they see.
 */
class ExecutionContext {
public:
    ExecutionContext(std::string working_directory, std::string target_environment);

    const std::string& working_directory() const { return working_directory_; }
    const std::string& target_environment() const { return target_environment_; }
    const std::map<std::string, std::string>& variables() const { return variables_; }

    void SetVariable(const std::string& name, const std::string& value);

    // Snapshot the invoking process's environment into the context.
    void InheritProcessEnvironment();

    // NAME=value entries for a child process. Step overrides win over context
    // variables; the target environment variable is always set last.
    std::vector<std::string> BuildEnvironment(
            const std::map<std::string, std::string>& step_overrides = {}) const;

    // Empty resolves to the context directory, relative paths resolve against it.
    std::string ResolveWorkingDirectory(const std::string& step_directory) const;

private:
    std::string working_directory_;
    std::string target_environment_;
    std::map<std::string, std::string> variables_;
};

} // namespace Bootstrap
