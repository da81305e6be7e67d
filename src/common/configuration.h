#ifndef BOOTSTRAP_CONFIGURATION_H_
#define BOOTSTRAP_CONFIGURATION_H_

#include <string>
#include <optional>
#include <map>
#include <vector>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Bootstrap {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * One explicitly configured step. Used verbatim instead of the canonical
 * sequence when the configuration lists any.
 */
struct StepConfig {
    std::string name;
    std::vector<std::string> command;
    std::string working_directory;
    std::map<std::string, std::string> environment;
};

/**
 * Main configuration structure
 */
struct BootstrapConfig {
    // Shared execution context handed to every step
    struct Context {
        ConfigValue<std::string> working_directory{".", "BOOTSTRAP_WORKING_DIR"};
        ConfigValue<std::string> target_environment{"production", "BOOTSTRAP_TARGET_ENV"};
        ConfigValue<bool> inherit_environment{true, "BOOTSTRAP_INHERIT_ENV"};
        std::map<std::string, std::string> environment;
    } context;

    // Commands the canonical sequence is built from
    struct Toolchain {
        ConfigValue<std::string> pip{"pip", "BOOTSTRAP_PIP"};
        ConfigValue<std::string> python{"python", "BOOTSTRAP_PYTHON"};
        ConfigValue<std::string> requirements_file{"requirements.txt", "BOOTSTRAP_REQUIREMENTS_FILE"};
        ConfigValue<std::string> manage_script{"manage.py", "BOOTSTRAP_MANAGE_SCRIPT"};
        std::vector<std::string> platform_settings_args;
    } toolchain;

    struct Diagnostics {
        // Bytes of a failing step's stderr kept as the failure cause.
        ConfigValue<size_t> stderr_tail_bytes{4096, "BOOTSTRAP_STDERR_TAIL_BYTES"};
        // Empty disables the CSV run report.
        ConfigValue<std::string> report_path{"", "BOOTSTRAP_REPORT_PATH"};
    } diagnostics;

    std::vector<StepConfig> steps;
};

/**
 * Loads and validates a BootstrapConfig. One instance per invocation, owned
 * by main and passed down explicitly.
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const BootstrapConfig& config() const { return config_; }
    BootstrapConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getWorkingDirectory() const { return config_.context.working_directory.get(); }
    std::string getTargetEnvironment() const { return config_.context.target_environment.get(); }
    size_t getStderrTailBytes() const { return config_.diagnostics.stderr_tail_bytes.get(); }
    std::string getReportPath() const { return config_.diagnostics.report_path.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    BootstrapConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& root);
    void parseSteps(const YAML::Node& steps);
};

} // namespace Bootstrap

#endif // BOOTSTRAP_CONFIGURATION_H_
