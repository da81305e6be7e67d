#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Bootstrap {

namespace {

constexpr size_t kMaxStderrTailBytes = 1UL << 20;

std::vector<std::string> ParseStringList(const YAML::Node& node) {
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::map<std::string, std::string> ParseStringMap(const YAML::Node& node) {
    std::map<std::string, std::string> values;
    for (const auto& entry : node) {
        values[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return values;
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (yaml["bootstrap"]) {
            parseRoot(yaml["bootstrap"]);
        } else {
            LOG(WARNING) << "No 'bootstrap' section in " << filename << ", using defaults";
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["bootstrap"]) {
            parseRoot(yaml["bootstrap"]);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::parseRoot(const YAML::Node& root) {
    // Context
    if (root["context"]) {
        auto context = root["context"];
        if (context["working_directory"]) config_.context.working_directory.set(context["working_directory"].as<std::string>());
        if (context["target_environment"]) config_.context.target_environment.set(context["target_environment"].as<std::string>());
        if (context["inherit_environment"]) config_.context.inherit_environment.set(context["inherit_environment"].as<bool>());
        if (context["environment"]) config_.context.environment = ParseStringMap(context["environment"]);
    }

    // Toolchain
    if (root["toolchain"]) {
        auto toolchain = root["toolchain"];
        if (toolchain["pip"]) config_.toolchain.pip.set(toolchain["pip"].as<std::string>());
        if (toolchain["python"]) config_.toolchain.python.set(toolchain["python"].as<std::string>());
        if (toolchain["requirements_file"]) config_.toolchain.requirements_file.set(toolchain["requirements_file"].as<std::string>());
        if (toolchain["manage_script"]) config_.toolchain.manage_script.set(toolchain["manage_script"].as<std::string>());
        if (toolchain["platform_settings_args"]) {
            config_.toolchain.platform_settings_args = ParseStringList(toolchain["platform_settings_args"]);
        }
    }

    // Diagnostics
    if (root["diagnostics"]) {
        auto diagnostics = root["diagnostics"];
        if (diagnostics["stderr_tail_bytes"]) config_.diagnostics.stderr_tail_bytes.set(diagnostics["stderr_tail_bytes"].as<size_t>());
        if (diagnostics["report_path"]) config_.diagnostics.report_path.set(diagnostics["report_path"].as<std::string>());
    }

    if (root["steps"]) {
        parseSteps(root["steps"]);
    }
}

void Configuration::parseSteps(const YAML::Node& steps) {
    if (!steps.IsSequence()) {
        throw YAML::RepresentationException(steps.Mark(), "'steps' must be a list");
    }
    config_.steps.clear();
    for (const auto& node : steps) {
        StepConfig step;
        if (node["name"]) step.name = node["name"].as<std::string>();
        if (node["command"]) step.command = ParseStringList(node["command"]);
        if (node["working_directory"]) step.working_directory = node["working_directory"].as<std::string>();
        if (node["environment"]) step.environment = ParseStringMap(node["environment"]);
        config_.steps.push_back(std::move(step));
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.context.working_directory.get().empty()) {
        validation_errors_.push_back("Working directory must not be empty");
    }

    if (config_.toolchain.pip.get().empty()) {
        validation_errors_.push_back("Toolchain pip command must not be empty");
    }
    if (config_.toolchain.python.get().empty()) {
        validation_errors_.push_back("Toolchain python command must not be empty");
    }
    if (config_.toolchain.requirements_file.get().empty()) {
        validation_errors_.push_back("Requirements file must not be empty");
    }
    if (config_.toolchain.manage_script.get().empty()) {
        validation_errors_.push_back("Manage script must not be empty");
    }

    if (config_.diagnostics.stderr_tail_bytes.get() > kMaxStderrTailBytes) {
        validation_errors_.push_back("stderr_tail_bytes must be at most 1MiB");
    }

    std::set<std::string> names;
    for (size_t i = 0; i < config_.steps.size(); ++i) {
        const StepConfig& step = config_.steps[i];
        if (step.name.empty()) {
            validation_errors_.push_back("Step " + std::to_string(i + 1) + " has no name");
        } else if (!names.insert(step.name).second) {
            validation_errors_.push_back("Duplicate step name: " + step.name);
        }
        if (step.command.empty() || step.command.front().empty()) {
            validation_errors_.push_back("Step " + std::to_string(i + 1) + " has no command");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Bootstrap
