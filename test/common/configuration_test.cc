#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/configuration.h"

#include <cstdlib>

using namespace Bootstrap;
using ::testing::Contains;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("BOOTSTRAP_TARGET_ENV");
        unsetenv("BOOTSTRAP_INHERIT_ENV");
        unsetenv("BOOTSTRAP_STDERR_TAIL_BYTES");
    }

    Configuration configuration_;
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(configuration_.validate());
    EXPECT_EQ(configuration_.getWorkingDirectory(), ".");
    EXPECT_EQ(configuration_.getTargetEnvironment(), "production");
    EXPECT_EQ(configuration_.getStderrTailBytes(), 4096u);
    EXPECT_TRUE(configuration_.getReportPath().empty());
    EXPECT_TRUE(configuration_.config().context.inherit_environment.get());
    EXPECT_TRUE(configuration_.config().steps.empty());
}

TEST_F(ConfigurationTest, LoadsAllSections) {
    const std::string yaml = R"(
bootstrap:
  context:
    working_directory: /srv/app
    target_environment: staging
    inherit_environment: false
    environment:
      DJANGO_SETTINGS_MODULE: scanQR.settings
  toolchain:
    pip: /opt/venv/bin/pip
    python: /opt/venv/bin/python
    requirements_file: requirements/prod.txt
    manage_script: src/manage.py
    platform_settings_args: ["--force"]
  diagnostics:
    stderr_tail_bytes: 1024
    report_path: /var/log/bootstrap.csv
)";
    ASSERT_TRUE(configuration_.loadFromString(yaml));

    const BootstrapConfig& config = configuration_.config();
    EXPECT_EQ(configuration_.getWorkingDirectory(), "/srv/app");
    EXPECT_EQ(configuration_.getTargetEnvironment(), "staging");
    EXPECT_FALSE(config.context.inherit_environment.get());
    EXPECT_EQ(config.context.environment.at("DJANGO_SETTINGS_MODULE"), "scanQR.settings");
    EXPECT_EQ(config.toolchain.pip.get(), "/opt/venv/bin/pip");
    EXPECT_EQ(config.toolchain.python.get(), "/opt/venv/bin/python");
    EXPECT_EQ(config.toolchain.requirements_file.get(), "requirements/prod.txt");
    EXPECT_EQ(config.toolchain.manage_script.get(), "src/manage.py");
    EXPECT_EQ(config.toolchain.platform_settings_args, std::vector<std::string>{"--force"});
    EXPECT_EQ(configuration_.getStderrTailBytes(), 1024u);
    EXPECT_EQ(configuration_.getReportPath(), "/var/log/bootstrap.csv");
}

TEST_F(ConfigurationTest, LoadsExplicitSteps) {
    const std::string yaml = R"(
bootstrap:
  steps:
    - name: install
      command: [pip, install, -r, requirements.txt]
    - name: migrate
      command: [python, manage.py, migrate]
      working_directory: backend
      environment:
        DATABASE_URL: postgres://db/app
)";
    ASSERT_TRUE(configuration_.loadFromString(yaml));

    const auto& steps = configuration_.config().steps;
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0].name, "install");
    EXPECT_EQ(steps[0].command.size(), 4u);
    EXPECT_EQ(steps[1].working_directory, "backend");
    EXPECT_EQ(steps[1].environment.at("DATABASE_URL"), "postgres://db/app");
}

TEST_F(ConfigurationTest, InvalidStepsReported) {
    const std::string yaml = R"(
bootstrap:
  steps:
    - name: migrate
      command: [python, manage.py, migrate]
    - name: migrate
      command: [python, manage.py, migrate]
    - command: [true]
    - name: empty
)";
    EXPECT_FALSE(configuration_.loadFromString(yaml));

    auto errors = configuration_.getValidationErrors();
    EXPECT_THAT(errors, Contains("Duplicate step name: migrate"));
    EXPECT_THAT(errors, Contains("Step 3 has no name"));
    EXPECT_THAT(errors, Contains("Step 4 has no command"));
}

TEST_F(ConfigurationTest, StepsMustBeAList) {
    EXPECT_FALSE(configuration_.loadFromString("bootstrap:\n  steps:\n    install: pip\n"));
}

TEST_F(ConfigurationTest, MalformedYamlRejected) {
    EXPECT_FALSE(configuration_.loadFromString("bootstrap: [unterminated"));
}

TEST_F(ConfigurationTest, WrongValueTypeRejected) {
    EXPECT_FALSE(configuration_.loadFromString("bootstrap:\n  diagnostics:\n    stderr_tail_bytes: lots\n"));
}

TEST_F(ConfigurationTest, MissingFileRejected) {
    EXPECT_FALSE(configuration_.loadFromFile("/nonexistent/bootstrap.yaml"));
}

TEST_F(ConfigurationTest, OversizedTailRejected) {
    configuration_.config().diagnostics.stderr_tail_bytes.set(8UL << 20);
    EXPECT_FALSE(configuration_.validate());
    EXPECT_THAT(configuration_.getValidationErrors(), Contains("stderr_tail_bytes must be at most 1MiB"));
}

TEST_F(ConfigurationTest, EmptyToolchainRejected) {
    configuration_.config().toolchain.python.set("");
    EXPECT_FALSE(configuration_.validate());
    EXPECT_THAT(configuration_.getValidationErrors(), Contains("Toolchain python command must not be empty"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValue) {
    ASSERT_TRUE(configuration_.loadFromString("bootstrap:\n  context:\n    target_environment: staging\n"));
    EXPECT_EQ(configuration_.getTargetEnvironment(), "staging");

    setenv("BOOTSTRAP_TARGET_ENV", "canary", 1);
    EXPECT_EQ(configuration_.getTargetEnvironment(), "canary");

    setenv("BOOTSTRAP_STDERR_TAIL_BYTES", "256", 1);
    EXPECT_EQ(configuration_.getStderrTailBytes(), 256u);
}

TEST_F(ConfigurationTest, UnparseableEnvironmentValueIgnored) {
    setenv("BOOTSTRAP_INHERIT_ENV", "maybe", 1);
    EXPECT_TRUE(configuration_.config().context.inherit_environment.get());

    setenv("BOOTSTRAP_INHERIT_ENV", "off", 1);
    EXPECT_FALSE(configuration_.config().context.inherit_environment.get());

    setenv("BOOTSTRAP_STDERR_TAIL_BYTES", "many", 1);
    EXPECT_EQ(configuration_.getStderrTailBytes(), 4096u);
}
