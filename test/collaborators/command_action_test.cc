#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/collaborators/command_action.h"
#include "../../src/sequencer/execution_context.h"

#include <cerrno>
#include <csignal>

using namespace Bootstrap;
using ::testing::_;
using ::testing::Contains;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

class MockProcessRunner : public IProcessRunner {
public:
    MOCK_METHOD(ProcessExit, Run, (const ProcessSpec& spec), (override));
};

class CommandActionTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<MockProcessRunner>();
    }

    std::shared_ptr<MockProcessRunner> runner_;
    ExecutionContext context_{"/srv/app", "staging"};
};

TEST_F(CommandActionTest, BuildsProcessSpecFromContext) {
    context_.SetVariable("DJANGO_SETTINGS_MODULE", "app.settings");
    context_.SetVariable("DEBUG", "1");

    CommandAction action({"python", "manage.py", "migrate"}, runner_, 512);
    action.SetWorkingDirectory("web");
    action.SetEnvironment({{"DEBUG", "0"}});

    ProcessSpec captured;
    EXPECT_CALL(*runner_, Run(_)).WillOnce(DoAll(SaveArg<0>(&captured), Return(ProcessExit{})));

    StepOutcome outcome = action.Execute(context_);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(captured.argv, (std::vector<std::string>{"python", "manage.py", "migrate"}));
    EXPECT_EQ(captured.working_directory, "/srv/app/web");
    EXPECT_EQ(captured.stderr_tail_bytes, 512u);
    EXPECT_THAT(captured.environment, Contains("DJANGO_SETTINGS_MODULE=app.settings"));
    EXPECT_THAT(captured.environment, Contains("DEBUG=0"));
    EXPECT_THAT(captured.environment, Contains("BOOTSTRAP_TARGET_ENV=staging"));
}

TEST_F(CommandActionTest, NonZeroExitFailsWithTrimmedStderr) {
    ProcessExit exit;
    exit.kind = ProcessExit::Kind::kExited;
    exit.exit_code = 1;
    exit.stderr_tail = "CommandError: pending conflicting migration\n\n";
    EXPECT_CALL(*runner_, Run(_)).WillOnce(Return(exit));

    CommandAction action({"python", "manage.py", "migrate"}, runner_);
    StepOutcome outcome = action.Execute(context_);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.cause().kind, FailureCause::Kind::kExitStatus);
    EXPECT_EQ(outcome.cause().exit_code, 1);
    EXPECT_EQ(outcome.cause().message, "CommandError: pending conflicting migration");
}

TEST_F(CommandActionTest, SignalFailsWithSignalCause) {
    ProcessExit exit;
    exit.kind = ProcessExit::Kind::kSignaled;
    exit.exit_code = -1;
    exit.signal = SIGKILL;
    EXPECT_CALL(*runner_, Run(_)).WillOnce(Return(exit));

    CommandAction action({"pip", "install", "-r", "requirements.txt"}, runner_);
    StepOutcome outcome = action.Execute(context_);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.cause().kind, FailureCause::Kind::kSignal);
    EXPECT_EQ(outcome.cause().signal, SIGKILL);
}

TEST_F(CommandActionTest, SpawnFailureCarriesOsError) {
    ProcessExit exit;
    exit.kind = ProcessExit::Kind::kSpawnFailed;
    exit.exit_code = -1;
    exit.failed_operation = "exec";
    exit.error_number = ENOENT;
    EXPECT_CALL(*runner_, Run(_)).WillOnce(Return(exit));

    CommandAction action({"pip3.99", "install"}, runner_);
    StepOutcome outcome = action.Execute(context_);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.cause().kind, FailureCause::Kind::kSpawnError);
    EXPECT_THAT(outcome.cause().message, ::testing::HasSubstr("exec failed"));
}

TEST_F(CommandActionTest, RejectsEmptyCommandOrRunner) {
    EXPECT_THROW(CommandAction({}, runner_), std::invalid_argument);
    EXPECT_THROW(CommandAction({"true"}, nullptr), std::invalid_argument);
}

TEST_F(CommandActionTest, DescribeQuotesWhenNeeded) {
    CommandAction plain({"python", "manage.py", "collectstatic", "--no-input"}, runner_);
    EXPECT_EQ(plain.Describe(), "python manage.py collectstatic --no-input");

    CommandAction spaced({"sh", "-c", "echo it's done"}, runner_);
    EXPECT_EQ(spaced.Describe(), "sh -c 'echo it'\\''s done'");

    EXPECT_EQ(FormatCommandLine({"printf", ""}), "printf ''");
}

TEST(CommandActionProcessTest, TargetEnvironmentReachesChild) {
    ExecutionContext context(".", "staging");
    context.SetVariable("PATH", "/usr/bin:/bin");
    CommandAction action({"/bin/sh", "-c", "echo \"target=$BOOTSTRAP_TARGET_ENV\" >&2; exit 4"},
                         std::make_shared<PosixProcessRunner>());

    StepOutcome outcome = action.Execute(context);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.cause().exit_code, 4);
    EXPECT_EQ(outcome.cause().message, "target=staging");
}
