#include "canonical_sequence.h"

#include <glog/logging.h>

#include "command_action.h"

namespace Bootstrap {

namespace {

StepConfig MakeStep(const std::string& name, std::vector<std::string> command) {
	StepConfig step;
	step.name = name;
	step.command = std::move(command);
	return step;
}

std::vector<std::string> ManageCommand(const BootstrapConfig& config, const std::string& subcommand) {
	return {config.toolchain.python.get(), config.toolchain.manage_script.get(), subcommand};
}

} // namespace

std::vector<StepConfig> CanonicalSteps(const BootstrapConfig& config) {
	std::vector<StepConfig> steps;

	steps.push_back(MakeStep(kInstallStep,
		{config.toolchain.pip.get(), "install", "-r", config.toolchain.requirements_file.get()}));

	// collectstatic must not prompt.
	std::vector<std::string> collect = ManageCommand(config, "collectstatic");
	collect.push_back("--no-input");
	steps.push_back(MakeStep(kCollectAssetsStep, std::move(collect)));

	steps.push_back(MakeStep(kMigrateStep, ManageCommand(config, "migrate")));

	std::vector<std::string> platform = ManageCommand(config, "initialize_platform_settings");
	platform.insert(platform.end(),
		config.toolchain.platform_settings_args.begin(),
		config.toolchain.platform_settings_args.end());
	steps.push_back(MakeStep(kPlatformSettingsStep, std::move(platform)));

	steps.push_back(MakeStep(kReferralSettingsStep, ManageCommand(config, "init_referral_settings")));

	return steps;
}

std::vector<StepConfig> ConfiguredSteps(const BootstrapConfig& config) {
	if (config.steps.empty()) {
		return CanonicalSteps(config);
	}
	return config.steps;
}

Sequence BuildSequence(const BootstrapConfig& config, std::shared_ptr<IProcessRunner> runner) {
	const size_t tail_bytes = config.diagnostics.stderr_tail_bytes.get();
	Sequence sequence;
	for (StepConfig& step : ConfiguredSteps(config)) {
		auto action = std::make_shared<CommandAction>(step.command, runner, tail_bytes);
		action->SetEnvironment(std::move(step.environment));
		action->SetWorkingDirectory(std::move(step.working_directory));
		VLOG(1) << "Step " << sequence.size() + 1 << " " << step.name << ": " << action->Describe();
		sequence.Append(std::move(step.name), std::move(action));
	}
	return sequence;
}

} // namespace Bootstrap
