#include "bootstrap_cli.h"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "../collaborators/canonical_sequence.h"
#include "../collaborators/process_runner.h"
#include "../sequencer/bootstrap_sequencer.h"
#include "../sequencer/run_report.h"

namespace Bootstrap {

namespace {

std::optional<cxxopts::ParseResult> ParseArguments(cxxopts::Options& options, int argc, char* argv[]) {
	try {
		return options.parse(argc, argv);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return std::nullopt;
	}
}

} // end of namespace

bool LoadConfiguration(Configuration& configuration,
		const std::string& path, bool explicitly_requested) {
	if (!explicitly_requested && !std::filesystem::exists(path)) {
		LOG(INFO) << "No configuration at " << path << ", using defaults";
		return configuration.validate();
	}
	LOG(INFO) << "Loading configuration from " << path;
	return configuration.loadFromFile(path);
}

void PrintPlan(const Sequence& sequence, const ExecutionContext& context, std::ostream& out) {
	out << "Bootstrap plan for " << context.target_environment()
		<< " (working directory " << context.working_directory() << "):\n";
	for (const Step& step : sequence) {
		out << "  " << step.position + 1 << ". " << step.name << ": "
			<< step.action->Describe() << "\n";
	}
	out << "DRY RUN - no step was executed" << std::endl;
}

int RunBootstrap(int argc, char* argv[], std::ostream& out) {
	cxxopts::Options options("bootstrap",
		"Prepare a deployment environment: dependencies, static assets, schema migrations, default settings");

	options.add_options()
		("c,config", "YAML configuration file",
		 cxxopts::value<std::string>()->default_value(kDefaultConfigPath))
		("C,working_dir", "Working directory for every step", cxxopts::value<std::string>())
		("report", "Write a CSV run report to this path", cxxopts::value<std::string>())
		("dry-run", "Print the step plan without executing it")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed = ParseArguments(options, argc, argv);
	if (!parsed) {
		out << options.help() << std::endl;
		return kExitUsageError;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	if (arguments.count("help")) {
		out << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();

	// *************** Configuration **********************
	Configuration configuration;
	if (!LoadConfiguration(configuration, arguments["config"].as<std::string>(),
			arguments.count("config") > 0)) {
		LOG(ERROR) << "Failed to load configuration";
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return kExitUsageError;
	}
	const BootstrapConfig& config = configuration.config();

	std::string working_directory = arguments.count("working_dir")
		? arguments["working_dir"].as<std::string>()
		: configuration.getWorkingDirectory();
	std::string report_path = arguments.count("report")
		? arguments["report"].as<std::string>()
		: configuration.getReportPath();

	ExecutionContext context(working_directory, configuration.getTargetEnvironment());
	for (const auto& [name, value] : config.context.environment) {
		context.SetVariable(name, value);
	}
	if (config.context.inherit_environment.get()) {
		context.InheritProcessEnvironment();
	}

	// *************** Sequence **********************
	Sequence sequence = BuildSequence(config, std::make_shared<PosixProcessRunner>());

	if (arguments.count("dry-run")) {
		PrintPlan(sequence, context, out);
		return EXIT_SUCCESS;
	}

	BootstrapSequencer sequencer(std::move(sequence));
	RunReport report(report_path);
	sequencer.AddObserver(&report);

	RunResult result = sequencer.Run(context);
	return result.ExitCode();
}

} // namespace Bootstrap
