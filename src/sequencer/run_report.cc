#include "run_report.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Bootstrap {

namespace {

// Quote a CSV field when it contains a separator, quote or newline.
std::string CsvField(const std::string& value) {
	if (value.find_first_of(",\"\n\r") == std::string::npos) {
		return value;
	}
	std::string quoted = "\"";
	for (char c : value) {
		if (c == '"') {
			quoted += '"';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

std::string FormatMs(double ms) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(1) << ms;
	return out.str();
}

} // namespace

const char* StepStatusName(RunReport::StepStatus status) {
	switch (status) {
		case RunReport::StepStatus::kSkipped: return "skipped";
		case RunReport::StepStatus::kRunning: return "running";
		case RunReport::StepStatus::kOk:      return "ok";
		case RunReport::StepStatus::kFailed:  return "failed";
	}
	return "unknown";
}

RunReport::RunReport(std::string report_path)
	: report_path_(std::move(report_path)) {}

void RunReport::OnRunStarted(const Sequence& sequence) {
	records_.clear();
	for (const Step& step : sequence) {
		StepRecord record;
		record.position = step.position;
		record.name = step.name;
		record.description = step.action->Describe();
		records_.push_back(std::move(record));
	}
	LOG(INFO) << "Bootstrapping environment: " << sequence.size() << " steps";
}

void RunReport::OnStepStarted(const Step& step) {
	StepRecord& record = records_.at(step.position);
	record.status = StepStatus::kRunning;
	LOG(INFO) << "[" << step.position + 1 << "/" << records_.size() << "] Running "
		<< step.name << ": " << record.description;
}

void RunReport::OnStepFinished(const Step& step, const StepOutcome& outcome, Duration elapsed) {
	StepRecord& record = records_.at(step.position);
	record.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();
	if (outcome.ok()) {
		record.status = StepStatus::kOk;
		LOG(INFO) << "[" << step.position + 1 << "/" << records_.size() << "] " << step.name
			<< " finished in " << FormatMs(record.duration_ms) << " ms";
	} else {
		record.status = StepStatus::kFailed;
		record.cause = outcome.cause().ToString();
		LOG(ERROR) << "[" << step.position + 1 << "/" << records_.size() << "] " << step.name
			<< " failed after " << FormatMs(record.duration_ms) << " ms: " << record.cause;
	}
}

void RunReport::OnRunFinished(const RunResult& result) {
	double total_ms = 0;
	for (const StepRecord& record : records_) {
		total_ms += record.duration_ms;
	}

	LOG(INFO) << std::string(50, '=');
	LOG(INFO) << "BOOTSTRAP SUMMARY:";
	LOG(INFO) << "Total steps: " << records_.size();
	LOG(INFO) << "Steps completed: " << result.steps_completed;
	for (const StepRecord& record : records_) {
		LOG(INFO) << "  " << record.position + 1 << ". " << record.name << ": "
			<< StepStatusName(record.status);
	}
	LOG(INFO) << "Elapsed: " << FormatMs(total_ms) << " ms";
	if (result.completed()) {
		LOG(INFO) << "Environment bootstrapped successfully";
	} else {
		LOG(ERROR) << "Bootstrap aborted at step " << result.failed_position + 1
			<< " (" << result.failed_step << "): " << result.cause.ToString();
		LOG(ERROR) << "Fix the cause and rerun the whole bootstrap; completed steps are safe to repeat";
	}

	if (!report_path_.empty()) {
		WriteCsv(report_path_);
	}
}

bool RunReport::WriteCsv(const std::string& path) const {
	fs::path report_file(path);
	if (report_file.has_parent_path()) {
		std::error_code ec;
		fs::create_directories(report_file.parent_path(), ec);
		if (ec) {
			LOG(ERROR) << "Failed to create report directory " << report_file.parent_path()
				<< ": " << ec.message();
			return false;
		}
	}

	std::ofstream out(path, std::ios::trunc);
	if (!out.is_open()) {
		LOG(ERROR) << "Failed to open report file " << path << ": " << strerror(errno);
		return false;
	}

	out << "position,name,status,duration_ms,cause\n";
	for (const StepRecord& record : records_) {
		out << record.position + 1 << ","
			<< CsvField(record.name) << ","
			<< StepStatusName(record.status) << ","
			<< FormatMs(record.duration_ms) << ","
			<< CsvField(record.cause) << "\n";
	}
	out.flush();
	if (!out) {
		LOG(ERROR) << "Failed to write report file " << path;
		return false;
	}
	VLOG(1) << "Run report written to " << path;
	return true;
}

} // namespace Bootstrap
