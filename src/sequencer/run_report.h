#pragma once

#include <string>
#include <vector>

#include "bootstrap_sequencer.h"

namespace Bootstrap {

/**
 * Run observer that logs progress and a final summary, and optionally
 * records one CSV row per step.
 */
class RunReport : public IRunObserver {
public:
    enum class StepStatus { kSkipped, kRunning, kOk, kFailed };

    struct StepRecord {
        size_t position = 0;
        std::string name;
        std::string description;
        StepStatus status = StepStatus::kSkipped;
        double duration_ms = 0;
        std::string cause;
    };

    // Empty report_path disables the CSV file.
    explicit RunReport(std::string report_path = "");

    void OnRunStarted(const Sequence& sequence) override;
    void OnStepStarted(const Step& step) override;
    void OnStepFinished(const Step& step, const StepOutcome& outcome, Duration elapsed) override;
    void OnRunFinished(const RunResult& result) override;

    const std::vector<StepRecord>& records() const { return records_; }

    // Writes the CSV report; returns false and logs on I/O failure.
    bool WriteCsv(const std::string& path) const;

private:
    std::string report_path_;
    std::vector<StepRecord> records_;
};

const char* StepStatusName(RunReport::StepStatus status);

} // namespace Bootstrap
