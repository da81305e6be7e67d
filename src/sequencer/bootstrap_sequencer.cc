#include "bootstrap_sequencer.h"

#include <cstdlib>
#include <stdexcept>

#include <glog/logging.h>

#include "execution_context.h"

namespace Bootstrap {

const char* SequencerStateName(SequencerState state) {
	switch (state) {
		case SequencerState::kNotStarted: return "NotStarted";
		case SequencerState::kRunning:    return "Running";
		case SequencerState::kCompleted:  return "Completed";
		case SequencerState::kAborted:    return "Aborted";
	}
	return "Unknown";
}

RunResult RunResult::Completed(size_t steps_completed) {
	RunResult result;
	result.status = Status::kCompleted;
	result.steps_completed = steps_completed;
	return result;
}

RunResult RunResult::Aborted(const Step& step, FailureCause cause) {
	RunResult result;
	result.status = Status::kAborted;
	result.steps_completed = step.position;
	result.failed_position = step.position;
	result.failed_step = step.name;
	result.cause = std::move(cause);
	return result;
}

int RunResult::ExitCode() const {
	return completed() ? EXIT_SUCCESS : EXIT_FAILURE;
}

BootstrapSequencer::BootstrapSequencer(Sequence sequence)
	: sequence_(std::move(sequence)) {
	if (sequence_.empty()) {
		throw std::invalid_argument("Bootstrap sequence must contain at least one step");
	}
}

void BootstrapSequencer::AddObserver(IRunObserver* observer) {
	if (observer) {
		observers_.push_back(observer);
	}
}

RunResult BootstrapSequencer::Run(const ExecutionContext& context) {
	if (state_ != SequencerState::kNotStarted) {
		throw std::logic_error(std::string("Sequencer already ran (state ") +
				SequencerStateName(state_) + "); construct a new one to rerun");
	}

	state_ = SequencerState::kRunning;
	current_step_ = 0;
	VLOG(1) << "Bootstrap run started: " << sequence_.size() << " steps, target "
		<< context.target_environment() << ", working directory " << context.working_directory();
	for (IRunObserver* observer : observers_) {
		observer->OnRunStarted(sequence_);
	}

	// A throw that is not a std::exception unwinds through here. Leave the
	// run Aborted at that step and let observers see the end before it leaves.
	struct UnwindGuard {
		BootstrapSequencer* sequencer;
		const Step* step = nullptr;

		~UnwindGuard() {
			if (sequencer->state_ != SequencerState::kRunning || step == nullptr) {
				return;
			}
			sequencer->state_ = SequencerState::kAborted;
			FailureCause cause;
			cause.kind = FailureCause::Kind::kException;
			cause.message = "non-standard exception";
			LOG(ERROR) << "Step '" << step->name << "' threw a " << cause.message;
			sequencer->Finish(RunResult::Aborted(*step, cause));
		}
	} guard{this};

	for (const Step& step : sequence_) {
		current_step_ = step.position;
		guard.step = &step;
		for (IRunObserver* observer : observers_) {
			observer->OnStepStarted(step);
		}

		auto start = std::chrono::steady_clock::now();
		StepOutcome outcome = ExecuteStep(step, context);
		auto elapsed = std::chrono::steady_clock::now() - start;

		for (IRunObserver* observer : observers_) {
			observer->OnStepFinished(step, outcome, elapsed);
		}

		if (!outcome.ok()) {
			state_ = SequencerState::kAborted;
			return Finish(RunResult::Aborted(step, outcome.cause()));
		}
	}

	state_ = SequencerState::kCompleted;
	return Finish(RunResult::Completed(sequence_.size()));
}

StepOutcome BootstrapSequencer::ExecuteStep(const Step& step, const ExecutionContext& context) {
	try {
		return step.action->Execute(context);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Step '" << step.name << "' threw: " << e.what();
		return StepOutcome::Failure(FailureCause::FromException(e));
	}
}

RunResult BootstrapSequencer::Finish(RunResult result) {
	for (IRunObserver* observer : observers_) {
		observer->OnRunFinished(result);
	}
	return result;
}

} // namespace Bootstrap
