#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "step.h"

namespace Bootstrap {

class ExecutionContext;

enum class SequencerState {
    kNotStarted,
    kRunning,
    kCompleted,
    kAborted
};

const char* SequencerStateName(SequencerState state);

/**
 * Terminal outcome of a run: Completed, or Aborted at exactly one step.
 */
struct RunResult {
    enum class Status { kCompleted, kAborted };

    Status status = Status::kCompleted;
    size_t steps_completed = 0;

    // Only meaningful when aborted
    size_t failed_position = 0;
    std::string failed_step;
    FailureCause cause;

    static RunResult Completed(size_t steps_completed);
    static RunResult Aborted(const Step& step, FailureCause cause);

    bool completed() const { return status == Status::kCompleted; }
    bool aborted() const { return status == Status::kAborted; }

    // Process completion signal for the invoking automation.
    int ExitCode() const;
};

/**
 * Notified of run progress in execution order. Observers never influence
 * control flow.
 */
class IRunObserver {
public:
    using Duration = std::chrono::steady_clock::duration;

    virtual ~IRunObserver() = default;

    virtual void OnRunStarted(const Sequence& sequence) = 0;
    virtual void OnStepStarted(const Step& step) = 0;
    virtual void OnStepFinished(const Step& step, const StepOutcome& outcome, Duration elapsed) = 0;
    virtual void OnRunFinished(const RunResult& result) = 0;
};

/**
 * Runs a sequence of steps in order on the calling thread and stops at the
 * first failure. No retry, no rollback: completed steps keep their effects
 * and recovery is a fresh run from the first step.
 *
 * Each instance is a single run of the state machine
 * NotStarted -> Running(i) -> Completed | Aborted(i). Rerunning means
 * constructing a new sequencer over the same Sequence.
 */
class BootstrapSequencer {
public:
    // Throws std::invalid_argument if the sequence is empty.
    explicit BootstrapSequencer(Sequence sequence);

    BootstrapSequencer(const BootstrapSequencer&) = delete;
    BootstrapSequencer& operator=(const BootstrapSequencer&) = delete;

    // Observer must outlive Run() and must not throw.
    void AddObserver(IRunObserver* observer);

    // Throws std::logic_error if this instance has already run. Exceptions
    // derived from std::exception fail the step; anything else thrown by an
    // action propagates after the run is marked Aborted and observers are told.
    RunResult Run(const ExecutionContext& context);

    SequencerState state() const { return state_; }
    // Index of the running step, or of the failing step once aborted.
    size_t current_step() const { return current_step_; }
    const Sequence& sequence() const { return sequence_; }

private:
    StepOutcome ExecuteStep(const Step& step, const ExecutionContext& context);
    RunResult Finish(RunResult result);

    Sequence sequence_;
    std::vector<IRunObserver*> observers_;
    SequencerState state_ = SequencerState::kNotStarted;
    size_t current_step_ = 0;
};

} // namespace Bootstrap
