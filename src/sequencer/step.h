#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace Bootstrap {

class ExecutionContext;

/**
 * Diagnostic payload of a failed step, forwarded unchanged from the
 * collaborator that produced it.
 */
struct FailureCause {
    enum class Kind {
        kReported,    // Action returned a failure with its own message
        kExitStatus,  // Child process exited non-zero
        kSignal,      // Child process was killed by a signal
        kSpawnError,  // Child process could not be started
        kException    // Action threw
    };

    Kind kind = Kind::kReported;
    int exit_code = 0;
    int signal = 0;
    std::string message;

    static FailureCause Reported(std::string message);
    static FailureCause FromException(const std::exception& e);

    std::string ToString() const;
};

/**
 * Binary result of one step action
 */
class StepOutcome {
public:
    static StepOutcome Success() { return StepOutcome(true, FailureCause{}); }
    static StepOutcome Failure(FailureCause cause) { return StepOutcome(false, std::move(cause)); }

    bool ok() const { return ok_; }
    const FailureCause& cause() const { return cause_; }

private:
    StepOutcome(bool ok, FailureCause cause) : ok_(ok), cause_(std::move(cause)) {}

    bool ok_;
    FailureCause cause_;
};

/**
 * Interface for the collaborator a step delegates to. Implementations must be
 * idempotent: a whole sequence is rerun from the top after any failure.
 */
class IStepAction {
public:
    virtual ~IStepAction() = default;

    virtual StepOutcome Execute(const ExecutionContext& context) = 0;

    // Human readable form for logs and dry-run plans, e.g. the command line.
    virtual std::string Describe() const = 0;
};

struct Step {
    std::string name;
    std::shared_ptr<IStepAction> action;
    size_t position = 0;
};

/**
 * Ordered list of steps fixed at configuration time. Positions are assigned
 * on Append and never change.
 */
class Sequence {
public:
    using const_iterator = std::vector<Step>::const_iterator;

    Sequence& Append(std::string name, std::shared_ptr<IStepAction> action);

    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }
    const Step& at(size_t position) const { return steps_.at(position); }
    const_iterator begin() const { return steps_.begin(); }
    const_iterator end() const { return steps_.end(); }

private:
    std::vector<Step> steps_;
};

} // namespace Bootstrap
