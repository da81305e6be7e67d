#include "step.h"

#include <cstring>
#include <stdexcept>

namespace Bootstrap {

FailureCause FailureCause::Reported(std::string message) {
	FailureCause cause;
	cause.kind = Kind::kReported;
	cause.message = std::move(message);
	return cause;
}

FailureCause FailureCause::FromException(const std::exception& e) {
	FailureCause cause;
	cause.kind = Kind::kException;
	cause.message = e.what();
	return cause;
}

std::string FailureCause::ToString() const {
	std::string text;
	switch (kind) {
		case Kind::kReported:
			return message;
		case Kind::kExitStatus:
			text = "exit status " + std::to_string(exit_code);
			break;
		case Kind::kSignal: {
			const char* name = strsignal(signal);
			text = "killed by signal " + std::to_string(signal);
			if (name) {
				text += std::string(" (") + name + ")";
			}
			break;
		}
		case Kind::kSpawnError:
			text = "failed to start";
			break;
		case Kind::kException:
			text = "exception";
			break;
	}
	if (!message.empty()) {
		text += ": " + message;
	}
	return text;
}

Sequence& Sequence::Append(std::string name, std::shared_ptr<IStepAction> action) {
	if (!action) {
		throw std::invalid_argument("Step '" + name + "' has no action");
	}
	Step step;
	step.name = std::move(name);
	step.action = std::move(action);
	step.position = steps_.size();
	steps_.push_back(std::move(step));
	return *this;
}

} // namespace Bootstrap
