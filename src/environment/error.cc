#include "error.h"
#include <sstream>

namespace ienv {

/**
 * ExecutionError implementation
 */
ExecutionError::ExecutionError(const std::exception& error) : ExecutionError{ExtractTraceback(error)} {}

auto ExecutionError::Unknown() -> ExecutionError {
	return ExecutionError{std::string{"unknown exception"}};
}

ExecutionError::ExecutionError(std::string diagnostic) :
	RuntimeErrorWithMessage{[&]() {
		// Indent the original diagnostic so it reads as a nested report
		std::ostringstream message;
		message << "An exception was raised while running the script.\n";
		std::istringstream lines{diagnostic};
		std::string line;
		while (std::getline(lines, line)) {
			message << "| " << line << '\n';
		}
		return message.str();
	}()},
	diagnostic{std::move(diagnostic)} {}

auto ExecutionError::ExtractTraceback(const std::exception& error) -> std::string {
	const auto* failure = dynamic_cast<const ScriptFailure*>(&error);
	if (failure == nullptr || failure->GetStackTrace().empty()) {
		return error.what();
	}
	return failure->GetMessage() + '\n' + failure->GetStackTrace();
}

} // namespace ienv
