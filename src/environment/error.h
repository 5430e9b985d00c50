#pragma once
#include <exception>
#include <string>
#include <utility>

namespace ienv {

/**
 * Every error raised by this library derives from `RuntimeError`
 */
class RuntimeError : public std::exception {};

namespace detail {

// `RuntimeErrorWithMessage` is a general error that has an error message with it
class RuntimeErrorWithMessage : public RuntimeError {
	public:
		explicit RuntimeErrorWithMessage(std::string message) : message{std::move(message)} {}

		auto GetMessage() const -> const std::string& {
			return message;
		}

		auto what() const noexcept -> const char* final {
			return message.c_str();
		}

	private:
		std::string message;
};

} // namespace detail

// Catch-all for misuse which has no more specific type
class RuntimeGenericError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// Operation on a disposed environment or script
class DisposedError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// Policy registration misuse
class AlreadyRegisteredError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

class NotRegisteredError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

class ConflictError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// A script variable was requested which does not exist
class NameError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// An operation needed the active event loop but none was set
class NoLoopError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// The awaited operation was cancelled before it could finish
class Cancelled : public detail::RuntimeErrorWithMessage {
	public:
		Cancelled() : RuntimeErrorWithMessage{"The operation was cancelled"} {}
		using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

/**
 * Thrown by host runtimes when user code fails. `stack_trace` is host formatted and may be empty.
 */
class ScriptFailure : public detail::RuntimeErrorWithMessage {
	public:
		explicit ScriptFailure(std::string message, std::string stack_trace = {}) :
			RuntimeErrorWithMessage{std::move(message)}, stack_trace{std::move(stack_trace)} {}

		auto GetStackTrace() const -> const std::string& {
			return stack_trace;
		}

	private:
		std::string stack_trace;
};

/**
 * Wraps any failure raised while a script executes. The message carries the formatted diagnostic of
 * the original error, so callers only ever have to handle this one type.
 */
class ExecutionError : public detail::RuntimeErrorWithMessage {
	public:
		explicit ExecutionError(const std::exception& error);
		// For failures which are not a `std::exception`
		static auto Unknown() -> ExecutionError;

		// Message and (for `ScriptFailure`) stack of the original error
		static auto ExtractTraceback(const std::exception& error) -> std::string;

		auto GetDiagnostic() const -> const std::string& {
			return diagnostic;
		}

	private:
		explicit ExecutionError(std::string diagnostic);

		std::string diagnostic;
};

} // namespace ienv
