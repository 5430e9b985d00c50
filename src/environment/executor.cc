#include "executor.h"
#include "error.h"
#include <utility>

namespace ienv {

thread_local Executor::InlineSection* Executor::current_section = nullptr;

auto Executor::GetInlineEnvironment() -> std::shared_ptr<EnvironmentData> {
	return current_section == nullptr ? nullptr : current_section->environment;
}

/**
 * InlineSection implementation
 */
Executor::InlineSection::InlineSection(std::shared_ptr<EnvironmentData> environment) :
		last{current_section}, environment{std::move(environment)} {
	if (last != nullptr && last->environment != this->environment) {
		throw RuntimeGenericError{"Inline sections for different environments cannot be nested"};
	}
	current_section = this;
}

Executor::InlineSection::~InlineSection() {
	current_section = last;
}

} // namespace ienv
