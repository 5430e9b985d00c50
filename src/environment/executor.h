#pragma once
#include "host.h"
#include <memory>

namespace ienv {

/**
 * Executor tracks inline sections on the current thread. An inline section makes the policy report
 * an environment as current without writing to the affinity store, so the switch is invisible to
 * everything outside the section.
 *
 * Rules: don't suspend or hand work to other threads inside a section, and don't open a section for
 * a different environment inside another one.
 */
class Executor {
	public:
		class InlineSection {
			public:
				explicit InlineSection(std::shared_ptr<EnvironmentData> environment);
				InlineSection(const InlineSection&) = delete;
				~InlineSection();
				auto operator=(const InlineSection&) = delete;

			private:
				InlineSection* last;
				std::shared_ptr<EnvironmentData> environment;
				friend Executor;
		};

		static auto GetInlineEnvironment() -> std::shared_ptr<EnvironmentData>;

	private:
		static thread_local InlineSection* current_section;
};

} // namespace ienv
