#pragma once
#include "environment/host.h"
#include "lib/lockable.h"
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace ienv::test {

/**
 * Host runtime for tests. Code is one statement per line:
 *
 *   let NAME = 42 | "text" | $env   binds NAME, `$env` is the current environment's description
 *   output INDEX LABEL               records LABEL as output INDEX of the current environment
 *   raise MESSAGE                    fails with a `ScriptFailure`
 *   sleep MS                         blocks the thread
 *   cwd NAME                         binds NAME to the process working directory
 *   panic                            throws a value which is not a `std::exception`
 */
class FakeRuntime final : public HostRuntime {
	public:
		auto CreateEnvironment() -> std::shared_ptr<EnvironmentData> final;
		void DestroyEnvironment(const std::shared_ptr<EnvironmentData>& environment) final;
		auto IsAlive(const EnvironmentData& environment) const -> bool final;

		void RegisterPolicy(EnvironmentPolicy& policy) final;
		void UnregisterPolicy() final;
		auto CurrentEnvironmentOfCaller() -> std::shared_ptr<EnvironmentData> final;

		auto GetOutputs() -> OutputMap final;

		auto NewModule(std::string name) -> std::shared_ptr<Module> final;
		auto Compile(const std::string& source, const std::string& filename) -> std::shared_ptr<const CompiledCode> final;
		auto RunInEnvironment(
			const std::shared_ptr<EnvironmentData>& environment,
			Module& module,
			const Code& code
		) -> OutputMap final;

		// Kills an environment behind the library's back
		void Kill(const std::shared_ptr<EnvironmentData>& environment);
		// The next `UnregisterPolicy()` throws and leaves the policy installed
		void FailNextUnregister() { fail_unregister = true; }

		auto PolicyInstalled() -> bool { return *policy.read() != nullptr; }
		auto Destroyed() const -> size_t { return destroyed; }
		auto Runs() const -> size_t { return runs; }

	private:
		lockable_t<EnvironmentPolicy*> policy{nullptr};
		std::atomic<size_t> next_id{0};
		std::atomic<size_t> destroyed{0};
		std::atomic<size_t> runs{0};
	std::atomic<bool> fail_unregister{false};
};

// Text of every output, for comparisons
auto Describe(const OutputMap& outputs) -> std::map<int, std::string>;

} // namespace ienv::test
