#pragma once
#include "environment/host.h"
#include "lib/lockable.h"
#include <v8.h>
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace ienv {

struct V8RuntimeOptions {
	// Old generation heap limit of each environment
	size_t memory_limit_in_mb = 128;
};

/**
 * `HostRuntime` backed by V8. Every environment is a separate isolate and scripts are JavaScript.
 * Code records outputs with the global `setOutput(index, value)`, which stores `String(value)` in
 * whatever environment the registered policy reports as current.
 *
 * A module is bound to a context in the first environment that runs code in it. Running it in
 * another environment afterwards fails until the module is cleared.
 */
class V8Runtime final : public HostRuntime {
	public:
		explicit V8Runtime(V8RuntimeOptions options = {});
		V8Runtime(const V8Runtime&) = delete;
		~V8Runtime() final = default;
		auto operator=(const V8Runtime&) = delete;

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

	private:
		auto NewIsolate() -> v8::Isolate*;
		static void SetOutput(const v8::FunctionCallbackInfo<v8::Value>& info);

		V8RuntimeOptions options;
		std::shared_ptr<v8::ArrayBuffer::Allocator> allocator;
		lockable_t<EnvironmentPolicy*> policy{nullptr};
		std::atomic<size_t> next_environment_id{0};
};

} // namespace ienv
