#pragma once
#include "runner.h"
#include "environment/environment.h"
#include "environment/host.h"
#include "environment/policy.h"
#include "lib/future.h"
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ienv {

struct ScriptOptions {
	// Name of the module a new script binds its variables in. Ignored when loading from a script.
	std::string module = "__main__";
	// Run on the calling thread instead of a worker of the active loop
	bool run_inline = true;
	// Process working directory while the script executes
	std::optional<std::filesystem::path> working_directory;
};

/**
 * Code loaded into an environment. Nothing executes until `Run()`, `Result()` or `Await()`, and it
 * executes at most once. Scripts are always handed out as `std::shared_ptr` since work dispatched to
 * other threads keeps them alive.
 *
 * Failures of the code are reported as `ExecutionError`.
 */
class Script : public std::enable_shared_from_this<Script> {
	public:
		// Executes the script against `module` once `environment` is current
		using Body = std::function<void(HostRuntime& host, const std::shared_ptr<EnvironmentData>& environment, Module& module)>;

		// `owned` environments are disposed along with the script
		Script(Body body, std::shared_ptr<Module> module, std::shared_ptr<ManagedEnvironment> managed, Environment environment, bool owned, Runner runner);
		Script(const Script&) = delete;
		~Script() = default;
		auto operator=(const Script&) = delete;

		auto Run() -> Future<void>;
		// Runs and blocks until done
		void Result();
		// Runs and waits through the active event loop
		void Await();
		// Resolves once the script finished. Without `fallback` a missing variable is a `NameError`.
		auto GetVariable(const std::string& name, std::optional<Value> fallback = std::nullopt) -> Future<Value>;
		void Dispose();

		auto GetEnvironment() const -> Environment;
		// Null when the script runs in a bare environment
		auto GetManagedEnvironment() const -> const std::shared_ptr<ManagedEnvironment>& { return managed; }
		auto GetModule() const -> const std::shared_ptr<Module>& { return module; }
		auto Disposed() const -> bool;

	private:
		void Execute();

		Body body;
		std::shared_ptr<Module> module;
		std::shared_ptr<ManagedEnvironment> managed;
		Environment environment;
		bool owned;
		Runner runner;
		mutable std::mutex mutex;
		std::optional<Future<void>> future;
		bool disposed = false;
};

// Creates a new environment which the script owns
auto LoadCode(Code code, Policy& policy, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
// Runs in an environment owned by the caller
auto LoadCode(Code code, std::shared_ptr<ManagedEnvironment> environment, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
auto LoadCode(Code code, const Environment& environment, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
// Shares the environment and the module of `script`
auto LoadCode(Code code, const Script& script, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
// Runs in the environment which is current now
auto LoadCode(Code code, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;

// Same as `LoadCode` but reads the file at `path` when the script runs
auto LoadScript(const std::filesystem::path& path, Policy& policy, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
auto LoadScript(const std::filesystem::path& path, std::shared_ptr<ManagedEnvironment> environment, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
auto LoadScript(const std::filesystem::path& path, const Environment& environment, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
auto LoadScript(const std::filesystem::path& path, const Script& script, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;
auto LoadScript(const std::filesystem::path& path, const ScriptOptions& options = {}) -> std::shared_ptr<Script>;

} // namespace ienv
