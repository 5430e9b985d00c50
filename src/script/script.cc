#include "script.h"
#include "environment/error.h"
#include "lib/log.h"
#include "loop/event_loop.h"
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace ienv {
namespace {
	// What a script runs in, before it is built
	struct Target {
		std::shared_ptr<ManagedEnvironment> managed;
		Environment environment;
		bool owned = false;
		std::shared_ptr<Module> module;
	};

	auto MakeRunner(const ScriptOptions& options) -> Runner {
		auto runner = options.run_inline ? InlineRunner() : ThreadRunner();
		if (options.working_directory) {
			runner = ChdirRunner(*options.working_directory, std::move(runner));
		}
		return runner;
	}

	auto Load(Script::Body body, Target target, const ScriptOptions& options) -> std::shared_ptr<Script> {
		auto environment = target.managed ? target.managed->GetEnvironment() : target.environment;
		if (environment == Environment{}) {
			throw RuntimeGenericError{"There is no environment to run the script in"};
		}
		auto module = target.module ? std::move(target.module) : environment.GetPolicy()->Host().NewModule(options.module);
		return std::make_shared<Script>(
			std::move(body), std::move(module), std::move(target.managed),
			std::move(environment), target.owned, MakeRunner(options));
	}

	auto FromPolicy(Policy& policy) -> Target {
		return {policy.NewEnvironment(), {}, true, nullptr};
	}

	auto FromManaged(std::shared_ptr<ManagedEnvironment> environment) -> Target {
		return {std::move(environment), {}, false, nullptr};
	}

	auto FromEnvironment(const Environment& environment) -> Target {
		return {nullptr, environment, false, nullptr};
	}

	// Never takes over ownership of the other script's environment
	auto FromScript(const Script& script) -> Target {
		return {script.GetManagedEnvironment(), script.GetEnvironment(), false, script.GetModule()};
	}

	auto CodeBody(Code code) -> Script::Body {
		return [ code = std::move(code) ](HostRuntime& host, const std::shared_ptr<EnvironmentData>& environment, Module& module) {
			host.RunInEnvironment(environment, module, code);
		};
	}

	auto FileBody(std::filesystem::path path) -> Script::Body {
		return [ path = std::move(path) ](HostRuntime& host, const std::shared_ptr<EnvironmentData>& environment, Module& module) {
			std::ifstream file{path, std::ios::binary};
			if (!file) {
				throw std::system_error{errno, std::generic_category(), "Could not open " + path.string()};
			}
			std::ostringstream source;
			source << file.rdbuf();
			host.RunInEnvironment(environment, module, Code{source.str(), path.string()});
		};
	}
}

/**
 * Script implementation
 */
Script::Script(Body body, std::shared_ptr<Module> module, std::shared_ptr<ManagedEnvironment> managed, Environment environment, bool owned, Runner runner) :
	body{std::move(body)},
	module{std::move(module)},
	managed{std::move(managed)},
	environment{std::move(environment)},
	owned{owned},
	runner{std::move(runner)} {}

auto Script::Run() -> Future<void> {
	std::lock_guard<std::mutex> lock{mutex};
	if (disposed) {
		throw DisposedError{"Script has been disposed"};
	}
	if (!future) {
		future = runner([ self = shared_from_this() ]() { self->Execute(); });
	}
	return *future;
}

void Script::Result() {
	Run().Get();
}

void Script::Await() {
	GetLoop()->AwaitFuture(Run());
}

auto Script::GetVariable(const std::string& name, std::optional<Value> fallback) -> Future<Value> {
	if (Disposed()) {
		throw DisposedError{"Script has been disposed"};
	}
	return Run().Then([ self = shared_from_this(), name, fallback = std::move(fallback) ]() -> Value {
		auto value = self->module->Lookup(name);
		if (value) {
			return *value;
		} else if (fallback) {
			return *fallback;
		}
		throw NameError{"Script has no variable named '" + name + "'"};
	});
}

void Script::Dispose() {
	{
		std::lock_guard<std::mutex> lock{mutex};
		if (disposed) {
			return;
		}
		disposed = true;
	}
	module->Clear();
	if (owned) {
		managed->Dispose();
	}
	Logger().debug("Disposed script in module {}", module->Name());
}

auto Script::GetEnvironment() const -> Environment {
	return managed ? managed->GetEnvironment() : environment;
}

auto Script::Disposed() const -> bool {
	std::lock_guard<std::mutex> lock{mutex};
	return disposed;
}

void Script::Execute() {
	auto target = GetEnvironment();
	auto scope = target.Use();
	try {
		body(target.GetPolicy()->Host(), target.Data(), *module);
	} catch (const std::exception& error) {
		throw ExecutionError{error};
	} catch (...) {
		throw ExecutionError::Unknown();
	}
}

/**
 * Loaders
 */
auto LoadCode(Code code, Policy& policy, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(CodeBody(std::move(code)), FromPolicy(policy), options);
}

auto LoadCode(Code code, std::shared_ptr<ManagedEnvironment> environment, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(CodeBody(std::move(code)), FromManaged(std::move(environment)), options);
}

auto LoadCode(Code code, const Environment& environment, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(CodeBody(std::move(code)), FromEnvironment(environment), options);
}

auto LoadCode(Code code, const Script& script, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(CodeBody(std::move(code)), FromScript(script), options);
}

auto LoadCode(Code code, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(CodeBody(std::move(code)), FromEnvironment(Environment::Current()), options);
}

auto LoadScript(const std::filesystem::path& path, Policy& policy, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(FileBody(path), FromPolicy(policy), options);
}

auto LoadScript(const std::filesystem::path& path, std::shared_ptr<ManagedEnvironment> environment, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(FileBody(path), FromManaged(std::move(environment)), options);
}

auto LoadScript(const std::filesystem::path& path, const Environment& environment, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(FileBody(path), FromEnvironment(environment), options);
}

auto LoadScript(const std::filesystem::path& path, const Script& script, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(FileBody(path), FromScript(script), options);
}

auto LoadScript(const std::filesystem::path& path, const ScriptOptions& options) -> std::shared_ptr<Script> {
	return Load(FileBody(path), FromEnvironment(Environment::Current()), options);
}

} // namespace ienv
