#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ienv {

/**
 * Identity of one environment, owned by the host runtime. The core only ever keeps weak references
 * to these so it can notice when the host has destroyed one.
 */
class EnvironmentData {
	public:
		EnvironmentData() = default;
		EnvironmentData(const EnvironmentData&) = delete;
		virtual ~EnvironmentData() = default;
		auto operator=(const EnvironmentData&) = delete;

		virtual auto Describe() const -> std::string = 0;
};

using EnvironmentRef = std::weak_ptr<EnvironmentData>;

// Opaque record produced by code running in an environment
class Output {
	public:
		virtual ~Output() = default;
		virtual auto Describe() const -> std::string = 0;
};

using OutputMap = std::map<int, std::shared_ptr<const Output>>;

// Script variables as seen from C++
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * Binding table code executes against, like a module's globals. Not tied to an environment by the
 * core, though a host may bind it to the first environment which uses it.
 */
class Module {
	public:
		Module() = default;
		Module(const Module&) = delete;
		virtual ~Module() = default;
		auto operator=(const Module&) = delete;

		virtual auto Name() const -> const std::string& = 0;
		virtual auto Lookup(const std::string& name) const -> std::optional<Value> = 0;
		// Drops every binding
		virtual void Clear() = 0;
};

// Host specific precompiled form of a script
class CompiledCode {
	public:
		virtual ~CompiledCode() = default;
};

/**
 * Code to run: either source text with the file name used in diagnostics, or a precompiled form
 * returned by `HostRuntime::Compile`.
 */
class Code {
	public:
		Code(std::string source, std::string filename = "<script>") :
			code{std::move(source)}, filename{std::move(filename)} {}
		Code(const char* source) : Code{std::string{source}} {} // NOLINT
		Code(std::shared_ptr<const CompiledCode> compiled) : code{std::move(compiled)} {} // NOLINT

		auto IsCompiled() const -> bool {
			return std::holds_alternative<std::shared_ptr<const CompiledCode>>(code);
		}
		auto Source() const -> const std::string& { return std::get<std::string>(code); }
		auto Compiled() const -> const CompiledCode& { return *std::get<std::shared_ptr<const CompiledCode>>(code); }
		auto Filename() const -> const std::string& { return filename; }

	private:
		std::variant<std::string, std::shared_ptr<const CompiledCode>> code;
		std::string filename;
};

/**
 * Installed into the host runtime by `Policy::Register`. The host calls into this whenever it needs
 * to know which environment is current for the calling thread or task.
 */
class EnvironmentPolicy {
	public:
		virtual ~EnvironmentPolicy() = default;

		virtual auto GetCurrentEnvironment() -> std::shared_ptr<EnvironmentData> = 0;
		// Returns the environment which was current before
		virtual auto SetEnvironment(const std::shared_ptr<EnvironmentData>& environment) -> std::shared_ptr<EnvironmentData> = 0;
};

/**
 * Everything the core needs from the underlying runtime. Implementations must be thread safe; the
 * core calls them from application threads, loop threads and worker threads alike.
 */
class HostRuntime {
	public:
		HostRuntime() = default;
		HostRuntime(const HostRuntime&) = delete;
		virtual ~HostRuntime() = default;
		auto operator=(const HostRuntime&) = delete;

		virtual auto CreateEnvironment() -> std::shared_ptr<EnvironmentData> = 0;
		virtual void DestroyEnvironment(const std::shared_ptr<EnvironmentData>& environment) = 0;
		virtual auto IsAlive(const EnvironmentData& environment) const -> bool = 0;

		// Only one policy may be installed at a time
		virtual void RegisterPolicy(EnvironmentPolicy& policy) = 0;
		virtual void UnregisterPolicy() = 0;
		// Environment the installed policy reports for the caller, or nullptr
		virtual auto CurrentEnvironmentOfCaller() -> std::shared_ptr<EnvironmentData> = 0;

		// Outputs of the environment which is current for the caller
		virtual auto GetOutputs() -> OutputMap = 0;

		virtual auto NewModule(std::string name) -> std::shared_ptr<Module> = 0;
		virtual auto Compile(const std::string& source, const std::string& filename) -> std::shared_ptr<const CompiledCode> = 0;
		// Runs `code` against `module`. The caller has already made `environment` current. Failures of
		// the code itself are thrown as `ScriptFailure`.
		virtual auto RunInEnvironment(
			const std::shared_ptr<EnvironmentData>& environment,
			Module& module,
			const Code& code
		) -> OutputMap = 0;
};

} // namespace ienv
