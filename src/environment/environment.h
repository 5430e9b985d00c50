#pragma once
#include "host.h"
#include "policy.h"
#include "lib/lockable.h"
#include <memory>

namespace ienv {

/**
 * Restores the previously current environment when destroyed. Scopes must be destroyed in the
 * reverse order they were created in, on the same thread (or task) which created them.
 */
class EnvironmentScope {
	public:
		EnvironmentScope(std::shared_ptr<ManagedPolicy> policy, const std::shared_ptr<EnvironmentData>& environment);
		EnvironmentScope(const EnvironmentScope&) = delete;
		~EnvironmentScope();
		auto operator=(const EnvironmentScope&) = delete;

	private:
		std::shared_ptr<ManagedPolicy> policy;
		std::shared_ptr<EnvironmentData> previous;
};

/**
 * Non-owning environment value: the policy it belongs to and a weak handle to the host's data. This
 * is what gets captured by `KeepEnvironment` and handed around between threads.
 */
class Environment {
	public:
		Environment() = default;
		Environment(std::shared_ptr<ManagedPolicy> policy, EnvironmentRef data);

		// Environment which is current for the caller, or an empty value
		static auto Current() -> Environment;

		auto Alive() const -> bool;
		explicit operator bool() const { return Alive(); }
		// Throws `DisposedError` once the environment is gone
		auto Data() const -> std::shared_ptr<EnvironmentData>;
		auto Use() const -> EnvironmentScope;
		auto GetPolicy() const -> const std::shared_ptr<ManagedPolicy>& { return policy; }

		auto operator==(const Environment& that) const -> bool;
		auto operator!=(const Environment& that) const -> bool { return !(*this == that); }

	private:
		std::shared_ptr<ManagedPolicy> policy;
		EnvironmentRef data;
};

/**
 * Owning handle to an environment created by `Policy::NewEnvironment()`. The owner must call
 * `Dispose()`; one which is destroyed undisposed is reported as a leak and disposed anyway.
 */
class ManagedEnvironment {
	public:
		ManagedEnvironment(std::shared_ptr<ManagedPolicy> policy, std::shared_ptr<EnvironmentData> data);
		ManagedEnvironment(const ManagedEnvironment&) = delete;
		~ManagedEnvironment();
		auto operator=(const ManagedEnvironment&) = delete;

		auto GetEnvironment() const -> Environment;
		auto Outputs() const -> OutputMap;
		// Makes this environment current. Nothing is restored afterwards.
		void Switch() const;
		auto Use() const -> EnvironmentScope;
		void Dispose();
		auto Disposed() const -> bool;

	private:
		auto Checked() const -> std::shared_ptr<EnvironmentData>;

		std::shared_ptr<ManagedPolicy> policy;
		lockable_t<std::shared_ptr<EnvironmentData>> data;
};

} // namespace ienv
