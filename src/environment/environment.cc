#include "environment.h"
#include "error.h"
#include "executor.h"
#include "lib/log.h"
#include <utility>

namespace ienv {

/**
 * EnvironmentScope implementation
 */
EnvironmentScope::EnvironmentScope(std::shared_ptr<ManagedPolicy> policy, const std::shared_ptr<EnvironmentData>& environment) :
	policy{std::move(policy)} {
	previous = this->policy->SetEnvironment(environment);
}

EnvironmentScope::~EnvironmentScope() {
	policy->SetEnvironment(previous);
}

/**
 * Environment implementation
 */
Environment::Environment(std::shared_ptr<ManagedPolicy> policy, EnvironmentRef data) :
	policy{std::move(policy)}, data{std::move(data)} {}

auto Environment::Current() -> Environment {
	auto policy = ManagedPolicy::GetRegistered();
	if (!policy) {
		return {};
	}
	auto current = policy->GetCurrentEnvironment();
	if (!current) {
		return {};
	}
	return {std::move(policy), current};
}

auto Environment::Alive() const -> bool {
	auto environment = data.lock();
	return environment && policy && policy->Host().IsAlive(*environment);
}

auto Environment::Data() const -> std::shared_ptr<EnvironmentData> {
	auto environment = data.lock();
	if (!environment || !policy || !policy->Host().IsAlive(*environment)) {
		throw DisposedError{"Environment has been disposed"};
	}
	return environment;
}

auto Environment::Use() const -> EnvironmentScope {
	return {policy, Data()};
}

auto Environment::operator==(const Environment& that) const -> bool {
	return policy == that.policy && !data.owner_before(that.data) && !that.data.owner_before(data);
}

/**
 * ManagedEnvironment implementation
 */
ManagedEnvironment::ManagedEnvironment(std::shared_ptr<ManagedPolicy> policy, std::shared_ptr<EnvironmentData> data) :
	policy{std::move(policy)}, data{std::move(data)} {}

ManagedEnvironment::~ManagedEnvironment() {
	if (!Disposed()) {
		Logger().warn("Leaked environment {}, disposing it", (*data.read())->Describe());
		try {
			Dispose();
		} catch (const std::exception& error) {
			Logger().error("Failed to dispose leaked environment: {}", error.what());
		}
	}
}

auto ManagedEnvironment::Checked() const -> std::shared_ptr<EnvironmentData> {
	auto environment = *data.read();
	if (!environment) {
		throw DisposedError{"Environment has been disposed"};
	}
	return environment;
}

auto ManagedEnvironment::GetEnvironment() const -> Environment {
	return {policy, Checked()};
}

auto ManagedEnvironment::Outputs() const -> OutputMap {
	auto environment = Checked();
	Executor::InlineSection section{environment};
	return policy->Host().GetOutputs();
}

void ManagedEnvironment::Switch() const {
	policy->SetEnvironment(Checked());
}

auto ManagedEnvironment::Use() const -> EnvironmentScope {
	return {policy, Checked()};
}

void ManagedEnvironment::Dispose() {
	auto environment = std::exchange(*data.write(), nullptr);
	if (environment) {
		Logger().debug("Disposing environment {}", environment->Describe());
		policy->Host().DestroyEnvironment(environment);
	}
}

auto ManagedEnvironment::Disposed() const -> bool {
	return *data.read() == nullptr;
}

} // namespace ienv
