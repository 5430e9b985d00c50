#include "policy.h"
#include "environment.h"
#include "error.h"
#include "executor.h"
#include "lib/lockable.h"
#include "lib/log.h"
#include <utility>

namespace ienv {
namespace {
	lockable_t<std::shared_ptr<ManagedPolicy>> registered_policy;

	// An empty reference was never set, an expired one points at a destroyed environment
	auto IsEmpty(const EnvironmentRef& ref) -> bool {
		const EnvironmentRef empty;
		return !ref.owner_before(empty) && !empty.owner_before(ref);
	}
}

/**
 * ManagedPolicy implementation
 */
ManagedPolicy::ManagedPolicy(HostRuntime& host, std::shared_ptr<AffinityStore> store) :
	host{host}, store{std::move(store)} {}

auto ManagedPolicy::GetCurrentEnvironment() -> std::shared_ptr<EnvironmentData> {
	// Inline sections don't touch the store at all
	auto inline_environment = Executor::GetInlineEnvironment();
	if (inline_environment && host.IsAlive(*inline_environment)) {
		return inline_environment;
	}

	std::lock_guard<std::mutex> lock{mutex};
	auto current = store->Get();
	if (IsEmpty(current)) {
		return nullptr;
	}
	auto environment = current.lock();
	if (!environment) {
		Logger().warn("Got dead environment: <released>");
		store->Clear();
		return nullptr;
	}
	if (!host.IsAlive(*environment)) {
		Logger().warn("Got dead environment: {}", environment->Describe());
		store->Clear();
		return nullptr;
	}
	return environment;
}

auto ManagedPolicy::SetEnvironment(const std::shared_ptr<EnvironmentData>& environment) -> std::shared_ptr<EnvironmentData> {
	std::lock_guard<std::mutex> lock{mutex};
	auto previous = store->Get().lock();
	if (environment && !host.IsAlive(*environment)) {
		Logger().warn("Got dead environment: {}", environment->Describe());
		store->Clear();
	} else if (environment) {
		Logger().trace("Setting environment: {}", environment->Describe());
		store->Set(environment);
	} else {
		Logger().trace("Clearing environment");
		store->Clear();
	}
	return previous;
}

auto ManagedPolicy::GetRegistered() -> std::shared_ptr<ManagedPolicy> {
	return *registered_policy.read();
}

/**
 * Policy implementation
 */
Policy::Policy(HostRuntime& host, std::shared_ptr<AffinityStore> store) :
	managed{std::make_shared<ManagedPolicy>(host, std::move(store))} {}

Policy::~Policy() {
	if (Registered()) {
		Logger().warn("Policy destroyed while still registered, unregistering it");
		try {
			Unregister();
		} catch (const std::exception& error) {
			Logger().error("Failed to unregister policy: {}", error.what());
		}
	}
}

void Policy::Register() {
	auto lock = registered_policy.write();
	if (*lock == managed) {
		throw AlreadyRegisteredError{"This policy is already registered"};
	} else if (*lock) {
		throw ConflictError{"Another policy is already registered with the host runtime"};
	}
	managed->Host().RegisterPolicy(*managed);
	*lock = managed;
	Logger().debug("Successfully registered policy with the host runtime.");
}

void Policy::Unregister() {
	auto lock = registered_policy.write();
	if (*lock != managed) {
		throw NotRegisteredError{"This policy is not registered"};
	}
	managed->Host().UnregisterPolicy();
	*lock = nullptr;
	Logger().debug("Policy cleared.");
}

auto Policy::Registered() const -> bool {
	return *registered_policy.read() == managed;
}

auto Policy::NewEnvironment() -> std::shared_ptr<ManagedEnvironment> {
	if (!Registered()) {
		throw NotRegisteredError{"Environments can only be created through a registered policy"};
	}
	auto data = managed->Host().CreateEnvironment();
	Logger().debug("Created new environment {}", data->Describe());
	return std::make_shared<ManagedEnvironment>(managed, std::move(data));
}

/**
 * Policy::Scope implementation
 */
Policy::Scope::Scope(Policy& policy) : policy{policy} {
	policy.Register();
}

Policy::Scope::~Scope() {
	try {
		policy.Unregister();
	} catch (const std::exception& error) {
		Logger().error("Policy scope could not unregister: {}", error.what());
	}
}

} // namespace ienv
