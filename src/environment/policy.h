#pragma once
#include "host.h"
#include "store.h"
#include <memory>
#include <mutex>

namespace ienv {

class ManagedEnvironment;

/**
 * The dispatcher which is actually installed into the host runtime. It resolves "current" through
 * the inline section of the calling thread first and the affinity store second, and drops
 * environments the host has already destroyed.
 */
class ManagedPolicy final : public EnvironmentPolicy {
	public:
		ManagedPolicy(HostRuntime& host, std::shared_ptr<AffinityStore> store);
		ManagedPolicy(const ManagedPolicy&) = delete;
		~ManagedPolicy() final = default;
		auto operator=(const ManagedPolicy&) = delete;

		auto GetCurrentEnvironment() -> std::shared_ptr<EnvironmentData> final;
		auto SetEnvironment(const std::shared_ptr<EnvironmentData>& environment) -> std::shared_ptr<EnvironmentData> final;

		auto Host() const -> HostRuntime& { return host; }
		auto Store() const -> AffinityStore& { return *store; }

		// The policy which is registered process wide, or nullptr
		static auto GetRegistered() -> std::shared_ptr<ManagedPolicy>;

	private:
		HostRuntime& host;
		std::shared_ptr<AffinityStore> store;
		std::mutex mutex;
};

/**
 * Owns the registration of one `ManagedPolicy` with the host runtime. Only one policy may be
 * registered in the process at a time. The host runtime must outlive the policy and every
 * environment created through it.
 */
class Policy {
	public:
		Policy(HostRuntime& host, std::shared_ptr<AffinityStore> store);
		Policy(const Policy&) = delete;
		~Policy();
		auto operator=(const Policy&) = delete;

		// Registers on construction, unregisters on destruction
		class Scope {
			public:
				explicit Scope(Policy& policy);
				Scope(const Scope&) = delete;
				~Scope();
				auto operator=(const Scope&) = delete;

			private:
				Policy& policy;
		};

		void Register();
		void Unregister();
		auto Registered() const -> bool;

		/**
		 * Creates a new environment in the host runtime. The caller owns it and must `Dispose()` it.
		 * The new environment is not made current.
		 */
		auto NewEnvironment() -> std::shared_ptr<ManagedEnvironment>;

		auto Host() const -> HostRuntime& { return managed->Host(); }
		auto Managed() const -> const std::shared_ptr<ManagedPolicy>& { return managed; }

	private:
		std::shared_ptr<ManagedPolicy> managed;
};

} // namespace ienv
