#pragma once
#include "host.h"
#include "lib/task_context.h"
#include <cstddef>

namespace ienv {

/**
 * Affinity stores record which environment is current. They differ in the scope one value applies
 * to. A store never restores a previous value by itself; `EnvironmentScope` does that.
 */
class AffinityStore {
	public:
		AffinityStore() = default;
		AffinityStore(const AffinityStore&) = delete;
		virtual ~AffinityStore() = default;
		auto operator=(const AffinityStore&) = delete;

		virtual auto Get() const -> EnvironmentRef = 0;
		virtual void Set(EnvironmentRef environment) = 0;

		void Clear() {
			Set({});
		}
};

/**
 * One slot for the whole process. Use this if you only ever run one environment at a time. Writes
 * from multiple threads need external locking; `ManagedPolicy` provides it for its own calls.
 */
class GlobalStore final : public AffinityStore {
	public:
		auto Get() const -> EnvironmentRef final;
		void Set(EnvironmentRef environment) final;

	private:
		EnvironmentRef current;
};

/**
 * One slot per thread. A value set on one thread is never visible on another.
 *
 * Destroying a store releases its slot on the destroying thread only. Slots it left on other threads
 * stay until those threads clear them or exit; create long lived stores rather than one per policy
 * reload when many threads are involved.
 */
class ThreadLocalStore final : public AffinityStore {
	public:
		ThreadLocalStore() = default;
		ThreadLocalStore(const ThreadLocalStore&) = delete;
		~ThreadLocalStore() final;
		auto operator=(const ThreadLocalStore&) = delete;

		auto Get() const -> EnvironmentRef final;
		void Set(EnvironmentRef environment) final;

		// Number of slots any store holds on the calling thread
		static auto SlotsOnThisThread() -> size_t;

	private:
		size_t key{TaskContext::NewKey()};
};

/**
 * One slot per logical task. The value follows the task across suspension points and threads
 * (futures and loop adapters carry the `TaskContext` along) while sibling tasks each work on their
 * own copy.
 *
 * Reuse one instance between successive policies; values written through an old instance stay in
 * the task contexts which saw them.
 */
class TaskStore final : public AffinityStore {
	public:
		auto Get() const -> EnvironmentRef final;
		void Set(EnvironmentRef environment) final;

	private:
		size_t key{TaskContext::NewKey()};
};

} // namespace ienv
