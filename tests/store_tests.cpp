#include "environment/store.h"
#include "fake_runtime.h"
#include "lib/future.h"
#include "lib/task_context.h"
#include "test_support.h"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {
	using ienv::EnvironmentData;
	using ienv::Future;
	using ienv::TaskContext;
	using ienv::test::ExpectTrue;
	using ienv::test::FakeRuntime;
	using ienv::test::TestCase;

	bool Holds(const ienv::AffinityStore& store, const std::shared_ptr<EnvironmentData>& environment) {
		return store.Get().lock() == environment;
	}

	bool GlobalStoreIsSharedBetweenThreads() {
		FakeRuntime host;
		auto environment = host.CreateEnvironment();
		ienv::GlobalStore store;
		bool ok = ExpectTrue(store.Get().lock() == nullptr, "Fresh store is empty");
		std::thread writer{[&]() { store.Set(environment); }};
		writer.join();
		ok &= ExpectTrue(Holds(store, environment), "Value set on another thread is visible");
		store.Clear();
		ok &= ExpectTrue(store.Get().lock() == nullptr, "Clear empties the slot");
		return ok;
	}

	bool ThreadLocalStoreIsolatesThreads() {
		FakeRuntime host;
		ienv::ThreadLocalStore store;
		constexpr int kThreads = 8;
		std::vector<std::shared_ptr<EnvironmentData>> environments;
		for (int ii = 0; ii < kThreads; ++ii) {
			environments.push_back(host.CreateEnvironment());
		}
		std::atomic<int> matches{0};
		std::vector<std::thread> threads;
		for (int ii = 0; ii < kThreads; ++ii) {
			threads.emplace_back([&, ii]() {
				store.Set(environments[ii]);
				for (int jj = 0; jj < 1000; ++jj) {
					std::this_thread::yield();
					if (!Holds(store, environments[ii])) {
						return;
					}
				}
				++matches;
			});
		}
		for (auto& thread : threads) {
			thread.join();
		}
		bool ok = ExpectTrue(matches == kThreads, "Every thread reads back its own value");
		ok &= ExpectTrue(store.Get().lock() == nullptr, "Main thread never saw a value");
		return ok;
	}

	bool ThreadLocalStoresHaveSeparateSlots() {
		FakeRuntime host;
		auto environment = host.CreateEnvironment();
		ienv::ThreadLocalStore first;
		ienv::ThreadLocalStore second;
		first.Set(environment);
		bool ok = ExpectTrue(Holds(first, environment), "First store holds the value");
		ok &= ExpectTrue(second.Get().lock() == nullptr, "Second store is untouched");
		first.Clear();
		return ok;
	}

	bool DestroyedThreadLocalStoreReleasesSlot() {
		FakeRuntime host;
		auto environment = host.CreateEnvironment();
		auto before = ienv::ThreadLocalStore::SlotsOnThisThread();
		{
			ienv::ThreadLocalStore store;
			store.Set(environment);
			if (!ExpectTrue(ienv::ThreadLocalStore::SlotsOnThisThread() == before + 1, "Slot taken")) {
				return false;
			}
		}
		return ExpectTrue(ienv::ThreadLocalStore::SlotsOnThisThread() == before, "Slot released with the store");
	}

	bool ExpiredEnvironmentReadsAsEmpty() {
		FakeRuntime host;
		ienv::ThreadLocalStore store;
		auto environment = host.CreateEnvironment();
		store.Set(environment);
		environment.reset();
		bool ok = ExpectTrue(store.Get().expired(), "Released environment is expired");
		ok &= ExpectTrue(store.Get().lock() == nullptr, "Nothing is returned for it");
		store.Clear();
		return ok;
	}

	bool TaskStoreFollowsTaskAcrossThreads() {
		FakeRuntime host;
		auto environment = host.CreateEnvironment();
		auto other = host.CreateEnvironment();
		ienv::TaskStore store;
		auto task = std::make_shared<TaskContext>();
		TaskContext::Scope scope{task};
		store.Set(environment);

		// Suspend, then resume on another thread
		Future<void> resumed;
		bool seen_after_resume = false;
		resumed.AddDoneCallback([&]() {
			seen_after_resume = Holds(store, environment);
		});
		std::thread worker{[&]() {
			store.Set(other);
			resumed.SetResult();
		}};
		worker.join();

		bool ok = ExpectTrue(seen_after_resume, "Value survives resumption on another thread");
		ok &= ExpectTrue(Holds(store, environment), "Worker's own context did not leak into the task");
		store.Clear();
		return ok;
	}

	bool TaskStoreSiblingsAreIsolated() {
		FakeRuntime host;
		auto parent_environment = host.CreateEnvironment();
		ienv::TaskStore store;
		auto parent = std::make_shared<TaskContext>();
		TaskContext::Scope parent_scope{parent};
		store.Set(parent_environment);

		std::vector<std::shared_ptr<EnvironmentData>> environments{host.CreateEnvironment(), host.CreateEnvironment()};
		std::atomic<int> matches{0};
		std::vector<std::thread> siblings;
		for (size_t ii = 0; ii < environments.size(); ++ii) {
			siblings.emplace_back(TaskContext::Bind([&, ii]() {
				bool inherited = Holds(store, parent_environment);
				store.Set(environments[ii]);
				for (int jj = 0; jj < 1000; ++jj) {
					std::this_thread::yield();
				}
				if (inherited && Holds(store, environments[ii])) {
					++matches;
				}
			}));
		}
		for (auto& sibling : siblings) {
			sibling.join();
		}
		bool ok = ExpectTrue(matches == 2, "Siblings inherit the parent value and keep their own");
		ok &= ExpectTrue(Holds(store, parent_environment), "Parent is unaffected by its children");
		store.Clear();
		return ok;
	}

	bool TaskContextScopeRestores() {
		auto ambient = TaskContext::Current();
		{
			TaskContext::Scope scope{std::make_shared<TaskContext>()};
			if (TaskContext::Current() == ambient) {
				return ExpectTrue(false, "Scope installs its context");
			}
		}
		return ExpectTrue(TaskContext::Current() == ambient, "Ambient context is back after the scope");
	}

	bool TaskContextKeysAreUnique() {
		auto first = TaskContext::NewKey();
		auto second = TaskContext::NewKey();
		return ExpectTrue(first != second, "Keys are never reused");
	}
}

int main() {
	return ienv::test::RunTests({
		{"GlobalStoreIsSharedBetweenThreads", GlobalStoreIsSharedBetweenThreads},
		{"ThreadLocalStoreIsolatesThreads", ThreadLocalStoreIsolatesThreads},
		{"ThreadLocalStoresHaveSeparateSlots", ThreadLocalStoresHaveSeparateSlots},
		{"DestroyedThreadLocalStoreReleasesSlot", DestroyedThreadLocalStoreReleasesSlot},
		{"ExpiredEnvironmentReadsAsEmpty", ExpiredEnvironmentReadsAsEmpty},
		{"TaskStoreFollowsTaskAcrossThreads", TaskStoreFollowsTaskAcrossThreads},
		{"TaskStoreSiblingsAreIsolated", TaskStoreSiblingsAreIsolated},
		{"TaskContextScopeRestores", TaskContextScopeRestores},
		{"TaskContextKeysAreUnique", TaskContextKeysAreUnique},
	});
}
