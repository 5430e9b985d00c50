#pragma once
#include "lockable.h"
#include <any>
#include <atomic>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <utility>

namespace ienv {

/**
 * Like thread_local data, but specific to a logical task instead. A task may hop between threads
 * as it suspends and resumes; whichever thread runs it installs its context with `Scope` first.
 *
 * Every thread has an ambient context of its own which is used when no `Scope` is up. New sibling
 * tasks should start from a `Copy()` of the spawning context so that their writes stay private.
 */
class TaskContext {
	public:
		TaskContext() = default;
		TaskContext(const TaskContext&) = delete;
		~TaskContext() = default;
		auto operator=(const TaskContext&) = delete;

		// Installs a context on the current thread until the scope is destroyed
		class Scope {
			public:
				explicit Scope(std::shared_ptr<TaskContext> context);
				Scope(const Scope&) = delete;
				~Scope();
				auto operator=(const Scope&) = delete;

			private:
				std::shared_ptr<TaskContext> last;
		};

		// Allocates a key which is unique for the lifetime of the process
		static auto NewKey() -> size_t {
			return next_key++;
		}

		static auto Current() -> std::shared_ptr<TaskContext>;

		auto Copy() const -> std::shared_ptr<TaskContext>;
		auto Get(size_t key) const -> std::any;
		void Set(size_t key, std::any value);

		// Returns a callable which runs `fn` inside a copy of the calling task's context
		template <class Functor>
		static auto Bind(Functor fn) {
			return [ context = Current()->Copy(), fn = std::move(fn) ]() mutable {
				Scope scope{context};
				return fn();
			};
		}

	private:
		lockable_t<std::unordered_map<size_t, std::any>> slots;

		static std::atomic<size_t> next_key;
		static thread_local std::shared_ptr<TaskContext> current;
};

} // namespace ienv
