#pragma once
#include "environment/environment.h"
#include "environment/error.h"
#include "lib/future.h"
#include "lib/runnable.h"
#include "lib/task_context.h"
#include <exception>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace ienv {

/**
 * Returns a callable which runs `fn` with the environment that is current right now. The returned
 * callable may be invoked later and on any thread; it restores whatever was current there when it
 * returns or throws. A callable wrapped while no environment was current runs `fn` untouched.
 */
template <class Functor>
auto KeepEnvironment(Functor fn) {
	return [ environment = Environment::Current(), fn = std::move(fn) ]() mutable {
		std::optional<EnvironmentScope> scope;
		if (environment != Environment{}) {
			scope.emplace(environment.GetPolicy(), environment.Data());
		}
		return fn();
	};
}

namespace detail {

// Runs `fn` on behalf of `future` unless it was cancelled before starting
template <class Result, class Functor>
void RunForFuture(Future<Result>& future, Functor& fn) {
	if (!future.SetRunningOrNotifyCancel()) {
		return;
	}
	try {
		if constexpr (std::is_void<Result>::value) {
			fn();
			future.SetResult();
		} else {
			future.SetResult(fn());
		}
	} catch (...) {
		future.SetException(std::current_exception());
	}
}

/**
 * Submitted work together with its future. If an adapter destroys the work without running it the
 * future is cancelled, so nobody waits on it forever.
 */
template <class Result, class Work>
class SubmittedWork {
	public:
		SubmittedWork(Future<Result> future, Work work) : future{std::move(future)}, work{std::move(work)} {}
		SubmittedWork(SubmittedWork&& that) : future{std::exchange(that.future, std::nullopt)}, work{std::move(that.work)} {}
		SubmittedWork(const SubmittedWork&) = delete;
		~SubmittedWork() {
			if (future) {
				// No-op once the work has started
				future->Cancel();
			}
		}
		auto operator=(const SubmittedWork&) = delete;
		auto operator=(SubmittedWork&&) = delete;

		void operator()() {
			RunForFuture(*future, work);
		}

	private:
		std::optional<Future<Result>> future;
		Work work;
};

template <class Functor, class... Args>
auto BindArguments(Functor fn, Args... args) {
	return [ fn = std::move(fn), args = std::make_tuple(std::move(args)...) ]() mutable {
		return std::apply(fn, std::move(args));
	};
}

} // namespace detail

/**
 * Bridge between the library and whatever scheduler the application runs. Adapters must supply
 * `FromThreadImpl`; every other hook has a default which suits loops that are not asynchronous.
 *
 * Work handed to an adapter runs inside a copy of the submitting task's `TaskContext`, so a
 * `TaskStore` value set by the submitter is visible to the work but writes made by the work are not
 * visible to the submitter.
 */
class EventLoop {
	public:
		EventLoop() = default;
		EventLoop(const EventLoop&) = delete;
		virtual ~EventLoop() = default;
		auto operator=(const EventLoop&) = delete;

		// Runs `fn(args...)` on the loop's home thread with the caller's environment current
		template <class Functor, class... Args>
		auto FromThread(Functor fn, Args... args) {
			auto work = KeepEnvironment(detail::BindArguments(std::move(fn), std::move(args)...));
			return Submit(std::move(work), &EventLoop::FromThreadImpl);
		}

		// Runs `fn(args...)` on a worker thread. The environment is not carried over.
		template <class Functor, class... Args>
		auto ToThread(Functor fn, Args... args) {
			return Submit(detail::BindArguments(std::move(fn), std::move(args)...), &EventLoop::ToThreadImpl);
		}

		// Resolves on a later turn of the loop
		virtual auto NextCycle() -> Future<void>;

		// Called when this loop becomes, or stops being, the active loop
		virtual void Attach() {}
		virtual void Detach() {}

		// Waits for `future` in whatever way suits the loop and returns its result
		template <class Type>
		auto AwaitFuture(const Future<Type>& future) -> Type {
			AwaitReady(future);
			return WrapCancelled([&]() { return future.Get(); });
		}

		// Runs `fn`, raising cancellation the way the loop's callers expect it
		template <class Functor>
		auto WrapCancelled(Functor fn) {
			try {
				return fn();
			} catch (const Cancelled& cancelled) {
				RaiseCancelled(cancelled);
			}
		}

	protected:
		virtual void FromThreadImpl(std::unique_ptr<Runnable> task) = 0;
		// Default spawns a detached thread per task
		virtual void ToThreadImpl(std::unique_ptr<Runnable> task);
		virtual void AwaitReady(const FutureBase& future);
		[[noreturn]] virtual void RaiseCancelled(const Cancelled& cancelled);

	private:
		template <class Work>
		auto Submit(Work work, void (EventLoop::*impl)(std::unique_ptr<Runnable>)) {
			using result_t = std::invoke_result_t<Work&>;
			Future<result_t> future;
			(this->*impl)(MakeRunnable(TaskContext::Bind(detail::SubmittedWork<result_t, Work>{future, std::move(work)})));
			return future;
		}
};

/**
 * Runs everything inline on the calling thread. Used when the application has no event loop.
 */
class InlineLoop final : public EventLoop {
	public:
		auto NextCycle() -> Future<void> final;

	protected:
		void FromThreadImpl(std::unique_ptr<Runnable> task) final;
};

// Replaces the active loop. `Detach()` is called on the old one, `Attach()` on the new one.
void SetLoop(std::shared_ptr<EventLoop> loop);
// Throws `NoLoopError` if no loop is active
auto GetLoop() -> std::shared_ptr<EventLoop>;

template <class Functor, class... Args>
auto FromThread(Functor fn, Args... args) {
	return GetLoop()->FromThread(std::move(fn), std::move(args)...);
}

// Unlike `EventLoop::ToThread` this keeps the caller's environment current for `fn`
template <class Functor, class... Args>
auto ToThread(Functor fn, Args... args) {
	return GetLoop()->ToThread(KeepEnvironment(detail::BindArguments(std::move(fn), std::move(args)...)));
}

} // namespace ienv
