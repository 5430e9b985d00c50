#pragma once
#include "event_loop.h"
#include "environment/error.h"
#include "lib/lockable.h"
#include "lib/thread_pool.h"
#include <uv.h>
#include <cstddef>
#include <memory>
#include <queue>
#include <thread>

namespace ienv {

// A libuv status code, as raised to callers of a `UvLoop`
class UvError : public detail::RuntimeErrorWithMessage {
	public:
		explicit UvError(int code);

		auto GetCode() const -> int {
			return code;
		}

	private:
		int code;
};

/**
 * Adapter for a libuv loop owned by the application. `Attach()`, `Detach()` and `AwaitFuture()` must
 * be called on the thread which runs the loop; everything else may be called from any thread.
 * `AwaitFuture()` turns the loop itself while it waits, so it must not be called from inside a
 * libuv callback.
 */
class UvLoop final : public EventLoop {
	public:
		explicit UvLoop(uv_loop_t* loop, size_t pool_size = std::thread::hardware_concurrency() + 1);
		UvLoop(const UvLoop&) = delete;
		~UvLoop() final;
		auto operator=(const UvLoop&) = delete;

		void Attach() final;
		void Detach() final;

		auto OnLoopThread() const -> bool;

	protected:
		void FromThreadImpl(std::unique_ptr<Runnable> task) final;
		void ToThreadImpl(std::unique_ptr<Runnable> task) final;
		void AwaitReady(const FutureBase& future) final;
		[[noreturn]] void RaiseCancelled(const Cancelled& cancelled) final;

	private:
		struct Pending {
			std::queue<std::unique_ptr<Runnable>> tasks;
			uv_async_t* async = nullptr;
		};

		void Drain();
		static void RunAll(std::queue<std::unique_ptr<Runnable>>& tasks);
		void Wake();

		uv_loop_t* loop;
		std::thread::id home;
		lockable_t<Pending> pending;
		thread_pool_t pool;
};

} // namespace ienv
