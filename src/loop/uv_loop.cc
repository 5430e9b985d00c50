#include "uv_loop.h"
#include "lib/log.h"
#include <string>
#include <utility>

namespace ienv {
namespace {
	auto AsHandle(uv_async_t* async) -> uv_handle_t* {
		return reinterpret_cast<uv_handle_t*>(async);
	}
}

/**
 * UvError implementation
 */
UvError::UvError(int code) :
	RuntimeErrorWithMessage{std::string{uv_err_name(code)} + ": " + uv_strerror(code)},
	code{code} {}

/**
 * UvLoop implementation
 */
UvLoop::UvLoop(uv_loop_t* loop, size_t pool_size) : loop{loop}, pool{pool_size} {}

UvLoop::~UvLoop() {
	auto dropped = [&]() {
		auto lock = pending.write();
		if (lock->async != nullptr) {
			// The handle can only be closed from the loop thread
			Logger().error("UvLoop destroyed while still attached, the async handle is leaked");
		}
		return std::exchange(lock->tasks, {});
	}();
	if (!dropped.empty()) {
		Logger().warn("UvLoop destroyed with {} queued tasks, cancelling them", dropped.size());
	}
}

void UvLoop::Attach() {
	auto lock = pending.write();
	if (lock->async != nullptr) {
		throw RuntimeGenericError{"UvLoop is already attached"};
	}
	auto* async = new uv_async_t;
	int status = uv_async_init(loop, async, [](uv_async_t* async) {
		static_cast<UvLoop*>(async->data)->Drain();
	});
	if (status != 0) {
		delete async;
		throw UvError{status};
	}
	async->data = this;
	// The application decides how long the loop lives, queued work doesn't keep it alive
	uv_unref(AsHandle(async));
	home = std::this_thread::get_id();
	lock->async = async;
}

void UvLoop::Detach() {
	if (!OnLoopThread()) {
		throw RuntimeGenericError{"UvLoop must be detached on the loop thread"};
	}
	// Run everything queued, including work queued by the drained tasks. The handle is released under
	// the same lock that observed the empty queue so nothing can be queued behind it.
	uv_async_t* async = nullptr;
	while (true) {
		auto tasks = [&]() {
			auto lock = pending.write();
			if (lock->tasks.empty()) {
				async = std::exchange(lock->async, nullptr);
			}
			return std::exchange(lock->tasks, {});
		}();
		if (tasks.empty()) {
			break;
		}
		RunAll(tasks);
	}
	if (async != nullptr) {
		uv_close(AsHandle(async), [](uv_handle_t* handle) {
			delete reinterpret_cast<uv_async_t*>(handle);
		});
	}
}

auto UvLoop::OnLoopThread() const -> bool {
	return std::this_thread::get_id() == home;
}

void UvLoop::FromThreadImpl(std::unique_ptr<Runnable> task) {
	auto lock = pending.write();
	if (lock->async == nullptr) {
		throw RuntimeGenericError{"UvLoop is not attached"};
	}
	lock->tasks.push(std::move(task));
	uv_async_send(lock->async);
}

void UvLoop::ToThreadImpl(std::unique_ptr<Runnable> task) {
	pool.exec(std::move(task));
}

void UvLoop::AwaitReady(const FutureBase& future) {
	uv_async_t* async = pending.read()->async;
	if (async == nullptr || !OnLoopThread()) {
		future.Wait();
		return;
	}
	uv_ref(AsHandle(async));
	future.AddDoneCallback([this]() { Wake(); });
	while (!future.Done()) {
		uv_run(loop, UV_RUN_ONCE);
	}
	uv_unref(AsHandle(async));
}

void UvLoop::RaiseCancelled(const Cancelled& /*cancelled*/) {
	throw UvError{UV_ECANCELED};
}

void UvLoop::Drain() {
	auto tasks = [&]() {
		auto lock = pending.write();
		return std::exchange(lock->tasks, {});
	}();
	RunAll(tasks);
}

void UvLoop::RunAll(std::queue<std::unique_ptr<Runnable>>& tasks) {
	while (!tasks.empty()) {
		auto task = std::move(tasks.front());
		tasks.pop();
		task->Run();
	}
}

void UvLoop::Wake() {
	auto lock = pending.write();
	if (lock->async != nullptr) {
		uv_async_send(lock->async);
	}
}

} // namespace ienv
