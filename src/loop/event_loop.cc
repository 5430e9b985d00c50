#include "event_loop.h"
#include "lib/lockable.h"
#include "lib/log.h"
#include <thread>

namespace ienv {
namespace {
	lockable_t<std::shared_ptr<EventLoop>> active_loop;
}

/**
 * EventLoop implementation
 */
auto EventLoop::NextCycle() -> Future<void> {
	return FromThread([]() {});
}

void EventLoop::ToThreadImpl(std::unique_ptr<Runnable> task) {
	std::thread thread{[ task = std::move(task) ]() { task->Run(); }};
	thread.detach();
}

void EventLoop::AwaitReady(const FutureBase& future) {
	future.Wait();
}

void EventLoop::RaiseCancelled(const Cancelled& cancelled) {
	throw cancelled;
}

/**
 * InlineLoop implementation
 */
auto InlineLoop::NextCycle() -> Future<void> {
	return Future<void>::Resolved();
}

void InlineLoop::FromThreadImpl(std::unique_ptr<Runnable> task) {
	task->Run();
}

/**
 * Active loop
 */
void SetLoop(std::shared_ptr<EventLoop> loop) {
	// Hooks run outside the lock, work drained by `Detach()` may look up the active loop
	auto previous = std::exchange(*active_loop.write(), loop);
	if (previous) {
		Logger().debug("Detaching previous event loop");
		previous->Detach();
	}
	if (loop) {
		try {
			loop->Attach();
		} catch (...) {
			auto lock = active_loop.write();
			if (*lock == loop) {
				*lock = nullptr;
			}
			throw;
		}
		Logger().debug("Attached new event loop");
	}
}

auto GetLoop() -> std::shared_ptr<EventLoop> {
	auto loop = *active_loop.read();
	if (!loop) {
		throw NoLoopError{"No event loop is active"};
	}
	return loop;
}

} // namespace ienv
