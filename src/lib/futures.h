#pragma once
#include "future.h"
#include "lockable.h"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace ienv {

// Produces futures one at a time, `std::nullopt` once exhausted
template <class Type>
using FutureSource = std::function<std::optional<Future<Type>>()>;

/**
 * Pulls futures from a source ahead of the consumer. At most `prefetch` requested futures are
 * unfinished at any time, and at most `backlog` are requested but not yet handed out. `Next()` hands
 * them out in the order the source produced them.
 *
 * Once a requested future fails (or is cancelled) no further futures are requested; the ones already
 * requested are still handed out. The source is only ever called with the buffer's lock held, so it
 * need not be thread safe.
 */
template <class Type>
class FutureBuffer {
	private:
		struct Record {
			FutureSource<Type> source;
			size_t prefetch;
			size_t backlog;
			bool finished = false;
			size_t running = 0;
			size_t requested = 0;
			std::map<size_t, Future<Type>> reorder;
		};
		using State = lockable_t<Record, false, true>;

	public:
		FutureBuffer(FutureSource<Type> source, size_t prefetch, size_t backlog) :
			state{std::make_shared<State>(Record{std::move(source), prefetch, std::max(backlog, prefetch)})} {
			Refill(state);
		}
		FutureBuffer(const FutureBuffer&) = delete;
		~FutureBuffer() {
			// Futures already requested keep running but nothing new is pulled
			state->write()->finished = true;
		}
		auto operator=(const FutureBuffer&) = delete;

		// Blocks until the next future in order has been requested. `std::nullopt` at the end.
		auto Next() -> std::optional<Future<Type>> {
			std::optional<Future<Type>> next;
			{
				auto lock = state->write();
				lock.wait([&]() {
					return lock->reorder.count(handed_out) != 0 || (lock->finished && lock->reorder.empty());
				});
				auto it = lock->reorder.find(handed_out);
				if (it == lock->reorder.end()) {
					return std::nullopt;
				}
				next = std::move(it->second);
				lock->reorder.erase(it);
				++handed_out;
			}
			Refill(state);
			return next;
		}

	private:
		static void Refill(const std::shared_ptr<State>& state) {
			while (true) {
				Future<Type> future;
				{
					auto lock = state->write();
					if (lock->finished || lock->running >= lock->prefetch || lock->reorder.size() >= lock->backlog) {
						break;
					}
					auto produced = lock->source();
					if (!produced) {
						lock->finished = true;
						break;
					}
					future = *produced;
					++lock->running;
					lock->reorder.emplace(lock->requested++, future);
				}
				// Registered outside the lock, a finished future runs the callback inline
				future.AddDoneCallback([ state, future ]() { Finished(state, future); });
			}
			state->notify_all();
		}

		static void Finished(const std::shared_ptr<State>& state, const Future<Type>& future) {
			{
				auto lock = state->write();
				--lock->running;
				if (lock->finished) {
					return;
				}
				if (future.GetStatus() != Future<Type>::Status::finished) {
					lock->finished = true;
				}
			}
			Refill(state);
		}

		std::shared_ptr<State> state;
		size_t handed_out = 0;
};

/**
 * Buffers `source` through a `FutureBuffer`. A `prefetch` of 0 means one per hardware thread, and
 * `backlog` defaults to three times the prefetch.
 */
template <class Type>
auto BufferFutures(FutureSource<Type> source, size_t prefetch = 0, std::optional<size_t> backlog = std::nullopt) -> FutureBuffer<Type> {
	if (prefetch == 0) {
		prefetch = std::max<size_t>(std::thread::hardware_concurrency(), 1);
	}
	return FutureBuffer<Type>{std::move(source), prefetch, backlog.value_or(prefetch * 3)};
}

/**
 * Wraps a source of resources so each one is opened when it is handed on and closed once the
 * consumer asks for the next one (or drops the returned source). `open(resource)` produces the value
 * the consumer sees; `close(resource)` runs after the resource's future has finished. Failed
 * resources are never opened or closed.
 */
template <class Resource, class Open, class Close>
auto CloseWhenNeeded(FutureSource<Resource> source, Open open, Close close) {
	using value_t = std::invoke_result_t<Open&, const Resource&>;

	class Closer {
		public:
			Closer(FutureSource<Resource> source, Open open, Close close) :
				source{std::move(source)}, open{std::move(open)}, close{std::move(close)} {}
			Closer(const Closer&) = delete;
			~Closer() {
				CloseLast();
			}
			auto operator=(const Closer&) = delete;

			auto Next() -> std::optional<Future<value_t>> {
				CloseLast();
				auto resource = source();
				if (!resource) {
					return std::nullopt;
				}
				last = *resource;
				return resource->Then([ open = open ](const Resource& value) mutable { return open(value); });
			}

		private:
			void CloseLast() {
				if (!last) {
					return;
				}
				auto resource = *std::exchange(last, std::nullopt);
				resource.AddDoneCallback([ resource, close = close ]() mutable {
					if (resource.GetStatus() == Future<Resource>::Status::finished) {
						close(resource.Get());
					}
				});
			}

			FutureSource<Resource> source;
			Open open;
			Close close;
			std::optional<Future<Resource>> last;
	};

	auto closer = std::make_shared<Closer>(std::move(source), std::move(open), std::move(close));
	return FutureSource<value_t>{[ closer ]() { return closer->Next(); }};
}

} // namespace ienv
