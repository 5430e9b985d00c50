#pragma once
#include "lockable.h"
#include "log.h"
#include "task_context.h"
#include "environment/error.h"
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ienv {

/**
 * Type erased view of a `Future<T>`, used by event loops which only need to know when a future
 * completes.
 */
class FutureBase {
	public:
		FutureBase() = default;
		FutureBase(const FutureBase&) = default;
		virtual ~FutureBase() = default;
		auto operator=(const FutureBase&) -> FutureBase& = default;

		virtual auto Done() const -> bool = 0;
		virtual void Wait() const = 0;
		virtual void AddDoneCallback(std::function<void()> callback) const = 0;
};

/**
 * Result handle for work which may run on another thread. Copies share one state. The state moves
 * `pending -> running -> finished | failed`, or `pending -> cancelled` if `Cancel()` wins the race
 * against whoever is about to run the work.
 *
 * Done callbacks resume inside the `TaskContext` which registered them, on the thread which
 * completes the future (or inline when it already has).
 */
template <class Type>
class Future final : public FutureBase {
	public:
		enum class Status { pending, running, finished, failed, cancelled };

	private:
		using value_t = std::conditional_t<std::is_void<Type>::value, std::monostate, std::optional<Type>>;

		struct Record {
			Status status = Status::pending;
			value_t value;
			std::exception_ptr error;
			std::vector<std::function<void()>> callbacks;
		};
		using State = lockable_t<Record, false, true>;

		static auto IsDone(Status status) -> bool {
			return status == Status::finished || status == Status::failed || status == Status::cancelled;
		}

	public:
		Future() : state{std::make_shared<State>()} {}

		static auto Resolved() -> Future {
			Future future;
			future.SetResult();
			return future;
		}

		template <class Value>
		static auto Resolved(Value&& value) -> Future {
			Future future;
			future.SetResult(std::forward<Value>(value));
			return future;
		}

		static auto Rejected(std::exception_ptr error) -> Future {
			Future future;
			future.SetException(std::move(error));
			return future;
		}

		auto GetStatus() const -> Status {
			return state->read()->status;
		}

		auto Done() const -> bool final {
			return IsDone(GetStatus());
		}

		auto IsCancelled() const -> bool {
			return GetStatus() == Status::cancelled;
		}

		// Cancels the future if the work has not started yet
		auto Cancel() -> bool {
			{
				auto lock = state->write();
				if (lock->status == Status::cancelled) {
					return true;
				} else if (lock->status != Status::pending) {
					return false;
				}
				lock->status = Status::cancelled;
			}
			Complete();
			return true;
		}

		// Called by the runner right before the work starts. Returns false if the future was cancelled
		// in which case the work must be skipped.
		auto SetRunningOrNotifyCancel() -> bool {
			auto lock = state->write();
			if (lock->status == Status::cancelled) {
				return false;
			} else if (lock->status != Status::pending) {
				throw RuntimeGenericError{"Future is already running or done"};
			}
			lock->status = Status::running;
			return true;
		}

		template <class Value = Type, std::enable_if_t<!std::is_void<Value>::value, int> = 0>
		void SetResult(Value value) {
			{
				auto lock = Settle();
				lock->value = std::move(value);
				lock->status = Status::finished;
			}
			Complete();
		}

		template <class Value = Type, std::enable_if_t<std::is_void<Value>::value, int> = 0>
		void SetResult() {
			Settle()->status = Status::finished;
			Complete();
		}

		void SetException(std::exception_ptr error) {
			{
				auto lock = Settle();
				lock->error = std::move(error);
				lock->status = Status::failed;
			}
			Complete();
		}

		void Wait() const final {
			auto lock = state->read();
			lock.wait([&]() { return IsDone(lock->status); });
		}

		// Blocks until the future is done. Rethrows the failure, or `Cancelled`.
		auto Get() const -> Type {
			Wait();
			auto lock = state->read();
			if (lock->status == Status::cancelled) {
				throw Cancelled{};
			} else if (lock->status == Status::failed) {
				std::rethrow_exception(lock->error);
			}
			if constexpr (std::is_void<Type>::value) {
				return;
			} else {
				return *lock->value;
			}
		}

		void AddDoneCallback(std::function<void()> callback) const final {
			auto resume = [ context = TaskContext::Current(), callback = std::move(callback) ]() {
				TaskContext::Scope scope{context};
				callback();
			};
			{
				auto lock = state->write();
				if (!IsDone(lock->status)) {
					lock->callbacks.emplace_back(std::move(resume));
					return;
				}
			}
			resume();
		}

		/**
		 * Returns a future for `fn(value)` which runs once this one finishes. Failures and cancellation
		 * of this future propagate without invoking `fn`.
		 */
		template <class Functor>
		auto Then(Functor fn) const {
			using result_t = std::conditional_t<std::is_void<Type>::value,
				std::invoke_result<Functor>,
				std::invoke_result<Functor, Type>>;
			using next_t = typename result_t::type;
			Future<next_t> next;
			AddDoneCallback([ self = *this, next, fn = std::move(fn) ]() mutable {
				try {
					if constexpr (std::is_void<Type>::value && std::is_void<next_t>::value) {
						self.Get();
						fn();
						next.SetResult();
					} else if constexpr (std::is_void<Type>::value) {
						self.Get();
						next.SetResult(fn());
					} else if constexpr (std::is_void<next_t>::value) {
						fn(self.Get());
						next.SetResult();
					} else {
						next.SetResult(fn(self.Get()));
					}
				} catch (const Cancelled&) {
					if (self.IsCancelled()) {
						next.Cancel();
					} else {
						next.SetException(std::current_exception());
					}
				} catch (...) {
					next.SetException(std::current_exception());
				}
			});
			return next;
		}

	private:
		auto Settle() {
			auto lock = state->write();
			if (IsDone(lock->status)) {
				throw RuntimeGenericError{"Future is already done"};
			}
			return lock;
		}

		void Complete() {
			auto callbacks = [&]() {
				auto lock = state->write();
				return std::exchange(lock->callbacks, {});
			}();
			state->notify_all();
			// A failing observer must not starve the ones after it
			for (auto& callback : callbacks) {
				try {
					callback();
				} catch (const std::exception& error) {
					Logger().error("Uncaught exception in future callback: {}", error.what());
				}
			}
		}

		std::shared_ptr<State> state;
};

} // namespace ienv
