#pragma once
#include <memory>
#include <utility>

namespace ienv {

/**
 * A unit of work handed between threads. Adapters own these until they run them, and may drop them
 * without running them (for instance a loop which was destroyed). Work submitted through an
 * `EventLoop` cancels its future when dropped.
 */
class Runnable {
	public:
		Runnable() = default;
		Runnable(const Runnable&) = delete;
		virtual ~Runnable() = default;
		auto operator=(const Runnable&) = delete;

		virtual void Run() = 0;
};

namespace detail {

template <class Functor>
class FunctorRunnable final : public Runnable {
	public:
		explicit FunctorRunnable(Functor fn) : fn{std::move(fn)} {}
		void Run() final { fn(); }

	private:
		Functor fn;
};

} // namespace detail

template <class Functor>
auto MakeRunnable(Functor fn) -> std::unique_ptr<Runnable> {
	return std::make_unique<detail::FunctorRunnable<Functor>>(std::move(fn));
}

} // namespace ienv
