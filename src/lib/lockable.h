#pragma once
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace ienv {
namespace detail {

// Shared lockables take a `std::shared_mutex` and hand out shared locks for reads
template <bool Shared>
struct mutex_for_t {
	using type = std::mutex;
	template <class Mutex>
	using read_lock_t = std::unique_lock<Mutex>;
};

template <>
struct mutex_for_t<true> {
	using type = std::shared_mutex;
	template <class Mutex>
	using read_lock_t = std::shared_lock<Mutex>;
};

// Lock + pointer semantics into the guarded resource
template <class Lockable, class Resource, class Lock>
class lock_holder_t {
	public:
		explicit lock_holder_t(Lockable& lockable, Resource& resource) :
			lockable{lockable}, resource{resource}, lock{lockable.mutex} {}

		auto operator*() const -> Resource& { return resource; }
		auto operator->() const -> Resource* { return &resource; }

		// Only instantiated for waitable lockables
		void wait() {
			lockable.cv.wait(lock);
		}

		template <class Predicate>
		void wait(Predicate predicate) {
			lockable.cv.wait(lock, std::move(predicate));
		}

	private:
		Lockable& lockable;
		Resource& resource;
		Lock lock;
};

} // namespace detail

/**
 * Holds a resource next to the mutex which guards it. `read()` and `write()` return a lock holder
 * which dereferences to the resource. Waitable lockables also carry a condition variable, and
 * their locks have `wait()`.
 */
template <class Type, bool Shared = false, bool Waitable = false>
class lockable_t {
	static_assert(!(Shared && Waitable), "Waitable lockables use an exclusive mutex");
	template <class, class, class> friend class detail::lock_holder_t;

	public:
		using mutex_t = typename detail::mutex_for_t<Shared>::type;
		using condition_variable_t = std::conditional_t<Shared, std::condition_variable_any, std::condition_variable>;

		lockable_t() = default;
		template <class... Args>
		explicit lockable_t(Args&&... args) : resource{std::forward<Args>(args)...} {}
		lockable_t(const lockable_t&) = delete;
		~lockable_t() = default;
		auto operator=(const lockable_t&) = delete;

		auto read() const {
			using lock_t = typename detail::mutex_for_t<Shared>::template read_lock_t<mutex_t>;
			return detail::lock_holder_t<const lockable_t, const Type, lock_t>{*this, resource};
		}

		auto write() {
			return detail::lock_holder_t<lockable_t, Type, std::unique_lock<mutex_t>>{*this, resource};
		}

		void notify_one() {
			static_assert(Waitable, "Lockable is not waitable");
			cv.notify_one();
		}

		void notify_all() {
			static_assert(Waitable, "Lockable is not waitable");
			cv.notify_all();
		}

	private:
		Type resource{};
		mutable mutex_t mutex;
		mutable condition_variable_t cv;
};

} // namespace ienv
