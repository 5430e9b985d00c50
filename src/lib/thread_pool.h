#pragma once
#include "runnable.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace ienv {

/**
 * Fixed set of worker threads which each run one task at a time. Tasks submitted while every worker
 * is busy and the pool is full get a detached thread of their own instead of queueing, so a task
 * which blocks on another pool task can never deadlock the pool.
 */
class thread_pool_t {
	public:
		explicit thread_pool_t(size_t desired_size) noexcept : desired_size{desired_size} {}
		thread_pool_t(const thread_pool_t&) = delete;
		~thread_pool_t() { resize(0); }
		auto operator=(const thread_pool_t&) = delete;

		void exec(std::unique_ptr<Runnable> task);
		void resize(size_t size);

	private:
		struct thread_data_t {
			std::thread thread;
			std::condition_variable cv;
			std::unique_ptr<Runnable> task;
			bool busy = false;
			bool should_exit = false;
		};

		auto new_thread(std::lock_guard<std::mutex>& /*lock*/) -> thread_data_t&;

		size_t desired_size;
		size_t rr = 0;
		std::mutex mutex;
		std::deque<thread_data_t> thread_data;
};

} // namespace ienv
