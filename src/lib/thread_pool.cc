#include "thread_pool.h"
#include "log.h"
#include <exception>

namespace ienv {
namespace {
	// Pool tasks report failures through their own futures; anything escaping is a bug in the task
	void RunTask(Runnable& task) {
		try {
			task.Run();
		} catch (const std::exception& error) {
			Logger().error("Uncaught exception in worker task: {}", error.what());
		}
	}
}

void thread_pool_t::exec(std::unique_ptr<Runnable> task) {
	std::lock_guard<std::mutex> lock{mutex};

	// Look for an idle thread, starting after the last one used
	thread_data_t* thread = nullptr;
	size_t offset = rr++;
	for (size_t ii = 0; ii < thread_data.size(); ++ii) {
		auto& data = thread_data[(ii + offset) % thread_data.size()];
		if (!data.busy) {
			thread = &data;
			break;
		}
	}

	if (thread == nullptr) {
		if (desired_size > thread_data.size()) {
			thread = &new_thread(lock);
		} else {
			// All threads are busy and pool is full, just run this in a new thread
			std::thread tmp_thread{[ task = std::move(task) ]() { RunTask(*task); }};
			tmp_thread.detach();
			return;
		}
	}

	thread->task = std::move(task);
	thread->busy = true;
	thread->cv.notify_one();
}

void thread_pool_t::resize(size_t size) {
	std::unique_lock<std::mutex> lock{mutex};
	desired_size = size;
	if (thread_data.size() > desired_size) {
		for (size_t ii = desired_size; ii < thread_data.size(); ++ii) {
			thread_data[ii].should_exit = true;
			thread_data[ii].cv.notify_one();
		}
		lock.unlock();
		for (size_t ii = desired_size; ii < thread_data.size(); ++ii) {
			thread_data[ii].thread.join();
		}
		lock.lock();
		thread_data.resize(desired_size);
	}
}

auto thread_pool_t::new_thread(std::lock_guard<std::mutex>& /*lock*/) -> thread_data_t& {
	thread_data.emplace_back();
	auto& data = thread_data.back();
	data.thread = std::thread{[this, &data]() {
		std::unique_lock<std::mutex> lock{mutex};
		while (!data.should_exit) {
			if (data.task == nullptr) {
				data.cv.wait(lock);
			} else {
				auto task = std::move(data.task);
				lock.unlock();
				RunTask(*task);
				task.reset();
				lock.lock();
				data.busy = false;
			}
		}
	}};
	return data;
}

} // namespace ienv
