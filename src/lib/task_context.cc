#include "task_context.h"

namespace ienv {

std::atomic<size_t> TaskContext::next_key{0};
thread_local std::shared_ptr<TaskContext> TaskContext::current;

auto TaskContext::Current() -> std::shared_ptr<TaskContext> {
	if (!current) {
		current = std::make_shared<TaskContext>();
	}
	return current;
}

auto TaskContext::Copy() const -> std::shared_ptr<TaskContext> {
	auto copy = std::make_shared<TaskContext>();
	*copy->slots.write() = *slots.read();
	return copy;
}

auto TaskContext::Get(size_t key) const -> std::any {
	auto lock = slots.read();
	auto it = lock->find(key);
	return it == lock->end() ? std::any{} : it->second;
}

void TaskContext::Set(size_t key, std::any value) {
	auto lock = slots.write();
	if (value.has_value()) {
		(*lock)[key] = std::move(value);
	} else {
		lock->erase(key);
	}
}

/**
 * Scope implementation
 */
TaskContext::Scope::Scope(std::shared_ptr<TaskContext> context) : last{std::exchange(current, std::move(context))} {}

TaskContext::Scope::~Scope() {
	current = std::move(last);
}

} // namespace ienv
