#include "store.h"
#include <any>
#include <unordered_map>
#include <utility>

namespace ienv {
namespace {
	thread_local std::unordered_map<size_t, EnvironmentRef> thread_slots;
}

/**
 * GlobalStore implementation
 */
auto GlobalStore::Get() const -> EnvironmentRef {
	return current;
}

void GlobalStore::Set(EnvironmentRef environment) {
	current = std::move(environment);
}

/**
 * ThreadLocalStore implementation
 */
ThreadLocalStore::~ThreadLocalStore() {
	thread_slots.erase(key);
}

auto ThreadLocalStore::SlotsOnThisThread() -> size_t {
	return thread_slots.size();
}

auto ThreadLocalStore::Get() const -> EnvironmentRef {
	auto it = thread_slots.find(key);
	return it == thread_slots.end() ? EnvironmentRef{} : it->second;
}

void ThreadLocalStore::Set(EnvironmentRef environment) {
	if (environment.expired()) {
		thread_slots.erase(key);
	} else {
		thread_slots[key] = std::move(environment);
	}
}

/**
 * TaskStore implementation
 */
auto TaskStore::Get() const -> EnvironmentRef {
	auto value = TaskContext::Current()->Get(key);
	if (!value.has_value()) {
		return {};
	}
	return std::any_cast<EnvironmentRef>(value);
}

void TaskStore::Set(EnvironmentRef environment) {
	if (environment.expired()) {
		TaskContext::Current()->Set(key, {});
	} else {
		TaskContext::Current()->Set(key, std::move(environment));
	}
}

} // namespace ienv
