#pragma once
#include "lib/future.h"
#include <filesystem>
#include <functional>

namespace ienv {

/**
 * A runner decides where a script body executes. It always returns a future, even when the body has
 * already finished by the time it returns.
 */
using Runner = std::function<Future<void>(std::function<void()>)>;

// Runs the body on the calling thread
auto InlineRunner() -> Runner;
// Runs the body on a worker of the active loop with the caller's environment current
auto ThreadRunner() -> Runner;

/**
 * Changes the process working directory around the body and restores it afterwards. The working
 * directory is process wide, so scripts using this must not run concurrently.
 */
auto ChdirRunner(std::filesystem::path directory, Runner parent) -> Runner;

} // namespace ienv
