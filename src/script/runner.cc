#include "runner.h"
#include "loop/event_loop.h"
#include "lib/log.h"
#include <utility>

namespace ienv {
namespace {
	// Puts the working directory back however the body exits
	class WorkingDirectory {
		public:
			explicit WorkingDirectory(const std::filesystem::path& directory) :
					previous{std::filesystem::current_path()} {
				std::filesystem::current_path(directory);
			}
			WorkingDirectory(const WorkingDirectory&) = delete;
			~WorkingDirectory() {
				std::error_code error;
				std::filesystem::current_path(previous, error);
				if (error) {
					Logger().error("Could not restore working directory {}: {}", previous.string(), error.message());
				}
			}
			auto operator=(const WorkingDirectory&) = delete;

		private:
			std::filesystem::path previous;
	};
}

auto InlineRunner() -> Runner {
	return [](std::function<void()> body) {
		Future<void> future;
		detail::RunForFuture(future, body);
		return future;
	};
}

auto ThreadRunner() -> Runner {
	return [](std::function<void()> body) {
		return ToThread(std::move(body));
	};
}

auto ChdirRunner(std::filesystem::path directory, Runner parent) -> Runner {
	return [ directory = std::move(directory), parent = std::move(parent) ](std::function<void()> body) {
		return parent([ directory, body = std::move(body) ]() {
			WorkingDirectory working_directory{directory};
			body();
		});
	};
}

} // namespace ienv
