#include "fake_runtime.h"
#include "environment/error.h"
#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace ienv::test {
namespace {

class FakeEnvironment final : public EnvironmentData {
	public:
		explicit FakeEnvironment(size_t id) : id{id} {}
		auto Describe() const -> std::string final { return "env#" + std::to_string(id); }

		const size_t id;
		std::atomic<bool> alive{true};
		lockable_t<OutputMap> outputs;
};

class FakeOutput final : public Output {
	public:
		explicit FakeOutput(std::string label) : label{std::move(label)} {}
		auto Describe() const -> std::string final { return label; }

	private:
		std::string label;
};

class FakeModule final : public Module {
	public:
		explicit FakeModule(std::string name) : name{std::move(name)} {}

		auto Name() const -> const std::string& final { return name; }

		auto Lookup(const std::string& binding) const -> std::optional<Value> final {
			auto lock = variables.read();
			auto it = lock->find(binding);
			if (it == lock->end()) {
				return std::nullopt;
			}
			return it->second;
		}

		void Clear() final {
			variables.write()->clear();
		}

		void Set(const std::string& binding, Value value) {
			(*variables.write())[binding] = std::move(value);
		}

	private:
		std::string name;
		lockable_t<std::map<std::string, Value>> variables;
};

class FakeCompiledCode final : public CompiledCode {
	public:
		FakeCompiledCode(std::string source, std::string filename) :
			source{std::move(source)}, filename{std::move(filename)} {}

		const std::string source;
		const std::string filename;
};

auto Cast(const EnvironmentData& environment) -> FakeEnvironment& {
	return const_cast<FakeEnvironment&>(dynamic_cast<const FakeEnvironment&>(environment));
}

auto Location(const std::string& filename, int line) -> std::string {
	return "  File \"" + filename + "\", line " + std::to_string(line);
}

// Calls `fn(keyword, rest, line_number)` for every non-empty line
template <class Functor>
void ForEachStatement(const std::string& source, Functor fn) {
	std::istringstream lines{source};
	std::string line;
	int line_number = 0;
	while (std::getline(lines, line)) {
		++line_number;
		std::istringstream statement{line};
		std::string keyword;
		if (!(statement >> keyword)) {
			continue;
		}
		std::string rest;
		std::getline(statement >> std::ws, rest);
		fn(keyword, rest, line_number);
	}
}

void CheckSyntax(const std::string& source, const std::string& filename) {
	ForEachStatement(source, [&](const std::string& keyword, const std::string& /*rest*/, int line) {
		if (keyword != "let" && keyword != "output" && keyword != "raise" && keyword != "sleep" && keyword != "cwd" && keyword != "panic") {
			throw ScriptFailure{"SyntaxError: unknown statement '" + keyword + "'", Location(filename, line)};
		}
	});
}

} // anonymous namespace

auto FakeRuntime::CreateEnvironment() -> std::shared_ptr<EnvironmentData> {
	return std::make_shared<FakeEnvironment>(next_id++);
}

void FakeRuntime::DestroyEnvironment(const std::shared_ptr<EnvironmentData>& environment) {
	Kill(environment);
	++destroyed;
}

auto FakeRuntime::IsAlive(const EnvironmentData& environment) const -> bool {
	return Cast(environment).alive;
}

void FakeRuntime::RegisterPolicy(EnvironmentPolicy& policy) {
	auto lock = this->policy.write();
	if (*lock != nullptr) {
		throw RuntimeGenericError{"A policy is already installed"};
	}
	*lock = &policy;
}

void FakeRuntime::UnregisterPolicy() {
	if (fail_unregister.exchange(false)) {
		throw std::runtime_error{"host refused to unregister"};
	}
	*policy.write() = nullptr;
}

auto FakeRuntime::CurrentEnvironmentOfCaller() -> std::shared_ptr<EnvironmentData> {
	auto lock = policy.read();
	return *lock == nullptr ? nullptr : (*lock)->GetCurrentEnvironment();
}

auto FakeRuntime::GetOutputs() -> OutputMap {
	auto current = CurrentEnvironmentOfCaller();
	if (!current) {
		throw RuntimeGenericError{"No environment is current"};
	}
	return *Cast(*current).outputs.read();
}

auto FakeRuntime::NewModule(std::string name) -> std::shared_ptr<Module> {
	return std::make_shared<FakeModule>(std::move(name));
}

auto FakeRuntime::Compile(const std::string& source, const std::string& filename) -> std::shared_ptr<const CompiledCode> {
	CheckSyntax(source, filename);
	return std::make_shared<FakeCompiledCode>(source, filename);
}

auto FakeRuntime::RunInEnvironment(
	const std::shared_ptr<EnvironmentData>& environment,
	Module& module,
	const Code& code
) -> OutputMap {
	++runs;
	auto& fake_environment = Cast(*environment);
	if (!fake_environment.alive) {
		throw DisposedError{"Environment is dead"};
	}
	auto& fake_module = dynamic_cast<FakeModule&>(module);
	const auto* compiled = code.IsCompiled() ? &dynamic_cast<const FakeCompiledCode&>(code.Compiled()) : nullptr;
	const std::string& source = compiled == nullptr ? code.Source() : compiled->source;
	const std::string& filename = compiled == nullptr ? code.Filename() : compiled->filename;
	CheckSyntax(source, filename);

	ForEachStatement(source, [&](const std::string& keyword, const std::string& rest, int line) {
		std::istringstream arguments{rest};
		if (keyword == "let") {
			std::string name;
			std::string equals;
			arguments >> name >> equals;
			std::string literal;
			std::getline(arguments >> std::ws, literal);
			if (literal == "$env") {
				auto current = CurrentEnvironmentOfCaller();
				fake_module.Set(name, current ? current->Describe() : std::string{"none"});
			} else if (literal.size() >= 2 && literal.front() == '"' && literal.back() == '"') {
				fake_module.Set(name, literal.substr(1, literal.size() - 2));
			} else {
				fake_module.Set(name, static_cast<int64_t>(std::stoll(literal)));
			}
		} else if (keyword == "output") {
			int index = 0;
			std::string label;
			arguments >> index >> label;
			auto current = CurrentEnvironmentOfCaller();
			if (!current) {
				throw ScriptFailure{"RuntimeError: no environment is current", Location(filename, line)};
			}
			(*Cast(*current).outputs.write())[index] = std::make_shared<FakeOutput>(label);
		} else if (keyword == "raise") {
			throw ScriptFailure{rest, Location(filename, line)};
		} else if (keyword == "sleep") {
			int milliseconds = 0;
			arguments >> milliseconds;
			std::this_thread::sleep_for(std::chrono::milliseconds{milliseconds});
		} else if (keyword == "cwd") {
			std::string name;
			arguments >> name;
			fake_module.Set(name, std::filesystem::current_path().string());
		} else if (keyword == "panic") {
			throw line;
		}
	});
	return *fake_environment.outputs.read();
}

void FakeRuntime::Kill(const std::shared_ptr<EnvironmentData>& environment) {
	Cast(*environment).alive = false;
}

auto Describe(const OutputMap& outputs) -> std::map<int, std::string> {
	std::map<int, std::string> described;
	for (const auto& [index, output] : outputs) {
		described[index] = output->Describe();
	}
	return described;
}

} // namespace ienv::test
