#include "environment/environment.h"
#include "environment/error.h"
#include "environment/policy.h"
#include "environment/store.h"
#include "fake_runtime.h"
#include "script/script.h"
#include "test_support.h"
#include "v8/v8_runtime.h"
#include <memory>
#include <string>

namespace {
	using ienv::LoadCode;
	using ienv::Policy;
	using ienv::V8Runtime;
	using ienv::Value;
	using ienv::test::ExpectThrows;
	using ienv::test::ExpectTrue;
	using ienv::test::TestCase;

	struct Fixture {
		V8Runtime host{ienv::V8RuntimeOptions{64}};
		Policy policy{host, std::make_shared<ienv::ThreadLocalStore>()};
		Policy::Scope scope{policy};
	};

	bool RunsJavaScript() {
		Fixture fixture;
		auto script = LoadCode("var answer = 40 + 2; var name = 'env'; var ratio = 0.5; var flag = true;", fixture.policy);
		script->Result();
		auto answer = script->GetVariable("answer").Get();
		auto name = script->GetVariable("name").Get();
		auto ratio = script->GetVariable("ratio").Get();
		auto flag = script->GetVariable("flag").Get();
		bool ok = ExpectTrue(std::holds_alternative<int64_t>(answer) && std::get<int64_t>(answer) == 42, "Integer variable");
		ok &= ExpectTrue(std::holds_alternative<std::string>(name) && std::get<std::string>(name) == "env", "String variable");
		ok &= ExpectTrue(std::holds_alternative<double>(ratio) && std::get<double>(ratio) == 0.5, "Number variable");
		ok &= ExpectTrue(std::holds_alternative<bool>(flag) && std::get<bool>(flag), "Boolean variable");
		ok &= ExpectThrows<ienv::NameError>([&]() { script->GetVariable("missing").Get(); }, "Missing variable");
		script->Dispose();
		return ok;
	}

	bool SetOutputRecordsIntoCurrentEnvironment() {
		Fixture fixture;
		auto script = LoadCode("setOutput(0, 'clip'); setOutput(2, 1 + 1);", fixture.policy);
		script->Result();
		auto outputs = ienv::test::Describe(script->GetManagedEnvironment()->Outputs());
		bool ok = ExpectTrue(outputs.size() == 2, "Two outputs");
		ok &= ExpectTrue(outputs[0] == "clip" && outputs[2] == "2", "Outputs stringified");
		script->Dispose();
		return ok;
	}

	bool ThrowBecomesExecutionError() {
		Fixture fixture;
		auto script = LoadCode(ienv::Code{"function fail() { throw new Error('boom'); }\nfail();", "failing.js"}, fixture.policy);
		bool ok = true;
		try {
			script->Result();
			ok &= ExpectTrue(false, "Result should have thrown");
		} catch (const ienv::ExecutionError& error) {
			std::string message = error.what();
			ok &= ExpectTrue(message.find("| Error: boom") != std::string::npos, "Message carried over");
			ok &= ExpectTrue(message.find("failing.js") != std::string::npos, "Stack carried over");
		}
		script->Dispose();
		return ok;
	}

	bool EnvironmentsAreIsolated() {
		Fixture fixture;
		auto first = LoadCode("var shared = 1; globalThis.marker = 'first';", fixture.policy);
		auto second = LoadCode("var seen = typeof marker;", fixture.policy);
		first->Result();
		second->Result();
		auto seen = second->GetVariable("seen").Get();
		bool ok = ExpectTrue(std::get<std::string>(seen) == "undefined", "Globals do not leak between environments");
		first->Dispose();
		second->Dispose();
		return ok;
	}

	bool ScriptsShareModuleContext() {
		Fixture fixture;
		auto first = LoadCode("var counter = 1;", fixture.policy);
		first->Result();
		auto second = LoadCode("counter += 1;", *first);
		second->Result();
		auto counter = first->GetVariable("counter").Get();
		bool ok = ExpectTrue(std::get<int64_t>(counter) == 2, "Second script saw the first's globals");
		first->Dispose();
		return ok;
	}

	bool PrecompiledCodeRuns() {
		Fixture fixture;
		auto compiled = fixture.host.Compile("var compiled = 6 * 7;", "compiled.js");
		auto script = LoadCode(compiled, fixture.policy);
		script->Result();
		bool ok = ExpectTrue(std::get<int64_t>(script->GetVariable("compiled").Get()) == 42, "Precompiled script ran");
		script->Dispose();
		ok &= ExpectThrows<ienv::ScriptFailure>([&]() { fixture.host.Compile("var = ;", "broken.js"); }, "Syntax errors reported");
		return ok;
	}

	bool DisposedEnvironmentIsDead() {
		Fixture fixture;
		auto environment = fixture.policy.NewEnvironment();
		auto data = environment->GetEnvironment().Data();
		bool ok = ExpectTrue(fixture.host.IsAlive(*data), "Alive before dispose");
		environment->Dispose();
		ok &= ExpectTrue(!fixture.host.IsAlive(*data), "Dead after dispose");
		return ok;
	}
}

int main() {
	return ienv::test::RunTests({
		{"RunsJavaScript", RunsJavaScript},
		{"SetOutputRecordsIntoCurrentEnvironment", SetOutputRecordsIntoCurrentEnvironment},
		{"ThrowBecomesExecutionError", ThrowBecomesExecutionError},
		{"EnvironmentsAreIsolated", EnvironmentsAreIsolated},
		{"ScriptsShareModuleContext", ScriptsShareModuleContext},
		{"PrecompiledCodeRuns", PrecompiledCodeRuns},
		{"DisposedEnvironmentIsDead", DisposedEnvironmentIsDead},
	});
}
