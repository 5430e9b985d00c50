#include "v8_runtime.h"
#include "v8_version.h"
#include "environment/error.h"
#include "lib/log.h"
#include <libplatform/libplatform.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace v8;
namespace ienv {
namespace {

std::once_flag platform_initialized;
std::unique_ptr<Platform> platform;

void InitializePlatform() {
	std::call_once(platform_initialized, []() {
		platform = platform::NewDefaultPlatform();
		V8::InitializePlatform(platform.get());
		V8::Initialize();
		Logger().debug("Initialized V8 {}", V8::GetVersion());
	});
}

auto NewString(Isolate* isolate, const std::string& string) -> Local<String> {
	Local<String> handle;
	if (!String::NewFromUtf8(isolate, string.data(), NewStringType::kNormal, static_cast<int>(string.size())).ToLocal(&handle)) {
		throw RuntimeGenericError{"String is too long for V8"};
	}
	return handle;
}

auto ToStdString(Isolate* isolate, Local<v8::Value> value) -> std::string {
	String::Utf8Value utf8{isolate, value};
	return *utf8 == nullptr ? std::string{} : std::string{*utf8, static_cast<size_t>(utf8.length())};
}

auto MakeOrigin(Isolate* isolate, const std::string& filename) -> ScriptOrigin {
#if V8_AT_LEAST(12, 0, 0)
	static_cast<void>(isolate);
	return ScriptOrigin{NewString(isolate, filename)};
#else
	return ScriptOrigin{isolate, NewString(isolate, filename)};
#endif
}

struct IsolateDisposer {
	void operator()(Isolate* isolate) const {
		isolate->Dispose();
	}
};

class V8Output final : public Output {
	public:
		explicit V8Output(std::string text) : text{std::move(text)} {}
		auto Describe() const -> std::string final { return text; }

	private:
		std::string text;
};

class V8Module;

/**
 * One isolate. Executions hold the state lock shared, disposal holds it exclusively, so disposal
 * waits for whatever is running in the environment.
 */
class V8Environment final : public EnvironmentData {
	public:
		V8Environment(size_t id, Isolate* isolate) : id{id}, isolate{isolate} {}
		V8Environment(const V8Environment&) = delete;
		~V8Environment() final { Dispose(); }
		auto operator=(const V8Environment&) = delete;

		auto Describe() const -> std::string final {
			return "<v8 environment #" + std::to_string(id) + ">";
		}

		void Dispose() {
			auto lock = state.write();
			if (lock->disposed) {
				return;
			}
			alive = false;
			{
				Locker locker{isolate};
				Isolate::Scope isolate_scope{isolate};
				lock->contexts.clear();
			}
			isolate->Dispose();
			lock->disposed = true;
			Logger().debug("Disposed isolate of {}", Describe());
		}

		struct State {
			bool disposed = false;
			// Guarded by the isolate's `v8::Locker` while `state` is only held shared
			mutable std::unordered_map<const V8Module*, Global<Context>> contexts;
		};

		const size_t id;
		Isolate* const isolate;
		std::atomic<bool> alive{true};
		std::atomic<bool> hit_memory_limit{false};
		lockable_t<State, true> state;
		lockable_t<OutputMap> outputs;
};

auto Cast(const EnvironmentData& environment) -> const V8Environment& {
	const auto* v8_environment = dynamic_cast<const V8Environment*>(&environment);
	if (v8_environment == nullptr) {
		throw RuntimeGenericError{"Environment was not created by this runtime"};
	}
	return *v8_environment;
}

auto Cast(const std::shared_ptr<EnvironmentData>& environment) -> std::shared_ptr<V8Environment> {
	auto v8_environment = std::dynamic_pointer_cast<V8Environment>(environment);
	if (!v8_environment) {
		throw RuntimeGenericError{"Environment was not created by this runtime"};
	}
	return v8_environment;
}

// Script precompiled in a scratch isolate, carried between isolates as a code cache
class V8CompiledCode final : public CompiledCode {
	public:
		V8CompiledCode(std::string source, std::string filename, std::vector<uint8_t> cache) :
			source{std::move(source)}, filename{std::move(filename)}, cache{std::move(cache)} {}

		const std::string source;
		const std::string filename;
		const std::vector<uint8_t> cache;
};

class V8Module final : public Module {
	public:
		explicit V8Module(std::string name) : name{std::move(name)} {}
		V8Module(const V8Module&) = delete;
		~V8Module() final {
			try {
				Clear();
			} catch (const std::exception& error) {
				Logger().error("Failed to release module {}: {}", name, error.what());
			}
		}
		auto operator=(const V8Module&) = delete;

		auto Name() const -> const std::string& final { return name; }
		auto Lookup(const std::string& binding) const -> std::optional<Value> final;
		void Clear() final;

		// Binds the module to `environment` unless it is bound to another one already
		void Bind(const std::shared_ptr<V8Environment>& environment) {
			auto lock = bound.write();
			auto current = lock->lock();
			if (current && current != environment && current->alive) {
				throw RuntimeGenericError{"Module '" + name + "' belongs to " + current->Describe()};
			}
			*lock = environment;
		}

	private:
		std::string name;
		lockable_t<std::weak_ptr<V8Environment>> bound;
};

auto V8Module::Lookup(const std::string& binding) const -> std::optional<Value> {
	auto environment = bound.read()->lock();
	if (!environment) {
		return std::nullopt;
	}
	auto state = environment->state.read();
	if (state->disposed) {
		return std::nullopt;
	}
	Isolate* isolate = environment->isolate;
	Locker locker{isolate};
	auto context_it = state->contexts.find(this);
	if (context_it == state->contexts.end()) {
		return std::nullopt;
	}
	Isolate::Scope isolate_scope{isolate};
	HandleScope handle_scope{isolate};
	Local<Context> context = context_it->second.Get(isolate);
	Context::Scope context_scope{context};
	TryCatch try_catch{isolate};

	Local<Object> global = context->Global();
	Local<String> key = NewString(isolate, binding);
	bool has = false;
	if (!global->HasOwnProperty(context, key).To(&has) || !has) {
		return std::nullopt;
	}
	Local<v8::Value> value;
	if (!global->Get(context, key).ToLocal(&value)) {
		return std::nullopt;
	}
	if (value->IsNullOrUndefined()) {
		return Value{};
	} else if (value->IsBoolean()) {
		return Value{value->BooleanValue(isolate)};
	} else if (value->IsNumber()) {
		double number = value.As<Number>()->Value();
		if (std::trunc(number) == number && std::abs(number) <= static_cast<double>(std::numeric_limits<int32_t>::max())) {
			return Value{static_cast<int64_t>(number)};
		}
		return Value{number};
	}
	return Value{ToStdString(isolate, value)};
}

void V8Module::Clear() {
	auto environment = std::exchange(*bound.write(), {}).lock();
	if (!environment) {
		return;
	}
	auto state = environment->state.write();
	auto context_it = state->contexts.find(this);
	if (state->disposed || context_it == state->contexts.end()) {
		return;
	}
	Locker locker{environment->isolate};
	Isolate::Scope isolate_scope{environment->isolate};
	state->contexts.erase(context_it);
}

} // anonymous namespace

/**
 * V8Runtime implementation
 */
V8Runtime::V8Runtime(V8RuntimeOptions options) :
		options{options},
		allocator{ArrayBuffer::Allocator::NewDefaultAllocator()} {
	InitializePlatform();
}

auto V8Runtime::NewIsolate() -> Isolate* {
	ResourceConstraints rc;
	size_t young_space_in_kb = (size_t)std::pow(2, std::min(sizeof(void*) >= 8 ? 4.0 : 3.0, options.memory_limit_in_mb / 128.0) + 10);
	rc.set_max_young_generation_size_in_bytes(young_space_in_kb * 1024);
	rc.set_max_old_generation_size_in_bytes(options.memory_limit_in_mb * 1024 * 1024);

	Isolate::CreateParams create_params;
	create_params.constraints = rc;
	create_params.array_buffer_allocator_shared = allocator;
	return Isolate::New(create_params);
}

auto V8Runtime::CreateEnvironment() -> std::shared_ptr<EnvironmentData> {
	auto environment = std::make_shared<V8Environment>(next_environment_id++, NewIsolate());
	// Stop the script instead of letting V8 abort the process. The extra room lets it unwind.
	environment->isolate->AddNearHeapLimitCallback([](void* data, size_t current_heap_limit, size_t /*initial_heap_limit*/) {
		auto* environment = static_cast<V8Environment*>(data);
		environment->hit_memory_limit = true;
		environment->isolate->TerminateExecution();
		return current_heap_limit * 2;
	}, environment.get());
	return environment;
}

void V8Runtime::DestroyEnvironment(const std::shared_ptr<EnvironmentData>& environment) {
	Cast(environment)->Dispose();
}

auto V8Runtime::IsAlive(const EnvironmentData& environment) const -> bool {
	const auto* v8_environment = dynamic_cast<const V8Environment*>(&environment);
	return v8_environment != nullptr && v8_environment->alive;
}

void V8Runtime::RegisterPolicy(EnvironmentPolicy& policy) {
	auto lock = this->policy.write();
	if (*lock != nullptr) {
		throw RuntimeGenericError{"A policy is already installed in this runtime"};
	}
	*lock = &policy;
}

void V8Runtime::UnregisterPolicy() {
	*policy.write() = nullptr;
}

auto V8Runtime::CurrentEnvironmentOfCaller() -> std::shared_ptr<EnvironmentData> {
	auto lock = policy.read();
	return *lock == nullptr ? nullptr : (*lock)->GetCurrentEnvironment();
}

auto V8Runtime::GetOutputs() -> OutputMap {
	auto current = CurrentEnvironmentOfCaller();
	if (!current) {
		throw RuntimeGenericError{"No environment is current"};
	}
	return *Cast(*current).outputs.read();
}

auto V8Runtime::NewModule(std::string name) -> std::shared_ptr<Module> {
	return std::make_shared<V8Module>(std::move(name));
}

auto V8Runtime::Compile(const std::string& source, const std::string& filename) -> std::shared_ptr<const CompiledCode> {
	std::unique_ptr<Isolate, IsolateDisposer> isolate{NewIsolate()};
	std::vector<uint8_t> cache;
	{
		Locker locker{isolate.get()};
		Isolate::Scope isolate_scope{isolate.get()};
		HandleScope handle_scope{isolate.get()};
		Local<Context> context = Context::New(isolate.get());
		Context::Scope context_scope{context};
		TryCatch try_catch{isolate.get()};

		ScriptCompiler::Source script_source{NewString(isolate.get(), source), MakeOrigin(isolate.get(), filename)};
		Local<UnboundScript> script;
		if (!ScriptCompiler::CompileUnboundScript(isolate.get(), &script_source).ToLocal(&script)) {
			throw ScriptFailure{ToStdString(isolate.get(), try_catch.Exception())};
		}
		std::unique_ptr<ScriptCompiler::CachedData> cached_data{ScriptCompiler::CreateCodeCache(script)};
		cache.assign(cached_data->data, cached_data->data + cached_data->length);
	}
	return std::make_shared<V8CompiledCode>(source, filename, std::move(cache));
}

auto V8Runtime::RunInEnvironment(
	const std::shared_ptr<EnvironmentData>& environment,
	Module& module,
	const Code& code
) -> OutputMap {
	auto v8_environment = Cast(environment);
	auto* v8_module = dynamic_cast<V8Module*>(&module);
	if (v8_module == nullptr) {
		throw RuntimeGenericError{"Module was not created by this runtime"};
	}
	v8_module->Bind(v8_environment);

	{
		auto state = v8_environment->state.read();
		if (state->disposed) {
			throw DisposedError{"Environment has been disposed"};
		}
		Isolate* isolate = v8_environment->isolate;
		Locker locker{isolate};
		Isolate::Scope isolate_scope{isolate};
		HandleScope handle_scope{isolate};

		Local<Context> context;
		auto context_it = state->contexts.find(v8_module);
		if (context_it == state->contexts.end()) {
			Local<ObjectTemplate> global = ObjectTemplate::New(isolate);
			global->Set(isolate, "setOutput", FunctionTemplate::New(isolate, SetOutput, External::New(isolate, this)));
			context = Context::New(isolate, nullptr, global);
			state->contexts.emplace(v8_module, Global<Context>{isolate, context});
		} else {
			context = context_it->second.Get(isolate);
		}
		Context::Scope context_scope{context};
		TryCatch try_catch{isolate};

		auto fail = [&]() {
			if (try_catch.HasTerminated() && v8_environment->hit_memory_limit) {
				throw ScriptFailure{"Isolate was disposed during execution due to memory limit"};
			}
			std::string stack;
			Local<v8::Value> stack_trace;
			if (try_catch.StackTrace(context).ToLocal(&stack_trace)) {
				stack = ToStdString(isolate, stack_trace);
			}
			throw ScriptFailure{ToStdString(isolate, try_catch.Exception()), stack};
		};

		Local<Script> script;
		if (code.IsCompiled()) {
			const auto& compiled = dynamic_cast<const V8CompiledCode&>(code.Compiled());
			ScriptCompiler::Source source{
				NewString(isolate, compiled.source),
				MakeOrigin(isolate, compiled.filename),
				new ScriptCompiler::CachedData{compiled.cache.data(), static_cast<int>(compiled.cache.size())}
			};
			if (!ScriptCompiler::Compile(context, &source, ScriptCompiler::kConsumeCodeCache).ToLocal(&script)) {
				fail();
			}
		} else {
			ScriptCompiler::Source source{NewString(isolate, code.Source()), MakeOrigin(isolate, code.Filename())};
			if (!ScriptCompiler::Compile(context, &source).ToLocal(&script)) {
				fail();
			}
		}
		if (script->Run(context).IsEmpty()) {
			fail();
		}
	}
	return *v8_environment->outputs.read();
}

void V8Runtime::SetOutput(const FunctionCallbackInfo<v8::Value>& info) {
	Isolate* isolate = info.GetIsolate();
	auto throw_error = [&](const std::string& message) {
		isolate->ThrowException(Exception::Error(NewString(isolate, message)));
	};
	if (info.Length() < 2 || !info[0]->IsInt32()) {
		throw_error("setOutput(index, value) expects an integer index and a value");
		return;
	}
	auto& runtime = *static_cast<V8Runtime*>(info.Data().As<External>()->Value());
	auto current = std::dynamic_pointer_cast<V8Environment>(runtime.CurrentEnvironmentOfCaller());
	if (!current) {
		throw_error("No environment is current");
		return;
	}
	int index = info[0].As<Int32>()->Value();
	Local<String> text;
	if (!info[1]->ToString(isolate->GetCurrentContext()).ToLocal(&text)) {
		return;
	}
	(*current->outputs.write())[index] = std::make_shared<V8Output>(ToStdString(isolate, text));
	info.GetReturnValue().SetUndefined();
}

} // namespace ienv
