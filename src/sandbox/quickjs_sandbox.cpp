#include "sandbox/quickjs_sandbox.hpp"

#include <optional>
#include <string>
#include <vector>

extern "C" {
#include "quickjs.h"
}

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::sandbox {
namespace {

enum ConsoleMethod {
    kConsoleLog = 0,
    kConsoleInfo,
    kConsoleDebug,
    kConsoleWarn,
    kConsoleError
};

struct ScriptState {
    host::CapabilityBridge* bridge = nullptr;
    std::optional<std::string> host_fault;
};

ScriptState& StateOf(JSContext* ctx) {
    return *static_cast<ScriptState*>(JS_GetContextOpaque(ctx));
}

std::optional<std::string> ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        return std::nullopt;
    }
    std::string out(str, len);
    JS_FreeCString(ctx, str);
    return out;
}

void DiscardException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    JS_FreeValue(ctx, exception);
}

std::optional<std::string> StringifyJson(JSContext* ctx, JSValueConst value) {
    JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(json)) {
        DiscardException(ctx);
        return std::nullopt;
    }
    std::optional<std::string> out;
    if (JS_IsString(json)) {
        out = ToStdString(ctx, json);
    }
    JS_FreeValue(ctx, json);
    return out;
}

// Objects are JSON-stringified; everything else goes through String().
std::string FormatConsoleArg(JSContext* ctx, JSValueConst arg) {
    if (JS_IsObject(arg) && !JS_IsFunction(ctx, arg)) {
        if (auto json = StringifyJson(ctx, arg)) {
            return *json;
        }
    }
    if (auto text = ToStdString(ctx, arg)) {
        return *text;
    }
    DiscardException(ctx);
    return JS_IsSymbol(arg) ? "Symbol()" : "[unprintable]";
}

std::string OptionalStringArg(JSContext* ctx, int argc, JSValueConst* argv, int index, bool& ok) {
    ok = true;
    if (index >= argc || JS_IsUndefined(argv[index]) || JS_IsNull(argv[index])) {
        return {};
    }
    auto text = ToStdString(ctx, argv[index]);
    if (!text) {
        ok = false;
        return {};
    }
    return *text;
}

JSValue ThrowHostFault(JSContext* ctx, const std::string& message) {
    StateOf(ctx).host_fault = message;
    return JS_ThrowInternalError(ctx, "%s", message.c_str());
}

JSValue JsLog(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    bool ok = true;
    const auto level = OptionalStringArg(ctx, argc, argv, 0, ok);
    if (!ok) {
        return JS_EXCEPTION;
    }
    const auto message = OptionalStringArg(ctx, argc, argv, 1, ok);
    if (!ok) {
        return JS_EXCEPTION;
    }
    StateOf(ctx).bridge->Log(level, message);
    return JS_UNDEFINED;
}

JSValue JsClock(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    try {
        return JS_NewInt64(ctx, static_cast<int64_t>(StateOf(ctx).bridge->Clock()));
    } catch (const host::HostFault& ex) {
        return ThrowHostFault(ctx, ex.what());
    }
}

JSValue ThrowFetchError(JSContext* ctx, const host::FetchError& error) {
    JSValue err = JS_NewError(ctx);
    JS_SetPropertyStr(ctx, err, "message", JS_NewString(ctx, error.message.c_str()));
    JS_SetPropertyStr(ctx, err, "code", JS_NewString(ctx, error.code.c_str()));
    return JS_Throw(ctx, err);
}

// fetch(options) -> {status, headers, body, error}. Invalid options throw an Error carrying
// `code` and `message`; transport failures return status 0 with the error filled in.
JSValue JsFetch(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto& bridge = *StateOf(ctx).bridge;
    host::FetchResult result{};
    if (argc >= 1 && JS_IsString(argv[0])) {
        auto url = ToStdString(ctx, argv[0]);
        if (!url) {
            return JS_EXCEPTION;
        }
        host::FetchRequest request{};
        request.url = *url;
        result = bridge.Fetch(request);
    } else if (argc >= 1 && JS_IsObject(argv[0])) {
        auto text = StringifyJson(ctx, argv[0]);
        if (!text) {
            return ThrowFetchError(ctx, {host::kFetchInvalidRequest, "fetch options are not serializable"});
        }
        result = bridge.Fetch(std::string_view(*text));
    } else {
        return ThrowFetchError(ctx, {host::kFetchInvalidRequest, "fetch expects an options object"});
    }

    if (result.error && result.error->code == host::kFetchInvalidRequest) {
        return ThrowFetchError(ctx, *result.error);
    }
    const auto serialized = host::SerializeFetchResult(result);
    return JS_ParseJSON(ctx, serialized.c_str(), serialized.size(), "<fetch>");
}

JSValue JsConsole(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    std::vector<std::string> parts;
    parts.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        parts.push_back(FormatConsoleArg(ctx, argv[i]));
    }
    const auto stream = (magic == kConsoleWarn || magic == kConsoleError)
        ? host::CaptureStream::kStderr
        : host::CaptureStream::kStdout;
    StateOf(ctx).bridge->Capture(stream, utils::Join(parts, " "));
    return JS_UNDEFINED;
}

void InstallGlobals(JSContext* ctx) {
    JSValue global = JS_GetGlobalObject(ctx);
    JS_SetPropertyStr(ctx, global, "log", JS_NewCFunction(ctx, JsLog, "log", 2));
    JS_SetPropertyStr(ctx, global, "app_log", JS_NewCFunction(ctx, JsLog, "app_log", 2));
    JS_SetPropertyStr(ctx, global, "clock", JS_NewCFunction(ctx, JsClock, "clock", 0));
    JS_SetPropertyStr(ctx, global, "get_unixtime", JS_NewCFunction(ctx, JsClock, "get_unixtime", 0));
    JS_SetPropertyStr(ctx, global, "fetch", JS_NewCFunction(ctx, JsFetch, "fetch", 1));

    JSValue console = JS_NewObject(ctx);
    struct {
        const char* name;
        int magic;
    } methods[] = {
        {"log", kConsoleLog},
        {"info", kConsoleInfo},
        {"debug", kConsoleDebug},
        {"warn", kConsoleWarn},
        {"error", kConsoleError},
    };
    for (const auto& method : methods) {
        JS_SetPropertyStr(ctx, console, method.name,
                          JS_NewCFunctionMagic(ctx, JsConsole, method.name, 1,
                                               JS_CFUNC_generic_magic, method.magic));
    }
    JS_SetPropertyStr(ctx, global, "console", console);
    JS_FreeValue(ctx, global);
}

std::string DescribeException(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    std::string text;
    if (JS_IsError(ctx, exception)) {
        text = ToStdString(ctx, exception).value_or("Error");
        JSValue stack = JS_GetPropertyStr(ctx, exception, "stack");
        if (JS_IsString(stack)) {
            if (auto trace = ToStdString(ctx, stack); trace && !trace->empty()) {
                text += "\n" + *trace;
            }
        }
        JS_FreeValue(ctx, stack);
    } else if (JS_IsObject(exception)) {
        text = StringifyJson(ctx, exception).value_or("[object]");
    } else if (auto plain = ToStdString(ctx, exception)) {
        text = *plain;
    } else {
        DiscardException(ctx);
        text = "uncaught exception";
    }
    JS_FreeValue(ctx, exception);
    return text;
}

const char* NonPrimitiveType(JSContext* ctx, JSValueConst value) {
    if (JS_IsFunction(ctx, value)) {
        return "Function";
    }
    if (JS_IsArray(ctx, value)) {
        return "Array";
    }
    if (JS_IsSymbol(value)) {
        return "Symbol";
    }
    if (JS_IsBigInt(ctx, value)) {
        return "BigInt";
    }
    if (JS_IsObject(value)) {
        return "Object";
    }
    return nullptr;
}

class QuickJsInstance : public GuestInstance {
public:
    QuickJsInstance(const GuestPayload& payload, host::CapabilityBridge& bridge)
        : source_(payload.bytes)
        , filename_(payload.url) {
        state_.bridge = &bridge;
        runtime_ = JS_NewRuntime();
        if (!runtime_) {
            throw GuestFault(ExecutionStage::kInstantiating, "failed to create QuickJS runtime");
        }
        context_ = JS_NewContext(runtime_);
        if (!context_) {
            JS_FreeRuntime(runtime_);
            throw GuestFault(ExecutionStage::kInstantiating, "failed to create QuickJS context");
        }
        JS_SetContextOpaque(context_, &state_);
        InstallGlobals(context_);
    }

    ~QuickJsInstance() override {
        JS_FreeContext(context_);
        JS_FreeRuntime(runtime_);
    }

    QuickJsInstance(const QuickJsInstance&) = delete;
    QuickJsInstance& operator=(const QuickJsInstance&) = delete;

    std::string Run() override {
        JSValue value = JS_Eval(context_, source_.c_str(), source_.size(), filename_.c_str(),
                                JS_EVAL_TYPE_GLOBAL);
        if (JS_IsException(value)) {
            Fail();
        }
        DrainJobs(value);
        auto output = Render(value);
        JS_FreeValue(context_, value);
        // A host fault aborts the invocation even when the script caught the exception.
        if (state_.host_fault) {
            throw GuestFault(ExecutionStage::kRunning, *state_.host_fault, true);
        }
        return output;
    }

private:
    [[noreturn]] void Fail() {
        const auto message = DescribeException(context_);
        if (state_.host_fault) {
            throw GuestFault(ExecutionStage::kRunning, *state_.host_fault, true);
        }
        throw GuestFault(ExecutionStage::kRunning, message);
    }

    void DrainJobs(JSValue pending_value) {
        for (;;) {
            JSContext* job_ctx = nullptr;
            const int ret = JS_ExecutePendingJob(runtime_, &job_ctx);
            if (ret == 0) {
                return;
            }
            if (ret < 0) {
                JS_FreeValue(context_, pending_value);
                Fail();
            }
        }
    }

    std::string Render(JSValueConst value) {
        if (JS_IsString(value)) {
            return ToStdString(context_, value).value_or("");
        }
        if (JS_IsUndefined(value)) {
            return "undefined";
        }
        if (JS_IsNull(value)) {
            return "null";
        }
        if (const char* type = NonPrimitiveType(context_, value)) {
            return std::string("Execution resulted in a non-primitive type: ") + type;
        }
        if (auto text = ToStdString(context_, value)) {
            return *text;
        }
        DiscardException(context_);
        return "[unprintable]";
    }

    ScriptState state_;
    std::string source_;
    std::string filename_;
    JSRuntime* runtime_ = nullptr;
    JSContext* context_ = nullptr;
};

}  // namespace

std::unique_ptr<GuestInstance> QuickJsSandbox::Instantiate(const GuestPayload& payload,
                                                           host::CapabilityBridge& bridge) {
    if (!utils::IsValidUtf8(payload.bytes)) {
        throw GuestFault(ExecutionStage::kInstantiating, "script is not valid UTF-8", true);
    }
    utils::Log(utils::LogLevel::kDebug, "js",
               "instantiate url=" + payload.url + " bytes=" + std::to_string(payload.bytes.size()));
    return std::make_unique<QuickJsInstance>(payload, bridge);
}

}  // namespace hoya::sandbox
