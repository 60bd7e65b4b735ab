#include "sandbox/wasm3_sandbox.hpp"

#include <cstring>
#include <optional>

#include "m3_api_defs.h"
#include "m3_env.h"
#include "wasm3.h"

#include "utils/logging.hpp"

namespace hoya::sandbox {
namespace {

constexpr const char* kImportNamespace = "env";
constexpr const char* kMemoryExport = "memory";
constexpr const char* kHostFaultTrap = "[trap] host capability fault";

struct ModuleState {
    host::CapabilityBridge* bridge = nullptr;
    IM3Runtime runtime = nullptr;
    std::optional<std::string> host_fault;
    std::optional<std::string> memory_fault;
};

ModuleState& StateOf(IM3ImportContext ctx) {
    return *static_cast<ModuleState*>(ctx->userdata);
}

// Re-acquired on every call: memory.grow may have moved or resized the region.
// A declared memory of zero pages is a valid empty region, not a host failure.
host::GuestMemoryView MemoryOf(const ModuleState& state) {
    std::uint32_t size = 0;
    std::uint8_t* base = m3_GetMemory(state.runtime, &size, 0);
    if (!base && state.runtime->memory.numPages != 0) {
        throw host::HostFault("guest linear memory is not available");
    }
    return host::GuestMemoryView(base, base ? size : 0);
}

m3ApiRawFunction(HostLog) {
    m3ApiGetArg(std::uint32_t, level_ptr);
    m3ApiGetArg(std::uint32_t, level_len);
    m3ApiGetArg(std::uint32_t, message_ptr);
    m3ApiGetArg(std::uint32_t, message_len);
    auto& state = StateOf(_ctx);
    try {
        const auto memory = MemoryOf(state);
        state.bridge->LogFromMemory(memory, level_ptr, level_len, message_ptr, message_len);
    } catch (const host::HostFault& ex) {
        state.host_fault = ex.what();
        m3ApiTrap(kHostFaultTrap);
    }
    m3ApiSuccess();
}

m3ApiRawFunction(HostClock) {
    m3ApiReturnType(std::uint64_t);
    auto& state = StateOf(_ctx);
    try {
        m3ApiReturn(state.bridge->Clock());
    } catch (const host::HostFault& ex) {
        state.host_fault = ex.what();
        m3ApiTrap(kHostFaultTrap);
    }
}

m3ApiRawFunction(HostFetch) {
    m3ApiReturnType(std::int32_t);
    m3ApiGetArg(std::uint32_t, request_ptr);
    m3ApiGetArg(std::uint32_t, request_len);
    m3ApiGetArg(std::uint32_t, response_ptr);
    m3ApiGetArg(std::uint32_t, response_capacity);
    auto& state = StateOf(_ctx);
    try {
        auto memory = MemoryOf(state);
        const auto written = state.bridge->FetchFromMemory(
            memory, request_ptr, request_len, response_ptr, response_capacity);
        m3ApiReturn(written);
    } catch (const host::HostFault& ex) {
        state.host_fault = ex.what();
        m3ApiTrap(kHostFaultTrap);
    } catch (const host::GuestMemoryError& ex) {
        state.memory_fault = ex.what();
        m3ApiTrap(m3Err_trapOutOfBoundsMemoryAccess);
    }
}

const void* CaptureInto(IM3ImportContext ctx, std::uint64_t* sp, host::CaptureStream stream) {
    const auto ptr = static_cast<std::uint32_t>(sp[0]);
    const auto len = static_cast<std::uint32_t>(sp[1]);
    auto& state = StateOf(ctx);
    try {
        const auto memory = MemoryOf(state);
        state.bridge->CaptureFromMemory(memory, stream, ptr, len);
    } catch (const host::HostFault& ex) {
        state.host_fault = ex.what();
        return kHostFaultTrap;
    }
    return m3Err_none;
}

m3ApiRawFunction(HostCaptureStdout) {
    return CaptureInto(_ctx, _sp, host::CaptureStream::kStdout);
}

m3ApiRawFunction(HostCaptureStderr) {
    return CaptureInto(_ctx, _sp, host::CaptureStream::kStderr);
}

struct HostImport {
    const char* name;
    const char* signature;
    M3RawCall function;
};

const HostImport kHostImports[] = {
    {"log", "v(iiii)", &HostLog},
    {"app_log", "v(iiii)", &HostLog},
    {"clock", "I()", &HostClock},
    {"get_unixtime", "I()", &HostClock},
    {"fetch", "i(iiii)", &HostFetch},
    {"capture_stdout", "v(ii)", &HostCaptureStdout},
    {"capture_stderr", "v(ii)", &HostCaptureStderr},
};

class Wasm3Instance : public GuestInstance {
public:
    Wasm3Instance(const GuestPayload& payload, host::CapabilityBridge& bridge,
                  const Wasm3Options& options)
        : bytes_(payload.bytes)
        , entry_point_(options.entry_point)
        , env_(m3_NewEnvironment(), &m3_FreeEnvironment)
        , runtime_(nullptr, &m3_FreeRuntime) {
        if (!env_) {
            throw GuestFault(ExecutionStage::kInstantiating, "failed to create wasm3 environment");
        }
        runtime_.reset(m3_NewRuntime(env_.get(), options.stack_bytes, &state_));
        if (!runtime_) {
            throw GuestFault(ExecutionStage::kInstantiating, "failed to create wasm3 runtime");
        }
        state_.bridge = &bridge;
        state_.runtime = runtime_.get();

        IM3Module module = nullptr;
        M3Result result = m3_ParseModule(env_.get(), &module,
                                         reinterpret_cast<const std::uint8_t*>(bytes_.data()),
                                         static_cast<std::uint32_t>(bytes_.size()));
        if (result) {
            throw GuestFault(ExecutionStage::kInstantiating, Describe("parse", result));
        }
        if (!module->memoryExportName || std::strcmp(module->memoryExportName, kMemoryExport) != 0) {
            m3_FreeModule(module);
            throw GuestFault(ExecutionStage::kInstantiating,
                             "WASM module does not export 'memory'", true);
        }
        result = m3_LoadModule(runtime_.get(), module);
        if (result) {
            m3_FreeModule(module);
            throw GuestFault(ExecutionStage::kInstantiating, Describe("load", result));
        }
        module_ = module;
        LinkImports();
    }

    std::string Run() override {
        M3Result result = m3_RunStart(module_);
        if (result) {
            Fault(result);
        }
        IM3Function entry = nullptr;
        result = m3_FindFunction(&entry, runtime_.get(), entry_point_.c_str());
        if (result == m3Err_functionLookupFailed || !entry ||
            m3_GetArgCount(entry) != 0 || m3_GetRetCount(entry) != 0) {
            utils::Log(utils::LogLevel::kDebug, "wasm", "no entry point export=" + entry_point_);
            return "WASM module instantiated (no " + entry_point_ + " called or found)";
        }
        if (result) {
            Fault(result);
        }
        result = m3_CallV(entry);
        if (result) {
            Fault(result);
        }
        return "WASM module executed (" + entry_point_ + ")";
    }

private:
    void LinkImports() {
        for (const auto& import : kHostImports) {
            M3Result result = m3_LinkRawFunctionEx(module_, kImportNamespace, import.name,
                                                   import.signature, import.function, &state_);
            if (result && result != m3Err_functionLookupFailed) {
                throw GuestFault(ExecutionStage::kInstantiating,
                                 Describe(std::string("link ") + import.name, result));
            }
        }
        // Every function import must be bound to a host capability before any guest code runs.
        for (std::uint32_t i = 0; i < module_->numFuncImports; ++i) {
            const IM3Function function = &module_->functions[i];
            if (!function->compiled) {
                const auto* module_name = function->import.moduleUtf8 ? function->import.moduleUtf8 : "?";
                const auto* field_name = function->import.fieldUtf8 ? function->import.fieldUtf8 : "?";
                throw GuestFault(ExecutionStage::kInstantiating,
                                 std::string("unresolved import ") + module_name + "." + field_name);
            }
        }
    }

    std::string Describe(const std::string& step, M3Result result) const {
        std::string message = step + ": " + result;
        if (runtime_) {
            M3ErrorInfo info{};
            m3_GetErrorInfo(runtime_.get(), &info);
            if (info.message && *info.message) {
                message += " (" + std::string(info.message) + ")";
            }
        }
        return message;
    }

    [[noreturn]] void Fault(M3Result result) {
        if (state_.host_fault) {
            throw GuestFault(ExecutionStage::kRunning, *state_.host_fault, true);
        }
        auto message = Describe("trap", result);
        if (state_.memory_fault) {
            message += ": " + *state_.memory_fault;
        }
        throw GuestFault(ExecutionStage::kRunning, message);
    }

    // wasm3 keeps pointers into the bytecode for the lifetime of the module.
    std::string bytes_;
    std::string entry_point_;
    ModuleState state_;
    std::unique_ptr<M3Environment, decltype(&m3_FreeEnvironment)> env_;
    std::unique_ptr<M3Runtime, decltype(&m3_FreeRuntime)> runtime_;
    IM3Module module_ = nullptr;
};

}  // namespace

Wasm3Sandbox::Wasm3Sandbox(Wasm3Options options)
    : options_(std::move(options)) {}

std::unique_ptr<GuestInstance> Wasm3Sandbox::Instantiate(const GuestPayload& payload,
                                                         host::CapabilityBridge& bridge) {
    utils::Log(utils::LogLevel::kDebug, "wasm",
               "instantiate url=" + payload.url + " bytes=" + std::to_string(payload.bytes.size()));
    return std::make_unique<Wasm3Instance>(payload, bridge, options_);
}

}  // namespace hoya::sandbox
