#include "executor/app_error.hpp"

namespace hoya::executor {

const char* ToString(AppErrorKind kind) {
    switch (kind) {
        case AppErrorKind::kScriptEngine: return "script_engine";
        case AppErrorKind::kModuleEngine: return "module_engine";
        case AppErrorKind::kFetch: return "fetch";
        case AppErrorKind::kInternal: return "internal";
        case AppErrorKind::kInvalidRequest: return "invalid_request";
    }
    return "unknown";
}

AppError::AppError(AppErrorKind kind, const std::string& message, nlohmann::json details)
    : std::runtime_error(message)
    , kind_(kind)
    , details_(std::move(details)) {}

AppError AppError::ScriptEngine(const std::string& message, sandbox::ExecutionStage stage) {
    return AppError(AppErrorKind::kScriptEngine,
                    "JavaScript Execution Error: " + message,
                    {{"errorType", "QuickJS"}, {"stage", sandbox::ToString(stage)}});
}

AppError AppError::ModuleEngine(const std::string& message, sandbox::ExecutionStage stage) {
    return AppError(AppErrorKind::kModuleEngine,
                    "WebAssembly Execution Error: " + message,
                    {{"errorType", "wasm3"}, {"stage", sandbox::ToString(stage)}});
}

AppError AppError::Fetch(const std::string& url, const std::string& message,
                         std::optional<int> status) {
    nlohmann::json details = {{"url", url}};
    if (status) {
        details["status"] = *status;
    }
    return AppError(AppErrorKind::kFetch, "Failed to fetch resource: " + message, std::move(details));
}

AppError AppError::Internal(const std::string& message) {
    return AppError(AppErrorKind::kInternal, message);
}

AppError AppError::InvalidRequest(const std::string& message) {
    return AppError(AppErrorKind::kInvalidRequest, message);
}

const char* AppError::Code() const {
    switch (kind_) {
        case AppErrorKind::kScriptEngine: return "JAVASCRIPT_EXECUTION_ERROR";
        case AppErrorKind::kModuleEngine: return "WEBASSEMBLY_EXECUTION_ERROR";
        case AppErrorKind::kFetch: return "FETCH_ERROR";
        case AppErrorKind::kInternal: return "INTERNAL_ERROR";
        case AppErrorKind::kInvalidRequest: return "INVALID_REQUEST";
    }
    return "INTERNAL_ERROR";
}

int AppError::HttpStatus() const {
    switch (kind_) {
        case AppErrorKind::kFetch: return 502;
        case AppErrorKind::kInvalidRequest: return 400;
        default: return 500;
    }
}

AppError& AppError::WithContext(ErrorContext context) {
    context_ = std::move(context);
    return *this;
}

}  // namespace hoya::executor
