#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_adapter.hpp"

namespace hoya::executor {

enum class AppErrorKind {
    kScriptEngine,
    kModuleEngine,
    kFetch,
    kInternal,
    // Malformed /execute body; never raised by the orchestrator.
    kInvalidRequest
};

const char* ToString(AppErrorKind kind);

// Whatever was known about the invocation when it failed.
struct ErrorContext {
    std::optional<sandbox::GuestKind> kind;
    std::string stdout_text;
    std::string stderr_text;
    std::size_t resource_size = 0;
    std::uint64_t execution_time_ms = 0;
};

class AppError : public std::runtime_error {
public:
    AppError(AppErrorKind kind, const std::string& message,
             nlohmann::json details = nlohmann::json::object());

    static AppError ScriptEngine(const std::string& message, sandbox::ExecutionStage stage);
    static AppError ModuleEngine(const std::string& message, sandbox::ExecutionStage stage);
    static AppError Fetch(const std::string& url, const std::string& message,
                          std::optional<int> status = std::nullopt);
    static AppError Internal(const std::string& message);
    static AppError InvalidRequest(const std::string& message);

    AppErrorKind Kind() const { return kind_; }
    const char* Code() const;
    int HttpStatus() const;
    const nlohmann::json& Details() const { return details_; }

    const ErrorContext& Context() const { return context_; }
    AppError& WithContext(ErrorContext context);

private:
    AppErrorKind kind_;
    nlohmann::json details_;
    ErrorContext context_;
};

}  // namespace hoya::executor
