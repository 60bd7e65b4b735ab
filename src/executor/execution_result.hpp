#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "executor/app_error.hpp"
#include "nlohmann/json.hpp"

namespace hoya::executor {

struct ExecutionMetadata {
    std::uint64_t execution_time_ms = 0;
    std::string code_type = "unknown";
    std::string timestamp;
    std::size_t resource_size = 0;
};

struct ErrorInfo {
    std::string code;
    std::string message;
    nlohmann::json details;
};

// The envelope returned for every invocation, success or not.
struct ExecutionResult {
    std::string status = "success";
    std::optional<std::string> output;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<ErrorInfo> error;
    ExecutionMetadata metadata;

    bool Succeeded() const { return status == "success"; }
};

ExecutionResult FromError(const AppError& error);

nlohmann::json ToJson(const ExecutionResult& result);
std::string SerializeResult(const ExecutionResult& result);

}  // namespace hoya::executor
