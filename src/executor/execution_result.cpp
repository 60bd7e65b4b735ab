#include "executor/execution_result.hpp"

#include "utils/common.hpp"

namespace hoya::executor {

ExecutionResult FromError(const AppError& error) {
    const auto& context = error.Context();
    ExecutionResult result{};
    result.status = "error";
    result.stdout_text = context.stdout_text;
    result.stderr_text = context.stderr_text;
    result.error = ErrorInfo{error.Code(), error.what(), error.Details()};
    result.metadata.execution_time_ms = context.execution_time_ms;
    result.metadata.code_type = context.kind ? sandbox::ToString(*context.kind) : "unknown";
    result.metadata.timestamp = utils::FormatIso8601(utils::Now());
    result.metadata.resource_size = context.resource_size;
    return result;
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json json = {
        {"status", result.status},
        {"output", nullptr},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"error", nullptr},
        {"metadata", {
            {"execution_time", result.metadata.execution_time_ms},
            {"code_type", result.metadata.code_type},
            {"timestamp", result.metadata.timestamp},
            {"resource_size", result.metadata.resource_size}
        }}
    };
    if (result.output) {
        json["output"] = *result.output;
    }
    if (result.error) {
        json["error"] = {
            {"code", result.error->code},
            {"message", result.error->message},
            {"details", result.error->details.empty() ? nlohmann::json(nullptr) : result.error->details}
        };
    }
    return json;
}

std::string SerializeResult(const ExecutionResult& result) {
    return ToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace hoya::executor
