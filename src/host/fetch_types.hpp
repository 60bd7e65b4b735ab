#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace hoya::host {

constexpr const char* kFetchInvalidRequest = "INVALID_REQUEST";
constexpr const char* kFetchFailed = "FETCH_FAILED";

struct FetchRequest {
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
};

struct FetchError {
    std::string code;
    std::string message;
};

struct FetchResult {
    // 0 when no HTTP exchange happened (invalid request or transport failure).
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<FetchError> error;
};

// Wire format, identical for both guest kinds:
//   request  {"url": str, "method": str?, "headers": {str: str}?, "body": str|null?}
//   result   {"status": int, "headers": {str: str}, "body": str,
//             "error": {"code": str, "message": str}|null}
std::optional<FetchRequest> ParseFetchRequest(const nlohmann::json& json, std::string* error_out);
std::optional<FetchRequest> ParseFetchRequest(std::string_view text, std::string* error_out);

// Checks method, URL and headers before anything goes on the wire.
bool ValidateFetchRequest(const FetchRequest& request, std::string* error_out);

bool IsHttpToken(std::string_view value);
bool IsValidHeaderValue(std::string_view value);

FetchResult MakeFetchFailure(const std::string& code, const std::string& message);

nlohmann::json ToJson(const FetchResult& result);
// Invalid UTF-8 in the body is replaced with U+FFFD rather than rejected.
std::string SerializeFetchResult(const FetchResult& result);
std::optional<FetchResult> ParseFetchResult(std::string_view text);

}  // namespace hoya::host
