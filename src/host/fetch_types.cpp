#include "host/fetch_types.hpp"

#include <cctype>
#include <cstring>

#include "host/http_support.hpp"

namespace hoya::host {

bool IsHttpToken(std::string_view value) {
    if (value.empty()) {
        return false;
    }
    static constexpr const char* kTokenSymbols = "!#$%&'*+-.^_`|~";
    for (char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            continue;
        }
        if (c != 0 && std::strchr(kTokenSymbols, ch) != nullptr) {
            continue;
        }
        return false;
    }
    return true;
}

bool IsValidHeaderValue(std::string_view value) {
    for (char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if ((c < 0x20 && c != '\t') || c == 0x7F) {
            return false;
        }
    }
    return true;
}

std::optional<FetchRequest> ParseFetchRequest(const nlohmann::json& json, std::string* error_out) {
    if (!json.is_object()) {
        if (error_out) *error_out = "fetch options must be an object";
        return std::nullopt;
    }
    FetchRequest request{};
    if (!json.contains("url") || !json["url"].is_string()) {
        if (error_out) *error_out = "fetch options require a string 'url'";
        return std::nullopt;
    }
    request.url = json["url"].get<std::string>();

    if (json.contains("method") && !json["method"].is_null()) {
        if (!json["method"].is_string()) {
            if (error_out) *error_out = "'method' must be a string";
            return std::nullopt;
        }
        request.method = json["method"].get<std::string>();
    }

    if (json.contains("headers") && !json["headers"].is_null()) {
        const auto& headers = json["headers"];
        if (!headers.is_object()) {
            if (error_out) *error_out = "'headers' must be an object of strings";
            return std::nullopt;
        }
        for (const auto& item : headers.items()) {
            if (!item.value().is_string()) {
                if (error_out) *error_out = "header '" + item.key() + "' must be a string";
                return std::nullopt;
            }
            request.headers[item.key()] = item.value().get<std::string>();
        }
    }

    if (json.contains("body") && !json["body"].is_null()) {
        if (!json["body"].is_string()) {
            if (error_out) *error_out = "'body' must be a string or null";
            return std::nullopt;
        }
        request.body = json["body"].get<std::string>();
    }
    return request;
}

std::optional<FetchRequest> ParseFetchRequest(std::string_view text, std::string* error_out) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        if (error_out) *error_out = "fetch options are not valid JSON";
        return std::nullopt;
    }
    return ParseFetchRequest(json, error_out);
}

bool ValidateFetchRequest(const FetchRequest& request, std::string* error_out) {
    if (!IsHttpToken(request.method)) {
        if (error_out) *error_out = "invalid HTTP method: " + request.method;
        return false;
    }
    if (!ParseUrl(request.url)) {
        if (error_out) *error_out = "invalid URL: " + request.url;
        return false;
    }
    for (const auto& [name, value] : request.headers) {
        if (!IsHttpToken(name)) {
            if (error_out) *error_out = "invalid header name " + name;
            return false;
        }
        if (!IsValidHeaderValue(value)) {
            if (error_out) *error_out = "invalid header value for " + name;
            return false;
        }
    }
    return true;
}

FetchResult MakeFetchFailure(const std::string& code, const std::string& message) {
    FetchResult result{};
    result.status = 0;
    result.error = FetchError{code, message};
    return result;
}

nlohmann::json ToJson(const FetchResult& result) {
    nlohmann::json json = {
        {"status", result.status},
        {"headers", result.headers},
        {"body", result.body},
        {"error", nullptr}
    };
    if (result.error) {
        json["error"] = {{"code", result.error->code}, {"message", result.error->message}};
    }
    return json;
}

std::string SerializeFetchResult(const FetchResult& result) {
    return ToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<FetchResult> ParseFetchResult(std::string_view text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    try {
        FetchResult result{};
        result.status = json.at("status").get<int>();
        result.headers = json.at("headers").get<std::map<std::string, std::string>>();
        result.body = json.at("body").get<std::string>();
        const auto& error = json.at("error");
        if (!error.is_null()) {
            result.error = FetchError{
                error.at("code").get<std::string>(),
                error.at("message").get<std::string>()};
        }
        return result;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

}  // namespace hoya::host
