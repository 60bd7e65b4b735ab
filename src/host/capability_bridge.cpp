#include "host/capability_bridge.hpp"

#include <chrono>
#include <limits>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::host {
namespace {

CallStatus StatusFor(const GuestMemoryError& error) {
    return error.Fault() == MemoryFault::kInvalidEncoding ? CallStatus::kInvalidEncoding
                                                         : CallStatus::kOutOfBounds;
}

}  // namespace

const char* ToString(CallStatus status) {
    switch (status) {
        case CallStatus::kOk: return "ok";
        case CallStatus::kOutOfBounds: return "out_of_bounds";
        case CallStatus::kInvalidEncoding: return "invalid_encoding";
    }
    return "unknown";
}

CapabilityBridge::CapabilityBridge(OutputCapture& capture, FetchClient& fetch_client)
    : capture_(capture)
    , fetch_client_(fetch_client) {}

void CapabilityBridge::Log(const std::string& level, const std::string& message) {
    const auto tag = level.empty() ? std::string("INFO") : utils::ToUpper(level);
    capture_.Write(CaptureStream::kStdout, "[" + tag + "]: " + message);
}

std::uint64_t CapabilityBridge::Clock() const {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    if (seconds < 0) {
        throw HostFault("host clock is before the Unix epoch");
    }
    return static_cast<std::uint64_t>(seconds);
}

FetchResult CapabilityBridge::Fetch(std::string_view request_json) {
    std::string error;
    auto request = ParseFetchRequest(request_json, &error);
    if (!request) {
        ++fetch_count_;
        utils::Log(utils::LogLevel::kDebug, "fetch", "rejected reason=" + error);
        return MakeFetchFailure(kFetchInvalidRequest, error);
    }
    return Fetch(*request);
}

FetchResult CapabilityBridge::Fetch(const FetchRequest& request) {
    ++fetch_count_;
    std::string error;
    if (!ValidateFetchRequest(request, &error)) {
        utils::Log(utils::LogLevel::kDebug, "fetch", "rejected reason=" + error);
        return MakeFetchFailure(kFetchInvalidRequest, error);
    }
    return fetch_client_.Send(request);
}

void CapabilityBridge::Capture(CaptureStream stream, const std::string& text) {
    capture_.Write(stream, text);
}

CallStatus CapabilityBridge::LogFromMemory(const GuestMemoryView& memory,
                                           std::uint32_t level_ptr, std::uint32_t level_len,
                                           std::uint32_t message_ptr, std::uint32_t message_len) {
    try {
        const auto level = memory.ReadUtf8(level_ptr, level_len);
        const auto message = memory.ReadUtf8(message_ptr, message_len);
        Log(level, message);
        return CallStatus::kOk;
    } catch (const GuestMemoryError& ex) {
        utils::Log(utils::LogLevel::kWarn, "bridge", std::string("log call dropped: ") + ex.what());
        return StatusFor(ex);
    }
}

std::int32_t CapabilityBridge::FetchFromMemory(GuestMemoryView& memory,
                                               std::uint32_t request_ptr, std::uint32_t request_len,
                                               std::uint32_t response_ptr,
                                               std::uint32_t response_capacity) {
    FetchResult result{};
    try {
        const auto request_json = memory.ReadUtf8(request_ptr, request_len);
        result = Fetch(request_json);
    } catch (const GuestMemoryError& ex) {
        ++fetch_count_;
        result = MakeFetchFailure(kFetchInvalidRequest, ex.what());
    }

    const auto serialized = SerializeFetchResult(result);
    if (serialized.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        return std::numeric_limits<std::int32_t>::min();
    }
    const auto size = static_cast<std::int32_t>(serialized.size());
    if (serialized.size() > response_capacity) {
        return -size;
    }
    memory.Write(response_ptr, serialized);
    return size;
}

CallStatus CapabilityBridge::CaptureFromMemory(const GuestMemoryView& memory, CaptureStream stream,
                                               std::uint32_t ptr, std::uint32_t len) {
    try {
        Capture(stream, memory.ReadUtf8(ptr, len));
        return CallStatus::kOk;
    } catch (const GuestMemoryError& ex) {
        utils::Log(utils::LogLevel::kWarn, "bridge",
                   std::string("capture_") + ToString(stream) + " call dropped: " + ex.what());
        return StatusFor(ex);
    }
}

}  // namespace hoya::host
