#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "host/fetch_client.hpp"
#include "host/fetch_types.hpp"
#include "host/guest_memory.hpp"
#include "host/output_capture.hpp"

namespace hoya::host {

// A failure the guest did not cause (host clock before the epoch, guest memory missing).
// Aborts the invocation instead of being reported back to the guest.
class HostFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class CallStatus {
    kOk,
    kOutOfBounds,
    kInvalidEncoding
};

const char* ToString(CallStatus status);

// The host functions a guest may call. Shared by both sandboxes; the script sandbox
// hands over native strings, the module sandbox hands over its linear memory.
class CapabilityBridge {
public:
    CapabilityBridge(OutputCapture& capture, FetchClient& fetch_client);

    // Writes "[LEVEL]: message" to the captured stdout. An empty level means INFO.
    void Log(const std::string& level, const std::string& message);

    // Unix time in whole seconds. Throws HostFault if the host clock is before the epoch.
    std::uint64_t Clock() const;

    // Decodes, validates and performs one request. Bad requests come back with status 0
    // and INVALID_REQUEST, transport failures with status 0 and FETCH_FAILED.
    FetchResult Fetch(std::string_view request_json);
    FetchResult Fetch(const FetchRequest& request);

    void Capture(CaptureStream stream, const std::string& text);

    CallStatus LogFromMemory(const GuestMemoryView& memory,
                             std::uint32_t level_ptr, std::uint32_t level_len,
                             std::uint32_t message_ptr, std::uint32_t message_len);

    // Returns the number of bytes written to [response_ptr, response_ptr + capacity), or
    // -(required size) when the serialized result does not fit. Nothing is written then.
    // Throws GuestMemoryError when the write itself falls outside guest memory.
    std::int32_t FetchFromMemory(GuestMemoryView& memory,
                                 std::uint32_t request_ptr, std::uint32_t request_len,
                                 std::uint32_t response_ptr, std::uint32_t response_capacity);

    CallStatus CaptureFromMemory(const GuestMemoryView& memory, CaptureStream stream,
                                 std::uint32_t ptr, std::uint32_t len);

    std::size_t FetchCount() const { return fetch_count_; }

private:
    OutputCapture& capture_;
    FetchClient& fetch_client_;
    std::size_t fetch_count_ = 0;
};

}  // namespace hoya::host
