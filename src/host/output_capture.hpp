#pragma once

#include <mutex>
#include <string>

namespace hoya::host {

enum class CaptureStream {
    kStdout,
    kStderr
};

const char* ToString(CaptureStream stream);

// Append-only stdout/stderr pair owned by one execution session.
class OutputCapture {
public:
    explicit OutputCapture(bool mirror_to_host = true);

    // Appends text plus a newline. The lock covers the append only; the host mirror
    // is written after it is released.
    void Write(CaptureStream stream, const std::string& text);
    std::string Snapshot(CaptureStream stream) const;

private:
    mutable std::mutex mutex_;
    std::string stdout_;
    std::string stderr_;
    bool mirror_to_host_ = true;
};

}  // namespace hoya::host
