#include "host/output_capture.hpp"

#include <iostream>

namespace hoya::host {

const char* ToString(CaptureStream stream) {
    switch (stream) {
        case CaptureStream::kStdout: return "stdout";
        case CaptureStream::kStderr: return "stderr";
    }
    return "unknown";
}

OutputCapture::OutputCapture(bool mirror_to_host)
    : mirror_to_host_(mirror_to_host) {}

void OutputCapture::Write(CaptureStream stream, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& target = stream == CaptureStream::kStdout ? stdout_ : stderr_;
        target.append(text);
        target.push_back('\n');
    }
    if (!mirror_to_host_) {
        return;
    }
    if (stream == CaptureStream::kStdout) {
        std::cout << "[guest] " << text << std::endl;
    } else {
        std::cerr << "[guest] " << text << std::endl;
    }
}

std::string OutputCapture::Snapshot(CaptureStream stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream == CaptureStream::kStdout ? stdout_ : stderr_;
}

}  // namespace hoya::host
