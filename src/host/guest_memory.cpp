#include "host/guest_memory.hpp"

#include <cstring>

#include "utils/common.hpp"

namespace hoya::host {

const char* ToString(MemoryFault fault) {
    switch (fault) {
        case MemoryFault::kOutOfBounds: return "OutOfBounds";
        case MemoryFault::kInvalidEncoding: return "InvalidEncoding";
    }
    return "Unknown";
}

GuestMemoryError::GuestMemoryError(MemoryFault fault, const std::string& message)
    : std::runtime_error(message)
    , fault_(fault) {}

GuestMemoryView::GuestMemoryView(std::uint8_t* base, std::size_t size)
    : base_(base)
    , size_(base ? size : 0) {}

bool GuestMemoryView::Contains(std::size_t offset, std::size_t length) const {
    return length <= size_ && offset <= size_ - length;
}

void GuestMemoryView::Check(std::size_t offset, std::size_t length) const {
    if (!Contains(offset, length)) {
        throw GuestMemoryError(
            MemoryFault::kOutOfBounds,
            "range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                ") exceeds guest memory of " + std::to_string(size_) + " bytes");
    }
}

std::string_view GuestMemoryView::Read(std::size_t offset, std::size_t length) const {
    Check(offset, length);
    if (length == 0) {
        return {};
    }
    return std::string_view(reinterpret_cast<const char*>(base_ + offset), length);
}

std::string GuestMemoryView::ReadUtf8(std::size_t offset, std::size_t length) const {
    const auto bytes = Read(offset, length);
    if (!utils::IsValidUtf8(bytes)) {
        throw GuestMemoryError(
            MemoryFault::kInvalidEncoding,
            "guest string at offset " + std::to_string(offset) + " is not valid UTF-8");
    }
    return std::string(bytes);
}

void GuestMemoryView::Write(std::size_t offset, std::string_view bytes) {
    Check(offset, bytes.size());
    if (!bytes.empty()) {
        std::memcpy(base_ + offset, bytes.data(), bytes.size());
    }
}

}  // namespace hoya::host
