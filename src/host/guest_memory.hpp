#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hoya::host {

enum class MemoryFault {
    kOutOfBounds,
    kInvalidEncoding
};

const char* ToString(MemoryFault fault);

class GuestMemoryError : public std::runtime_error {
public:
    GuestMemoryError(MemoryFault fault, const std::string& message);

    MemoryFault Fault() const { return fault_; }

private:
    MemoryFault fault_;
};

// Non-owning view over a guest's linear memory. Valid only for the duration of one
// capability call: the guest may grow (and move) its memory between calls.
class GuestMemoryView {
public:
    GuestMemoryView(std::uint8_t* base, std::size_t size);

    std::size_t Size() const { return size_; }

    // True when [offset, offset + length) lies inside the region. Never overflows.
    bool Contains(std::size_t offset, std::size_t length) const;

    std::string_view Read(std::size_t offset, std::size_t length) const;
    std::string ReadUtf8(std::size_t offset, std::size_t length) const;
    void Write(std::size_t offset, std::string_view bytes);

private:
    void Check(std::size_t offset, std::size_t length) const;

    std::uint8_t* base_;
    std::size_t size_;
};

}  // namespace hoya::host
