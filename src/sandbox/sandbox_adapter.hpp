#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "host/capability_bridge.hpp"

namespace hoya::sandbox {

enum class GuestKind {
    kScript,
    kModule
};

// "javascript" / "webassembly", the code_type reported in result metadata.
const char* ToString(GuestKind kind);

enum class ExecutionStage {
    kReceived,
    kClassified,
    kDownloaded,
    kInstantiating,
    kRunning,
    kCompleted,
    kFaulted
};

const char* ToString(ExecutionStage stage);

struct GuestPayload {
    GuestKind kind = GuestKind::kScript;
    std::string url;
    std::string bytes;
};

// Raised by adapters. `internal` marks failures that are not the engine's report on guest
// code: a module without a memory export, or a host fault surfaced through the bridge.
class GuestFault : public std::runtime_error {
public:
    GuestFault(ExecutionStage stage, const std::string& message, bool internal = false)
        : std::runtime_error(message)
        , stage_(stage)
        , internal_(internal) {}

    ExecutionStage Stage() const { return stage_; }
    bool Internal() const { return internal_; }

private:
    ExecutionStage stage_;
    bool internal_;
};

class GuestInstance {
public:
    virtual ~GuestInstance() = default;
    // Runs the guest to completion and returns its output string. Single use.
    virtual std::string Run() = 0;
};

class SandboxAdapter {
public:
    virtual ~SandboxAdapter() = default;
    virtual GuestKind Kind() const = 0;
    // The bridge must outlive the returned instance.
    virtual std::unique_ptr<GuestInstance> Instantiate(const GuestPayload& payload,
                                                       host::CapabilityBridge& bridge) = 0;
};

}  // namespace hoya::sandbox
