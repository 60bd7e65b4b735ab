#pragma once

#include <cstdint>
#include <string>

#include "sandbox/sandbox_adapter.hpp"

namespace hoya::sandbox {

struct Wasm3Options {
    std::uint32_t stack_bytes = 64 * 1024;
    std::string entry_point = "_start";
};

// Runs a module payload in a fresh wasm3 environment and runtime. The module must export
// its memory as "memory"; the bridge is linked under the "env" import namespace.
class Wasm3Sandbox : public SandboxAdapter {
public:
    explicit Wasm3Sandbox(Wasm3Options options = {});

    GuestKind Kind() const override { return GuestKind::kModule; }
    std::unique_ptr<GuestInstance> Instantiate(const GuestPayload& payload,
                                               host::CapabilityBridge& bridge) override;

private:
    Wasm3Options options_;
};

}  // namespace hoya::sandbox
