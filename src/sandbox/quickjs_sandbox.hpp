#pragma once

#include "sandbox/sandbox_adapter.hpp"

namespace hoya::sandbox {

// Runs a script payload in a fresh QuickJS runtime and context. Globals: log, clock, fetch,
// app_log, get_unixtime and console.
class QuickJsSandbox : public SandboxAdapter {
public:
    GuestKind Kind() const override { return GuestKind::kScript; }
    std::unique_ptr<GuestInstance> Instantiate(const GuestPayload& payload,
                                               host::CapabilityBridge& bridge) override;
};

}  // namespace hoya::sandbox
