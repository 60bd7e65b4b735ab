#pragma once

#include <chrono>
#include <cstdint>

#include "host/capability_bridge.hpp"
#include "host/fetch_client.hpp"
#include "host/output_capture.hpp"
#include "sandbox/sandbox_adapter.hpp"

namespace hoya::executor {

// Per-invocation state. Created for one execute call and destroyed with it; nothing in
// here is shared with another session.
class ExecutionSession {
public:
    explicit ExecutionSession(const host::FetchClientOptions& fetch_options,
                              bool mirror_output = true);

    ExecutionSession(const ExecutionSession&) = delete;
    ExecutionSession& operator=(const ExecutionSession&) = delete;

    host::CapabilityBridge& Bridge() { return bridge_; }
    const host::OutputCapture& Capture() const { return capture_; }

    sandbox::ExecutionStage Stage() const { return stage_; }
    void Advance(sandbox::ExecutionStage stage) { stage_ = stage; }

    void StartTimer();
    std::uint64_t ElapsedMs() const;

private:
    host::OutputCapture capture_;
    host::FetchClient fetch_client_;
    host::CapabilityBridge bridge_;
    sandbox::ExecutionStage stage_ = sandbox::ExecutionStage::kReceived;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace hoya::executor
