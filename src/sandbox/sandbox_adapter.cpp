#include "sandbox/sandbox_adapter.hpp"

namespace hoya::sandbox {

const char* ToString(GuestKind kind) {
    switch (kind) {
        case GuestKind::kScript: return "javascript";
        case GuestKind::kModule: return "webassembly";
    }
    return "unknown";
}

const char* ToString(ExecutionStage stage) {
    switch (stage) {
        case ExecutionStage::kReceived: return "received";
        case ExecutionStage::kClassified: return "classified";
        case ExecutionStage::kDownloaded: return "downloaded";
        case ExecutionStage::kInstantiating: return "instantiating";
        case ExecutionStage::kRunning: return "running";
        case ExecutionStage::kCompleted: return "completed";
        case ExecutionStage::kFaulted: return "faulted";
    }
    return "unknown";
}

}  // namespace hoya::sandbox
