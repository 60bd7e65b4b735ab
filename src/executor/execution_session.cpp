#include "executor/execution_session.hpp"

namespace hoya::executor {

ExecutionSession::ExecutionSession(const host::FetchClientOptions& fetch_options, bool mirror_output)
    : capture_(mirror_output)
    , fetch_client_(fetch_options)
    , bridge_(capture_, fetch_client_)
    , started_(std::chrono::steady_clock::now()) {}

void ExecutionSession::StartTimer() {
    started_ = std::chrono::steady_clock::now();
}

std::uint64_t ExecutionSession::ElapsedMs() const {
    const auto elapsed = std::chrono::steady_clock::now() - started_;
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

}  // namespace hoya::executor
