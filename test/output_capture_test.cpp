#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "host/output_capture.hpp"

namespace hoya::host {
namespace {

TEST(OutputCaptureTest, AppendsLinesInCallOrder) {
    OutputCapture capture(false);
    capture.Write(CaptureStream::kStdout, "first");
    capture.Write(CaptureStream::kStderr, "oops");
    capture.Write(CaptureStream::kStdout, "second");

    EXPECT_EQ(capture.Snapshot(CaptureStream::kStdout), "first\nsecond\n");
    EXPECT_EQ(capture.Snapshot(CaptureStream::kStderr), "oops\n");
}

TEST(OutputCaptureTest, SnapshotDoesNotClear) {
    OutputCapture capture(false);
    capture.Write(CaptureStream::kStdout, "kept");
    EXPECT_EQ(capture.Snapshot(CaptureStream::kStdout), "kept\n");
    EXPECT_EQ(capture.Snapshot(CaptureStream::kStdout), "kept\n");
}

TEST(OutputCaptureTest, ConcurrentWritersNeverInterleaveWithinALine) {
    OutputCapture capture(false);
    constexpr int kThreads = 8;
    constexpr int kLinesPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&capture, t]() {
            const std::string line(32, static_cast<char>('a' + t));
            for (int i = 0; i < kLinesPerThread; ++i) {
                capture.Write(CaptureStream::kStdout, line);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto out = capture.Snapshot(CaptureStream::kStdout);
    std::size_t lines = 0;
    std::size_t start = 0;
    while (start < out.size()) {
        const auto end = out.find('\n', start);
        ASSERT_NE(end, std::string::npos);
        const auto line = out.substr(start, end - start);
        ASSERT_EQ(line.size(), 32u);
        EXPECT_EQ(line.find_first_not_of(line.front()), std::string::npos);
        ++lines;
        start = end + 1;
    }
    EXPECT_EQ(lines, static_cast<std::size_t>(kThreads * kLinesPerThread));
}

TEST(OutputCaptureTest, StreamNames) {
    EXPECT_STREQ(ToString(CaptureStream::kStdout), "stdout");
    EXPECT_STREQ(ToString(CaptureStream::kStderr), "stderr");
}

}  // namespace
}  // namespace hoya::host
