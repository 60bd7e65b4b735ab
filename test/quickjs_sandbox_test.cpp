#include <string>

#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "sandbox/quickjs_sandbox.hpp"

namespace hoya::sandbox {
namespace {

class QuickJsSandboxTest : public ::testing::Test {
protected:
    std::string Run(const std::string& script) {
        GuestPayload payload{GuestKind::kScript, "https://example.com/test.js", script};
        auto instance = sandbox_.Instantiate(payload, bridge_);
        return instance->Run();
    }

    std::string Stdout() const { return capture_.Snapshot(host::CaptureStream::kStdout); }
    std::string Stderr() const { return capture_.Snapshot(host::CaptureStream::kStderr); }

    host::OutputCapture capture_{false};
    host::FetchClient client_{host::FetchClientOptions{.connect_timeout_s = 2,
                                                              .read_timeout_s = 2,
                                                              .follow_redirects = false,
                                                              .use_proxy = false}};
    host::CapabilityBridge bridge_{capture_, client_};
    QuickJsSandbox sandbox_;
};

TEST_F(QuickJsSandboxTest, EvaluatesExpression) {
    EXPECT_EQ(Run("1+1"), "2");
    EXPECT_EQ(Stdout(), "");
    EXPECT_EQ(Stderr(), "");
}

TEST_F(QuickJsSandboxTest, LogWritesLevelTaggedLine) {
    EXPECT_EQ(Run(R"(log("INFO", "hello"))"), "undefined");
    EXPECT_EQ(Stdout(), "[INFO]: hello\n");
}

TEST_F(QuickJsSandboxTest, LogOrderMatchesCallOrder) {
    Run(R"(for (let i = 0; i < 5; i++) { log("debug", "line " + i); })");
    EXPECT_EQ(Stdout(),
              "[DEBUG]: line 0\n[DEBUG]: line 1\n[DEBUG]: line 2\n[DEBUG]: line 3\n[DEBUG]: line 4\n");
}

TEST_F(QuickJsSandboxTest, AliasesAreInstalled) {
    EXPECT_EQ(Run(R"(app_log(undefined, "via alias"); typeof get_unixtime())"), "number");
    EXPECT_EQ(Stdout(), "[INFO]: via alias\n");
    EXPECT_EQ(Run("clock() > 1600000000"), "true");
}

TEST_F(QuickJsSandboxTest, ConsoleRoutesToStreams) {
    Run(R"(
        console.log("a", 1, {k: [1, 2]});
        console.info("info");
        console.debug(null);
        console.warn("careful");
        console.error("bad", true);
    )");
    EXPECT_EQ(Stdout(), "a 1 {\"k\":[1,2]}\ninfo\nnull\n");
    EXPECT_EQ(Stderr(), "careful\nbad true\n");
}

TEST_F(QuickJsSandboxTest, ConvertsCompletionValues) {
    EXPECT_EQ(Run("'abc'"), "abc");
    EXPECT_EQ(Run("true"), "true");
    EXPECT_EQ(Run("null"), "null");
    EXPECT_EQ(Run("undefined"), "undefined");
    EXPECT_EQ(Run("0.5 + 0.25"), "0.75");
}

TEST_F(QuickJsSandboxTest, ReportsNonPrimitiveResults) {
    EXPECT_EQ(Run("({a: 1})"), "Execution resulted in a non-primitive type: Object");
    EXPECT_EQ(Run("[1, 2]"), "Execution resulted in a non-primitive type: Array");
    EXPECT_EQ(Run("(function () {})"), "Execution resulted in a non-primitive type: Function");
    EXPECT_EQ(Run("Symbol('s')"), "Execution resulted in a non-primitive type: Symbol");
    EXPECT_EQ(Run("10n"), "Execution resulted in a non-primitive type: BigInt");
}

TEST_F(QuickJsSandboxTest, UncaughtExceptionFaultsWhileRunning) {
    try {
        Run(R"(log("INFO", "before"); throw new Error("boom");)");
        FAIL() << "expected GuestFault";
    } catch (const GuestFault& fault) {
        EXPECT_EQ(fault.Stage(), ExecutionStage::kRunning);
        EXPECT_FALSE(fault.Internal());
        EXPECT_NE(std::string(fault.what()).find("boom"), std::string::npos);
    }
    EXPECT_EQ(Stdout(), "[INFO]: before\n");
}

TEST_F(QuickJsSandboxTest, SyntaxErrorFaults) {
    EXPECT_THROW(Run("let = ;"), GuestFault);
}

TEST_F(QuickJsSandboxTest, InvalidUtf8ScriptIsRejectedBeforeEvaluation) {
    GuestPayload payload{GuestKind::kScript, "https://example.com/bad.js", std::string("'\xC3\x28'", 4)};
    try {
        sandbox_.Instantiate(payload, bridge_);
        FAIL() << "expected GuestFault";
    } catch (const GuestFault& fault) {
        EXPECT_TRUE(fault.Internal());
        EXPECT_EQ(fault.Stage(), ExecutionStage::kInstantiating);
    }
}

TEST_F(QuickJsSandboxTest, FetchTransportFailureIsAValue) {
    const auto output = Run(R"(
        const r = fetch({url: "http://127.0.0.1:1/none"});
        r.status + ":" + r.error.code
    )");
    EXPECT_EQ(output, "0:FETCH_FAILED");
}

TEST_F(QuickJsSandboxTest, FetchInvalidRequestThrowsWithCode) {
    const auto output = Run(R"(
        let seen = "none";
        try { fetch({url: "ftp://example.com/"}); } catch (e) { seen = e.code + "|" + (e instanceof Error); }
        seen
    )");
    EXPECT_EQ(output, "INVALID_REQUEST|true");
    EXPECT_EQ(Run(R"(try { fetch(42); "no" } catch (e) { e.code })"), "INVALID_REQUEST");
}

TEST_F(QuickJsSandboxTest, FetchAcceptsBareUrlString) {
    EXPECT_EQ(Run(R"(fetch("http://127.0.0.1:1/").status)"), "0");
}

TEST_F(QuickJsSandboxTest, EachInstanceStartsClean) {
    Run("var leaked = 5;");
    EXPECT_EQ(Run("typeof leaked"), "undefined");
}

}  // namespace
}  // namespace hoya::sandbox
