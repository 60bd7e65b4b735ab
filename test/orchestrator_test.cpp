#include <atomic>
#include <map>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "executor/orchestrator.hpp"
#include "wasm_module_builder.hpp"

namespace hoya::executor {
namespace {

class FakeFetcher : public PayloadFetcher {
public:
    void Serve(const std::string& url, std::string body) { bodies_[url] = std::move(body); }

    std::string Download(const std::string& url) override {
        ++calls;
        auto it = bodies_.find(url);
        if (it == bodies_.end()) {
            throw AppError::Fetch(url, "HTTP 404", 404);
        }
        return it->second;
    }

    std::atomic<int> calls{0};

private:
    std::map<std::string, std::string> bodies_;
};

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest()
        : fetcher_(std::make_shared<FakeFetcher>())
        , orchestrator_(fetcher_, Options()) {}

    static OrchestratorOptions Options() {
        OrchestratorOptions options{};
        options.fetch.connect_timeout_s = 2;
        options.fetch.read_timeout_s = 2;
        options.fetch.use_proxy = false;
        options.mirror_guest_output = false;
        return options;
    }

    AppError ExpectFailure(const std::string& url) {
        try {
            orchestrator_.Execute(url);
        } catch (const AppError& ex) {
            return ex;
        }
        ADD_FAILURE() << "expected AppError for " << url;
        return AppError::Internal("no failure");
    }

    std::shared_ptr<FakeFetcher> fetcher_;
    Orchestrator orchestrator_;
};

TEST(ClassifyTest, UsesPathSuffixOnly) {
    using sandbox::GuestKind;
    EXPECT_EQ(Orchestrator::Classify("https://a.com/app.js"), GuestKind::kScript);
    EXPECT_EQ(Orchestrator::Classify("https://a.com/APP.JS"), GuestKind::kScript);
    EXPECT_EQ(Orchestrator::Classify("https://a.com/mod.wasm?v=2#top"), GuestKind::kModule);
    EXPECT_FALSE(Orchestrator::Classify("https://a.com/readme.txt").has_value());
    EXPECT_FALSE(Orchestrator::Classify("https://a.com/page?file=x.js").has_value());
    EXPECT_FALSE(Orchestrator::Classify("https://a.com/js").has_value());
}

TEST_F(OrchestratorTest, UnsupportedExtensionFailsWithoutDownloading) {
    const auto error = ExpectFailure("https://example.com/readme.txt");
    EXPECT_EQ(error.Kind(), AppErrorKind::kInternal);
    EXPECT_STREQ(error.Code(), "INTERNAL_ERROR");
    EXPECT_EQ(error.HttpStatus(), 500);
    EXPECT_EQ(std::string(error.what()),
              "Unsupported file extension. Only .js and .wasm are supported.");
    EXPECT_EQ(fetcher_->calls.load(), 0);
}

TEST_F(OrchestratorTest, RunsScriptAndReportsMetadata) {
    fetcher_->Serve("https://example.com/sum.js", "1+1");
    const auto result = orchestrator_.Execute("https://example.com/sum.js");
    EXPECT_TRUE(result.Succeeded());
    ASSERT_TRUE(result.output.has_value());
    EXPECT_EQ(*result.output, "2");
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.metadata.code_type, "javascript");
    EXPECT_EQ(result.metadata.resource_size, 3u);
    EXPECT_FALSE(result.metadata.timestamp.empty());
}

TEST_F(OrchestratorTest, RepeatedRunsAreIndependent) {
    fetcher_->Serve("https://example.com/log.js", R"(log("INFO", "hi"); 40 + 2)");
    const auto first = orchestrator_.Execute("https://example.com/log.js");
    const auto second = orchestrator_.Execute("https://example.com/log.js");
    EXPECT_EQ(first.output, second.output);
    EXPECT_EQ(first.stdout_text, "[INFO]: hi\n");
    EXPECT_EQ(second.stdout_text, "[INFO]: hi\n");
    EXPECT_EQ(first.metadata.resource_size, second.metadata.resource_size);
    EXPECT_EQ(fetcher_->calls.load(), 2);
}

TEST_F(OrchestratorTest, DownloadFailureIsAFetchError) {
    const auto error = ExpectFailure("https://example.com/missing.wasm");
    EXPECT_EQ(error.Kind(), AppErrorKind::kFetch);
    EXPECT_EQ(error.HttpStatus(), 502);
    EXPECT_EQ(error.Details()["url"], "https://example.com/missing.wasm");
    EXPECT_EQ(error.Details()["status"], 404);
    ASSERT_TRUE(error.Context().kind.has_value());
    EXPECT_EQ(*error.Context().kind, sandbox::GuestKind::kModule);
}

TEST_F(OrchestratorTest, InvalidUtf8ScriptIsInternal) {
    fetcher_->Serve("https://example.com/bad.js", std::string("'\xFF'", 3));
    const auto error = ExpectFailure("https://example.com/bad.js");
    EXPECT_EQ(error.Kind(), AppErrorKind::kInternal);
    EXPECT_NE(std::string(error.what()).find("UTF-8"), std::string::npos);
    EXPECT_EQ(error.Context().resource_size, 3u);
    ASSERT_TRUE(error.Context().kind.has_value());
    EXPECT_EQ(*error.Context().kind, sandbox::GuestKind::kScript);
}

TEST_F(OrchestratorTest, UnresolvedModuleImportIsAnEngineError) {
    test::WasmModuleBuilder builder;
    const auto void_type = builder.AddType({}, {});
    builder.ImportFunction("env", "not_provided", void_type);
    builder.SetMemory(1);
    fetcher_->Serve("https://example.com/import.wasm", builder.Build());

    const auto error = ExpectFailure("https://example.com/import.wasm");
    EXPECT_EQ(error.Kind(), AppErrorKind::kModuleEngine);
    EXPECT_STREQ(error.Code(), "WEBASSEMBLY_EXECUTION_ERROR");
    EXPECT_EQ(error.Details()["stage"], "instantiating");
}

TEST_F(OrchestratorTest, ScriptExceptionKeepsCapturedOutput) {
    fetcher_->Serve("https://example.com/throw.js",
                    R"(log("INFO", "before"); console.error("oops"); throw new Error("boom");)");
    const auto error = ExpectFailure("https://example.com/throw.js");
    EXPECT_EQ(error.Kind(), AppErrorKind::kScriptEngine);
    EXPECT_STREQ(error.Code(), "JAVASCRIPT_EXECUTION_ERROR");
    EXPECT_NE(std::string(error.what()).find("boom"), std::string::npos);
    EXPECT_EQ(error.Details()["errorType"], "QuickJS");
    EXPECT_EQ(error.Details()["stage"], "running");
    EXPECT_EQ(error.Context().stdout_text, "[INFO]: before\n");
    EXPECT_EQ(error.Context().stderr_text, "oops\n");

    const auto envelope = ToJson(FromError(error));
    EXPECT_EQ(envelope["status"], "error");
    EXPECT_EQ(envelope["stdout"], "[INFO]: before\n");
    EXPECT_EQ(envelope["metadata"]["code_type"], "javascript");
    EXPECT_EQ(envelope["error"]["code"], "JAVASCRIPT_EXECUTION_ERROR");
}

TEST_F(OrchestratorTest, ModuleWithoutMemoryIsInternal) {
    test::WasmModuleBuilder builder;
    const auto void_type = builder.AddType({}, {});
    builder.ExportFunction("_start", builder.AddFunction(void_type, {}));
    fetcher_->Serve("https://example.com/nomem.wasm", builder.Build());

    const auto error = ExpectFailure("https://example.com/nomem.wasm");
    EXPECT_EQ(error.Kind(), AppErrorKind::kInternal);
    EXPECT_NE(std::string(error.what()).find("memory"), std::string::npos);
}

TEST_F(OrchestratorTest, ModuleTrapIsAnEngineError) {
    test::WasmModuleBuilder builder;
    const auto void_type = builder.AddType({}, {});
    builder.SetMemory(1);
    builder.ExportFunction("_start", builder.AddFunction(void_type, test::op::Unreachable()));
    fetcher_->Serve("https://example.com/trap.wasm", builder.Build());

    const auto error = ExpectFailure("https://example.com/trap.wasm");
    EXPECT_EQ(error.Kind(), AppErrorKind::kModuleEngine);
    EXPECT_EQ(error.Details()["errorType"], "wasm3");
}

TEST_F(OrchestratorTest, RunsModuleEntryPoint) {
    test::WasmModuleBuilder builder;
    const auto void_type = builder.AddType({}, {});
    builder.SetMemory(1);
    builder.ExportFunction("_start", builder.AddFunction(void_type, {}));
    const auto bytes = builder.Build();
    fetcher_->Serve("https://example.com/ok.wasm", bytes);

    const auto result = orchestrator_.Execute("https://example.com/ok.wasm");
    EXPECT_EQ(result.output, "WASM module executed (_start)");
    EXPECT_EQ(result.metadata.code_type, "webassembly");
    EXPECT_EQ(result.metadata.resource_size, bytes.size());
}

}  // namespace
}  // namespace hoya::executor
