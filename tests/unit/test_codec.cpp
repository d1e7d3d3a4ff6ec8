/**
 * @file test_codec.cpp
 * @brief Unit tests for the /execute request decoder and response encoders.
 * @author Dimitris Kafetzis
 */

#include "api/codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace sandbox_runner;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

Result<ExecutionRequest> decode(std::string_view body) {
    return decode_execute_request(body, DecodeDefaults{.timeout = 30000ms,
                                                       .use_shared_dataset = false});
}

}  // namespace

// ═══════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════

TEST(DecodeRequestTest, MinimalBodyUsesDefaults) {
    auto request = decode(R"json({"code": "print(1)"})json");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->language, Language::Python);
    EXPECT_EQ(request->code, "print(1)");
    EXPECT_EQ(request->timeout, 30000ms);
    EXPECT_TRUE(request->packages.empty());
    EXPECT_FALSE(request->use_shared_dataset);
    EXPECT_EQ(request->priority, 0);
}

TEST(DecodeRequestTest, FullBody) {
    auto request = decode(R"json({
        "language": "JS",
        "code": "console.log(1)",
        "timeout": 2.5,
        "packages": ["lodash", "left-pad"],
        "use_shared_dataset": true,
        "priority": 7
    })json");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->language, Language::JavaScript);
    EXPECT_EQ(request->timeout, 2500ms);
    EXPECT_EQ(request->packages, (std::vector<std::string>{"lodash", "left-pad"}));
    EXPECT_TRUE(request->use_shared_dataset);
    EXPECT_EQ(request->priority, 7);
}

TEST(DecodeRequestTest, LibrariesAliasAndCommaString) {
    auto request = decode(R"({"code": "x", "packages": "numpy, pandas", "libraries": ["scipy"]})");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->packages, (std::vector<std::string>{"numpy", "pandas", "scipy"}));
}

TEST(DecodeRequestTest, DatasetDefaultFollowsServer) {
    auto request = decode_execute_request(R"({"code": "x"})",
                                          DecodeDefaults{.timeout = 1000ms,
                                                         .use_shared_dataset = true});
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->use_shared_dataset);
    EXPECT_EQ(request->timeout, 1000ms);
}

TEST(DecodeRequestTest, NullFieldsMeanDefault) {
    auto request = decode(R"({"code": "x", "language": null, "timeout": null, "packages": null})");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->language, Language::Python);
    EXPECT_EQ(request->timeout, 30000ms);
}

TEST(DecodeRequestTest, Rejections) {
    const char* bodies[] = {
        "not json",
        "[1,2,3]",
        R"({"language": "python"})",
        R"({"code": 42})",
        R"({"code": "x", "language": "cobol"})",
        R"({"code": "x", "language": 3})",
        R"({"code": "x", "timeout": 0})",
        R"({"code": "x", "timeout": -1})",
        R"({"code": "x", "timeout": "10"})",
        R"({"code": "x", "packages": [1]})",
        R"({"code": "x", "packages": {"a": 1}})",
        R"({"code": "x", "use_shared_dataset": "yes"})",
        R"({"code": "x", "priority": 1.5})",
        R"({"code": "x", "priority": 101})",
    };
    for (const char* body : bodies) {
        auto request = decode(body);
        ASSERT_FALSE(request.has_value()) << body;
        EXPECT_EQ(request.error().kind, ErrorKind::Validation) << body;
    }
}

// ═══════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════

TEST(EncodeReportTest, CompletedShape) {
    ExecutionReport report;
    report.session_id = "abc";
    report.status = SessionState::Completed;
    report.stdout_data = "4950\n";
    report.exit_code = 0;
    report.duration_seconds = 0.12;

    auto body = json::parse(encode_report(report));
    EXPECT_EQ(body["session_id"], "abc");
    EXPECT_EQ(body["status"], "completed");
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["language"], "python");
    EXPECT_EQ(body["stdout"], "4950\n");
    EXPECT_EQ(body["stderr"], "");
    EXPECT_EQ(body["exit_code"], 0);
    EXPECT_EQ(body["truncated"], false);
    EXPECT_EQ(body["retryable"], false);
    EXPECT_FALSE(body.contains("error_kind"));
    EXPECT_TRUE(body["usage"].contains("cpu_seconds"));
    EXPECT_TRUE(body["usage"].contains("peak_memory_bytes"));
}

TEST(EncodeReportTest, TimedOutHasNullExitCode) {
    ExecutionReport report;
    report.status = SessionState::TimedOut;
    report.error_kind = ErrorKind::Timeout;
    report.reason = "wall_clock";
    report.message = "Execution exceeded the time limit";

    auto body = json::parse(encode_report(report));
    EXPECT_EQ(body["status"], "timed_out");
    EXPECT_TRUE(body["exit_code"].is_null());
    EXPECT_EQ(body["error_kind"], "timeout_error");
    EXPECT_EQ(body["reason"], "wall_clock");
    EXPECT_EQ(body["success"], false);
}

TEST(EncodeReportTest, InvalidUtf8OutputDoesNotThrow) {
    ExecutionReport report;
    report.status = SessionState::Completed;
    report.stdout_data = std::string("ok\xff\xfe", 4);

    std::string encoded;
    EXPECT_NO_THROW(encoded = encode_report(report));
    auto body = json::parse(encoded);
    EXPECT_TRUE(body["stdout"].get<std::string>().starts_with("ok"));
}

TEST(EncodeErrorTest, CarriesKindAndDetail) {
    auto body = json::parse(encode_error(Error{ErrorKind::Auth, "Not authenticated", "missing_token"}));
    EXPECT_EQ(body["error_kind"], "auth_error");
    EXPECT_EQ(body["detail"], "Not authenticated");
    EXPECT_EQ(body["reason"], "missing_token");
    EXPECT_EQ(body["status"], "failed");
    EXPECT_EQ(body["retryable"], false);

    auto rejected = json::parse(encode_error(Error{ErrorKind::AdmissionRejected, "busy"}));
    EXPECT_EQ(rejected["status"], "rejected");
    EXPECT_EQ(rejected["retryable"], true);
}

TEST(EncodeLanguagesTest, ListsEveryTemplate) {
    auto body = json::parse(encode_languages(LanguageTable::defaults()));
    ASSERT_EQ(body["languages"].size(), kAllLanguages.size());
    EXPECT_EQ(body["languages"][0], "python");
    EXPECT_EQ(body["details"][0]["packages"], true);
}

TEST(EncodeStatsTest, AdmissionAndSessions) {
    StatsInfo info;
    info.admission.capacity = 4;
    info.admission.active = 1;
    info.admission.rejected_timeout = 2;
    info.metrics.total = 9;
    info.metrics.qps = 0.15;

    auto body = json::parse(encode_stats(info));
    EXPECT_EQ(body["admission"]["capacity"], 4);
    EXPECT_EQ(body["admission"]["available"], 3);
    EXPECT_EQ(body["admission"]["rejected"]["queue_timeout"], 2);
    EXPECT_EQ(body["sessions"]["total"], 9);
    EXPECT_DOUBLE_EQ(body["qps"].get<double>(), 0.15);
    EXPECT_FALSE(body.contains("host"));
}

TEST(EncodeRootTest, AdvertisesAuthentication) {
    auto body = json::parse(encode_root("SandboxRunner", "1.0.0"));
    EXPECT_EQ(body["authentication"], "required");
    EXPECT_EQ(body["version"], "1.0.0");
}

// ═══════════════════════════════════════════════
// Status mapping
// ═══════════════════════════════════════════════

TEST(HttpStatusTest, ErrorKinds) {
    EXPECT_EQ(http_status_for(ErrorKind::Auth), 401);
    EXPECT_EQ(http_status_for(ErrorKind::Validation), 400);
    EXPECT_EQ(http_status_for(ErrorKind::AdmissionRejected), 503);
    EXPECT_EQ(http_status_for(ErrorKind::Provision), 503);
    EXPECT_EQ(http_status_for(ErrorKind::Internal), 500);
}

TEST(HttpStatusTest, ExecutedOutcomesAre200) {
    ExecutionReport report;
    report.status = SessionState::Completed;
    EXPECT_EQ(http_status_for(report), 200);
    report.status = SessionState::Failed;
    report.error_kind = ErrorKind::ExecutionFailure;
    EXPECT_EQ(http_status_for(report), 200);
    report.status = SessionState::TimedOut;
    report.error_kind = ErrorKind::Timeout;
    EXPECT_EQ(http_status_for(report), 200);
    report.status = SessionState::Rejected;
    report.error_kind = ErrorKind::AdmissionRejected;
    EXPECT_EQ(http_status_for(report), 503);
}
