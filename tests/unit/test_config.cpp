/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and derived limits.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace sandbox_runner;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sr_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.auth.token_env, "AUTH_TOKEN");
    EXPECT_TRUE(config.auth.health_requires_auth);
    EXPECT_EQ(config.admission.max_concurrent, 0u);
    EXPECT_EQ(config.limits.default_timeout_s, 30u);
    EXPECT_EQ(config.sandbox.backend, "process");
    EXPECT_TRUE(config.sandbox.require_isolation);
    EXPECT_EQ(config.dataset.path.string(), "/bucket_data");
    EXPECT_TRUE(config.languages.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [server]
        host = "127.0.0.1"
        port = 9000
        worker_threads = 12

        [auth]
        token_env = "RUNNER_TOKEN"
        health_requires_auth = false

        [admission]
        max_concurrent = 6
        backlog = 3
        max_queue_wait_ms = 500

        [limits]
        default_timeout_s = 10
        max_timeout_s = 60
        memory_mb = 256
        max_processes = 64

        [sandbox]
        work_root = "/var/tmp/runner"
        isolate_network = false
        require_isolation = false
        kill_grace_ms = 500

        [dataset]
        enabled = false

        [telemetry]
        log_dir = "/tmp/sr_logs"
        log_level = "debug"
        qps_window_s = 30
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.server.worker_threads, 12u);
    EXPECT_EQ(config.auth.token_env, "RUNNER_TOKEN");
    EXPECT_FALSE(config.auth.health_requires_auth);
    EXPECT_EQ(config.admission.max_concurrent, 6u);
    EXPECT_EQ(config.admission.backlog, 3u);
    EXPECT_EQ(config.admission.max_queue_wait_ms, 500u);
    EXPECT_EQ(config.limits.default_timeout_s, 10u);
    EXPECT_EQ(config.limits.max_timeout_s, 60u);
    EXPECT_EQ(config.limits.memory_mb, 256u);
    EXPECT_EQ(config.sandbox.work_root.string(), "/var/tmp/runner");
    EXPECT_FALSE(config.sandbox.isolate_network);
    EXPECT_FALSE(config.sandbox.require_isolation);
    EXPECT_EQ(config.sandbox.kill_grace_ms, 500u);
    EXPECT_FALSE(config.dataset.enabled);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.qps_window_s, 30u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [server]
        port = 7000
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->server.port, 7000);
    // Defaults for everything else
    EXPECT_EQ(result->server.host, "0.0.0.0");
    EXPECT_EQ(result->limits.max_timeout_s, 120u);
}

TEST_F(ConfigTest, LanguageOverrides) {
    auto path = write_toml(R"(
        [languages.python]
        run = ["python3", "-I", "{source}"]
        env = { PYTHONHASHSEED = "0" }

        [languages.cpp]
        source_file = "prog.cc"
        compile = ["clang++", "-O1", "-o", "{binary}", "{source}"]
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->languages.size(), 2u);

    const auto& python = result->languages.at(Language::Python);
    ASSERT_TRUE(python.run.has_value());
    EXPECT_EQ(python.run->at(1), "-I");
    EXPECT_EQ(python.env.at("PYTHONHASHSEED"), "0");
    EXPECT_FALSE(python.compile.has_value());

    const auto& cpp = result->languages.at(Language::Cpp);
    EXPECT_EQ(cpp.source_file, "prog.cc");
    ASSERT_TRUE(cpp.compile.has_value());
    EXPECT_EQ(cpp.compile->front(), "clang++");
}

TEST_F(ConfigTest, RejectsBadValues) {
    EXPECT_FALSE(load_config(write_toml("[languages.cobol]\nrun = [\"cobc\"]\n")).has_value());
    EXPECT_FALSE(load_config(write_toml("[languages.python]\nrun = [\"python3\", 3]\n")).has_value());
    EXPECT_FALSE(load_config(write_toml("[telemetry]\nlog_level = \"chatty\"\n")).has_value());
    EXPECT_FALSE(load_config(write_toml(
        "[limits]\ndefault_timeout_s = 200\nmax_timeout_s = 100\n")).has_value());
    EXPECT_FALSE(load_config(write_toml("[limits]\ndefault_timeout_s = 0\n")).has_value());
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}

// ─── Derived values ──────────────────────────

TEST(DeriveCapacityTest, ExplicitCeilingWins) {
    auto config = default_config();
    config.admission.max_concurrent = 7;
    EXPECT_EQ(derive_capacity(config, 1ULL << 40), 7u);
}

TEST(DeriveCapacityTest, MinOfCpuAndMemory) {
    auto config = default_config();
    config.admission.cpus = 8;
    config.admission.sessions_per_cpu = 2;
    config.limits.memory_mb = 512;

    // 4 GiB / 512 MiB = 8 < 16
    EXPECT_EQ(derive_capacity(config, 4ULL * 1024 * 1024 * 1024), 8u);
    // 64 GiB allows 128; CPU bound is 16
    EXPECT_EQ(derive_capacity(config, 64ULL * 1024 * 1024 * 1024), 16u);

    config.admission.memory_budget_mb = 1024;
    EXPECT_EQ(derive_capacity(config, 64ULL * 1024 * 1024 * 1024), 2u);
}

TEST(DeriveCapacityTest, NeverBelowOne) {
    auto config = default_config();
    config.limits.memory_mb = 4096;
    EXPECT_EQ(derive_capacity(config, 1024ULL * 1024 * 1024), 1u);
}

TEST(DeriveCapacityTest, UnknownHostMemoryFallsBackToCpu) {
    auto config = default_config();
    config.admission.cpus = 3;
    EXPECT_EQ(derive_capacity(config, 0), 3u);
}

TEST(ResourceLimitsTest, ConvertsUnits) {
    LimitsConfig limits;
    limits.memory_mb = 128;
    limits.max_file_size_mb = 2;
    limits.max_processes = 32;
    limits.max_output_bytes = 4096;

    auto out = resource_limits(limits);
    EXPECT_EQ(out.memory_bytes, 128ULL * 1024 * 1024);
    EXPECT_EQ(out.max_file_size_bytes, 2ULL * 1024 * 1024);
    EXPECT_EQ(out.max_processes, 32u);
    EXPECT_EQ(out.max_output_bytes, 4096u);
    EXPECT_EQ(out.cpu_time_seconds, 0u);
}
