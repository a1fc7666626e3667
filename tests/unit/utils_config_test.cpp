#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <unordered_map>

#include "utils/config.h"

using namespace modelswitch;
namespace fs = std::filesystem;

namespace {

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

const std::vector<std::string> kProbeEnv = {
    "MODELSWITCH_CONFIG",
    "HOME",
    "MODELSWITCH_CONCURRENCY",
    "MODELSWITCH_TIMEOUT_MS",
    "MODELSWITCH_BATCH_TIMEOUT_MS",
    "MODELSWITCH_WARMUP",
    "MODELSWITCH_TLS_POLICY",
    "MODELSWITCH_RATE_LIMIT_STATUSES",
};

void clearProbeEnv(const fs::path& empty_home) {
    for (const auto& key : kProbeEnv) unsetenv(key.c_str());
    setenv("HOME", empty_home.string().c_str(), 1);
}
}  // namespace

TEST(UtilsConfigTest, DefaultsWithoutFileOrEnv) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_empty_home";
    fs::create_directories(home);
    clearProbeEnv(home);

    auto [cfg, log] = loadProbeConfigWithLog();

    EXPECT_EQ(cfg.concurrency, 5);
    EXPECT_EQ(cfg.timeout, std::chrono::milliseconds(8000));
    EXPECT_EQ(cfg.batch_timeout, std::chrono::milliseconds(0));
    EXPECT_FALSE(cfg.warmup);
    EXPECT_EQ(cfg.tls_policy, "relaxed");
    EXPECT_EQ(cfg.rate_limit_statuses, (std::vector<int>{409, 429}));
    EXPECT_EQ(cfg.fallback_statuses, (std::vector<int>{400, 405, 415, 422}));
    EXPECT_NE(log.find("sources=default"), std::string::npos);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, LoadsProbeSectionFromFile) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_file_home";
    fs::create_directories(home);
    clearProbeEnv(home);

    fs::path tmp = fs::temp_directory_path() / "modelswitch_probe_cfg.json";
    std::ofstream(tmp) << R"({
        "probe": {
            "concurrency": 8,
            "timeout_ms": 3000,
            "batch_timeout_ms": 20000,
            "warmup": true,
            "tls_policy": "strict",
            "rate_limit_statuses": [429, 403],
            "fallback_statuses": "400,422",
            "probe_model": "claude-test"
        }
    })";
    setenv("MODELSWITCH_CONFIG", tmp.string().c_str(), 1);

    auto info = loadProbeConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.concurrency, 8);
    EXPECT_EQ(cfg.timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.batch_timeout, std::chrono::milliseconds(20000));
    EXPECT_TRUE(cfg.warmup);
    EXPECT_EQ(cfg.tls_policy, "strict");
    EXPECT_EQ(cfg.rate_limit_statuses, (std::vector<int>{429, 403}));
    EXPECT_EQ(cfg.fallback_statuses, (std::vector<int>{400, 422}));
    EXPECT_EQ(cfg.probe_model, "claude-test");
    EXPECT_EQ(cfg.probe_path, "/v1/messages");
    EXPECT_NE(info.second.find("file="), std::string::npos);
    EXPECT_NE(info.second.find("sources=file"), std::string::npos);

    fs::remove(tmp);
    fs::remove_all(home);
}

TEST(UtilsConfigTest, EnvOverridesFile) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_env_home";
    fs::create_directories(home / ".modelswitch");
    clearProbeEnv(home);
    std::ofstream(home / ".modelswitch" / "config.json") << R"({"probe": {"concurrency": 2, "timeout_ms": 4000}})";

    setenv("MODELSWITCH_CONCURRENCY", "7", 1);
    setenv("MODELSWITCH_WARMUP", "yes", 1);
    setenv("MODELSWITCH_RATE_LIMIT_STATUSES", "429, 402", 1);

    auto [cfg, log] = loadProbeConfigWithLog();

    EXPECT_EQ(cfg.concurrency, 7);
    EXPECT_EQ(cfg.timeout, std::chrono::milliseconds(4000));
    EXPECT_TRUE(cfg.warmup);
    EXPECT_EQ(cfg.rate_limit_statuses, (std::vector<int>{429, 402}));
    EXPECT_NE(log.find(".modelswitch/config.json"), std::string::npos);
    EXPECT_NE(log.find("sources=env,file"), std::string::npos);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, InvalidEnvValuesAreIgnored) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_bad_env";
    fs::create_directories(home);
    clearProbeEnv(home);

    setenv("MODELSWITCH_CONCURRENCY", "many", 1);
    setenv("MODELSWITCH_TIMEOUT_MS", "-5", 1);
    setenv("MODELSWITCH_WARMUP", "perhaps", 1);
    setenv("MODELSWITCH_RATE_LIMIT_STATUSES", "429,abc", 1);

    auto cfg = loadProbeConfig();

    EXPECT_EQ(cfg.concurrency, 5);
    EXPECT_EQ(cfg.timeout, std::chrono::milliseconds(8000));
    EXPECT_FALSE(cfg.warmup);
    EXPECT_EQ(cfg.rate_limit_statuses, (std::vector<int>{409, 429}));

    fs::remove_all(home);
}

TEST(UtilsConfigTest, OutOfRangeEnvTimeoutsAreIgnored) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_huge_env";
    fs::create_directories(home);
    clearProbeEnv(home);

    setenv("MODELSWITCH_TIMEOUT_MS", "9300000000000", 1);
    setenv("MODELSWITCH_BATCH_TIMEOUT_MS", "86400001", 1);
    setenv("MODELSWITCH_CONCURRENCY", "99999999999", 1);

    auto [cfg, log] = loadProbeConfigWithLog();

    EXPECT_EQ(cfg.timeout, std::chrono::milliseconds(8000));
    EXPECT_EQ(cfg.batch_timeout, std::chrono::milliseconds(0));
    EXPECT_EQ(cfg.concurrency, 1 << 16);
    EXPECT_EQ(log.find("TIMEOUT_MS"), std::string::npos) << log;

    fs::remove_all(home);
}

TEST(UtilsConfigTest, OutOfRangeFileIntegersKeepDefaults) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_huge_file";
    fs::create_directories(home);
    clearProbeEnv(home);

    fs::path tmp = home / "probe.json";
    std::ofstream(tmp) << R"({
        "probe": {
            "concurrency": 99999999999,
            "timeout_ms": -5,
            "batch_timeout_ms": 18446744073709551615,
            "tls_policy": "strict",
            "rate_limit_statuses": [429, 4294967725]
        }
    })";
    setenv("MODELSWITCH_CONFIG", tmp.string().c_str(), 1);

    auto cfg = loadProbeConfig();

    EXPECT_EQ(cfg.concurrency, 5);
    EXPECT_EQ(cfg.timeout, std::chrono::milliseconds(8000));
    EXPECT_EQ(cfg.batch_timeout, std::chrono::milliseconds(0));
    EXPECT_EQ(cfg.tls_policy, "strict");
    EXPECT_EQ(cfg.rate_limit_statuses, (std::vector<int>{409, 429}));

    std::ofstream(tmp) << R"({"probe": {"timeout_ms": 1500.5, "batch_timeout_ms": 86400000}})";
    auto fractional = loadProbeConfig();
    EXPECT_EQ(fractional.timeout, std::chrono::milliseconds(8000));
    EXPECT_EQ(fractional.batch_timeout, std::chrono::milliseconds(86400000));

    fs::remove_all(home);
}

TEST(UtilsConfigTest, MalformedFileFallsBackToDefaults) {
    EnvGuard guard(kProbeEnv);
    fs::path home = fs::temp_directory_path() / "modelswitch_cfg_malformed";
    fs::create_directories(home);
    clearProbeEnv(home);

    fs::path tmp = home / "broken.json";
    std::ofstream(tmp) << "{ probe: ";
    setenv("MODELSWITCH_CONFIG", tmp.string().c_str(), 1);

    auto [cfg, log] = loadProbeConfigWithLog();
    EXPECT_EQ(cfg.concurrency, 5);
    EXPECT_NE(log.find("sources=default"), std::string::npos);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, ParseStatusList) {
    EXPECT_EQ(parseStatusList("429"), (std::optional<std::vector<int>>(std::vector<int>{429})));
    EXPECT_EQ(parseStatusList(" 409 , 429 ,"), (std::optional<std::vector<int>>(std::vector<int>{409, 429})));
    EXPECT_EQ(parseStatusList(""), (std::optional<std::vector<int>>(std::vector<int>{})));
    EXPECT_FALSE(parseStatusList("42").has_value());
    EXPECT_FALSE(parseStatusList("429x").has_value());
}

TEST(UtilsConfigTest, ParseBool) {
    EXPECT_EQ(parseBool("TRUE"), std::optional<bool>(true));
    EXPECT_EQ(parseBool("off"), std::optional<bool>(false));
    EXPECT_EQ(parseBool(" 1 "), std::optional<bool>(true));
    EXPECT_FALSE(parseBool("maybe").has_value());
}
