// Shared fixtures for the command contract tests
#pragma once

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli/commands.h"
#include "utils/cli.h"

namespace modelswitch {
namespace contract {

namespace fs = std::filesystem;

class EnvGuard {
public:
    explicit EnvGuard(std::vector<std::string> keys) : keys_(std::move(keys)) {
        for (const auto& key : keys_) {
            const char* value = std::getenv(key.c_str());
            if (value) {
                saved_[key] = value;
            }
        }
    }
    ~EnvGuard() {
        for (const auto& key : keys_) {
            if (auto it = saved_.find(key); it != saved_.end()) {
                setenv(key.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(key.c_str());
            }
        }
    }

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("modelswitch-cli-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path path;
};

/// Minimal messages endpoint on 127.0.0.1.
class FakeEndpoint {
public:
    FakeEndpoint(int port, std::chrono::milliseconds delay = std::chrono::milliseconds(0), int status = 200)
        : port_(port) {
        svr_.Post("/v1/messages", [delay, status](const httplib::Request&, httplib::Response& res) {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            res.status = status;
            res.set_content("event: message_start\ndata: {}\n\n", "text/event-stream");
        });
        thread_ = std::thread([this]() { svr_.listen("127.0.0.1", port_); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ~FakeEndpoint() {
        svr_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    int port_;
    httplib::Server svr_;
    std::thread thread_;
};

/// Nothing listens here.
inline std::string closedUrl() { return "http://127.0.0.1:18299"; }

class CommandTest : public ::testing::Test {
protected:
    CommandTest()
        : env_({"ANTHROPIC_BASE_URL", "MODELSWITCH_PROFILES", "MODELSWITCH_CONFIG", "MODELSWITCH_CONCURRENCY",
                "MODELSWITCH_TIMEOUT_MS", "MODELSWITCH_BATCH_TIMEOUT_MS", "MODELSWITCH_WARMUP",
                "MODELSWITCH_TLS_POLICY", "MODELSWITCH_RATE_LIMIT_STATUSES"}) {}

    void SetUp() override {
        for (const char* key : {"ANTHROPIC_BASE_URL", "MODELSWITCH_PROFILES", "MODELSWITCH_CONCURRENCY",
                                "MODELSWITCH_TIMEOUT_MS", "MODELSWITCH_BATCH_TIMEOUT_MS", "MODELSWITCH_WARMUP",
                                "MODELSWITCH_TLS_POLICY", "MODELSWITCH_RATE_LIMIT_STATUSES"}) {
            unsetenv(key);
        }
        // Keep the user's settings file out of the tests.
        setenv("MODELSWITCH_CONFIG", (tmp_.path / "no-config.json").string().c_str(), 1);
    }

    /// profiles: name -> base URL, written in the given order.
    std::string writeProfiles(const std::vector<std::pair<std::string, std::string>>& profiles) {
        nlohmann::ordered_json root = nlohmann::ordered_json::object();
        for (const auto& [name, url] : profiles) {
            root[name] = {{"ANTHROPIC_BASE_URL", url}, {"ANTHROPIC_AUTH_TOKEN", "sk-" + name}};
        }
        auto path = tmp_.path / "model_config.json";
        std::ofstream(path) << root.dump(2);
        return path.string();
    }

    CliResult parse(std::vector<std::string> args) {
        args.insert(args.begin(), "modelswitch");
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(arg.data());
        return parseCliArgs(static_cast<int>(argv.size()), argv.data());
    }

    std::ostringstream out_;
    std::ostringstream err_;
    TempDir tmp_;

private:
    EnvGuard env_;
};

}  // namespace contract
}  // namespace modelswitch
