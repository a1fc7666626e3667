// Contract tests for 'auto' command

#include "cli_contract_support.h"

using namespace modelswitch;
using namespace modelswitch::contract;
using namespace std::chrono_literals;

class CliAutoTest : public CommandTest {};

// Contract: auto takes --current and no positional arguments
TEST_F(CliAutoTest, ParseCurrent) {
    auto result = parse({"auto", "--current", "work", "--json"});
    ASSERT_FALSE(result.should_exit) << result.output;
    EXPECT_EQ(result.subcommand, Subcommand::Auto);
    EXPECT_EQ(result.current, "work");
    EXPECT_TRUE(result.probe_options.json);

    auto positional = parse({"auto", "work"});
    EXPECT_TRUE(positional.should_exit);
    EXPECT_EQ(positional.exit_code, 1);

    auto missing = parse({"auto", "--current"});
    EXPECT_TRUE(missing.should_exit);
    EXPECT_EQ(missing.exit_code, 1);
}

// Contract: a healthy current endpoint is kept even when another is faster
TEST_F(CliAutoTest, KeepsHealthyCurrent) {
    FakeEndpoint slow(18251, 200ms);
    FakeEndpoint fast(18252);
    auto path = writeProfiles({{"fast", fast.url()}, {"slow", slow.url()}});
    setenv("ANTHROPIC_BASE_URL", slow.url().c_str(), 1);

    auto args = parse({"auto", "--config", path, "--json"});
    EXPECT_EQ(commands::autoSelect(args, out_, err_), commands::kExitOk);

    auto j = nlohmann::json::parse(out_.str());
    EXPECT_EQ(j["current"], "slow");
    EXPECT_EQ(j["decision"]["chosen"], "slow");
    EXPECT_EQ(j["decision"]["reason"], "currentHealthy");
    EXPECT_EQ(j["decision"]["base_url"], slow.url());
    EXPECT_EQ(j["report"]["results"].size(), 2u);
}

// Contract: an unhealthy current endpoint fails over to the fastest healthy one
TEST_F(CliAutoTest, FailsOverToFastestHealthy) {
    FakeEndpoint slow(18253, 300ms);
    FakeEndpoint fast(18254);
    auto path = writeProfiles({{"down", closedUrl()}, {"slow", slow.url()}, {"fast", fast.url()}});

    auto args = parse({"auto", "--config", path, "--current", "down", "--json"});
    EXPECT_EQ(commands::autoSelect(args, out_, err_), commands::kExitOk);

    auto j = nlohmann::json::parse(out_.str());
    EXPECT_EQ(j["current"], "down");
    EXPECT_EQ(j["decision"]["chosen"], "fast");
    EXPECT_EQ(j["decision"]["reason"], "fasterAlternative");
    EXPECT_EQ(j["report"]["results"][0]["name"], "down");
}

// Contract: degraded endpoints are never chosen; exit 3 when nothing is healthy
TEST_F(CliAutoTest, NoHealthyEndpointExitsThree) {
    FakeEndpoint limited(18255, 0ms, 429);
    auto path = writeProfiles({{"limited", limited.url()}, {"down", closedUrl()}});

    auto args = parse({"auto", "--config", path});
    EXPECT_EQ(commands::autoSelect(args, out_, err_), commands::kExitNoHealthy);
    EXPECT_NE(out_.str().find("No healthy endpoint"), std::string::npos) << out_.str();
    EXPECT_NE(out_.str().find("degraded"), std::string::npos);

    std::ostringstream out;
    auto json_args = parse({"auto", "--config", path, "--json"});
    EXPECT_EQ(commands::autoSelect(json_args, out, err_), commands::kExitNoHealthy);
    auto j = nlohmann::json::parse(out.str());
    EXPECT_TRUE(j["current"].is_null());
    EXPECT_TRUE(j["decision"]["chosen"].is_null());
    EXPECT_EQ(j["decision"]["reason"], "noHealthyCandidate");
    EXPECT_FALSE(j["decision"].contains("base_url"));
}

// Contract: text output ends with the decision line
TEST_F(CliAutoTest, TextOutputNamesSwitch) {
    FakeEndpoint ok(18256);
    auto path = writeProfiles({{"down", closedUrl()}, {"ok", ok.url()}});
    setenv("ANTHROPIC_BASE_URL", closedUrl().c_str(), 1);

    auto args = parse({"auto", "--config", path});
    EXPECT_EQ(commands::autoSelect(args, out_, err_), commands::kExitOk);
    EXPECT_NE(out_.str().find("Switch to ok (current down is not healthy)"), std::string::npos) << out_.str();
    EXPECT_NE(out_.str().find("* down"), std::string::npos);
}

// Contract: an unknown --current name exits 1 without probing
TEST_F(CliAutoTest, UnknownCurrentIsAnError) {
    auto path = writeProfiles({{"work", closedUrl()}});
    auto args = parse({"auto", "--config", path, "--current", "nope"});
    EXPECT_EQ(commands::autoSelect(args, out_, err_), commands::kExitError);
    EXPECT_NE(err_.str().find("nope"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

// Contract: the batch deadline bounds the whole run
TEST_F(CliAutoTest, BatchTimeoutBoundsRun) {
    FakeEndpoint hung(18257, 2000ms);
    FakeEndpoint ok(18258);
    auto path = writeProfiles({{"hung", hung.url()}, {"ok", ok.url()}});

    auto args = parse({"auto", "--config", path, "--json", "--batch-timeout-ms", "400", "--timeout-ms", "5000"});
    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(commands::autoSelect(args, out_, err_), commands::kExitOk);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1500ms);

    auto j = nlohmann::json::parse(out_.str());
    EXPECT_EQ(j["decision"]["chosen"], "ok");
    EXPECT_EQ(j["report"]["results"][0]["error_kind"], "batchTimeout");
}
