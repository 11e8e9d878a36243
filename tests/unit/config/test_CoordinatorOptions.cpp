#include "AgentHubTestHelper.hpp"
#include "config/CoordinatorOptions.hpp"

#include <doctest/doctest.h>

using AH::Test::Argv;
using AH::Test::EnvGuard;

TEST_SUITE("config.coordinator_options") {
    TEST_CASE("Defaults with one agent on the command line") {
        EnvGuard port("AGENTHUB_PORT", nullptr);
        EnvGuard host("AGENTHUB_HOST", nullptr);
        Argv     args{"--agent", "agentA:secret-a"};
        auto     options = AH::ParseCoordinatorArguments(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->host == "127.0.0.1");
        CHECK(options->port == 47800);
        CHECK(options->pending_timeout_ms == 30000);
        CHECK(options->challenge_ttl_ms == 60000);
        CHECK(options->credentials.size() == 1);
        CHECK(options->credentials.at("agentA") == "secret-a");

        auto config = AH::MakeChannelServerConfig(*options);
        CHECK(config.bind_address == "127.0.0.1");
        CHECK(config.port == 47800);
        CHECK(config.sweep_interval == std::chrono::milliseconds{1000});
    }

    TEST_CASE("Command line values are parsed and range checked") {
        Argv args{"--host", "0.0.0.0", "--port", "0", "--agent", "a:1", "--agent", "b:2",
                  "--pending-timeout-ms", "500", "--challenge-ttl-ms", "0", "--max-frame-bytes", "2048"};
        auto options = AH::ParseCoordinatorArguments(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->host == "0.0.0.0");
        CHECK(options->port == 0);
        CHECK(options->credentials.size() == 2);
        CHECK(options->pending_timeout_ms == 500);
        CHECK(options->challenge_ttl_ms == 0);
        CHECK(options->max_frame_bytes == 2048);

        Argv badPort{"--agent", "a:1", "--port", "70000"};
        CHECK_FALSE(AH::ParseCoordinatorArguments(badPort.argc(), badPort.argv()).has_value());
        Argv badTimeout{"--agent", "a:1", "--pending-timeout-ms", "0"};
        CHECK_FALSE(AH::ParseCoordinatorArguments(badTimeout.argc(), badTimeout.argv()).has_value());
        Argv tinyFrame{"--agent", "a:1", "--max-frame-bytes", "100"};
        CHECK_FALSE(AH::ParseCoordinatorArguments(tinyFrame.argc(), tinyFrame.argv()).has_value());
        Argv missingValue{"--agent"};
        CHECK_FALSE(AH::ParseCoordinatorArguments(missingValue.argc(), missingValue.argv()).has_value());
        Argv unknown{"--agent", "a:1", "--verbose"};
        CHECK_FALSE(AH::ParseCoordinatorArguments(unknown.argc(), unknown.argv()).has_value());
        Argv badAgent{"--agent", "no-secret"};
        CHECK_FALSE(AH::ParseCoordinatorArguments(badAgent.argc(), badAgent.argv()).has_value());
    }

    TEST_CASE("Help short-circuits validation") {
        Argv args{"--help"};
        auto options = AH::ParseCoordinatorArguments(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->show_help);
    }

    TEST_CASE("A credential is required") {
        EnvGuard file("AGENTHUB_AGENTS_FILE", nullptr);
        Argv     args{};
        CHECK_FALSE(AH::ParseCoordinatorArguments(args.argc(), args.argv()).has_value());

        AH::CoordinatorOptions options;
        auto                   error = AH::ValidateCoordinatorOptions(options);
        REQUIRE(error.has_value());
        CHECK(error->find("at least one agent credential") != std::string::npos);
    }

    TEST_CASE("Environment overrides defaults and the command line overrides it") {
        EnvGuard port("AGENTHUB_PORT", "5000");
        EnvGuard timeout("AGENTHUB_PENDING_TIMEOUT_MS", "1234");
        EnvGuard dir("AGENTHUB_DOWNLOAD_DIR", "/tmp/agenthub-downloads");

        Argv args{"--agent", "a:1", "--port", "6000"};
        auto options = AH::ParseCoordinatorArguments(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->port == 6000);
        CHECK(options->pending_timeout_ms == 1234);
        CHECK(options->download_dir == "/tmp/agenthub-downloads");
    }

    TEST_CASE("Invalid environment values are rejected") {
        EnvGuard port("AGENTHUB_PORT", "not-a-port");
        AH::CoordinatorOptions options;
        CHECK_FALSE(AH::ApplyCoordinatorEnvOverrides(options));
    }

    TEST_CASE("Single credential parsing") {
        auto parsed = AH::ParseAgentCredential("agentA:s3:cret");
        REQUIRE(parsed.has_value());
        CHECK(parsed->first == "agentA");
        CHECK(parsed->second == "s3:cret");
        CHECK_FALSE(AH::ParseAgentCredential(":secret").has_value());
        CHECK_FALSE(AH::ParseAgentCredential("agentA:").has_value());
        CHECK_FALSE(AH::ParseAgentCredential("agentA").has_value());
    }

    TEST_CASE("Credential files") {
        auto table = AH::ParseAgentCredentials(R"([{"name":"a","secret":"1"},{"name":"b","secret":"2"}])");
        REQUIRE(table.has_value());
        CHECK(table->size() == 2);
        CHECK(table->at("b") == "2");

        auto notJson = AH::ParseAgentCredentials("{nope");
        REQUIRE_FALSE(notJson.has_value());
        CHECK(notJson.error().code == AH::Error::Code::MalformedInput);

        CHECK_FALSE(AH::ParseAgentCredentials(R"({"name":"a"})").has_value());
        CHECK_FALSE(AH::ParseAgentCredentials(R"([1])").has_value());

        auto missingSecret = AH::ParseAgentCredentials(R"([{"name":"a"}])");
        REQUIRE_FALSE(missingSecret.has_value());
        CHECK(missingSecret.error().message.value_or("") == "agents[0].secret must be a non-empty string");

        auto missing = AH::LoadAgentCredentials("/nonexistent/agents.json");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == AH::Error::Code::NotFound);
    }

    TEST_CASE("Command line credentials win over the agents file") {
        AH::Test::TempDirectory dir;
        auto path = dir.write("agents.json", R"([{"name":"a","secret":"from-file"},{"name":"b","secret":"2"}])");

        Argv args{"--agents-file", path.string(), "--agent", "a:from-cli"};
        auto options = AH::ParseCoordinatorArguments(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->credentials.size() == 2);
        CHECK(options->credentials.at("a") == "from-cli");
        CHECK(options->credentials.at("b") == "2");
    }
}
