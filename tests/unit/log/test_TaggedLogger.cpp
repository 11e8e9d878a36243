#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include "AgentHubTestHelper.hpp"

#ifdef AH_LOG_DEBUG

#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <thread>

namespace {

using AH::Test::EnvGuard;

// Restores the process-wide logger after a test reconfigures it.
class GlobalLoggerGuard {
public:
    GlobalLoggerGuard() : wasEnabled(AH::logger().loggingEnabled()) {}
    ~GlobalLoggerGuard() {
        AH::logger().setEnabledTags({});
        AH::logger().setLoggingEnabled(wasEnabled);
    }

private:
    bool wasEnabled;
};

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        AH::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        logger.flush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        logger.flush();
    });

    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_frame_tag") {
    auto skipped = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("frame dump", std::source_location::current(), "Frame");
        logger.flush();
    });
    CHECK(skipped.empty());

    auto kept = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.log_impl("frame dump", std::source_location::current(), "Frame");
        logger.flush();
    });
    CHECK(kept.find("frame dump") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto accepted = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"Focus"});
        logger.log_impl("keep me", std::source_location::current(), "Focus", "Other");
        logger.log_impl("drop me", std::source_location::current(), "Other");
        logger.flush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);
    CHECK(accepted.find("drop me") == std::string::npos);
}

TEST_CASE("skip_tags_win_over_enabled_tags") {
    auto output = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"Focus"});
        logger.setSkipTags({"Noisy"});
        logger.log_impl("not expected", std::source_location::current(), "Focus", "Noisy");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Worker-7");
        logger.log_impl("with name", std::source_location::current(), "Test");
        logger.flush();
    });

    CHECK(output.find("[Worker-7]") != std::string::npos);
}

TEST_CASE("cleared_thread_name_is_forgotten") {
    AH::TaggedLogger logger;
    std::size_t      whileNamed = 0;
    std::thread([&] {
        logger.setThreadName("AgentChannelServer conn-1");
        whileNamed = logger.namedThreadCount();
        logger.clearThreadName();
    }).join();

    CHECK(whileNamed == 1);
    CHECK(logger.namedThreadCount() == 0);
}

TEST_CASE("multiple_tags_are_joined") {
    auto output = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("joined", std::source_location::current(), "Alpha", "Beta");
        logger.flush();
    });

    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        AH::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 170 "tests/unit/log/test_TaggedLogger.cpp"
        logger.flush();
    });

    CHECK(output.find("[subdir/TaggedLoggerChild.cpp:42]") != std::string::npos);
}

TEST_CASE("environment_configures_global_logger") {
    GlobalLoggerGuard restore;

    SUBCASE("unset disables") {
        EnvGuard log("AGENTHUB_LOG", nullptr);
        AH::configure_logging_from_env();
        CHECK_FALSE(AH::logger().loggingEnabled());
    }
    SUBCASE("zero disables") {
        EnvGuard log("AGENTHUB_LOG", "0");
        AH::configure_logging_from_env();
        CHECK_FALSE(AH::logger().loggingEnabled());
    }
    SUBCASE("any other value enables") {
        EnvGuard log("AGENTHUB_LOG", "1");
        EnvGuard tags("AGENTHUB_LOG_TAGS", " Coordinator , Registry ");
        AH::configure_logging_from_env();
        CHECK(AH::logger().loggingEnabled());
    }
}

} // TEST_SUITE

#endif // AH_LOG_DEBUG
