#include "agenthub/config/AgentOptions.hpp"
#include "agenthub/log/TaggedLogger.hpp"
#include "agenthub/network/AgentClient.hpp"
#include "agenthub/network/AgentResponder.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_should_stop = false;

void handle_signal(int) {
    g_should_stop.store(true);
}

// Sleeps in short steps so a signal cuts the wait short.
void pause_for(std::chrono::milliseconds delay) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!g_should_stop.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace

int main(int argc, char** argv) {
    AH::configure_logging_from_env();
    AH::set_thread_name("Agent");

    auto options_opt = AH::ParseAgentArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }
    auto options = *options_opt;
    if (options.show_help) {
        AH::PrintAgentUsage();
        return EXIT_SUCCESS;
    }

    auto responder = std::make_shared<AH::Network::AgentResponder>(AH::MakeResponderConfig(options));
    AH::Network::AgentClient client(AH::MakeClientConfig(options), responder);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Watches for a signal and closes the connection so the wait below returns.
    std::thread watcher([&client]() {
        while (!g_should_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        client.stop();
    });

    int exit_code = EXIT_SUCCESS;
    while (!g_should_stop.load()) {
        auto connected = client.connect();
        if (!connected) {
            std::cerr << "Connect failed: " << AH::describeError(connected.error()) << "\n";
        } else {
            auto authenticated = client.waitForAuthentication(std::chrono::milliseconds{options.auth_timeout_ms});
            if (!authenticated) {
                std::cerr << "Login as " << options.name << " failed: " << AH::describeError(authenticated.error())
                          << "\n";
                client.stop();
                if (authenticated.error().code == AH::Error::Code::Unauthorized) {
                    // A wrong secret does not get better by retrying.
                    exit_code = EXIT_FAILURE;
                    break;
                }
            } else {
                std::cout << "Serving " << options.share_root << " as " << options.name << " via " << options.host
                          << ":" << options.port << "\n";
                client.waitUntilDisconnected();
                if (!g_should_stop.load()) {
                    std::cerr << "Connection to coordinator lost\n";
                }
            }
        }
        if (!options.reconnect || g_should_stop.load()) {
            break;
        }
        pause_for(std::chrono::milliseconds{options.reconnect_delay_ms});
    }

    g_should_stop.store(true);
    watcher.join();
    AH::flush_log();
    return exit_code;
}
