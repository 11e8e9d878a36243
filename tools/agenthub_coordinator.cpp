#include "agenthub/config/CoordinatorOptions.hpp"
#include "agenthub/log/TaggedLogger.hpp"
#include "agenthub/network/AgentChannelServer.hpp"
#include "agenthub/network/AgentSessionCoordinator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_should_stop = false;

void handle_signal(int) {
    g_should_stop.store(true);
}

void print_line(std::string const& line) {
    std::lock_guard const lock{AH::console_mutex()};
    std::cout << line << std::endl;
}

void print_help() {
    print_line("Commands:\n"
               "  agents                 List authenticated agents\n"
               "  info <agent> <file>    Ask an agent whether it has a file\n"
               "  get <agent> <file>     Fetch a file from an agent into the download directory\n"
               "  pending                Show outstanding requests\n"
               "  quit                   Stop the coordinator");
}

void run_command(std::string const&                                     line,
                 std::shared_ptr<AH::Network::AgentSessionCoordinator> const& coordinator,
                 std::filesystem::path const&                           downloadDir) {
    std::istringstream input(line);
    std::string        command;
    input >> command;
    if (command.empty()) {
        return;
    }
    auto const& components = coordinator->components();

    if (command == "help") {
        print_help();
    } else if (command == "quit" || command == "exit") {
        g_should_stop.store(true);
    } else if (command == "agents") {
        auto agents = components.registry->snapshot();
        if (agents.empty()) {
            print_line("No agents connected");
        }
        for (auto const& record : agents) {
            print_line(record.agentName + " on " + record.connectionId);
        }
    } else if (command == "pending") {
        print_line(std::to_string(components.inquiries->size()) + " file info requests, "
                   + std::to_string(components.uploads->size()) + " file requests");
    } else if (command == "info" || command == "get") {
        std::string agent;
        std::string filename;
        input >> agent;
        std::getline(input >> std::ws, filename);
        if (agent.empty() || filename.empty()) {
            print_line("usage: " + command + " <agent> <file>");
            return;
        }
        if (command == "info") {
            coordinator->requestFileInfo(agent, filename).then([agent, filename](AH::Expected<AH::Network::FileInfo> const& result) {
                if (!result) {
                    print_line(agent + ":" + filename + " failed: " + AH::describeError(result.error()));
                } else if (!result->exists) {
                    print_line(agent + ":" + filename + " does not exist");
                } else {
                    print_line(agent + ":" + filename + " is " + std::to_string(result->length) + " bytes");
                }
            });
        } else {
            coordinator->requestFile(agent, filename).then([agent, filename, downloadDir](AH::Expected<AH::Network::UploadHandle> const& result) {
                if (!result) {
                    print_line(agent + ":" + filename + " failed: " + AH::describeError(result.error()));
                    return;
                }
                auto saved = AH::Network::saveUpload(**result, downloadDir);
                if (!saved) {
                    print_line("Could not save " + filename + ": " + AH::describeError(saved.error()));
                    return;
                }
                print_line("Saved " + std::to_string((*result)->size()) + " bytes to " + saved->string());
            });
        }
    } else {
        print_line("Unknown command: " + command + " (try 'help')");
    }
}

} // namespace

int main(int argc, char** argv) {
    AH::configure_logging_from_env();
    AH::set_thread_name("Coordinator");

    auto options_opt = AH::ParseCoordinatorArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }
    auto options = *options_opt;
    if (options.show_help) {
        AH::PrintCoordinatorUsage();
        return EXIT_SUCCESS;
    }

    auto server     = std::make_shared<AH::Network::AgentChannelServer>(AH::MakeChannelServerConfig(options));
    auto components = AH::Network::CoordinatorComponents::create(options.credentials,
                                                                 std::chrono::milliseconds{options.challenge_ttl_ms},
                                                                 std::chrono::milliseconds{options.upload_token_ttl_ms});
    auto coordinator = std::make_shared<AH::Network::AgentSessionCoordinator>(
            server, components, std::chrono::milliseconds{options.pending_timeout_ms});
    server->attach(coordinator);

    auto started = server->start();
    if (!started) {
        std::cerr << "Failed to start coordinator: " << AH::describeError(started.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Coordinator listening on " << options.host << ":" << server->port() << " for "
              << options.credentials.size() << " agent(s)\nType 'help' for commands, Ctrl+C to stop.\n";

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Reads commands until stdin closes; the process keeps serving after that.
    std::filesystem::path downloadDir{options.download_dir};
    std::thread([coordinator, downloadDir]() {
        AH::set_thread_name("Console");
        std::string line;
        while (!g_should_stop.load() && std::getline(std::cin, line)) {
            run_command(line, coordinator, downloadDir);
        }
    }).detach();

    while (!g_should_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    coordinator->shutdown();
    server->stop();
    AH::flush_log();
    return EXIT_SUCCESS;
}
