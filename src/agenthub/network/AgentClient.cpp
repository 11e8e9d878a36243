#include "agenthub/network/AgentClient.hpp"

#include "log/TaggedLogger.hpp"

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace AH::Network {

struct AgentClient::Impl {
    Impl(AgentClientConfig cfg, std::shared_ptr<AgentResponder> r)
        : config(std::move(cfg))
        , responder(std::move(r))
        , socket(io_context) {}

    auto connect() -> Expected<void> {
        if (connected.load()) {
            return {};
        }
        if (reader.joinable()) {
            reader.join();
        }
        std::error_code         ec;
        asio::ip::tcp::resolver resolver(io_context);
        auto endpoints = resolver.resolve(config.host, std::to_string(config.port), ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::TransportError, "resolve " + config.host + ": " + ec.message()});
        }
        socket = asio::ip::tcp::socket(io_context);
        asio::connect(socket, endpoints, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::TransportError,
                                         "connect " + config.host + ":" + std::to_string(config.port) + ": " + ec.message()});
        }
        socket.set_option(asio::ip::tcp::no_delay(true), ec);
        responder->reset();
        {
            std::lock_guard const lock{state_mutex};
            connected = true;
            stopping  = false;
        }
        reader = std::thread([this]() { readLoop(); });
        return {};
    }

    auto readLoop() -> void {
        set_thread_name("AgentClient " + responder->config().agentName);
        while (!stopping.load()) {
            auto body = readFrameBody(socket, config.max_frame_bytes);
            if (!body) {
                ah_log("Connection closed: " + describeError(body.error()), "AgentClient");
                break;
            }
            auto frame = deserializeFrame(*body);
            std::vector<AgentFrame> replies;
            if (!frame) {
                replies.push_back(makeErrorFrame(frame.error()));
            } else {
                replies = responder->handle(*frame);
            }
            bool failed = false;
            for (auto const& reply : replies) {
                std::lock_guard const lock{write_mutex};
                if (auto sent = writeFrame(socket, reply, config.max_frame_bytes); !sent) {
                    ah_log("Send failed: " + describeError(sent.error()), "AgentClient");
                    failed = true;
                    break;
                }
            }
            {
                std::lock_guard const lock{state_mutex};
                state_cv.notify_all();
            }
            if (failed) {
                break;
            }
        }
        {
            std::lock_guard const lock{write_mutex};
            std::error_code ec;
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
        clear_thread_name();
        std::lock_guard const lock{state_mutex};
        connected = false;
        state_cv.notify_all();
    }

    auto waitForAuthentication(std::chrono::milliseconds timeout) -> Expected<void> {
        std::unique_lock lock{state_mutex};
        auto             decided = [this] {
            auto state = responder->state();
            return state == AgentResponder::State::Authenticated || state == AgentResponder::State::Rejected
                   || !connected.load();
        };
        if (!state_cv.wait_for(lock, timeout, decided)) {
            return std::unexpected(Error{Error::Code::Timeout, "no authentication verdict received"});
        }
        switch (responder->state()) {
        case AgentResponder::State::Authenticated:
            return {};
        case AgentResponder::State::Rejected:
            return std::unexpected(Error{Error::Code::Unauthorized, "coordinator rejected the login"});
        default:
            return std::unexpected(Error{Error::Code::ConnectionLost, "connection closed during handshake"});
        }
    }

    auto waitUntilDisconnected() -> void {
        std::unique_lock lock{state_mutex};
        state_cv.wait(lock, [this] { return !connected.load(); });
    }

    auto stop() -> void {
        stopping = true;
        {
            std::lock_guard const lock{write_mutex};
            std::error_code       ec;
            if (socket.is_open()) {
                socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            }
        }
        if (reader.joinable()) {
            reader.join();
        }
    }

    AgentClientConfig               config;
    std::shared_ptr<AgentResponder> responder;
    asio::io_context                io_context;
    asio::ip::tcp::socket           socket;
    std::mutex                      write_mutex;
    std::thread                     reader;
    std::atomic<bool>               connected{false};
    std::atomic<bool>               stopping{false};
    std::mutex                      state_mutex;
    std::condition_variable         state_cv;
};

AgentClient::AgentClient(AgentClientConfig config, std::shared_ptr<AgentResponder> responder)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(responder))) {}

AgentClient::~AgentClient() {
    stop();
}

auto AgentClient::connect() -> Expected<void> {
    return impl_->connect();
}

auto AgentClient::waitForAuthentication(std::chrono::milliseconds timeout) -> Expected<void> {
    return impl_->waitForAuthentication(timeout);
}

auto AgentClient::waitUntilDisconnected() -> void {
    impl_->waitUntilDisconnected();
}

auto AgentClient::stop() -> void {
    impl_->stop();
}

auto AgentClient::connected() const -> bool {
    return impl_->connected.load();
}

auto AgentClient::responder() const -> std::shared_ptr<AgentResponder> const& {
    return impl_->responder;
}

} // namespace AH::Network
