#include "agenthub/network/AgentChannelServer.hpp"

#include "log/TaggedLogger.hpp"
#include "network/AgentSessionCoordinator.hpp"

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace AH::Network {

namespace {

struct Connection {
    explicit Connection(asio::ip::tcp::socket s)
        : socket(std::move(s)) {}

    asio::ip::tcp::socket socket;
    std::mutex            writeMutex;
};

auto shutdown_socket(asio::ip::tcp::socket& socket) -> void {
    std::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
}

} // namespace

struct AgentChannelServer::Impl {
    explicit Impl(AgentChannelServerConfig cfg)
        : config(std::move(cfg)) {}

    auto start() -> Expected<void> {
        if (running.exchange(true)) {
            return {};
        }
        std::error_code ec;
        auto            address = asio::ip::make_address(config.bind_address, ec);
        if (ec) {
            running = false;
            return std::unexpected(Error{Error::Code::TransportError, "invalid bind address " + config.bind_address});
        }
        asio::ip::tcp::endpoint endpoint(address, config.port);
        acceptor = std::make_unique<asio::ip::tcp::acceptor>(io_context);
        acceptor->open(endpoint.protocol(), ec);
        if (ec) {
            running = false;
            return std::unexpected(Error{Error::Code::TransportError, "open acceptor: " + ec.message()});
        }
        acceptor->set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
        acceptor->bind(endpoint, ec);
        if (ec) {
            running = false;
            return std::unexpected(Error{Error::Code::TransportError, "bind " + config.bind_address + ":"
                                                                         + std::to_string(config.port) + ": " + ec.message()});
        }
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            running = false;
            return std::unexpected(Error{Error::Code::TransportError, "listen: " + ec.message()});
        }
        actual_port   = acceptor->local_endpoint().port();
        accept_thread = std::thread([this]() { acceptLoop(); });
        if (config.sweep_interval.count() > 0) {
            sweep_thread = std::thread([this]() { sweepLoop(); });
        }
        ah_log("Listening on " + config.bind_address + ":" + std::to_string(actual_port), "AgentChannelServer");
        return {};
    }

    auto stop() -> void {
        if (!running.exchange(false)) {
            return;
        }
        wakeAcceptor();
        if (accept_thread.joinable()) {
            accept_thread.join();
        }
        std::error_code ec;
        if (acceptor) {
            acceptor->close(ec);
        }
        {
            std::lock_guard const lock{sweep_mutex};
            sweep_cv.notify_all();
        }
        if (sweep_thread.joinable()) {
            sweep_thread.join();
        }
        {
            std::lock_guard const lock{connections_mutex};
            for (auto& [_, connection] : connections) {
                shutdown_socket(connection->socket);
            }
        }
        std::unique_lock lock{readers_mutex};
        readers_cv.wait(lock, [this] { return active_readers == 0; });
        io_context.stop();
    }

    auto send(ConnectionId const& connectionId, AgentFrame const& frame) -> Expected<void> {
        auto connection = find(connectionId);
        if (!connection) {
            return std::unexpected(Error{Error::Code::ConnectionLost, "connection " + connectionId + " is closed"});
        }
        std::lock_guard const lock{connection->writeMutex};
        return writeFrame(connection->socket, frame, config.max_frame_bytes);
    }

    auto disconnect(ConnectionId const& connectionId) -> bool {
        // Under the map lock the reader thread cannot be closing the socket yet.
        std::lock_guard const lock{connections_mutex};
        auto                  it = connections.find(connectionId);
        if (it == connections.end()) {
            return false;
        }
        shutdown_socket(it->second->socket);
        return true;
    }

    [[nodiscard]] auto find(ConnectionId const& connectionId) -> std::shared_ptr<Connection> {
        std::lock_guard const lock{connections_mutex};
        if (auto it = connections.find(connectionId); it != connections.end()) {
            return it->second;
        }
        return nullptr;
    }

    [[nodiscard]] auto connectionCount() const -> std::size_t {
        std::lock_guard const lock{connections_mutex};
        return connections.size();
    }

    auto coordinatorRef() -> std::shared_ptr<AgentSessionCoordinator> {
        std::lock_guard const lock{coordinator_mutex};
        return coordinator.lock();
    }

    // Connects to our own listening socket so a blocking accept() returns.
    auto wakeAcceptor() -> void {
        std::error_code ec;
        auto            address = acceptor ? acceptor->local_endpoint(ec).address() : asio::ip::address{};
        if (ec) {
            return;
        }
        if (address.is_unspecified()) {
            address = address.is_v6() ? asio::ip::address{asio::ip::address_v6::loopback()}
                                      : asio::ip::address{asio::ip::address_v4::loopback()};
        }
        asio::io_context      wake_context;
        asio::ip::tcp::socket socket(wake_context);
        socket.connect(asio::ip::tcp::endpoint(address, actual_port), ec);
        socket.close(ec);
    }

    void acceptLoop() {
        set_thread_name("AgentChannelServer accept");
        while (running.load()) {
            asio::ip::tcp::socket socket(io_context);
            std::error_code       ec;
            acceptor->accept(socket, ec);
            if (ec) {
                if (!running.load()) {
                    break;
                }
                continue;
            }
            if (!running.load()) {
                shutdown_socket(socket);
                break;
            }
            socket.set_option(asio::ip::tcp::no_delay(true), ec);
            auto id         = "conn-" + std::to_string(next_connection.fetch_add(1));
            auto connection = std::make_shared<Connection>(std::move(socket));
            {
                std::lock_guard const lock{connections_mutex};
                connections.emplace(id, connection);
            }
            {
                std::lock_guard const lock{readers_mutex};
                ++active_readers;
            }
            std::thread(&Impl::handleConnection, this, id, connection).detach();
        }
        clear_thread_name();
    }

    void handleConnection(ConnectionId id, std::shared_ptr<Connection> connection) {
        set_thread_name("AgentChannelServer " + id);
        ah_log("Accepted " + id, "AgentChannelServer");
        if (auto target = coordinatorRef()) {
            target->onConnect(id);
        }

        while (running.load()) {
            auto body = readFrameBody(connection->socket, config.max_frame_bytes);
            if (!body) {
                ah_log("Closing " + id + ": " + describeError(body.error()), "AgentChannelServer");
                break;
            }
            auto frame = deserializeFrame(*body);
            if (!frame) {
                ah_log("Malformed frame on " + id + ": " + describeError(frame.error()), "AgentChannelServer");
                std::lock_guard const lock{connection->writeMutex};
                auto                  sent = writeFrame(connection->socket, makeErrorFrame(frame.error()), config.max_frame_bytes);
                if (!sent) {
                    break;
                }
                continue;
            }
            if (auto target = coordinatorRef()) {
                target->handleFrame(id, *frame);
            }
        }

        {
            std::lock_guard const lock{connections_mutex};
            connections.erase(id);
        }
        {
            std::lock_guard const lock{connection->writeMutex};
            shutdown_socket(connection->socket);
            std::error_code ec;
            connection->socket.close(ec);
        }
        if (auto target = coordinatorRef()) {
            target->onDisconnect(id);
        }
        ah_log("Disconnected " + id, "AgentChannelServer");

        // The socket belongs to io_context; stop() may destroy it once the count drops.
        connection.reset();
        clear_thread_name();

        std::lock_guard const lock{readers_mutex};
        --active_readers;
        readers_cv.notify_all();
    }

    void sweepLoop() {
        set_thread_name("AgentChannelServer sweep");
        std::unique_lock lock{sweep_mutex};
        while (running.load()) {
            sweep_cv.wait_for(lock, config.sweep_interval, [this] { return !running.load(); });
            if (!running.load()) {
                break;
            }
            lock.unlock();
            if (auto target = coordinatorRef()) {
                auto failed = target->sweepExpired(std::chrono::steady_clock::now());
                if (failed > 0) {
                    ah_log("Timed out " + std::to_string(failed) + " pending requests", "AgentChannelServer");
                }
            }
            lock.lock();
        }
        clear_thread_name();
    }

    AgentChannelServerConfig config;

    asio::io_context                         io_context;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor;
    std::thread                              accept_thread;
    std::atomic<bool>                        running{false};
    std::uint16_t                            actual_port{0};
    std::atomic<std::uint64_t>               next_connection{1};

    mutable std::mutex                                           connections_mutex;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;

    std::mutex              readers_mutex;
    std::condition_variable readers_cv;
    std::size_t             active_readers{0};

    std::mutex              sweep_mutex;
    std::condition_variable sweep_cv;
    std::thread             sweep_thread;

    std::mutex                             coordinator_mutex;
    std::weak_ptr<AgentSessionCoordinator> coordinator;
};

AgentChannelServer::AgentChannelServer(AgentChannelServerConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

AgentChannelServer::~AgentChannelServer() {
    stop();
}

auto AgentChannelServer::attach(std::weak_ptr<AgentSessionCoordinator> coordinator) -> void {
    std::lock_guard const lock{impl_->coordinator_mutex};
    impl_->coordinator = std::move(coordinator);
}

auto AgentChannelServer::start() -> Expected<void> {
    return impl_->start();
}

auto AgentChannelServer::stop() -> void {
    impl_->stop();
}

auto AgentChannelServer::send(ConnectionId const& connectionId, AgentFrame const& frame) -> Expected<void> {
    return impl_->send(connectionId, frame);
}

auto AgentChannelServer::disconnect(ConnectionId const& connectionId) -> bool {
    return impl_->disconnect(connectionId);
}

auto AgentChannelServer::running() const -> bool {
    return impl_->running.load();
}

auto AgentChannelServer::port() const -> std::uint16_t {
    return impl_->actual_port;
}

auto AgentChannelServer::connectionCount() const -> std::size_t {
    return impl_->connectionCount();
}

} // namespace AH::Network
