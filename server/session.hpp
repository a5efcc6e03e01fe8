// server/session.hpp
// Per-connection state machine: line reader, bounded outbound queue, idle timeout
#ifndef SERVER_SESSION_HPP
#define SERVER_SESSION_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio.hpp>

#include "../shared/codec.hpp"
#include "../shared/errors.hpp"
#include "broadcaster.hpp"

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class Hub;

struct SessionLimits {
    std::size_t maxLineLength = DEFAULT_MAX_LINE_LENGTH;
    std::size_t maxOutboundBytes = DEFAULT_MAX_OUTBOUND_BYTES;
    std::chrono::seconds idleTimeout{300};   // zero disables
    std::chrono::milliseconds closeDeadline{2000};
};

class ClientSession : public Subscriber, public std::enable_shared_from_this<ClientSession> {
public:
    enum class State {
        CONNECTED,
        HANDSHAKING,
        ACTIVE,
        CLOSING,
        CLOSED
    };

    ClientSession(tcp::socket socket, uint64_t connectionId, Hub& hub, const SessionLimits& limits);

    void start();

    // Thread-safe; queued on the session strand
    void send(const std::string& message);
    void deliver(std::shared_ptr<const std::string> message) override;
    void close();

    uint64_t connectionId() const override { return connectionId_; }
    const std::string& remoteAddress() const { return remote_; }

    // The following run on the session strand only (from Hub handlers)
    void activate(int playerId);
    int playerId() const { return playerId_; }
    // Sends `reason` as a talk record, then closes once it has been written
    void fail(const std::string& reason);

    static const char* stateName(State s);

private:
    tcp::socket socket_;
    net::strand<net::any_io_executor> strand_;
    uint64_t connectionId_;
    Hub& hub_;
    SessionLimits limits_;
    std::string remote_;

    std::atomic<State> state_{State::CONNECTED};
    int playerId_ = 0;

    Codec::LineDecoder decoder_;
    std::array<char, 4096> readBuffer_{};

    std::deque<std::shared_ptr<const std::string>> queue_;
    std::size_t queuedBytes_ = 0;
    bool closeAfterFlush_ = false;

    net::steady_timer idleTimer_;
    net::steady_timer closeTimer_;

    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void handleLine(const std::string& line);

    void enqueue(std::shared_ptr<const std::string> message);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);

    void resetIdleTimer();
    void on_idle(boost::system::error_code ec);

    bool beginClose();
    // Socket failure, timeout or overflow: logged, then the session closes
    void fault(const ConnectionFault& e);
    void shutdown();
    void finish();

    std::string tag() const { return "Connection " + std::to_string(connectionId_); }
};

#endif // SERVER_SESSION_HPP
