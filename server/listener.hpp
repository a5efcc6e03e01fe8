// server/listener.hpp
// Accepts incoming TCP connections and starts a session for each
#ifndef SERVER_LISTENER_HPP
#define SERVER_LISTENER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <boost/asio.hpp>

#include "session.hpp"

class Hub;

class Listener : public std::enable_shared_from_this<Listener> {
public:
    // Throws boost::system::system_error if the endpoint cannot be bound
    Listener(net::io_context& ioc, tcp::endpoint endpoint, Hub& hub, const SessionLimits& limits);

    void run();
    void stop();

    unsigned short port() const { return port_; }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Hub& hub_;
    SessionLimits limits_;
    unsigned short port_ = 0;
    std::atomic<uint64_t> nextConnectionId_{1};

    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
};

#endif // SERVER_LISTENER_HPP
