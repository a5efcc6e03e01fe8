// server/listener.cpp
#include "listener.hpp"
#include "hub.hpp"
#include "logger.hpp"

Listener::Listener(net::io_context& ioc, tcp::endpoint endpoint, Hub& hub, const SessionLimits& limits)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)), hub_(hub), limits_(limits) {
    boost::system::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        Logger::error("Listener open error: " + ec.message());
        throw boost::system::system_error(ec, "open");
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        Logger::error("Listener set option error: " + ec.message());
        throw boost::system::system_error(ec, "set_option");
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        Logger::error("Listener bind error on " + endpoint.address().to_string() + ":" +
                      std::to_string(endpoint.port()) + ": " + ec.message());
        throw boost::system::system_error(ec, "bind");
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        Logger::error("Listener listen error: " + ec.message());
        throw boost::system::system_error(ec, "listen");
    }

    port_ = acceptor_.local_endpoint().port();
}

void Listener::run() {
    do_accept();
}

void Listener::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        boost::system::error_code ec;
        self->acceptor_.close(ec);
        if (ec) {
            Logger::error("Listener close error: " + ec.message());
        }
    });
}

void Listener::do_accept() {
    // Each connection gets its own strand
    acceptor_.async_accept(net::make_strand(ioc_),
        [self = shared_from_this()](boost::system::error_code ec, tcp::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void Listener::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        // Don't keep trying once the acceptor has been closed
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            Logger::listener("Stopped accepting connections");
            return;
        }
        Logger::error("Listener accept error: " + ec.message());
    } else {
        uint64_t id = nextConnectionId_++;
        Logger::listener("Accepted connection " + std::to_string(id));
        std::make_shared<ClientSession>(std::move(socket), id, hub_, limits_)->start();
    }

    // Accept next connection
    do_accept();
}
