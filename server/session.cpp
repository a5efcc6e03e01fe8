// server/session.cpp
#include "session.hpp"
#include "hub.hpp"
#include "logger.hpp"
#include "../shared/errors.hpp"

ClientSession::ClientSession(tcp::socket socket, uint64_t connectionId, Hub& hub, const SessionLimits& limits)
    : socket_(std::move(socket)),
      strand_(socket_.get_executor()),
      connectionId_(connectionId),
      hub_(hub),
      limits_(limits),
      decoder_(limits.maxLineLength),
      idleTimer_(strand_),
      closeTimer_(strand_) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

const char* ClientSession::stateName(State s) {
    switch (s) {
        case State::CONNECTED:   return "CONNECTED";
        case State::HANDSHAKING: return "HANDSHAKING";
        case State::ACTIVE:      return "ACTIVE";
        case State::CLOSING:     return "CLOSING";
        case State::CLOSED:      return "CLOSED";
        default:                 return "UNKNOWN";
    }
}

void ClientSession::start() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->state_ != State::CONNECTED) return;
        if (!self->hub_.addClient(self)) {
            Logger::session(self->tag() + " refused, server is shutting down");
            self->finish();
            return;
        }
        self->state_ = State::HANDSHAKING;
        Logger::session(self->tag() + " from " + self->remote_ + " awaiting handshake");
        self->resetIdleTimer();
        self->do_read();
    });
}

void ClientSession::send(const std::string& message) {
    deliver(std::make_shared<const std::string>(message));
}

void ClientSession::deliver(std::shared_ptr<const std::string> message) {
    net::post(strand_, [self = shared_from_this(), message = std::move(message)]() mutable {
        self->enqueue(std::move(message));
    });
}

void ClientSession::close() {
    net::post(strand_, [self = shared_from_this()]() {
        self->shutdown();
    });
}

void ClientSession::activate(int playerId) {
    playerId_ = playerId;
    state_ = State::ACTIVE;
}

void ClientSession::fail(const std::string& reason) {
    State s = state_;
    if (s == State::CLOSING || s == State::CLOSED) return;

    enqueue(std::make_shared<const std::string>(Codec::encode(ServerMsg::Talk{reason})));
    if (!beginClose()) return;

    if (queue_.empty()) {
        finish();
        return;
    }
    closeAfterFlush_ = true;
    closeTimer_.expires_after(limits_.closeDeadline);
    closeTimer_.async_wait(net::bind_executor(strand_, [self = shared_from_this()](boost::system::error_code ec) {
        if (ec == net::error::operation_aborted) return;
        if (self->state_ != State::CLOSED) {
            Logger::debug(self->tag() + " flush deadline passed");
            self->finish();
        }
    }));
}

// Reading

void ClientSession::do_read() {
    socket_.async_read_some(net::buffer(readBuffer_),
        net::bind_executor(strand_, [self = shared_from_this()](boost::system::error_code ec, std::size_t n) {
            self->on_read(ec, n);
        }));
}

void ClientSession::on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
    State s = state_;
    if (s == State::CLOSING || s == State::CLOSED) return;

    if (ec == net::error::eof) {
        Logger::session(tag() + " disconnected");
        shutdown();
        return;
    }
    if (ec) {
        fault(ConnectionFault("read error: " + ec.message()));
        return;
    }

    resetIdleTimer();
    decoder_.feed(readBuffer_.data(), bytes_transferred);

    try {
        while (auto line = decoder_.next()) {
            if (line->empty()) continue;   // keep-alive
            handleLine(*line);

            s = state_;
            if (s != State::HANDSHAKING && s != State::ACTIVE) return;
        }
    } catch (const ProtocolError& e) {
        Logger::error(tag() + ": " + e.what());
        fail(std::string("Protocol error: ") + e.what());
        return;
    }

    do_read();
}

void ClientSession::handleLine(const std::string& line) {
    ClientMessage message = Codec::decodeClientMessage(line);
    if (state_ == State::HANDSHAKING) {
        hub_.handleHandshake(shared_from_this(), message);
    } else {
        hub_.handleMessage(shared_from_this(), message);
    }
}

// Writing

void ClientSession::enqueue(std::shared_ptr<const std::string> message) {
    State s = state_;
    if (s != State::HANDSHAKING && s != State::ACTIVE) return;

    if (queuedBytes_ + message->size() > limits_.maxOutboundBytes) {
        fault(ConnectionFault("outbound queue exceeded " + std::to_string(limits_.maxOutboundBytes) + " bytes"));
        return;
    }

    queuedBytes_ += message->size();
    queue_.push_back(std::move(message));
    if (queue_.size() == 1) {
        do_write();
    }
}

void ClientSession::do_write() {
    if (queue_.empty()) return;

    auto message = queue_.front();
    net::async_write(socket_, net::buffer(*message),
        net::bind_executor(strand_, [self = shared_from_this(), message](boost::system::error_code ec, std::size_t n) {
            self->on_write(ec, n);
        }));
}

void ClientSession::on_write(boost::system::error_code ec, std::size_t bytes_transferred) {
    (void)bytes_transferred;
    if (state_ == State::CLOSED) return;

    if (ec) {
        fault(ConnectionFault("write error: " + ec.message()));
        return;
    }

    queuedBytes_ -= queue_.front()->size();
    queue_.pop_front();

    if (!queue_.empty()) {
        do_write();
    } else if (closeAfterFlush_) {
        finish();
    }
}

// Timers

void ClientSession::resetIdleTimer() {
    if (limits_.idleTimeout.count() == 0) return;

    idleTimer_.expires_after(limits_.idleTimeout);
    idleTimer_.async_wait(net::bind_executor(strand_, [self = shared_from_this()](boost::system::error_code ec) {
        self->on_idle(ec);
    }));
}

void ClientSession::on_idle(boost::system::error_code ec) {
    if (ec == net::error::operation_aborted) return;
    State s = state_;
    if (s == State::CLOSING || s == State::CLOSED) return;

    // Re-armed after this wait completed
    if (idleTimer_.expiry() > std::chrono::steady_clock::now()) return;

    fault(ConnectionFault("idle for " + std::to_string(limits_.idleTimeout.count()) + "s"));
}

// Closing

bool ClientSession::beginClose() {
    State s = state_;
    if (s == State::CLOSING || s == State::CLOSED) return false;

    Logger::debug(tag() + " " + stateName(s) + " -> CLOSING");
    state_ = State::CLOSING;
    hub_.removeClient(shared_from_this());
    return true;
}

void ClientSession::fault(const ConnectionFault& e) {
    State s = state_;
    if (s == State::CLOSED) return;
    if (s != State::CLOSING) {
        Logger::session(tag() + " " + e.what() + " - closing");
    }
    shutdown();
}

void ClientSession::shutdown() {
    beginClose();
    finish();
}

void ClientSession::finish() {
    if (state_ == State::CLOSED) return;
    state_ = State::CLOSED;

    idleTimer_.cancel();
    closeTimer_.cancel();
    queue_.clear();
    queuedBytes_ = 0;

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        Logger::debug(tag() + " shutdown: " + ec.message());
    }
    socket_.close(ec);
    if (ec) {
        Logger::debug(tag() + " close: " + ec.message());
    }
    Logger::session(tag() + " closed");
}
