// server/game_server.cpp
#include "game_server.hpp"
#include "logger.hpp"

GameServer::GameServer(const ServerConfig& config)
    : config_(config),
      storage_(config_.saveDir),
      world_(config_.seed, config_.minY, config_.maxY, &storage_),
      hub_(world_, players_, broadcaster_, config_),
      persistence_(world_, storage_, std::chrono::seconds(config_.flushIntervalSeconds), config_.flushDirtyThreshold) {}

GameServer::~GameServer() {
    stop();
}

unsigned short GameServer::port() const {
    return listener_ ? listener_->port() : config_.port;
}

void GameServer::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) return;

    persistence_.loadAll();
    hub_.calculateSpawnPoint();

    SessionLimits limits;
    limits.maxLineLength = config_.maxLineLength;
    limits.maxOutboundBytes = config_.maxOutboundBytes;
    limits.idleTimeout = std::chrono::seconds(config_.idleTimeoutSeconds);

    auto address = net::ip::make_address(config_.host);
    listener_ = std::make_shared<Listener>(ioc_, tcp::endpoint{address, config_.port}, hub_, limits);

    persistence_.start();
    listener_->run();

    work_.emplace(net::make_work_guard(ioc_));
    unsigned int count = config_.threads == 0 ? 1 : config_.threads;
    threads_.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { ioc_.run(); });
    }

    running_ = true;
    Logger::server("Listening on " + config_.host + ":" + std::to_string(listener_->port()) + " with " +
                   std::to_string(count) + " worker thread(s)");
}

void GameServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) return;
    running_ = false;

    Logger::server("Shutting down...");
    listener_->stop();
    hub_.closeAll();

    // Workers return once every session has closed and the acceptor is gone
    work_.reset();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    Logger::server("Saving world...");
    persistence_.stop();
    Logger::server("Stopped");
}
