// server/broadcaster.cpp
#include "broadcaster.hpp"
#include "logger.hpp"

#include <vector>

void Broadcaster::subscribe(const std::shared_ptr<Subscriber>& subscriber) {
    std::lock_guard<std::mutex> lock(mutex);
    subscribers[subscriber->connectionId()] = subscriber;
}

void Broadcaster::unsubscribe(uint64_t connectionId) {
    std::lock_guard<std::mutex> lock(mutex);
    subscribers.erase(connectionId);
}

void Broadcaster::publish(const std::string& encoded, uint64_t originConnectionId, Delivery delivery) {
    auto message = std::make_shared<const std::string>(encoded);

    // Copy the recipients so deliver() runs without the table lock
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        targets.reserve(subscribers.size());
        for (auto it = subscribers.begin(); it != subscribers.end();) {
            if (delivery == Delivery::EXCEPT_ORIGIN && it->first == originConnectionId) {
                ++it;
                continue;
            }
            if (auto sub = it->second.lock()) {
                targets.push_back(std::move(sub));
                ++it;
            } else {
                Logger::debug("Dropping expired subscriber " + std::to_string(it->first));
                it = subscribers.erase(it);
            }
        }
    }

    for (const auto& sub : targets) {
        sub->deliver(message);
    }
}

std::size_t Broadcaster::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return subscribers.size();
}
