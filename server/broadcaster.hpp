// server/broadcaster.hpp
// Fan-out of encoded records to every subscribed connection
#ifndef SERVER_BROADCASTER_HPP
#define SERVER_BROADCASTER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

enum class Delivery {
    ALL,
    EXCEPT_ORIGIN
};

// Anything that owns an outbound queue. deliver() must not block on I/O.
class Subscriber {
public:
    virtual ~Subscriber() = default;
    virtual uint64_t connectionId() const = 0;
    virtual void deliver(std::shared_ptr<const std::string> message) = 0;
};

class Broadcaster {
public:
    void subscribe(const std::shared_ptr<Subscriber>& subscriber);
    void unsubscribe(uint64_t connectionId);

    // Hands `encoded` to every live subscriber, skipping the origin for EXCEPT_ORIGIN
    void publish(const std::string& encoded, uint64_t originConnectionId = 0, Delivery delivery = Delivery::ALL);

    std::size_t subscriberCount() const;

private:
    mutable std::mutex mutex;
    std::map<uint64_t, std::weak_ptr<Subscriber>> subscribers;
};

#endif // SERVER_BROADCASTER_HPP
