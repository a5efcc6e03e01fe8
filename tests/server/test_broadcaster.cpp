/**
 * @file test_broadcaster.cpp
 * @brief Fan-out targeting and subscriber lifetime.
 */

#include <catch2/catch.hpp>

#include "server/broadcaster.hpp"

#include <thread>
#include <vector>

namespace {

class RecordingSubscriber : public Subscriber {
public:
    explicit RecordingSubscriber(uint64_t id) : id_(id) {}

    uint64_t connectionId() const override { return id_; }

    void deliver(std::shared_ptr<const std::string> message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(*message);
    }

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    uint64_t id_;
    mutable std::mutex mutex_;
    std::vector<std::string> received_;
};

} // namespace

TEST_CASE("Broadcaster delivers to every subscriber by default", "[broadcaster]") {
    Broadcaster broadcaster;
    auto a = std::make_shared<RecordingSubscriber>(1);
    auto b = std::make_shared<RecordingSubscriber>(2);
    broadcaster.subscribe(a);
    broadcaster.subscribe(b);

    broadcaster.publish("B,0,0,3,10,3,5\n", 1);

    REQUIRE(a->received() == std::vector<std::string>{"B,0,0,3,10,3,5\n"});
    REQUIRE(b->received() == std::vector<std::string>{"B,0,0,3,10,3,5\n"});
}

TEST_CASE("EXCEPT_ORIGIN skips the originating connection", "[broadcaster]") {
    Broadcaster broadcaster;
    auto a = std::make_shared<RecordingSubscriber>(1);
    auto b = std::make_shared<RecordingSubscriber>(2);
    auto c = std::make_shared<RecordingSubscriber>(3);
    broadcaster.subscribe(a);
    broadcaster.subscribe(b);
    broadcaster.subscribe(c);

    broadcaster.publish("P,1,0,34,0,0,0\n", 1, Delivery::EXCEPT_ORIGIN);

    REQUIRE(a->received().empty());
    REQUIRE(b->received().size() == 1);
    REQUIRE(c->received().size() == 1);
}

TEST_CASE("Unsubscribed connections receive nothing further", "[broadcaster]") {
    Broadcaster broadcaster;
    auto a = std::make_shared<RecordingSubscriber>(1);
    auto b = std::make_shared<RecordingSubscriber>(2);
    broadcaster.subscribe(a);
    broadcaster.subscribe(b);

    broadcaster.unsubscribe(2);
    broadcaster.unsubscribe(99);
    broadcaster.publish("T,hello\n");

    REQUIRE(a->received().size() == 1);
    REQUIRE(b->received().empty());
    REQUIRE(broadcaster.subscriberCount() == 1);
}

TEST_CASE("Destroyed subscribers are pruned on publish", "[broadcaster]") {
    Broadcaster broadcaster;
    auto keep = std::make_shared<RecordingSubscriber>(1);
    broadcaster.subscribe(keep);
    {
        auto gone = std::make_shared<RecordingSubscriber>(2);
        broadcaster.subscribe(gone);
        REQUIRE(broadcaster.subscriberCount() == 2);
    }

    broadcaster.publish("T,still here\n");
    REQUIRE(keep->received().size() == 1);
    REQUIRE(broadcaster.subscriberCount() == 1);
}

TEST_CASE("Each subscriber sees one publisher's records in publish order", "[broadcaster][concurrency]") {
    Broadcaster broadcaster;
    auto sink = std::make_shared<RecordingSubscriber>(1);
    broadcaster.subscribe(sink);

    std::vector<std::thread> publishers;
    for (int t = 0; t < 4; ++t) {
        publishers.emplace_back([&, t]() {
            for (int i = 0; i < 100; ++i) {
                broadcaster.publish(std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& p : publishers) p.join();

    auto received = sink->received();
    REQUIRE(received.size() == 400);

    std::vector<int> last(4, -1);
    for (const auto& message : received) {
        int t = message[0] - '0';
        int i = std::stoi(message.substr(2));
        REQUIRE(i == last[t] + 1);
        last[t] = i;
    }
}
