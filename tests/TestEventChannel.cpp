#include "core/events/EventChannel.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using tradeguard::core::BoundedChannel;
using tradeguard::core::EngineEvent;
using tradeguard::core::EngineEventType;
using tradeguard::core::EventChannel;
using tradeguard::core::OverflowPolicy;

int main() {
    // ===== Drop oldest =====
    {
        BoundedChannel<int> channel(3, OverflowPolicy::DROP_OLDEST);
        for (int i = 1; i <= 5; ++i) {
            assert(channel.publish(i));
        }
        assert(channel.size() == 3);
        assert(channel.droppedCount() == 2);

        auto items = channel.drain();
        assert(items.size() == 3);
        assert(items[0] == 3 && items[1] == 4 && items[2] == 5);
        assert(!channel.tryPop());
    }

    // ===== Block until a consumer makes room =====
    {
        BoundedChannel<int> channel(1, OverflowPolicy::BLOCK);
        assert(channel.publish(1));

        std::atomic<bool> published{false};
        std::thread producer([&]() {
            published = channel.publish(2);
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(!published);

        auto first = channel.popFor(std::chrono::milliseconds(100));
        assert(first && *first == 1);
        producer.join();
        assert(published);

        auto second = channel.tryPop();
        assert(second && *second == 2);
        assert(channel.droppedCount() == 0);
    }

    // ===== Close releases blocked producers and refuses new events =====
    {
        BoundedChannel<int> channel(1, OverflowPolicy::BLOCK);
        channel.publish(1);
        std::atomic<bool> result{true};
        std::thread producer([&]() {
            result = channel.publish(2);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.close();
        producer.join();
        assert(!result);
        assert(!channel.publish(3));
        // Queued events stay readable after close
        auto remaining = channel.popFor(std::chrono::milliseconds(10));
        assert(remaining && *remaining == 1);
        assert(!channel.popFor(std::chrono::milliseconds(10)));
    }

    // ===== Engine events keep publish order =====
    {
        EventChannel channel(16);
        EngineEvent a;
        a.type = EngineEventType::POSITION_OPENED;
        a.symbol = "BTC/USD";
        EngineEvent b;
        b.type = EngineEventType::POSITION_CLOSED;
        b.symbol = "BTC/USD";
        channel.publish(a);
        channel.publish(b);

        assert(channel.popFor(std::chrono::milliseconds(10))->type == EngineEventType::POSITION_OPENED);
        assert(channel.popFor(std::chrono::milliseconds(10))->type == EngineEventType::POSITION_CLOSED);
        assert(!channel.popFor(std::chrono::milliseconds(10)));
        assert(std::string(tradeguard::core::toString(EngineEventType::EMERGENCY_STOP)) == "EMERGENCY_STOP");
    }

    std::cout << "[TEST] EventChannel PASSED\n";
    return 0;
}
