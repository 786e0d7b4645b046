#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <variant>

#include "application/DeliveryQueue.hpp"

using namespace audiovault;
using application::DeliveryQueue;
using application::QueueEntry;
using application::ShutdownSignal;

namespace {

domain::PendingSegment SegmentOfLength(std::size_t n) {
    domain::PendingSegment s;
    s.samples.assign(n, 0.0f);
    return s;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DeliveryQueue Test..." << std::endl;

    // FIFO with the shutdown entry honoured last.
    {
        DeliveryQueue queue;
        queue.push(SegmentOfLength(1));
        queue.push(SegmentOfLength(2));
        queue.push(ShutdownSignal{});
        assert(queue.size() == 3);

        QueueEntry a = queue.pop();
        QueueEntry b = queue.pop();
        QueueEntry c = queue.pop();
        assert(std::get<domain::PendingSegment>(a).samples.size() == 1);
        assert(std::get<domain::PendingSegment>(b).samples.size() == 2);
        assert(std::holds_alternative<ShutdownSignal>(c));
        assert(!queue.tryPop().has_value());
        std::cout << "[PASS] Entries come out in push order." << std::endl;
    }

    // pop() blocks until a producer pushes.
    {
        DeliveryQueue queue;
        auto begin = std::chrono::steady_clock::now();
        std::thread producer([&queue]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            queue.push(SegmentOfLength(7));
        });

        QueueEntry entry = queue.pop();
        auto waited = std::chrono::steady_clock::now() - begin;
        producer.join();

        assert(std::get<domain::PendingSegment>(entry).samples.size() == 7);
        assert(waited >= std::chrono::milliseconds(40));
        std::cout << "[PASS] pop() waits for a push without polling." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
