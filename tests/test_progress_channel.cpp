#include "test_common.h"
#include "filechunker/progress_channel.hpp"
#include <thread>

using namespace filechunker;

static ProgressEvent event(std::uint64_t done) {
    return ProgressEvent{done, 100, "step " + std::to_string(done)};
}

int main() {
    // FIFO order
    {
        ProgressChannel channel(8);
        for (std::uint64_t i = 1; i <= 5; ++i) channel.push(event(i));
        if (channel.size() != 5) return fail(64, "size");
        auto first = channel.tryPop();
        if (!first || first->unitsDone != 1) return fail(65, "first out");
        auto rest = channel.drain();
        if (rest.size() != 4 || rest.front().unitsDone != 2 || rest.back().unitsDone != 5) return fail(66, "drain order");
        if (channel.tryPop()) return fail(67, "empty after drain");
    }

    // Full channel drops the oldest, never blocks
    {
        ProgressChannel channel(3);
        for (std::uint64_t i = 1; i <= 10; ++i) channel.push(event(i));
        if (channel.size() != 3 || channel.dropped() != 7) return fail(68, "overflow accounting");
        auto kept = channel.drain();
        if (kept[0].unitsDone != 8 || kept[2].unitsDone != 10) return fail(69, "latest events kept");
    }

    // Close wakes a waiting observer and rejects later pushes
    {
        ProgressChannel channel;
        if (channel.capacity() != ProgressChannel::kDefaultCapacity) return fail(70, "default capacity");
        std::thread closer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            channel.close();
        });
        auto start = std::chrono::steady_clock::now();
        auto none = channel.waitPop(std::chrono::seconds(10));
        closer.join();
        if (none) return fail(71, "nothing to pop");
        if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5)) return fail(72, "close did not wake observer");
        channel.push(event(1));
        if (channel.size() != 0 || !channel.closed()) return fail(73, "push after close");

        channel.reset();
        if (channel.closed() || channel.dropped() != 0) return fail(74, "reset");
        channel.push(event(2));
        auto got = channel.waitPop(std::chrono::milliseconds(10));
        if (!got || got->unitsDone != 2) return fail(75, "push after reset");
    }

    // Events queued before close are still delivered
    {
        ProgressChannel channel(4);
        channel.push(event(1));
        channel.close();
        auto got = channel.waitPop(std::chrono::milliseconds(10));
        if (!got || got->unitsDone != 1) return fail(76, "pending event after close");
        if (channel.waitPop(std::chrono::milliseconds(10))) return fail(77, "closed and empty");
    }

    // Producer thread, consumer thread
    {
        ProgressChannel channel(2048);
        std::thread producer([&] {
            for (std::uint64_t i = 1; i <= 1000; ++i) channel.push(event(i));
            channel.close();
        });
        std::uint64_t last = 0;
        std::size_t received = 0;
        while (true) {
            auto e = channel.waitPop(std::chrono::milliseconds(100));
            if (e) {
                if (e->unitsDone <= last) { producer.join(); return fail(78, "out of order"); }
                last = e->unitsDone;
                ++received;
            } else if (channel.closed() && channel.size() == 0) {
                break;
            }
        }
        producer.join();
        if (received != 1000 || last != 1000) return fail(79, "lost events");
    }

    std::cout << "[TEST] OK progress channel" << std::endl;
    return 0;
}
