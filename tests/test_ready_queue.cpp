#include "test_common.h"

#include "caproute/ready_queue.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using caproute::ReadyQueue;

int main() {
    // Test 1: lowest rank first, FIFO within a rank
    {
        ReadyQueue<std::string> q;
        q.push(5, "low");
        q.push(1, "hi1");
        q.push(1, "hi2");
        expect_eq_ll((long long)q.size(), 3, "size");

        auto a = q.pop();
        auto b = q.pop();
        auto c = q.pop();
        expect_true(a && b && c, "three pops");
        expect_true(*a == "hi1" && *b == "hi2", "FIFO within a rank");
        expect_true(*c == "low", "higher rank last");
    }

    // Test 2: close wakes a blocked pop
    {
        ReadyQueue<int> q;
        std::atomic<bool> returned{false};
        bool got_value = true;
        std::thread t([&] {
            auto v = q.pop();
            got_value = v.has_value();
            returned = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        expect_true(!returned.load(), "pop should block on an empty queue");
        q.close();
        t.join();
        expect_true(returned.load() && !got_value, "closed empty queue returns nullopt");
    }

    // Test 3: close drains queued work, then rejects pushes
    {
        ReadyQueue<int> q;
        q.push(2, 20);
        q.push(1, 10);
        q.close();
        q.push(0, 99);
        expect_true(q.closed(), "closed");
        auto a = q.pop();
        auto b = q.pop();
        auto c = q.pop();
        expect_true(a && *a == 10 && b && *b == 20, "queued items still delivered");
        expect_true(!c, "push after close ignored");
    }

    // Test 4: pool of workers consumes everything exactly once
    {
        ReadyQueue<int> q;
        std::atomic<long long> sum{0};
        std::atomic<int> count{0};
        std::vector<std::thread> workers;
        for (int w = 0; w < 4; w++) {
            workers.emplace_back([&] {
                while (auto v = q.pop()) {
                    sum += *v;
                    count++;
                }
            });
        }
        for (int i = 1; i <= 1000; i++) q.push((uint64_t)(i % 7), i);
        while (q.size() > 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        q.close();
        for (auto& t : workers) t.join();
        expect_eq_ll(count.load(), 1000, "every item popped once");
        expect_eq_ll(sum.load(), 500500, "sum matches");
    }

    std::cerr << "test_ready_queue: ALL PASSED" << std::endl;
    return 0;
}
