#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace caproute {

// ReadyQueue
// - Work whose prerequisites are met, handed to a fixed pool of workers
// - Lowest rank first (plan steps use their declaration index), FIFO within a rank
// - close() wakes every blocked pop(); pop() then drains what is left and returns nullopt
template <typename T>
class ReadyQueue {
public:
    void push(uint64_t rank, T value) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            q_.push(Slot{rank, seq_++, std::move(value)});
        }
        cv_.notify_one();
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return std::nullopt;
        T v = q_.top().value;
        q_.pop();
        return v;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    struct Slot {
        uint64_t rank{0};
        uint64_t seq{0};
        T value;
    };
    struct Later {
        bool operator()(const Slot& a, const Slot& b) const {
            if (a.rank != b.rank) return a.rank > b.rank;
            return a.seq > b.seq;
        }
    };

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Slot, std::vector<Slot>, Later> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

} // namespace caproute
