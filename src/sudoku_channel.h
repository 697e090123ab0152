#ifndef SUDOKU_CHANNEL_H
#define SUDOKU_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "sudoku_game.h"

enum class PopResult {
    ITEM,
    TIMEOUT,
    CLOSED
};

// Many search tasks push, one collector pops. push() never blocks on
// capacity, so a finished node can always hand over its solution.
class SolutionChannel {
public:
    SolutionChannel() : closed_(false) {}

    void push(const Game& game) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(game);
        }
        cv_.notify_one();
    }

    // No more pushes will follow
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // TIMEOUT once the deadline has passed, even with solutions still
    // queued. A channel closed after the deadline also reads as TIMEOUT:
    // branches only give up early when the deadline expired.
    PopResult pop_until(Game& out, Deadline deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (std::chrono::steady_clock::now() >= deadline) {
            return PopResult::TIMEOUT;
        }
        bool ready = cv_.wait_until(lock, deadline, [this] {
            return !queue_.empty() || closed_;
        });
        if (!ready) {
            return PopResult::TIMEOUT;
        }
        if (!queue_.empty()) {
            out = queue_.front();
            queue_.pop_front();
            return PopResult::ITEM;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return PopResult::TIMEOUT;
        }
        return PopResult::CLOSED;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Game> queue_;
    bool closed_;
};

#endif
