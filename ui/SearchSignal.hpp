// Completion signal for a search: set once per search, re-armed by the next.
#pragma once
#include <QString>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <cstdint>
#include <optional>
#include <utility>

struct SearchOutcome {
    enum class Kind {
        Pending,     // no answer yet
        ResultsFile, // results listing downloaded to path
        NoResults,   // the search bot found nothing
        Failed,      // transfer could not be started or stored
        Cancelled    // the user gave up waiting
    };
    Kind kind = Kind::Pending;
    QString path;
    QString error;
};

class SearchSignal {
public:
    // Clears the previous outcome; waiters block again until set().
    void arm() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            set_ = false;
            outcome_ = SearchOutcome{};
            ++round_;
        }
        cv_.notify_all();
    }

    // First outcome after arm() wins. Returns false if already set.
    bool set(SearchOutcome outcome) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (set_)
                return false;
            set_ = true;
            outcome_ = std::move(outcome);
        }
        cv_.notify_all();
        return true;
    }

    bool cancel() {
        SearchOutcome o;
        o.kind = SearchOutcome::Kind::Cancelled;
        return set(o);
    }

    // Blocks with no timeout. A waiter whose search was superseded by a
    // newer arm() wakes up with Cancelled.
    SearchOutcome wait() {
        std::unique_lock<std::mutex> lk(mtx_);
        const std::uint64_t round = round_;
        cv_.wait(lk, [this, round] { return set_ || round_ != round; });
        return resultFor(round);
    }

    std::optional<SearchOutcome> waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        const std::uint64_t round = round_;
        if (!cv_.wait_for(lk, timeout,
                          [this, round] { return set_ || round_ != round; }))
            return std::nullopt;
        return resultFor(round);
    }

    bool isSet() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return set_;
    }

    SearchOutcome outcome() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return outcome_;
    }

private:
    // requires mtx_
    SearchOutcome resultFor(std::uint64_t round) const {
        if (round_ != round) {
            SearchOutcome o;
            o.kind = SearchOutcome::Kind::Cancelled;
            return o;
        }
        return outcome_;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool set_ = false;
    std::uint64_t round_ = 0;
    SearchOutcome outcome_;
};
