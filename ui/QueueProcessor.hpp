// Background loop that starts the next queued download whenever the client
// is idle.
#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class EbookClient;
class QueueManager;

class QueueProcessor {
public:
    QueueProcessor(EbookClient &client, QueueManager &queue,
                   std::chrono::milliseconds interval = std::chrono::seconds(1));
    ~QueueProcessor();

    QueueProcessor(const QueueProcessor &) = delete;
    QueueProcessor &operator=(const QueueProcessor &) = delete;

    // No-op when already running.
    void start();
    // Wakes the loop and joins it. Safe to call more than once.
    void stop();
    bool isRunning() const;

private:
    void run();

    EbookClient &client_;
    QueueManager &queue_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mtx_; // protects running_ and stopRequested_
    std::condition_variable cv_;
    bool running_ = false;
    bool stopRequested_ = false;
    std::thread worker_;
};
