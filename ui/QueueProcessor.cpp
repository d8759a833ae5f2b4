#include "QueueProcessor.hpp"
#include "EbookClient.hpp"
#include "QueueManager.hpp"

#include <QLoggingCategory>
#include <exception>
Q_DECLARE_LOGGING_CATEGORY(bfQueue)

QueueProcessor::QueueProcessor(EbookClient &client, QueueManager &queue,
                               std::chrono::milliseconds interval)
    : client_(client), queue_(queue), interval_(interval) {}

QueueProcessor::~QueueProcessor() { stop(); }

void QueueProcessor::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_)
        return;
    // A previous loop may have been stopped but not joined yet
    if (worker_.joinable())
        worker_.join();
    stopRequested_ = false;
    running_ = true;
    worker_ = std::thread([this] { run(); });
    qCInfo(bfQueue) << "Queue processor started";
}

void QueueProcessor::stop() {
    std::thread toJoin;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = true;
        toJoin = std::move(worker_);
    }
    cv_.notify_all();
    if (toJoin.joinable()) {
        toJoin.join();
        qCInfo(bfQueue) << "Queue processor stopped";
    }
}

bool QueueProcessor::isRunning() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

void QueueProcessor::run() {
    unsigned checks = 0;
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopRequested_) {
        lk.unlock();
        try {
            if (client_.isIdle() && !queue_.isEmpty()) {
                qCInfo(bfQueue) << "Processing next item in queue";
                client_.processQueue();
            }
            if (++checks % 10 == 0)
                qCDebug(bfQueue) << "Queue check; size:" << queue_.size();
        } catch (const std::exception &e) {
            qCWarning(bfQueue) << "Error in queue processor:" << e.what();
        }
        lk.lock();
        cv_.wait_for(lk, interval_, [this] { return stopRequested_; });
    }
    running_ = false;
}
