// Queue implementation: a mutex guarded FIFO whose observers are notified
// after the lock is released, so a callback may call back into the manager.
#include "QueueManager.hpp"

#include <QLoggingCategory>
#include <exception>
#include <utility>
Q_LOGGING_CATEGORY(bfQueue, "bookfetch.queue")

const char *queueStatusName(QueueItem::Status st) {
    switch (st) {
    case QueueItem::Status::Pending:
        return "Pending";
    case QueueItem::Status::Downloading:
        return "Downloading";
    case QueueItem::Status::Completed:
        return "Completed";
    case QueueItem::Status::Failed:
        return "Failed";
    }
    return "Unknown";
}

QString QueueItem::displayName() const {
    return QStringLiteral("%1 (from %2)").arg(filename.left(50), user);
}

QueueManager::QueueManager(QObject *parent) : QObject(parent) {}

bool QueueManager::headIsDownloading() const {
    return !queue_.isEmpty() &&
           queue_.front().status == QueueItem::Status::Downloading;
}

QueueItem QueueManager::add(const QString &user, const QString &filename) {
    QueueItem item;
    item.user = user;
    item.filename = filename;
    item.command = QStringLiteral("!%1 %2").arg(user, filename);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        item.id = nextId_++;
        queue_.push_back(item);
        qCInfo(bfQueue) << "Added to queue:" << item.displayName();
        qCDebug(bfQueue) << "Queue size after add:" << queue_.size();
    }
    notifyCallbacks();
    return item;
}

std::optional<QueueItem> QueueManager::peekNext() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (queue_.isEmpty())
        return std::nullopt;
    QueueItem &head = queue_.front();
    head.status = QueueItem::Status::Downloading;
    qCInfo(bfQueue) << "Processing:" << head.displayName();
    return head;
}

void QueueManager::markCompleted(const QueueItem &item, bool success) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        QueueItem done = item;
        done.status = success ? QueueItem::Status::Completed
                              : QueueItem::Status::Failed;
        completed_.push_back(done);
        if (!queue_.isEmpty() && queue_.front().id == item.id) {
            queue_.pop_front();
            qCInfo(bfQueue) << "Removed finished item from queue";
        }
        if (current_ && current_->id == item.id)
            current_.reset();
        qCInfo(bfQueue) << "Completed:" << done.displayName()
                        << "success=" << success;
        qCInfo(bfQueue) << "Stats after completion:" << completed_.size()
                        << "done," << queue_.size() << "queued";
    }
    notifyCallbacks();
}

bool QueueManager::remove(int index) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (index >= 0 && index < queue_.size() &&
            !(index == 0 && headIsDownloading())) {
            qCInfo(bfQueue) << "Removed from queue:"
                            << queue_.at(index).displayName();
            queue_.remove(index);
            removed = true;
        }
    }
    if (removed)
        notifyCallbacks();
    return removed;
}

bool QueueManager::moveUp(int index) {
    bool moved = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (index > 0 && index < queue_.size() &&
            !(index == 1 && headIsDownloading())) {
            std::swap(queue_[index], queue_[index - 1]);
            moved = true;
        }
    }
    if (moved)
        notifyCallbacks();
    return moved;
}

bool QueueManager::moveDown(int index) {
    bool moved = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (index >= 0 && index < queue_.size() - 1 &&
            !(index == 0 && headIsDownloading())) {
            std::swap(queue_[index], queue_[index + 1]);
            moved = true;
        }
    }
    if (moved)
        notifyCallbacks();
    return moved;
}

void QueueManager::clear() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const auto before = queue_.size();
        // The in-flight head stays until its transfer resolves
        if (headIsDownloading())
            queue_.resize(1);
        else
            queue_.clear();
        qCInfo(bfQueue) << "Cleared" << (before - queue_.size())
                        << "items from queue";
    }
    notifyCallbacks();
}

void QueueManager::setCurrent(const std::optional<QueueItem> &item) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        current_ = item;
    }
    notifyCallbacks();
}

std::optional<QueueItem> QueueManager::current() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_;
}

QVector<QueueItem> QueueManager::items() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_;
}

QVector<QueueItem> QueueManager::completedItems() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completed_;
}

int QueueManager::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(queue_.size());
}

bool QueueManager::isEmpty() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.isEmpty();
}

QString QueueManager::status() const {
    std::lock_guard<std::mutex> lk(mtx_);
    // The live queue includes the item being downloaded
    const auto total = completed_.size() + queue_.size();
    return QStringLiteral("%1 done, %2 queued (Total: %3)")
        .arg(completed_.size())
        .arg(queue_.size())
        .arg(total);
}

void QueueManager::registerCallback(Callback cb) {
    std::lock_guard<std::mutex> lk(cbMutex_);
    callbacks_.push_back(std::move(cb));
}

void QueueManager::notifyCallbacks() {
    std::vector<Callback> snapshot;
    {
        std::lock_guard<std::mutex> lk(cbMutex_);
        snapshot = callbacks_;
    }
    qCDebug(bfQueue) << "Notifying" << snapshot.size() << "callbacks";
    for (const auto &cb : snapshot) {
        try {
            cb();
        } catch (const std::exception &e) {
            qCWarning(bfQueue) << "Error in queue callback:" << e.what();
        }
    }
    emit queueChanged();
}
