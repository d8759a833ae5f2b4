// Download queue: ordered pending requests, the in-flight slot and a history
// of finished items. All methods are thread-safe.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

// One requested download.
struct QueueItem {
    // Status only moves forward: Pending -> Downloading -> Completed/Failed.
    enum class Status { Pending, Downloading, Completed, Failed };

    quint64 id = 0;   // stable identity, assigned by QueueManager
    QString user;     // nick offering the file
    QString filename;
    QString command;  // "!<user> <filename>", fixed at creation
    Status status = Status::Pending;

    // "<first 50 chars of filename> (from <user>)"
    QString displayName() const;
};

const char *queueStatusName(QueueItem::Status st);

class QueueManager : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void()>;

    explicit QueueManager(QObject *parent = nullptr);

    QueueItem add(const QString &user, const QString &filename);

    // Head of the queue, marked Downloading, without removing it.
    std::optional<QueueItem> peekNext();

    // Records the outcome in the history. The live queue is popped only when
    // item is still its head, so a stale completion is harmless.
    void markCompleted(const QueueItem &item, bool success);

    // Index based edits of the live queue. They refuse out-of-range indexes
    // and anything that would displace a Downloading head.
    bool remove(int index);
    bool moveUp(int index);
    bool moveDown(int index);
    void clear();

    void setCurrent(const std::optional<QueueItem> &item);
    std::optional<QueueItem> current() const;

    QVector<QueueItem> items() const;
    QVector<QueueItem> completedItems() const;
    int size() const;
    bool isEmpty() const;
    QString status() const;

    // Called after every mutation, outside the queue lock. Exceptions thrown
    // by a callback are logged and do not reach the caller.
    void registerCallback(Callback cb);

signals:
    void queueChanged();

private:
    void notifyCallbacks();
    bool headIsDownloading() const; // requires mtx_

    mutable std::mutex mtx_; // protects queue_, completed_, current_
    QVector<QueueItem> queue_;
    QVector<QueueItem> completed_;
    std::optional<QueueItem> current_;
    quint64 nextId_ = 1;

    std::mutex cbMutex_;
    std::vector<Callback> callbacks_;
};
