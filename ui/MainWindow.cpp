#include "MainWindow.hpp"
#include "EbookClient.hpp"
#include "QueueManager.hpp"
#include "UiAlerts.hpp"

#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QPointer>
#include <QProgressBar>
#include <QPushButton>
#include <QSettings>
#include <QSpinBox>
#include <QSplitter>
#include <QStatusBar>
#include <QTableWidget>
#include <QTimer>
#include <QVBoxLayout>
#include <algorithm>
#include <chrono>
#include <exception>
Q_LOGGING_CATEGORY(bfUi, "bookfetch.ui")

// How long a finished search waits for the ISON replies.
static constexpr auto kIsonWait = std::chrono::seconds(5);

enum ResultColumn { ColFile = 0, ColUsers, ColOnline, ColCount };

static QStringList sortedList(const QSet<QString> &set) {
    QStringList out(set.begin(), set.end());
    std::sort(out.begin(), out.end(), [](const QString &a, const QString &b) {
        return a.compare(b, Qt::CaseInsensitive) < 0;
    });
    return out;
}

MainWindow::MainWindow(const AppConfig &config, EbookClient &client,
                       QueueManager &queue, QWidget *parent)
    : QMainWindow(parent), config_(config), client_(client), queue_(queue),
      processor_(config.fileTypes) {
    buildUi();

    // queueChanged may be emitted from the transport or processor threads
    connect(&queue_, &QueueManager::queueChanged, this,
            &MainWindow::refreshQueue, Qt::QueuedConnection);

    statusTimer_ = new QTimer(this);
    statusTimer_->setInterval(200);
    connect(statusTimer_, &QTimer::timeout, this, &MainWindow::refreshStatus);
    statusTimer_->start();

    refreshQueue();
    refreshStatus();
}

MainWindow::~MainWindow() { joinSearchWorker(); }

void MainWindow::buildUi() {
    setWindowTitle(config_.windowTitle);
    resize(config_.windowSize);

    auto *central = new QWidget(this);
    auto *root = new QVBoxLayout(central);

    // Search row
    auto *searchRow = new QHBoxLayout();
    searchEdit_ = new QLineEdit(central);
    searchEdit_->setPlaceholderText(tr("Title or author"));
    searchBtn_ = new QPushButton(tr("Search"), central);
    cancelBtn_ = new QPushButton(tr("Cancel Current"), central);
    searchRow->addWidget(new QLabel(tr("Search:"), central));
    searchRow->addWidget(searchEdit_, 1);
    searchRow->addWidget(searchBtn_);
    searchRow->addWidget(cancelBtn_);
    root->addLayout(searchRow);

    // Filters
    auto *filterBox = new QGroupBox(tr("Filters"), central);
    auto *filterRow = new QHBoxLayout(filterBox);
    minUsersSpin_ = new QSpinBox(filterBox);
    minUsersSpin_->setRange(1, 99);
    filterEdit_ = new QLineEdit(filterBox);
    filterEdit_->setPlaceholderText(tr("Filter text"));
    filterEdit_->setClearButtonEnabled(true);
    filterRow->addWidget(new QLabel(tr("Min users:"), filterBox));
    filterRow->addWidget(minUsersSpin_);
    filterRow->addWidget(filterEdit_, 1);
    for (const QString &type : processor_.fileTypes()) {
        auto *cb = new QCheckBox(type, filterBox);
        cb->setChecked(true);
        typeChecks_.insert(type, cb);
        filterRow->addWidget(cb);
        connect(cb, &QCheckBox::toggled, this, &MainWindow::applyFilters);
    }
    hideOfflineCheck_ = new QCheckBox(tr("Hide offline"), filterBox);
    filterRow->addWidget(hideOfflineCheck_);
    root->addWidget(filterBox);

    auto *splitter = new QSplitter(Qt::Horizontal, central);

    // Results
    auto *resultsPane = new QWidget(splitter);
    auto *resultsLayout = new QVBoxLayout(resultsPane);
    resultsLayout->setContentsMargins(0, 0, 0, 0);
    resultsTable_ = new QTableWidget(0, ColCount, resultsPane);
    resultsTable_->setHorizontalHeaderLabels(
        {tr("File"), tr("Users"), tr("Online")});
    resultsTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    resultsTable_->setSelectionMode(QAbstractItemView::SingleSelection);
    resultsTable_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    resultsTable_->setSortingEnabled(true);
    resultsTable_->horizontalHeader()->setSectionResizeMode(
        ColFile, QHeaderView::Stretch);
    resultsTable_->verticalHeader()->setVisible(false);
    queueBtn_ = new QPushButton(tr("Queue download"), resultsPane);
    resultsLayout->addWidget(resultsTable_, 1);
    resultsLayout->addWidget(queueBtn_);

    // Queue
    auto *queueBox = new QGroupBox(tr("Download queue"), splitter);
    auto *queueLayout = new QVBoxLayout(queueBox);
    queueList_ = new QListWidget(queueBox);
    queueLayout->addWidget(queueList_, 1);
    auto *queueButtons = new QHBoxLayout();
    upBtn_ = new QPushButton(tr("Up"), queueBox);
    downBtn_ = new QPushButton(tr("Down"), queueBox);
    removeBtn_ = new QPushButton(tr("Remove"), queueBox);
    clearBtn_ = new QPushButton(tr("Clear"), queueBox);
    queueButtons->addWidget(upBtn_);
    queueButtons->addWidget(downBtn_);
    queueButtons->addWidget(removeBtn_);
    queueButtons->addWidget(clearBtn_);
    queueLayout->addLayout(queueButtons);

    splitter->addWidget(resultsPane);
    splitter->addWidget(queueBox);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 1);
    root->addWidget(splitter, 1);
    setCentralWidget(central);

    // Status bar
    modeLabel_ = new QLabel(this);
    queueLabel_ = new QLabel(this);
    progress_ = new QProgressBar(this);
    progress_->setRange(0, 100);
    progress_->setMaximumWidth(220);
    statusBar()->addWidget(modeLabel_);
    statusBar()->addWidget(queueLabel_, 1);
    statusBar()->addPermanentWidget(progress_);

    connect(searchBtn_, &QPushButton::clicked, this, &MainWindow::startSearch);
    connect(searchEdit_, &QLineEdit::returnPressed, this,
            &MainWindow::startSearch);
    connect(cancelBtn_, &QPushButton::clicked, this,
            &MainWindow::cancelCurrent);
    connect(queueBtn_, &QPushButton::clicked, this, &MainWindow::queueSelected);
    connect(resultsTable_, &QTableWidget::cellDoubleClicked, this,
            [this](int, int) { queueSelected(); });
    connect(minUsersSpin_, qOverload<int>(&QSpinBox::valueChanged), this,
            &MainWindow::applyFilters);
    connect(filterEdit_, &QLineEdit::textChanged, this,
            &MainWindow::applyFilters);
    connect(hideOfflineCheck_, &QCheckBox::toggled, this,
            &MainWindow::applyFilters);
    connect(upBtn_, &QPushButton::clicked, this, &MainWindow::moveSelectedUp);
    connect(downBtn_, &QPushButton::clicked, this,
            &MainWindow::moveSelectedDown);
    connect(removeBtn_, &QPushButton::clicked, this,
            &MainWindow::removeSelected);
    connect(clearBtn_, &QPushButton::clicked, this, &MainWindow::clearQueue);
}

void MainWindow::joinSearchWorker() {
    if (!searchWorker_.joinable())
        return;
    if (searching_) {
        if (client_.mode() == ClientMode::AwaitingSearch)
            client_.cancelCurrentDownload();
        else
            client_.searchSignal().cancel();
    }
    searchWorker_.join();
}

void MainWindow::startSearch() {
    const QString text = searchEdit_->text().trimmed();
    if (text.isEmpty())
        return;
    if (searching_) {
        UiAlerts::information(this, tr("Search"),
                              tr("A search is already running."));
        return;
    }
    if (searchWorker_.joinable())
        searchWorker_.join();
    if (!client_.doSearch(text)) {
        UiAlerts::warning(
            this, tr("Search"),
            tr("Cannot search right now (client is busy: %1).")
                .arg(client_.modeName()));
        return;
    }

    searching_ = true;
    searchBtn_->setEnabled(false);
    statusBar()->showMessage(tr("Searching for \"%1\"...").arg(text));
    qCInfo(bfUi) << "Search started:" << text;

    QPointer<MainWindow> self(this);
    EbookClient *client = &client_;
    const FileProcessor processor = processor_;
    searchWorker_ = std::thread([self, client, processor]() {
        const SearchOutcome outcome = client->searchSignal().wait();
        SearchResults results;
        QSet<QString> online;
        QString error = outcome.error;
        try {
            if (outcome.kind == SearchOutcome::Kind::ResultsFile) {
                results = processor.processSearchResults(outcome.path);
                QSet<QString> users;
                for (auto it = results.cbegin(); it != results.cend(); ++it)
                    users.unite(it.value());
                if (!users.isEmpty()) {
                    client->checkUsersOnline(users);
                    if (!client->waitForUsersOnline(kIsonWait))
                        qCWarning(bfUi) << "Timed out waiting for ISON replies";
                    online = client->usersOnline();
                }
            }
        } catch (const std::exception &ex) {
            error = QString::fromUtf8(ex.what());
            results.clear();
        }
        QMetaObject::invokeMethod(
            qApp,
            [self, outcome, results, online, error]() {
                if (!self)
                    return;
                self->finishSearch(outcome, results, online, error);
            },
            Qt::QueuedConnection);
    });
}

void MainWindow::finishSearch(const SearchOutcome &outcome,
                              const SearchResults &results,
                              const QSet<QString> &online,
                              const QString &error) {
    searching_ = false;
    searchBtn_->setEnabled(true);
    statusBar()->clearMessage();

    switch (outcome.kind) {
    case SearchOutcome::Kind::ResultsFile:
        if (!error.isEmpty()) {
            UiAlerts::warning(this, tr("Search"),
                              tr("Could not read the results: %1").arg(error));
            return;
        }
        results_ = results;
        online_ = online;
        applyFilters();
        statusBar()->showMessage(
            tr("%1 results, %2 users online").arg(results_.size()).arg(online_.size()),
            5000);
        if (results_.isEmpty())
            UiAlerts::information(this, tr("Search"),
                                  tr("The results file listed no books."));
        break;
    case SearchOutcome::Kind::NoResults:
        UiAlerts::information(this, tr("Search"), tr("No results found."));
        break;
    case SearchOutcome::Kind::Failed:
        UiAlerts::warning(this, tr("Search"),
                          tr("Search failed: %1").arg(error));
        break;
    case SearchOutcome::Kind::Cancelled:
        statusBar()->showMessage(tr("Search cancelled"), 3000);
        break;
    case SearchOutcome::Kind::Pending:
        break;
    }
}

void MainWindow::cancelCurrent() {
    qCInfo(bfUi) << "Cancel requested";
    client_.cancelCurrentDownload();
}

void MainWindow::applyFilters() {
    const int minUsers = minUsersSpin_->value();
    const QString needle = filterEdit_->text().trimmed();
    const bool hideOffline = hideOfflineCheck_->isChecked();
    QStringList types;
    for (auto it = typeChecks_.cbegin(); it != typeChecks_.cend(); ++it) {
        if (it.value()->isChecked())
            types << it.key();
    }

    resultsTable_->setSortingEnabled(false);
    resultsTable_->setRowCount(0);
    for (auto it = results_.cbegin(); it != results_.cend(); ++it) {
        const QString &file = it.key();
        const QSet<QString> &users = it.value();
        if (users.size() < minUsers)
            continue;
        if (!needle.isEmpty() && !file.contains(needle, Qt::CaseInsensitive))
            continue;
        const QString lower = file.toLower();
        const bool typeOk =
            std::any_of(types.cbegin(), types.cend(), [&](const QString &t) {
                return lower.contains(QLatin1Char('.') + t);
            });
        if (!typeOk)
            continue;
        const QSet<QString> onlineUsers = users & online_;
        if (hideOffline && onlineUsers.isEmpty())
            continue;

        const int row = resultsTable_->rowCount();
        resultsTable_->insertRow(row);
        auto *fileItem = new QTableWidgetItem(file);
        fileItem->setData(Qt::UserRole, sortedList(users));
        fileItem->setData(Qt::UserRole + 1, sortedList(onlineUsers));
        resultsTable_->setItem(row, ColFile, fileItem);
        auto *countItem = new QTableWidgetItem();
        countItem->setData(Qt::DisplayRole, static_cast<int>(users.size()));
        resultsTable_->setItem(row, ColUsers, countItem);
        resultsTable_->setItem(
            row, ColOnline,
            new QTableWidgetItem(sortedList(onlineUsers).join(QStringLiteral(", "))));
    }
    resultsTable_->setSortingEnabled(true);
}

void MainWindow::queueSelected() {
    const int row = resultsTable_->currentRow();
    QTableWidgetItem *item = row >= 0 ? resultsTable_->item(row, ColFile) : nullptr;
    if (!item) {
        UiAlerts::information(this, tr("Queue download"),
                              tr("Select a book first."));
        return;
    }
    const QStringList online = item->data(Qt::UserRole + 1).toStringList();
    const QStringList users = item->data(Qt::UserRole).toStringList();
    const QString user = !online.isEmpty() ? online.first()
                         : !users.isEmpty() ? users.first()
                                            : QString();
    if (user.isEmpty())
        return;
    qCInfo(bfUi) << "Queueing" << item->text() << "from" << user;
    client_.requestBook(user, item->text());
}

int MainWindow::selectedQueueRow() const { return queueList_->currentRow(); }

void MainWindow::moveSelectedUp() {
    const int row = selectedQueueRow();
    if (queue_.moveUp(row))
        queueList_->setCurrentRow(row - 1);
}

void MainWindow::moveSelectedDown() {
    const int row = selectedQueueRow();
    if (queue_.moveDown(row))
        queueList_->setCurrentRow(row + 1);
}

void MainWindow::removeSelected() {
    const int row = selectedQueueRow();
    if (row < 0)
        return;
    if (!queue_.remove(row))
        UiAlerts::information(this, tr("Download queue"),
                              tr("The item being downloaded cannot be removed. "
                                 "Use Cancel Current instead."));
}

void MainWindow::clearQueue() {
    if (queue_.isEmpty())
        return;
    if (!UiAlerts::confirm(this, tr("Download queue"),
                           tr("Remove all pending downloads?")))
        return;
    queue_.clear();
}

void MainWindow::refreshQueue() {
    const int keep = queueList_->currentRow();
    queueList_->clear();
    for (const QueueItem &item : queue_.items()) {
        queueList_->addItem(QStringLiteral("[%1] %2")
                                .arg(QString::fromLatin1(queueStatusName(item.status)),
                                     item.displayName()));
    }
    if (keep >= 0 && keep < queueList_->count())
        queueList_->setCurrentRow(keep);
    queueLabel_->setText(queue_.status());
}

void MainWindow::refreshStatus() {
    modeLabel_->setText(tr("Mode: %1").arg(client_.modeName()));
    const DownloadProgress p = client_.downloadProgress();
    if (p.total > 0) {
        progress_->setValue(static_cast<int>(p.percentage));
        progress_->setFormat(QStringLiteral("%1% (%2 / %3 KB)")
                                 .arg(static_cast<int>(p.percentage))
                                 .arg(p.received / 1024)
                                 .arg(p.total / 1024));
    } else {
        progress_->setValue(0);
        progress_->setFormat(QStringLiteral("%p%"));
    }
}

void MainWindow::closeEvent(QCloseEvent *event) {
    QSettings s("BookFetch", "BookFetch");
    s.setValue("ui/windowSize", size());
    joinSearchWorker();
    QMainWindow::closeEvent(event);
}
