#pragma once
#include "AppConfig.hpp"
#include "FileProcessor.hpp"
#include "SearchSignal.hpp"

#include <QMainWindow>
#include <QMap>
#include <QSet>
#include <QString>
#include <thread>

class EbookClient;
class QueueManager;
class QCheckBox;
class QCloseEvent;
class QLabel;
class QLineEdit;
class QListWidget;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QTableWidget;
class QTimer;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    // client and queue are not owned and must outlive the window.
    MainWindow(const AppConfig &config, EbookClient &client,
               QueueManager &queue, QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void startSearch();
    void cancelCurrent();
    void queueSelected();
    void applyFilters();
    void refreshQueue();
    void refreshStatus();

    void moveSelectedUp();
    void moveSelectedDown();
    void removeSelected();
    void clearQueue();

private:
    void buildUi();
    // Runs on the GUI thread once the search worker is done.
    void finishSearch(const SearchOutcome &outcome,
                      const SearchResults &results,
                      const QSet<QString> &online, const QString &error);
    void joinSearchWorker();
    int selectedQueueRow() const;

    AppConfig config_;
    EbookClient &client_;
    QueueManager &queue_;
    FileProcessor processor_;

    SearchResults results_;
    QSet<QString> online_;
    bool searching_ = false;
    std::thread searchWorker_;

    // Search
    QLineEdit *searchEdit_ = nullptr;
    QPushButton *searchBtn_ = nullptr;
    QPushButton *cancelBtn_ = nullptr;

    // Results and filters
    QTableWidget *resultsTable_ = nullptr;
    QSpinBox *minUsersSpin_ = nullptr;
    QLineEdit *filterEdit_ = nullptr;
    QMap<QString, QCheckBox *> typeChecks_;
    QCheckBox *hideOfflineCheck_ = nullptr;
    QPushButton *queueBtn_ = nullptr;

    // Queue
    QListWidget *queueList_ = nullptr;
    QPushButton *upBtn_ = nullptr;
    QPushButton *downBtn_ = nullptr;
    QPushButton *removeBtn_ = nullptr;
    QPushButton *clearBtn_ = nullptr;

    // Status bar
    QLabel *modeLabel_ = nullptr;
    QLabel *queueLabel_ = nullptr;
    QProgressBar *progress_ = nullptr;
    QTimer *statusTimer_ = nullptr;
};
