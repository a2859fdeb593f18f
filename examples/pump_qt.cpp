#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QSpinBox>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGridLayout>
#include <QScrollBar>
#include <QTimer>
#include <QDateTime>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <map>
#include <vector>

#include "common/config.hpp"
#include "devices/cu300.hpp"
#include "devices/pump_controller.hpp"

using namespace genibus;

class PumpGui : public QWidget
{
    Q_OBJECT

public:
    explicit PumpGui(const Config& config)
        : config_(config),
          pump_(make_stream_factory(config), Catalog::builtin(), config.device_addr, config.source_addr),
          controller_(pump_)
    {
        setWindowTitle("CU300 Pump");
        resize(480, 560);

        auto* layout = new QVBoxLayout(this);

        status_label_ = new QLabel("Status: Not connected");
        status_label_->setStyleSheet("font-weight: bold;");
        layout->addWidget(status_label_);

        auto* grid = new QGridLayout();
        int row = 0;
        for (const auto& name : Cu300::poll_names()) {
            auto* value = new QLabel("-");
            value->setStyleSheet("font-size: 14px; color: #666;");
            grid->addWidget(new QLabel(QString::fromStdString(name.second)), row, 0);
            grid->addWidget(value, row, 1);
            value_labels_[name.second] = value;
            ++row;
        }
        layout->addLayout(grid);

        auto* btn_layout = new QHBoxLayout();
        btn_connect_ = new QPushButton("Connect");
        connect(btn_connect_, &QPushButton::clicked, this, &PumpGui::connectPump);
        btn_layout->addWidget(btn_connect_);
        auto* btn_refresh = new QPushButton("Refresh");
        connect(btn_refresh, &QPushButton::clicked, this, &PumpGui::refresh);
        btn_layout->addWidget(btn_refresh);
        layout->addLayout(btn_layout);

        auto* btn_layout2 = new QHBoxLayout();
        auto* btn_start = new QPushButton("Start");
        connect(btn_start, &QPushButton::clicked, this, &PumpGui::startPump);
        btn_layout2->addWidget(btn_start);
        auto* btn_stop = new QPushButton("Stop");
        connect(btn_stop, &QPushButton::clicked, this, &PumpGui::stopPump);
        btn_layout2->addWidget(btn_stop);
        layout->addLayout(btn_layout2);

        auto* ref_layout = new QHBoxLayout();
        ref_spin_ = new QSpinBox();
        ref_spin_->setRange(Protocol::REFERENCE_MIN, Protocol::REFERENCE_MAX);
        ref_spin_->setSuffix(" %");
        ref_layout->addWidget(ref_spin_);
        auto* btn_ref = new QPushButton("Set reference");
        connect(btn_ref, &QPushButton::clicked, this, &PumpGui::setReference);
        ref_layout->addWidget(btn_ref);
        layout->addLayout(ref_layout);

        layout->addWidget(new QLabel("Log:"));
        log_text_ = new QTextEdit();
        log_text_->setReadOnly(true);
        log_text_->setStyleSheet("font-family: monospace; font-size: 11px;");
        layout->addWidget(log_text_);

        auto* btn_clear = new QPushButton("Clear Log");
        connect(btn_clear, &QPushButton::clicked, log_text_, &QTextEdit::clear);
        layout->addWidget(btn_clear);

        // engine and controller log from worker threads
        auto queue_log = [this](const std::string& msg) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(QString::fromStdString(msg));
        };
        pump_.set_log_callback(queue_log);
        controller_.set_log_callback(queue_log);
        controller_.set_data_callback([this](const PumpSnapshot& snapshot) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            data_queue_.push(snapshot);
        });

        message_timer_ = new QTimer(this);
        connect(message_timer_, &QTimer::timeout, this, &PumpGui::processMessages);
        message_timer_->start(50);

        logMsg(QString("[INIT] Target %1").arg(QString::fromStdString(describe(config_))));
    }

    ~PumpGui()
    {
        controller_.shutdown();
        if (connect_thread_.joinable()) {
            connect_thread_.join();
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private slots:
    void processMessages()
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (!log_queue_.empty()) {
            logMsg(log_queue_.front());
            log_queue_.pop();
        }
        while (!data_queue_.empty()) {
            showSnapshot(data_queue_.front());
            data_queue_.pop();
        }
        if (connect_done_flag_) {
            connect_done_flag_ = false;
            if (connect_thread_.joinable()) {
                connect_thread_.join();
            }
            btn_connect_->setEnabled(!controller_.connected());
            if (controller_.connected()) {
                controller_.start_polling(std::chrono::seconds(config_.update_interval_sec));
            }
        }
        status_label_->setText(controller_.connected() ? "Status: Connected" : "Status: Not connected");
    }

    void connectPump()
    {
        if (connect_thread_.joinable()) {
            logMsg("[PUMP] Connect already in progress");
            return;
        }
        btn_connect_->setEnabled(false);
        status_label_->setText("Status: Connecting...");
        connect_thread_ = std::thread([this]() {
            auto result = controller_.setup();
            if (!result.ok()) {
                report("Connect", Result<bool>::failure(result.error()));
            }
            connect_done_flag_ = true;
        });
    }

    void refresh()
    {
        runInBackground([this]() {
            auto result = controller_.refresh();
            if (!result.ok()) {
                report("Refresh", Result<bool>::failure(result.error()));
            }
        });
    }

    void startPump()
    {
        runInBackground([this]() { report("Start", controller_.start_pump()); });
    }

    void stopPump()
    {
        runInBackground([this]() { report("Stop", controller_.stop_pump()); });
    }

    void setReference()
    {
        int value = ref_spin_->value();
        runInBackground([this, value]() {
            report(QString("Reference %1%").arg(value), controller_.set_reference(value));
        });
    }

private:
    // Commands block up to the command timeout, keep them off the GUI thread
    template<typename F>
    void runInBackground(F&& fn)
    {
        workers_.emplace_back(std::forward<F>(fn));
    }

    void report(const QString& what, const Result<bool>& result)
    {
        QString msg = result.ok()
            ? QString("[PUMP] %1 OK").arg(what)
            : QString("[PUMP] %1 FAILED: %2").arg(what, error_name(result.error()));
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(msg);
    }

    void showSnapshot(const PumpSnapshot& snapshot)
    {
        const char* style = snapshot.available
            ? "font-size: 14px; color: #00aa00; font-weight: bold;"
            : "font-size: 14px; color: #666;";
        for (auto& [name, label] : value_labels_) {
            auto it = snapshot.values.find(name);
            label->setText(it == snapshot.values.end() ? "-" : QString::number(it->second));
            label->setStyleSheet(style);
        }
    }

    void logMsg(const QString& msg)
    {
        QString ts = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        log_text_->append(QString("[%1] %2").arg(ts, msg));
        QScrollBar* sb = log_text_->verticalScrollBar();
        sb->setValue(sb->maximum());
    }

    Config config_;
    Cu300 pump_;
    PumpController controller_;

    std::thread connect_thread_;
    std::vector<std::thread> workers_;
    std::atomic<bool> connect_done_flag_{false};

    std::mutex queue_mutex_;
    std::queue<QString> log_queue_;
    std::queue<PumpSnapshot> data_queue_;
    QTimer* message_timer_;

    QLabel* status_label_;
    std::map<std::string, QLabel*> value_labels_;
    QSpinBox* ref_spin_;
    QTextEdit* log_text_;
    QPushButton* btn_connect_;
};

#include "pump_qt.moc"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);

    auto config = parse_args(argc, argv);
    if (!config.ok()) {
        return 2;
    }

    PumpGui gui(config.value());
    gui.show();
    return app.exec();
}
