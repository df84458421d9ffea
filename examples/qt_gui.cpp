#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QScrollBar>
#include <QTimer>
#include <QDateTime>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <functional>

#include "transport/serial.hpp"
#include "devices/vending_engine.hpp"
#include "devices/lane_manager.hpp"
#include "devices/water_fountain.hpp"
#include "common/helpers.hpp"

using namespace vmc;

class VmcPanel : public QWidget
{
    Q_OBJECT

public:
    VmcPanel() : engine_(serial_), fountain_(engine_, lanes_)
    {
        setWindowTitle("VMC Hardware Test");
        resize(520, 640);

        auto* layout = new QVBoxLayout(this);

        status_label_ = new QLabel("Status: Not connected");
        status_label_->setStyleSheet("font-weight: bold;");
        layout->addWidget(status_label_);

        auto* port_layout = new QHBoxLayout();
        port_edit_ = new QLineEdit("/dev/ttyS0");
        port_layout->addWidget(port_edit_);
        baud_box_ = new QSpinBox();
        baud_box_->setRange(9600, 115200);
        baud_box_->setValue(9600);
        port_layout->addWidget(baud_box_);
        auto* btn_connect = new QPushButton("Connect");
        connect(btn_connect, &QPushButton::clicked, this, &VmcPanel::connectVmc);
        port_layout->addWidget(btn_connect);
        layout->addLayout(port_layout);

        auto* btn_layout = new QHBoxLayout();
        auto* btn_id = new QPushButton("Device ID");
        connect(btn_id, &QPushButton::clicked, this, &VmcPanel::deviceId);
        btn_layout->addWidget(btn_id);
        auto* btn_clear = new QPushButton("Clear Faults");
        connect(btn_clear, &QPushButton::clicked, this, &VmcPanel::clearFaults);
        btn_layout->addWidget(btn_clear);
        auto* btn_balance = new QPushButton("Balance");
        connect(btn_balance, &QPushButton::clicked, this, &VmcPanel::balance);
        btn_layout->addWidget(btn_balance);
        layout->addLayout(btn_layout);

        auto* dispense_layout = new QHBoxLayout();
        slot_box_ = new QSpinBox();
        slot_box_->setRange(1, 58);
        dispense_layout->addWidget(new QLabel("Slot:"));
        dispense_layout->addWidget(slot_box_);
        btn_dispense_ = new QPushButton("Dispense");
        connect(btn_dispense_, &QPushButton::clicked, this, &VmcPanel::dispense);
        dispense_layout->addWidget(btn_dispense_);
        btn_cancel_ = new QPushButton("Cancel");
        btn_cancel_->setEnabled(false);
        connect(btn_cancel_, &QPushButton::clicked, this, &VmcPanel::cancel);
        dispense_layout->addWidget(btn_cancel_);
        layout->addLayout(dispense_layout);

        auto* lane_layout = new QHBoxLayout();
        auto* btn_fountain = new QPushButton("Fountain Dispense");
        connect(btn_fountain, &QPushButton::clicked, this, &VmcPanel::fountainDispense);
        lane_layout->addWidget(btn_fountain);
        auto* btn_lanes = new QPushButton("Lane Report");
        connect(btn_lanes, &QPushButton::clicked, this, &VmcPanel::laneReport);
        lane_layout->addWidget(btn_lanes);
        auto* btn_health = new QPushButton("Health Check");
        connect(btn_health, &QPushButton::clicked, this, &VmcPanel::healthCheck);
        lane_layout->addWidget(btn_health);
        layout->addLayout(lane_layout);

        layout->addWidget(new QLabel("Log:"));
        log_text_ = new QTextEdit();
        log_text_->setReadOnly(true);
        log_text_->setStyleSheet("font-family: monospace; font-size: 11px;");
        layout->addWidget(log_text_);

        auto* btn_clear_log = new QPushButton("Clear Log");
        connect(btn_clear_log, &QPushButton::clicked, log_text_, &QTextEdit::clear);
        layout->addWidget(btn_clear_log);

        auto queue_log = [this](const std::string& msg) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(QString::fromStdString(msg));
        };
        serial_.set_log_callback(queue_log);
        engine_.set_log_callback(queue_log);
        lanes_.set_log_callback(queue_log);
        fountain_.set_log_callback(queue_log);

        message_timer_ = new QTimer(this);
        connect(message_timer_, &QTimer::timeout, this, &VmcPanel::processMessages);
        message_timer_->start(50);
    }

    ~VmcPanel()
    {
        cancel();
        if (worker_.joinable()) {
            worker_.join();
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
        while (!status_queue_.empty()) {
            status_label_->setText(status_queue_.front());
            status_queue_.pop();
        }
        if (worker_done_.exchange(false)) {
            if (worker_.joinable()) {
                worker_.join();
            }
            btn_dispense_->setEnabled(true);
            btn_cancel_->setEnabled(false);
        }
    }

    void connectVmc()
    {
        SerialConfig config;
        config.device = port_edit_->text().toStdString();
        config.baud = baud_box_->value();
        runInBackground([this, config]() {
            auto result = fountain_.initialize(config);
            postStatus(result.ok()
                ? "Connected: " + QString::fromStdString(result.value())
                : "Connect FAILED: " + QString::fromStdString(result.message()));
        });
    }

    void deviceId()
    {
        runInBackground([this]() {
            auto result = engine_.get_device_id();
            postStatus(result.ok()
                ? "Device ID: " + QString::fromStdString(result.value())
                : QString("Device ID FAILED (%1)").arg(error_name(result.error())));
        });
    }

    void clearFaults()
    {
        runInBackground([this]() {
            auto result = engine_.clear_faults();
            postStatus(result.ok() && result.value() ? "Faults cleared" : "Clear faults FAILED");
        });
    }

    void balance()
    {
        runInBackground([this]() {
            auto result = engine_.query_balance();
            postStatus(result.ok()
                ? QString("Balance: %1.%2").arg(result.value() / 100).arg(result.value() % 100, 2, 10, QChar('0'))
                : QString("Balance FAILED (%1)").arg(error_name(result.error())));
        });
    }

    void dispense()
    {
        int slot = slot_box_->value();
        dispensing_.store(true);
        runInBackground([this, slot]() {
            auto result = engine_.dispense_water(slot, dispensing_);
            postStatus(describe(result));
        });
    }

    void fountainDispense()
    {
        runInBackground([this]() {
            postStatus(describe(fountain_.dispense_water()));
        });
    }

    void laneReport()
    {
        logMsg(QString::fromStdString(lanes_.status_report().to_string()));
    }

    void healthCheck()
    {
        runInBackground([this]() {
            auto health = fountain_.health_check();
            for (const auto& line : health.details) {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                log_queue_.push(QString::fromStdString("[HEALTH] " + line));
            }
            postStatus(QString::fromStdString(health.message));
        });
    }

    void cancel()
    {
        dispensing_.store(false);
    }

private:
    void runInBackground(std::function<void()> job)
    {
        if (busy_.exchange(true)) {
            logMsg("[PANEL] Busy, wait for the current command");
            return;
        }
        if (worker_.joinable()) {
            worker_.join();
            worker_done_.store(false);
        }
        btn_dispense_->setEnabled(false);
        btn_cancel_->setEnabled(true);
        worker_ = std::thread([this, job = std::move(job)]() {
            job();
            busy_.store(false);
            worker_done_.store(true);
        });
    }

    void postStatus(const QString& text)
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        status_queue_.push(text);
    }

    static QString describe(const DispenseResult& result)
    {
        if (result.success) {
            return QString("Slot %1 dispensed in %2 ms").arg(result.slot).arg(result.elapsed_ms);
        }
        return QString("Slot %1 FAILED: %2").arg(result.slot)
            .arg(QString::fromStdString(result.error_message.value_or("unknown error")));
    }

    void logMsg(const QString& msg)
    {
        QString ts = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        log_text_->append(QString("[%1] %2").arg(ts, msg));
        QScrollBar* sb = log_text_->verticalScrollBar();
        sb->setValue(sb->maximum());
    }

    SerialPort serial_;
    VendingEngine engine_;
    LaneManager lanes_;
    WaterFountain fountain_;

    std::thread worker_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> worker_done_{false};
    std::atomic<bool> dispensing_{false};

    std::mutex queue_mutex_;
    std::queue<QString> log_queue_;
    std::queue<QString> status_queue_;
    QTimer* message_timer_;

    QLabel* status_label_;
    QLineEdit* port_edit_;
    QSpinBox* baud_box_;
    QSpinBox* slot_box_;
    QTextEdit* log_text_;
    QPushButton* btn_dispense_;
    QPushButton* btn_cancel_;
};

#include "qt_gui.moc"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    VmcPanel panel;
    panel.show();
    return app.exec();
}
