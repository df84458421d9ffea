#include <iostream>
#include <string>
#include <cstdlib>
#include <signal.h>
#include <atomic>
#include <vector>

#include "transport/serial.hpp"
#include "devices/vending_engine.hpp"
#include "devices/dispense_policy.hpp"
#include "devices/lane_manager.hpp"
#include "devices/water_fountain.hpp"
#include "common/helpers.hpp"

using namespace vmc;

std::atomic<bool> running{true};
void sig_handler(int) { running.store(false); }

namespace {

void usage(const char* prog)
{
    std::cerr <<
        "Usage: " << prog << " [options] <command> [args]\n"
        "\n"
        "Options:\n"
        "  --port <dev>            serial device (default /dev/ttyS0)\n"
        "  --baud <rate>           9600, 19200, 38400, 57600 or 115200 (default 9600)\n"
        "  --timeout <ms>          per-command timeout (default 5000)\n"
        "  --poll-interval <ms>    delay between status polls (default 500)\n"
        "  --poll-attempts <n>     status polls before giving up (default 20)\n"
        "  --retries <n>           dispense attempts, faults cleared in between (default 1)\n"
        "  --quiet                 no protocol trace on stderr\n"
        "\n"
        "Commands:\n"
        "  device-id | dispense <slot> | deliver <slot> [qty] | status <slot> [qty]\n"
        "  clear-faults | balance | pay <cents> <method 0-3> <slot> | coin-change\n"
        "  cashless-cancel | debit <cents> | age <years> | coin-status | age-status\n"
        "  fountain | health\n";
}

bool parse_int(const std::string& text, long long& out)
{
    try {
        size_t pos = 0;
        out = std::stoll(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

template<typename T>
int report(const Result<T>& result, const std::string& what)
{
    if (!result.ok()) {
        std::cout << "[FAIL] " << what << " (" << error_name(result.error()) << "): "
                  << result.message() << "\n";
        return 1;
    }
    std::cout << "[OK] " << what << ": " << result.value() << "\n";
    return 0;
}

int report(const DispenseResult& result)
{
    if (result.success) {
        std::cout << "[OK] Dispensed slot " << result.slot << " in " << result.elapsed_ms << "ms\n";
        return 0;
    }
    std::cout << "[FAIL] Slot " << result.slot << ": " << result.error_message.value_or("unknown error");
    if (result.error_code) {
        std::cout << " (code " << byte_to_hex(*result.error_code) << ")";
    }
    std::cout << " after " << result.elapsed_ms << "ms\n";
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    signal(SIGINT, sig_handler);
    std::cout << std::boolalpha;

    SerialConfig serial_config;
    EngineConfig engine_config;
    DispensePolicy policy;
    policy.max_attempts = 1;
    bool quiet = false;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) break;
        if (arg == "--quiet") { quiet = true; continue; }
        if (i + 1 >= argc) { usage(argv[0]); return 2; }

        std::string value = argv[++i];
        long long number = 0;
        if (arg == "--port") { serial_config.device = value; continue; }
        if (!parse_int(value, number)) {
            std::cerr << "Bad value for " << arg << ": " << value << "\n";
            return 2;
        }
        if (arg == "--baud") serial_config.baud = static_cast<int>(number);
        else if (arg == "--timeout") engine_config.command_timeout_ms = static_cast<int>(number);
        else if (arg == "--poll-interval") engine_config.poll_interval_ms = static_cast<int>(number);
        else if (arg == "--poll-attempts") engine_config.max_poll_attempts = static_cast<int>(number);
        else if (arg == "--retries") policy.max_attempts = static_cast<int>(number);
        else { usage(argv[0]); return 2; }
    }

    if (i >= argc) {
        usage(argv[0]);
        return 2;
    }
    std::string command = argv[i++];
    std::vector<long long> args;
    for (; i < argc; ++i) {
        long long number = 0;
        if (!parse_int(argv[i], number)) {
            std::cerr << "Bad argument: " << argv[i] << "\n";
            return 2;
        }
        args.push_back(number);
    }
    auto need = [&](size_t n) {
        if (args.size() < n) {
            std::cerr << command << " needs " << n << " argument(s)\n";
            return false;
        }
        return true;
    };

    auto logger = [quiet](const std::string& msg) {
        if (!quiet) std::cerr << msg << std::endl;
    };

    SerialPort serial;
    serial.set_log_callback(logger);
    VendingEngine engine(serial, engine_config);
    engine.set_log_callback(logger);

    LaneManager lanes;
    lanes.set_log_callback(logger);
    WaterFountain fountain(engine, lanes);
    fountain.set_log_callback(logger);

    if (command == "fountain" || command == "health") {
        auto init = fountain.initialize(serial_config);
        if (!init.ok()) {
            std::cout << "[FAIL] Initialize: " << init.message() << "\n";
            return 1;
        }
        if (command == "fountain") {
            int rc = report(fountain.dispense_water());
            std::cout << lanes.status_report().to_string();
            return rc;
        }
        auto health = fountain.health_check();
        std::cout << (health.success ? "[OK] " : "[FAIL] ") << health.message << "\n";
        for (const auto& line : health.details) {
            std::cout << "  " << line << "\n";
        }
        return health.success ? 0 : 1;
    }

    auto connected = engine.connect(serial_config);
    if (!connected.ok()) {
        std::cout << "[FAIL] " << connected.message() << ": " << serial.get_last_error() << "\n";
        return 1;
    }

    int rc = 0;
    if (command == "device-id") {
        rc = report(engine.get_device_id(), "Device ID");
    } else if (command == "dispense") {
        if (!need(1)) return 2;
        FaultRecoveryDispenser dispenser(engine, policy);
        dispenser.set_log_callback(logger);
        auto outcome = dispenser.dispense(static_cast<int>(args[0]), running);
        rc = report(outcome.result);
        if (outcome.attempts > 1) {
            std::cout << "  attempts: " << outcome.attempts << "\n";
        }
    } else if (command == "deliver") {
        if (!need(1)) return 2;
        int qty = args.size() > 1 ? static_cast<int>(args[1]) : 1;
        auto r = engine.send_delivery_command(static_cast<int>(args[0]), qty);
        if (r.ok()) {
            std::cout << "[OK] Delivery echo slot " << int(r.value().slot)
                      << " qty " << int(r.value().quantity) << "\n";
        } else {
            std::cout << "[FAIL] Delivery (" << error_name(r.error()) << "): " << r.message() << "\n";
            rc = 1;
        }
    } else if (command == "status") {
        if (!need(1)) return 2;
        int qty = args.size() > 1 ? static_cast<int>(args[1]) : 1;
        auto r = engine.query_delivery_status(static_cast<int>(args[0]), qty);
        if (r.ok()) {
            std::cout << "[OK] " << describe_response(r.value()) << "\n";
        } else {
            std::cout << "[FAIL] Status (" << error_name(r.error()) << "): " << r.message() << "\n";
            rc = 1;
        }
    } else if (command == "clear-faults") {
        rc = report(engine.clear_faults(), "Clear faults");
    } else if (command == "balance") {
        rc = report(engine.query_balance(), "Balance (cents)");
    } else if (command == "pay") {
        if (!need(3)) return 2;
        if (args[1] < 0 || args[1] > 3) {
            std::cerr << "payment method must be 0-3\n";
            return 2;
        }
        rc = report(engine.payment_instruction(args[0], static_cast<PaymentMethod>(args[1]),
                                               static_cast<int>(args[2])), "Payment accepted");
    } else if (command == "coin-change") {
        rc = report(engine.coin_change(), "Coin change");
    } else if (command == "cashless-cancel") {
        rc = report(engine.cashless_cancel(), "Cashless cancel");
    } else if (command == "debit") {
        if (!need(1)) return 2;
        rc = report(engine.debit_instruction(args[0]), "Debit");
    } else if (command == "age") {
        if (!need(1)) return 2;
        rc = report(engine.age_recognition(static_cast<int>(args[0])), "Age recognition");
    } else if (command == "coin-status") {
        rc = report(engine.query_coin_change_status(), "Can refund");
    } else if (command == "age-status") {
        rc = report(engine.query_age_verification(), "Age verified");
    } else {
        usage(argv[0]);
        rc = 2;
    }

    engine.disconnect();
    return rc;
}
