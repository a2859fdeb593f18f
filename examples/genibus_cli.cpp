#include <iostream>
#include <chrono>
#include <thread>
#include <signal.h>
#include "common/config.hpp"
#include "common/helpers.hpp"
#include "devices/cu300.hpp"
#include "devices/pump_controller.hpp"

using namespace genibus;

volatile bool running = true;
void sig_handler(int) { running = false; }

static void usage()
{
    std::cout << "Usage: genibus_cli [--tcp HOST[:PORT] | --serial PATH] [--baud N]\n"
              << "                   [--device-addr N] [--source-addr N] [--interval SEC] [-v]\n"
              << "                   COMMAND\n"
              << "Commands:\n"
              << "  poll        read measurements once\n"
              << "  info        show unit info from the connect reply\n"
              << "  start       REMOTE + START\n"
              << "  stop        STOP\n"
              << "  ref N       set reference to N percent (0..100)\n"
              << "  watch       poll every interval until Ctrl+C\n";
}

static void print_values(const Values& values)
{
    for (const auto& [name, value] : values) {
        std::cout << "  " << name << ": " << value << "\n";
    }
}

int main(int argc, char* argv[])
{
    signal(SIGINT, sig_handler);

    std::vector<std::string> args;
    auto parsed = parse_args(argc, argv, &args);
    if (!parsed.ok()) {
        usage();
        return 2;
    }
    const Config& config = parsed.value();

    bool verbose = false;
    std::vector<std::string> command;
    for (const auto& arg : args) {
        if (arg == "-v") {
            verbose = true;
        } else {
            command.push_back(arg);
        }
    }
    if (command.empty()) {
        usage();
        return 2;
    }

    std::cout << "=== GENIBus " << describe(config) << " ===" << std::endl;

    Cu300 pump(make_stream_factory(config), Catalog::builtin(), config.device_addr, config.source_addr);
    PumpController controller(pump);

    auto print_log = [](const std::string& msg) { std::cout << msg << std::endl; };
    if (verbose) {
        pump.set_log_callback(print_log);
    }
    controller.set_log_callback(print_log);

    if (!controller.setup().ok()) {
        std::cerr << "[FAIL] Cannot connect to " << describe(config) << std::endl;
        return 1;
    }

    int rc = 0;
    const std::string& cmd = command[0];

    if (cmd == "poll") {
        auto r = controller.refresh();
        if (r.ok()) {
            std::cout << "[OK] Measurements:\n";
            print_values(r.value());
        } else {
            std::cout << "[FAIL] Poll: " << error_name(r.error()) << "\n";
            rc = 1;
        }
    } else if (cmd == "info") {
        std::cout << "[OK] Unit info:\n";
        print_values(pump.unit_info());
    } else if (cmd == "start" || cmd == "stop") {
        auto r = cmd == "start" ? controller.start_pump() : controller.stop_pump();
        std::cout << (r.ok() ? "[OK] " : "[FAIL] ") << cmd;
        if (!r.ok()) {
            std::cout << ": " << error_name(r.error());
            rc = 1;
        }
        std::cout << "\n";
    } else if (cmd == "ref" && command.size() > 1) {
        int value = 0;
        try {
            value = std::stoi(command[1]);
        } catch (const std::exception&) {
            std::cerr << "Bad reference value " << command[1] << std::endl;
            return 2;
        }
        auto r = controller.set_reference(value);
        if (r.ok()) {
            std::cout << "[OK] Reference set to " << value << "%\n";
        } else {
            std::cout << "[FAIL] Reference: " << error_name(r.error()) << "\n";
            rc = 1;
        }
    } else if (cmd == "watch") {
        controller.set_data_callback([](const PumpSnapshot& snapshot) {
            if (snapshot.available) {
                std::cout << "[DATA] " << formatValues(snapshot.values) << std::endl;
            } else {
                std::cout << "[STALE] " << formatValues(snapshot.values) << std::endl;
            }
        });
        controller.start_polling(std::chrono::seconds(config.update_interval_sec));
        std::cout << "Polling, Ctrl+C to stop...\n";
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        controller.stop_polling();
    } else {
        usage();
        rc = 2;
    }

    controller.shutdown();
    std::cout << "=== Done ===" << std::endl;
    return rc;
}
