#include "ymodem/device_commands.hpp"
#include "ymodem/file_loader.hpp"
#include "ymodem/serial_port.hpp"
#include "ymodem/session.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Command-line sender: push one file to a board over a serial line with
// YMODEM, optionally resetting the board first or running the file as a
// script afterwards.
// Exit codes:
//   0 -> receiver acknowledged the whole batch
//   1 -> transfer started but failed (timeout, write failure, bad input)
//   2 -> CLI/argument error or I/O error (device, file)

namespace {

struct ParsedArgs {
    std::string device;
    std::filesystem::path input;
    // Name announced to the receiver; defaults to the input's base name
    std::string remote_name;
    // Link
    int baud = 115200;
    int timeout_ms = 10000;
    // Workflow
    bool reset = false;
    bool run = false;
    int stack = ymodem::kDefaultScriptStack;
    // Diagnostics
    bool debug = false;
};

void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options] <device> <file>\n"
              << "Options:\n"
              << "  --baud <int>            Line rate (default 115200)\n"
              << "  --timeout-ms <int>      Per-reply timeout in ms (default 10000)\n"
              << "  --name <str>            Remote file name (default: base name of <file>)\n"
              << "  --reset                 Pulse RTS for 100 ms before sending (board reset)\n"
              << "  --run                   Send 'yrcv' first, then stop and run the file as a script\n"
              << "  --stack <int>           Script stack size for --run (default 1024)\n"
              << "  --debug                 Trace every packet and the receive buffer\n";
}

ParsedArgs parse_args(int argc, char **argv) {
    ParsedArgs args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string cur = argv[i];
        if (cur == "--baud" && i + 1 < argc) {
            args.baud = std::stoi(argv[++i]);
        } else if (cur == "--timeout-ms" && i + 1 < argc) {
            args.timeout_ms = std::stoi(argv[++i]);
        } else if (cur == "--name" && i + 1 < argc) {
            args.remote_name = argv[++i];
        } else if (cur == "--reset") {
            args.reset = true;
        } else if (cur == "--run") {
            args.run = true;
        } else if (cur == "--stack" && i + 1 < argc) {
            args.stack = std::stoi(argv[++i]);
        } else if (cur == "--debug") {
            args.debug = true;
        } else if (cur == "--help" || cur == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (cur.rfind("--", 0) == 0) {
            throw std::runtime_error("Unrecognized option: " + cur);
        } else {
            positional.push_back(cur);
        }
    }
    if (positional.size() != 2) {
        throw std::runtime_error("Expected <device> and <file>");
    }
    args.device = positional[0];
    args.input = positional[1];
    if (args.timeout_ms <= 0) {
        throw std::runtime_error("--timeout-ms must be positive");
    }
    if (args.stack <= 0) {
        throw std::runtime_error("--stack must be positive");
    }
    if (args.remote_name.empty()) {
        args.remote_name = ymodem::FileLoader::remote_name(args.input);
    }
    return args;
}

} // namespace

int main(int argc, char **argv) {
    ParsedArgs parsed;
    std::vector<uint8_t> file;
    std::unique_ptr<ymodem::SerialPort> port;
    try {
        // 1) Parse CLI, load the file and open the line.
        parsed = parse_args(argc, argv);
        file = ymodem::FileLoader::load(parsed.input);

        ymodem::SerialConfig cfg;
        cfg.baud_rate = static_cast<uint32_t>(parsed.baud);
        port = std::make_unique<ymodem::SerialPort>(parsed.device, cfg);
        std::cerr << "[INFO] " << parsed.device << " @ " << parsed.baud << " baud\n";

        if (parsed.reset) {
            port->pulse_rts();
            std::cerr << "[INFO] board reset\n";
        }
    } catch (const std::exception &ex) {
        std::cerr << "[ERROR] " << ex.what() << '\n';
        print_usage(argv[0]);
        return 2;
    }

    try {
        // 2) Transfer, optionally wrapped in the receive/run command sequence.
        if (parsed.run) {
            ymodem::send_command(*port, ymodem::kReceiveCommand);
        }

        ymodem::TransferParams params;
        params.timeout = std::chrono::milliseconds(parsed.timeout_ms);
        params.trace_packets = parsed.debug;
        params.trace_buffer = parsed.debug;

        auto on_progress = [](std::size_t sent, std::size_t total) {
            std::cerr << "YMODEM progress: " << sent << "/" << total << " packets\n";
        };
        const auto result = ymodem::transfer(*port, parsed.remote_name, file, on_progress,
                                             ymodem::stderr_logger(), params);

        if (parsed.run) {
            ymodem::send_command(*port, ymodem::kStopScriptCommand);
            ymodem::send_command(*port, ymodem::run_script_command(parsed.remote_name, parsed.stack));
        }

        // 3) One status line on stdout for scripts.
        std::cout << "file=" << result.file_path
                  << " total_bytes=" << result.total_bytes
                  << " written_bytes=" << result.written_bytes << '\n';
        return 0;
    } catch (const std::exception &ex) {
        // TransferError carries phase and expected byte in what()
        std::cerr << "[ERROR] " << ex.what() << '\n';
        return 1;
    }
}
