// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rget/cli/commands.hpp>
#include <rget/version.hpp>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>
#include <pthread.h>

using namespace rget::cli;

namespace {

// Terminate handler to report exceptions escaping noexcept code
void rget_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

// SIGINT/SIGTERM are blocked in every thread and received here instead. The
// first one requests a stop; a second one exits immediately.
std::jthread watch_interrupts(std::stop_source& cancel) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    return std::jthread([signals, &cancel](std::stop_token stoken) {
        const timespec timeout{0, 200'000'000};
        while (!stoken.stop_requested()) {
            int sig = sigtimedwait(&signals, nullptr, &timeout);
            if (sig < 0) {
                continue;
            }
            if (cancel.stop_requested()) {
                std::_Exit(128 + sig);
            }
            cancel.request_stop();
        }
    });
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(rget_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    init_logging(args.verbose);

    std::stop_source cancel;
    std::jthread watcher = watch_interrupts(cancel);

    rget::core::TransferConfig config{args.url, args.output_file};
    auto result = download(config, args.quiet, cancel.get_token());

    return result ? *result : 1;
}
