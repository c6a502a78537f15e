#include "panic.hpp"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace {
std::atomic<ConsoleInterface *> g_panic_console{nullptr};
}

void set_panic_console(ConsoleInterface *console) { g_panic_console.store(console); }

void kernel_panic(const char *file, int line, const std::string &message) {
    if (ConsoleInterface *console = g_panic_console.load()) {
        console_print(*console, "Panicked with message: \"");
        console_print(*console, message);
        console_print(*console, "\" at ");
        console_print(*console, file);
        console_print(*console, ":");
        console_print_number(*console, static_cast<uint64_t>(line));
        console_print(*console, "\n");
    }
    fmt::print(stderr, "Panicked with message: \"{}\" at {}:{}\n", message, file, line);
    std::fflush(stderr);

    auto logger = spdlog::default_logger();
    if (logger) {
        logger->critical("panic at {}:{}: {}", file, line, message);
        logger->flush();
    }
    // the simulated hart halts here; there is nothing to return to
    std::abort();
}
