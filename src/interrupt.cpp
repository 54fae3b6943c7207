#include "interrupt.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>

namespace qwstream {

static std::atomic<bool> g_interrupted{false};

static void interrupt_handler(int /*sig*/) {
    g_interrupted.store(true);
}

static void install(int sig, void (*handler)(int)) {
    struct sigaction sa {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(sig, &sa, nullptr) != 0)
        throw std::runtime_error(std::string("sigaction failed: ") + std::strerror(errno));
}

void install_interrupt_handlers() {
    install(SIGINT, interrupt_handler);
    install(SIGTERM, interrupt_handler);
    install(SIGPIPE, SIG_IGN);
}

bool interrupted() {
    return g_interrupted.load();
}

void clear_interrupt() {
    g_interrupted.store(false);
}

} // namespace qwstream
