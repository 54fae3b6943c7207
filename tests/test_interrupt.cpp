#include <catch2/catch_test_macros.hpp>
#include "interrupt.hpp"

#include <pthread.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>

using namespace qwstream;

namespace {

// Puts the previous SIGINT/SIGTERM/SIGPIPE dispositions back after a test.
class SignalGuard {
public:
    SignalGuard() {
        sigaction(SIGINT, nullptr, &int_);
        sigaction(SIGTERM, nullptr, &term_);
        sigaction(SIGPIPE, nullptr, &pipe_);
        clear_interrupt();
    }
    ~SignalGuard() {
        sigaction(SIGINT, &int_, nullptr);
        sigaction(SIGTERM, &term_, nullptr);
        sigaction(SIGPIPE, &pipe_, nullptr);
        clear_interrupt();
    }

private:
    struct sigaction int_ {};
    struct sigaction term_ {};
    struct sigaction pipe_ {};
};

} // namespace

TEST_CASE("interrupt: SIGINT sets the flag until cleared", "[interrupt]") {
    SignalGuard guard;
    install_interrupt_handlers();
    REQUIRE_FALSE(interrupted());

    std::raise(SIGINT);
    REQUIRE(interrupted());
    REQUIRE(interrupted());

    clear_interrupt();
    REQUIRE_FALSE(interrupted());
}

TEST_CASE("interrupt: SIGPIPE is ignored", "[interrupt]") {
    SignalGuard guard;
    install_interrupt_handlers();
    struct sigaction current {};
    sigaction(SIGPIPE, nullptr, &current);
    REQUIRE(current.sa_handler == SIG_IGN);
}

TEST_CASE("interrupt: SIGINT breaks a blocking read", "[interrupt]") {
    SignalGuard guard;
    install_interrupt_handlers();

    int fds[2];
    REQUIRE(pipe(fds) == 0);
    pthread_t reader = pthread_self();
    std::thread sender([reader, fds] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pthread_kill(reader, SIGINT);
        // Unblocks the read if the signal restarted it instead
        std::this_thread::sleep_for(std::chrono::milliseconds(2000));
        char byte = 'x';
        ssize_t n = write(fds[1], &byte, 1);
        (void)n;
    });

    char buf = 0;
    ssize_t n = read(fds[0], &buf, 1);
    int err = errno;
    sender.join();
    close(fds[0]);
    close(fds[1]);

    REQUIRE(n == -1);
    REQUIRE(err == EINTR);
    REQUIRE(interrupted());
}
