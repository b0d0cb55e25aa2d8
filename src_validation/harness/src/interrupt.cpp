#include "valsim_harness/interrupt.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace valsim::harness {

namespace {

std::atomic<InterruptMonitor*> g_active_monitor{nullptr};

void on_interrupt(int) {
    if (auto* monitor = g_active_monitor.load()) {
        monitor->raise();
    }
}

}  // namespace

InterruptMonitor::~InterruptMonitor() {
    if (installed_) {
        ::sigaction(SIGINT, &previous_, nullptr);
        g_active_monitor.store(nullptr);
    }
}

bool InterruptMonitor::second_within(unsigned mark, std::chrono::milliseconds grace, unsigned extra) const {
    std::this_thread::sleep_for(grace);
    return (count() - mark) + extra > 1;
}

void InterruptMonitor::install() {
    if (installed_) {
        return;
    }
    InterruptMonitor* expected = nullptr;
    if (!g_active_monitor.compare_exchange_strong(expected, this)) {
        throw std::runtime_error("Another interrupt monitor is already installed");
    }

    struct sigaction action{};
    action.sa_handler = &on_interrupt;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: blocking waits return with EINTR so callers notice the interrupt.
    action.sa_flags = 0;
    if (::sigaction(SIGINT, &action, &previous_) != 0) {
        g_active_monitor.store(nullptr);
        throw std::runtime_error(std::string("Unable to install SIGINT handler: ") + std::strerror(errno));
    }
    installed_ = true;
}

}  // namespace valsim::harness
