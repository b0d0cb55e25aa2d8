#pragma once

#include <signal.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

namespace valsim::harness {

/// Thrown by testers that noticed a user interrupt; the phase becomes Interrupted.
class Interrupted : public std::runtime_error {
public:
    explicit Interrupted(const std::string& what = "interrupted by user") : std::runtime_error(what) {}
};

/// A second interrupt arrived within the grace window: stop the whole run.
class RunAborted : public std::runtime_error {
public:
    explicit RunAborted(const std::string& what = "run aborted by user") : std::runtime_error(what) {}
};

/**
 * \brief Counts user interrupts (SIGINT).
 *
 * install() routes SIGINT of the process to this monitor; the previous handler is
 * restored on destruction. At most one monitor is installed at a time. raise()
 * does exactly what the signal handler does and may be called from testers or
 * tests to simulate an interrupt.
 */
class InterruptMonitor {
public:
    InterruptMonitor() = default;
    ~InterruptMonitor();

    InterruptMonitor(const InterruptMonitor&) = delete;
    InterruptMonitor& operator=(const InterruptMonitor&) = delete;

    /// \throws std::runtime_error if the handler cannot be installed or another monitor is active.
    void install();

    void raise() noexcept { count_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] unsigned count() const noexcept { return count_.load(std::memory_order_relaxed); }

    /**
     * Waits for the grace window, then reports whether more than one interrupt
     * has been observed since \p mark. \p extra counts interrupts noticed without
     * a signal (a cooperative Interrupted).
     */
    [[nodiscard]] bool second_within(unsigned mark, std::chrono::milliseconds grace, unsigned extra = 0) const;

private:
    std::atomic<unsigned> count_{0};
    bool installed_{false};
    struct sigaction previous_{};
};

/**
 * \brief Cooperative interruption point for long running tester code.
 *
 * Remembers the interrupt count when constructed; check() throws Interrupted
 * once a further interrupt has arrived. A null monitor never interrupts.
 */
class InterruptCheckpoint {
public:
    explicit InterruptCheckpoint(const InterruptMonitor* monitor)
        : monitor_{monitor}, mark_{monitor != nullptr ? monitor->count() : 0U} {}

    /// \throws Interrupted
    void check() const {
        if (monitor_ != nullptr && monitor_->count() != mark_) {
            throw Interrupted();
        }
    }

private:
    const InterruptMonitor* monitor_;
    unsigned mark_;
};

}  // namespace valsim::harness
