/*
 * shotguard - Concurrency Gate
 *
 * Counting gate bounding how many expensive operations (headless browser
 * captures) run at once. acquire() blocks, try_acquire() never does.
 * release() hands its unit straight to the longest-waiting acquire()
 * caller, so a late try_acquire() can never overtake a queued waiter.
 *
 * One instance per process, constructed by its owner and passed by
 * reference. Prefer GateLease over naked acquire()/release().
 */
#ifndef shotguard_CORE_CONCURRENCY_GATE_HPP
#define shotguard_CORE_CONCURRENCY_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace shotguard {

class ConcurrencyGate {
public:
    explicit ConcurrencyGate(size_t capacity);
    ~ConcurrencyGate();

    // Blocks until a unit is granted. Never fails.
    void acquire();

    // Takes a unit if one is free right now.
    bool try_acquire();

    // Returns a unit. Throws std::logic_error when nothing is outstanding.
    void release();

    size_t capacity() const { return capacity_; }
    size_t available() const;
    size_t waiting() const;
    size_t in_use() const;

private:
    ConcurrencyGate(const ConcurrencyGate&);
    ConcurrencyGate& operator=(const ConcurrencyGate&);

    struct Waiter {
        bool granted;
        std::condition_variable cv;
        Waiter() : granted(false) {}
    };

    const size_t capacity_;
    size_t available_;
    std::deque<Waiter*> waiters_;   // arrival order
    mutable std::mutex mutex_;
};

// Scoped ownership of one gate unit. Released on destruction, on every
// exit path. Move-only.
class GateLease {
public:
    GateLease() : gate_(nullptr) {}

    // Blocking acquisition.
    explicit GateLease(ConcurrencyGate& gate) : gate_(&gate) { gate_->acquire(); }

    // Non-blocking acquisition; the lease is empty if the gate is full.
    static GateLease try_acquire(ConcurrencyGate& gate) {
        return gate.try_acquire() ? GateLease(&gate) : GateLease();
    }

    GateLease(GateLease&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }

    GateLease& operator=(GateLease&& other) noexcept {
        if (this != &other) {
            reset();
            gate_ = other.gate_;
            other.gate_ = nullptr;
        }
        return *this;
    }

    ~GateLease() { reset(); }

    bool held() const { return gate_ != nullptr; }
    explicit operator bool() const { return held(); }

    // Give the unit back early.
    void reset() {
        if (gate_) {
            ConcurrencyGate* g = gate_;
            gate_ = nullptr;
            g->release();
        }
    }

private:
    explicit GateLease(ConcurrencyGate* adopted) : gate_(adopted) {}

    GateLease(const GateLease&);
    GateLease& operator=(const GateLease&);

    ConcurrencyGate* gate_;
};

} // namespace shotguard

#endif // shotguard_CORE_CONCURRENCY_GATE_HPP
