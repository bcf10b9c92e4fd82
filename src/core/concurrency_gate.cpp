/*
 * shotguard - Concurrency Gate Implementation
 */
#include <shotguard/core/concurrency_gate.hpp>
#include <shotguard/core/logger.hpp>

#include <stdexcept>

namespace shotguard {

ConcurrencyGate::ConcurrencyGate(size_t capacity)
    : capacity_(capacity)
    , available_(capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("ConcurrencyGate capacity must be at least 1");
    }
}

ConcurrencyGate::~ConcurrencyGate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!waiters_.empty()) {
        LOG_ERROR("[Gate] Destroyed with %zu caller(s) still waiting", waiters_.size());
    }
}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    // Waiters imply available_ == 0, so the fast path cannot jump the queue
    if (available_ > 0) {
        --available_;
        return;
    }

    Waiter self;
    waiters_.push_back(&self);
    LOG_DEBUG("[Gate] Saturated (%zu/%zu in use), queued at position %zu",
              capacity_, capacity_, waiters_.size());

    self.cv.wait(lock, [&self] { return self.granted; });
}

bool ConcurrencyGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ > 0) {
        --available_;
        return true;
    }
    LOG_DEBUG("[Gate] try_acquire refused (%zu/%zu in use, %zu waiting)",
              capacity_, capacity_, waiters_.size());
    return false;
}

void ConcurrencyGate::release() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!waiters_.empty()) {
        // Hand the unit over directly; the counter never sees it
        Waiter* next = waiters_.front();
        waiters_.pop_front();
        next->granted = true;
        // Notify under the lock: the waiter's cv lives on its stack and
        // may be gone as soon as it observes `granted`.
        next->cv.notify_one();
        return;
    }

    if (available_ >= capacity_) {
        LOG_ERROR("[Gate] release() without a matching acquire (capacity %zu)", capacity_);
        throw std::logic_error("ConcurrencyGate::release() called more times than acquire()");
    }
    ++available_;
}

size_t ConcurrencyGate::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

size_t ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

size_t ConcurrencyGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - available_;
}

} // namespace shotguard
