#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace sblint {

// ============================================================================
// Counting Semaphore
// ============================================================================

class Semaphore {
public:
    explicit Semaphore(std::size_t permits) : permits_(permits) {}

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return permits_ > 0; });
        --permits_;
    }

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (permits_ == 0) {
            return false;
        }
        --permits_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++permits_;
        }
        available_.notify_one();
    }

private:
    std::mutex mutex_;
    std::condition_variable available_;
    std::size_t permits_;
};

// ============================================================================
// Permit
// ============================================================================

/**
 * An acquired permit, released when the Permit is destroyed. Movable so the
 * dispatcher can acquire and hand the permit to the worker thread.
 */
class Permit {
public:
    explicit Permit(Semaphore& semaphore) : semaphore_(&semaphore) {
        semaphore_->acquire();
    }

    Permit(Permit&& other) noexcept : semaphore_(other.semaphore_) {
        other.semaphore_ = nullptr;
    }

    Permit& operator=(Permit&& other) noexcept {
        if (this != &other) {
            reset();
            semaphore_ = other.semaphore_;
            other.semaphore_ = nullptr;
        }
        return *this;
    }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    ~Permit() { reset(); }

    void reset() {
        if (semaphore_) {
            semaphore_->release();
            semaphore_ = nullptr;
        }
    }

private:
    Semaphore* semaphore_;
};

} // namespace sblint
