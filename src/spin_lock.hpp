#pragma once

#include <atomic>
#include <mutex>
#include <utility>

class SpinLock {
public:
    void lock() {
        while (m_locked.test_and_set(std::memory_order_acquire)) {
        }
    }
    bool try_lock() { return !m_locked.test_and_set(std::memory_order_acquire); }
    void unlock() { m_locked.clear(std::memory_order_release); }

private:
    std::atomic_flag m_locked = ATOMIC_FLAG_INIT;
};

/**
 * @brief 持有锁与被保护的数据，数据只能通过lock()返回的Guard访问
 */
template <typename T, typename Lock = SpinLock> class Locked {
public:
    class Guard {
    public:
        Guard(Lock &lock, T &value) : m_guard(lock), m_value(value) {}
        T *operator->() const { return &m_value; }
        T &operator*() const { return m_value; }

    private:
        std::unique_lock<Lock> m_guard;
        T &m_value;
    };

    template <typename... Args>
    explicit Locked(Args &&...args) : m_value(std::forward<Args>(args)...) {}
    Locked(const Locked &) = delete;
    Locked &operator=(const Locked &) = delete;

    Guard lock() { return Guard(m_lock, m_value); }

private:
    Lock m_lock;
    T m_value;
};
