#ifndef SAYCAST_THREAD_H
#define SAYCAST_THREAD_H

#include <pthread.h>
#include <stdint.h>

#define thread_return void*

namespace saycast {

void msleep(int ms);

// Milliseconds on CLOCK_MONOTONIC.
int64_t monotonic_ms();

class Mutex {
public:
    Mutex() { pthread_mutex_init(&mutex_, NULL); }
    ~Mutex() { pthread_mutex_destroy(&mutex_); }

    void lock() { pthread_mutex_lock(&mutex_); }
    void unlock() { pthread_mutex_unlock(&mutex_); }
    pthread_mutex_t *native() { return &mutex_; }

private:
    Mutex(const Mutex &);
    Mutex &operator=(const Mutex &);

    pthread_mutex_t mutex_;
};

class ScopedLock {
public:
    explicit ScopedLock(Mutex &m) : mutex_(m) { mutex_.lock(); }
    ~ScopedLock() { mutex_.unlock(); }

private:
    ScopedLock(const ScopedLock &);
    ScopedLock &operator=(const ScopedLock &);

    Mutex &mutex_;
};

// Condition variable bound to CLOCK_MONOTONIC so wall clock jumps do not
// stretch or cut short a timed wait.
class Condition {
public:
    Condition();
    ~Condition();

    // Caller holds m. Returns false when timeout_ms elapsed.
    bool wait_for(Mutex &m, int timeout_ms);
    void wait(Mutex &m);
    void signal() { pthread_cond_signal(&cond_); }
    void broadcast() { pthread_cond_broadcast(&cond_); }

private:
    Condition(const Condition &);
    Condition &operator=(const Condition &);

    pthread_cond_t cond_;
};

// Joinable worker thread running a member function style entry point.
class Thread {
public:
    Thread() : started_(false) {}
    ~Thread() { join(); }

    bool start(thread_return (*entry)(void *), void *arg);
    void join();
    bool started() const { return started_; }

private:
    Thread(const Thread &);
    Thread &operator=(const Thread &);

    pthread_t tid_;
    bool started_;
};

}  // namespace saycast

#endif  // SAYCAST_THREAD_H
