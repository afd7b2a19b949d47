#include "saycast/thread.h"

#include <errno.h>
#include <time.h>
#include <unistd.h>

namespace saycast {

void msleep(int ms) {
    if (ms <= 0) return;
    struct timespec ts;
    ts.tv_sec = ms / 1000;
    ts.tv_nsec = (long)(ms % 1000) * 1000000L;
    while (nanosleep(&ts, &ts) == -1 && errno == EINTR) {
    }
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (int64_t)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

Condition::Condition() {
    pthread_condattr_t attr;
    pthread_condattr_init(&attr);
    pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    pthread_cond_init(&cond_, &attr);
    pthread_condattr_destroy(&attr);
}

Condition::~Condition() {
    pthread_cond_destroy(&cond_);
}

bool Condition::wait_for(Mutex &m, int timeout_ms) {
    if (timeout_ms < 0) timeout_ms = 0;
    struct timespec deadline;
    clock_gettime(CLOCK_MONOTONIC, &deadline);
    deadline.tv_sec += timeout_ms / 1000;
    deadline.tv_nsec += (long)(timeout_ms % 1000) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec++;
        deadline.tv_nsec -= 1000000000L;
    }
    return pthread_cond_timedwait(&cond_, m.native(), &deadline) != ETIMEDOUT;
}

void Condition::wait(Mutex &m) {
    pthread_cond_wait(&cond_, m.native());
}

bool Thread::start(thread_return (*entry)(void *), void *arg) {
    if (started_) return false;
    if (pthread_create(&tid_, NULL, entry, arg) != 0) return false;
    started_ = true;
    return true;
}

void Thread::join() {
    if (!started_) return;
    pthread_join(tid_, NULL);
    started_ = false;
}

}  // namespace saycast
