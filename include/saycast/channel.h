#ifndef SAYCAST_CHANNEL_H
#define SAYCAST_CHANNEL_H

#include <deque>
#include <stddef.h>

#include "saycast/thread.h"

namespace saycast {

// Unbounded FIFO handing messages from any number of senders to one
// receiver thread. close() wakes the receiver; items already queued can
// still be taken with drain().
template <typename T>
class Channel {
public:
    enum PopStatus { POP_OK, POP_TIMEOUT, POP_CLOSED };

    Channel() : closed_(false) {}

    // Returns false once the channel is closed.
    bool push(const T &item) {
        ScopedLock lock(mutex_);
        if (closed_) return false;
        items_.push_back(item);
        not_empty_.signal();
        return true;
    }

    // Waits up to timeout_ms for an item. A negative timeout waits forever.
    PopStatus pop(T *out, int timeout_ms) {
        ScopedLock lock(mutex_);
        int64_t deadline = monotonic_ms() + timeout_ms;
        while (items_.empty() && !closed_) {
            if (timeout_ms < 0) {
                not_empty_.wait(mutex_);
                continue;
            }
            int64_t left = deadline - monotonic_ms();
            if (left <= 0) return POP_TIMEOUT;
            not_empty_.wait_for(mutex_, (int)left);
        }
        if (closed_) return POP_CLOSED;
        *out = items_.front();
        items_.pop_front();
        return POP_OK;
    }

    void close() {
        ScopedLock lock(mutex_);
        closed_ = true;
        not_empty_.broadcast();
    }

    // Removes and returns everything still queued.
    std::deque<T> drain() {
        ScopedLock lock(mutex_);
        std::deque<T> rest;
        rest.swap(items_);
        return rest;
    }

    size_t size() const {
        ScopedLock lock(mutex_);
        return items_.size();
    }

    bool closed() const {
        ScopedLock lock(mutex_);
        return closed_;
    }

private:
    Channel(const Channel &);
    Channel &operator=(const Channel &);

    mutable Mutex mutex_;
    Condition not_empty_;
    std::deque<T> items_;
    bool closed_;
};

}  // namespace saycast

#endif  // SAYCAST_CHANNEL_H
