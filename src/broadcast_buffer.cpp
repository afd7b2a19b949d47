#include "saycast/broadcast_buffer.h"

namespace saycast {

BroadcastBuffer::BroadcastBuffer(size_t capacity, size_t chunk_size)
    : capacity_(capacity > 0 ? capacity : 1),
      chunk_size_(chunk_size),
      ring_(capacity_),
      next_seq_(0),
      closed_(false) {
    for (size_t i = 0; i < ring_.size(); i++) ring_[i].reserve(chunk_size_);
}

uint64_t BroadcastBuffer::append(const unsigned char *data, size_t len) {
    ScopedLock lock(mutex_);
    uint64_t seq = next_seq_;
    // the slot being overwritten holds seq - capacity, which drops out here
    std::vector<unsigned char> &slot = ring_[seq % capacity_];
    slot.assign(data, data + len);
    next_seq_++;
    data_ready_.broadcast();
    return seq;
}

ReadStatus BroadcastBuffer::read_from(uint64_t sequence, int timeout_ms,
                                      std::vector<unsigned char> *out, uint64_t *next) {
    ScopedLock lock(mutex_);
    int64_t deadline = monotonic_ms() + timeout_ms;

    while (!closed_ && sequence >= next_seq_) {
        int64_t left = deadline - monotonic_ms();
        if (left <= 0) {
            out->clear();
            *next = sequence;
            return READ_TIMEOUT;
        }
        data_ready_.wait_for(mutex_, (int)left);
    }
    if (closed_) {
        out->clear();
        *next = sequence;
        return READ_CLOSED;
    }

    if (sequence < lowest_locked()) {
        out->clear();
        *next = live_edge_locked();
        return READ_RESYNC;
    }

    *out = ring_[sequence % capacity_];
    *next = sequence + 1;
    return READ_OK;
}

uint64_t BroadcastBuffer::live_edge() const {
    ScopedLock lock(mutex_);
    return live_edge_locked();
}

uint64_t BroadcastBuffer::next_sequence() const {
    ScopedLock lock(mutex_);
    return next_seq_;
}

uint64_t BroadcastBuffer::lowest_sequence() const {
    ScopedLock lock(mutex_);
    return lowest_locked();
}

void BroadcastBuffer::close() {
    ScopedLock lock(mutex_);
    closed_ = true;
    data_ready_.broadcast();
}

bool BroadcastBuffer::closed() const {
    ScopedLock lock(mutex_);
    return closed_;
}

}  // namespace saycast
