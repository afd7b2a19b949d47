#ifndef SAYCAST_BROADCAST_BUFFER_H
#define SAYCAST_BROADCAST_BUFFER_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "saycast/thread.h"

namespace saycast {

enum ReadStatus {
    READ_OK,       // chunk copied out, *next = sequence + 1
    READ_TIMEOUT,  // nothing new within the wait
    READ_RESYNC,   // cursor fell behind the ring, *next = live edge
    READ_CLOSED    // buffer shut down
};

// Ring of the last `capacity` encoded chunks. One producer appends, any
// number of listeners read with their own cursor. Every chunk gets the next
// sequence number, starting at 0, with no gaps.
class BroadcastBuffer {
public:
    explicit BroadcastBuffer(size_t capacity = 256, size_t chunk_size = 4096);

    // Producer only. Returns the sequence assigned to the chunk.
    uint64_t append(const unsigned char *data, size_t len);

    // Copies chunk `sequence` into *out. Blocks up to timeout_ms when the
    // chunk has not been produced yet.
    ReadStatus read_from(uint64_t sequence, int timeout_ms,
                         std::vector<unsigned char> *out, uint64_t *next);

    // Sequence of the newest chunk, 0 before anything was appended.
    uint64_t live_edge() const;
    uint64_t next_sequence() const;
    uint64_t lowest_sequence() const;

    size_t chunk_size() const { return chunk_size_; }

    // Wakes every reader with READ_CLOSED.
    void close();
    bool closed() const;

private:
    BroadcastBuffer(const BroadcastBuffer &);
    BroadcastBuffer &operator=(const BroadcastBuffer &);

    uint64_t live_edge_locked() const { return next_seq_ > 0 ? next_seq_ - 1 : 0; }
    uint64_t lowest_locked() const { return next_seq_ > capacity_ ? next_seq_ - capacity_ : 0; }

    const size_t capacity_;
    const size_t chunk_size_;
    std::vector<std::vector<unsigned char> > ring_;
    uint64_t next_seq_;
    bool closed_;

    mutable Mutex mutex_;
    Condition data_ready_;
};

}  // namespace saycast

#endif  // SAYCAST_BROADCAST_BUFFER_H
