#ifndef SAYCAST_LISTENER_SESSION_H
#define SAYCAST_LISTENER_SESSION_H

#include <stddef.h>
#include <stdint.h>

namespace saycast {

class BroadcastBuffer;

// The client end of a stream. write() sends everything or fails.
class Transport {
public:
    virtual ~Transport() {}

    virtual bool write(const unsigned char *data, size_t len) = 0;
    // Cheap probe for a peer that went away while nothing was written.
    virtual bool closed() = 0;
};

struct SessionStats {
    SessionStats() : chunks(0), bytes(0), resyncs(0) {}

    uint64_t chunks;
    uint64_t bytes;
    unsigned long resyncs;
};

// Tails the broadcast buffer from the live edge and forwards every chunk to
// one client until the client goes away or the buffer closes. A listener
// that falls out of the ring jumps to the live edge.
class ListenerSession {
public:
    ListenerSession(BroadcastBuffer *buffer, Transport *transport, int wait_ms);

    // Returns when the session is over.
    void run();

    uint64_t cursor() const { return cursor_; }
    const SessionStats &stats() const { return stats_; }

private:
    ListenerSession(const ListenerSession &);
    ListenerSession &operator=(const ListenerSession &);

    BroadcastBuffer *buffer_;
    Transport *transport_;
    const int wait_ms_;
    uint64_t cursor_;
    SessionStats stats_;
};

}  // namespace saycast

#endif  // SAYCAST_LISTENER_SESSION_H
