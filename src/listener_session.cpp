#include "saycast/listener_session.h"

#include <vector>

#include "saycast/broadcast_buffer.h"
#include "saycast/log.h"

namespace saycast {

ListenerSession::ListenerSession(BroadcastBuffer *buffer, Transport *transport, int wait_ms)
    : buffer_(buffer), transport_(transport), wait_ms_(wait_ms), cursor_(buffer->live_edge()) {}

void ListenerSession::run() {
    std::vector<unsigned char> chunk;
    chunk.reserve(buffer_->chunk_size());

    for (;;) {
        uint64_t next = cursor_;
        ReadStatus st = buffer_->read_from(cursor_, wait_ms_, &chunk, &next);
        switch (st) {
            case READ_OK:
                if (!chunk.empty() && !transport_->write(&chunk[0], chunk.size()))
                    return;
                stats_.chunks++;
                stats_.bytes += chunk.size();
                cursor_ = next;
                break;
            case READ_RESYNC:
                logmsg(LOG_PURPLE, 1, "Listener fell behind at %llu, jumping to %llu\n",
                       (unsigned long long)cursor_, (unsigned long long)next);
                stats_.resyncs++;
                cursor_ = next;
                break;
            case READ_TIMEOUT:
                if (transport_->closed())
                    return;
                break;
            case READ_CLOSED:
                return;
        }
    }
}

}  // namespace saycast
