// Tests for BroadcastBuffer: sequencing, eviction, blocking reads.

#include "saycast/broadcast_buffer.h"

#include <cassert>
#include <iostream>
#include <vector>

#include "saycast/log.h"
#include "saycast/thread.h"

using namespace saycast;

static void append_byte(BroadcastBuffer &buf, unsigned char value, size_t len = 16) {
    std::vector<unsigned char> chunk(len, value);
    buf.append(&chunk[0], chunk.size());
}

void test_sequences_are_gapless() {
    std::cout << "Testing gapless sequence numbers..." << std::endl;

    BroadcastBuffer buf(8, 16);
    assert(buf.next_sequence() == 0);
    assert(buf.live_edge() == 0);

    for (int i = 0; i < 20; i++) {
        std::vector<unsigned char> chunk(16, (unsigned char)i);
        uint64_t seq = buf.append(&chunk[0], chunk.size());
        assert(seq == (uint64_t)i);
    }
    assert(buf.next_sequence() == 20);
    assert(buf.live_edge() == 19);
    assert(buf.lowest_sequence() == 12);

    // every retained chunk reads back in order, each next is seq + 1
    uint64_t cursor = buf.lowest_sequence();
    std::vector<unsigned char> out;
    while (cursor < buf.next_sequence()) {
        uint64_t next = 0;
        ReadStatus st = buf.read_from(cursor, 0, &out, &next);
        assert(st == READ_OK);
        assert(next == cursor + 1);
        assert(out.size() == 16);
        assert(out[0] == (unsigned char)cursor);
        cursor = next;
    }

    std::cout << "  PASS" << std::endl;
}

void test_evicted_sequence_resyncs_to_live_edge() {
    std::cout << "Testing resync below the retained floor..." << std::endl;

    BroadcastBuffer buf(4, 16);
    for (int i = 0; i < 10; i++) append_byte(buf, (unsigned char)i);

    std::vector<unsigned char> out(3, 0xAA);
    uint64_t next = 0;
    ReadStatus st = buf.read_from(2, 0, &out, &next);
    assert(st == READ_RESYNC);
    assert(next == 9);
    assert(out.empty());

    st = buf.read_from(next, 0, &out, &next);
    assert(st == READ_OK);
    assert(out[0] == 9);
    assert(next == 10);

    std::cout << "  PASS" << std::endl;
}

void test_read_at_head_times_out() {
    std::cout << "Testing timeout at the live edge..." << std::endl;

    BroadcastBuffer buf(4, 16);
    append_byte(buf, 1);

    std::vector<unsigned char> out;
    uint64_t next = 0;
    int64_t started = monotonic_ms();
    ReadStatus st = buf.read_from(1, 100, &out, &next);
    int64_t waited = monotonic_ms() - started;
    assert(st == READ_TIMEOUT);
    assert(next == 1);
    assert(out.empty());
    assert(waited >= 90);

    std::cout << "  PASS" << std::endl;
}

struct DelayedAppend {
    BroadcastBuffer *buf;
    int delay_ms;
};

static thread_return delayed_append(void *arg) {
    DelayedAppend *d = static_cast<DelayedAppend *>(arg);
    msleep(d->delay_ms);
    append_byte(*d->buf, 42);
    return 0;
}

void test_blocked_reader_wakes_on_append() {
    std::cout << "Testing wakeup on append..." << std::endl;

    BroadcastBuffer buf(4, 16);
    DelayedAppend d;
    d.buf = &buf;
    d.delay_ms = 50;
    Thread producer;
    assert(producer.start(delayed_append, &d));

    std::vector<unsigned char> out;
    uint64_t next = 0;
    int64_t started = monotonic_ms();
    ReadStatus st = buf.read_from(0, 5000, &out, &next);
    int64_t waited = monotonic_ms() - started;
    producer.join();

    assert(st == READ_OK);
    assert(out.size() == 16 && out[0] == 42);
    assert(next == 1);
    assert(waited < 2000);

    std::cout << "  PASS" << std::endl;
}

static thread_return delayed_close(void *arg) {
    BroadcastBuffer *buf = static_cast<BroadcastBuffer *>(arg);
    msleep(50);
    buf->close();
    return 0;
}

void test_close_releases_readers() {
    std::cout << "Testing close releases readers..." << std::endl;

    BroadcastBuffer buf(4, 16);
    Thread closer;
    assert(closer.start(delayed_close, &buf));

    std::vector<unsigned char> out;
    uint64_t next = 0;
    ReadStatus st = buf.read_from(0, 5000, &out, &next);
    closer.join();
    assert(st == READ_CLOSED);
    assert(buf.closed());

    std::cout << "  PASS" << std::endl;
}

void test_stalled_reader_after_two_wraps() {
    std::cout << "Testing a cursor that stalled through two wraps..." << std::endl;

    BroadcastBuffer buf(8, 16);
    for (int i = 0; i < 3; i++) append_byte(buf, (unsigned char)i);
    uint64_t cursor = buf.live_edge();
    assert(cursor == 2);

    // producer laps the ring twice while the reader is away
    for (int i = 3; i < 3 + 16; i++) append_byte(buf, (unsigned char)i);

    std::vector<unsigned char> out;
    uint64_t next = 0;
    ReadStatus st = buf.read_from(cursor, 0, &out, &next);
    assert(st == READ_RESYNC);
    assert(next == buf.live_edge());
    cursor = next;

    uint64_t last = 0;
    bool first = true;
    while ((st = buf.read_from(cursor, 0, &out, &next)) == READ_OK) {
        assert(first || next == last + 1);
        assert(out[0] == (unsigned char)cursor);
        first = false;
        last = next;
        cursor = next;
    }
    assert(st == READ_TIMEOUT);
    assert(cursor == buf.next_sequence());

    std::cout << "  PASS" << std::endl;
}

int main() {
    log_set_quiet(true);

    std::cout << "=== BroadcastBuffer Tests ===" << std::endl;
    test_sequences_are_gapless();
    test_evicted_sequence_resyncs_to_live_edge();
    test_read_at_head_times_out();
    test_blocked_reader_wakes_on_append();
    test_close_releases_readers();
    test_stalled_reader_after_two_wraps();
    std::cout << "All BroadcastBuffer tests passed." << std::endl;
    return 0;
}
