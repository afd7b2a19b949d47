// Tests for SourceSelector: preemption and drain handling.

#include "saycast/source_selector.h"

#include <cassert>
#include <iostream>

#include "saycast/broadcast_buffer.h"
#include "saycast/log.h"
#include "saycast/thread.h"

using namespace saycast;

void test_starts_on_background() {
    std::cout << "Testing initial source..." << std::endl;

    SourceSelector sel("bg.mp3");
    BroadcastSource src = sel.current();
    assert(src.kind == SOURCE_BACKGROUND);
    assert(src.path == "bg.mp3");
    assert(src.generation == 0);
    assert(sel.background() == "bg.mp3");

    std::cout << "  PASS" << std::endl;
}

void test_speech_preempts_and_drains_back() {
    std::cout << "Testing speech preempt and drain..." << std::endl;

    SourceSelector sel("bg.mp3");
    sel.preempt("tts/a.mp3");
    BroadcastSource speech = sel.current();
    assert(speech.kind == SOURCE_SPEECH);
    assert(speech.path == "tts/a.mp3");
    assert(speech.generation == 1);

    assert(sel.drained(speech.generation));
    BroadcastSource after = sel.current();
    assert(after.kind == SOURCE_BACKGROUND);
    assert(after.path == "bg.mp3");
    assert(after.generation == 2);

    std::cout << "  PASS" << std::endl;
}

void test_newer_speech_wins() {
    std::cout << "Testing newest speech wins..." << std::endl;

    SourceSelector sel("bg.mp3");
    sel.preempt("tts/a.mp3");
    uint64_t first = sel.generation();
    sel.preempt("tts/b.mp3");
    assert(sel.current().path == "tts/b.mp3");

    // the abandoned file draining late must not knock out the newer one
    assert(!sel.drained(first));
    assert(sel.current().kind == SOURCE_SPEECH);
    assert(sel.current().path == "tts/b.mp3");

    assert(sel.drained(sel.generation()));
    assert(sel.current().kind == SOURCE_BACKGROUND);

    std::cout << "  PASS" << std::endl;
}

void test_background_drain_is_ignored() {
    std::cout << "Testing background drain is a no-op..." << std::endl;

    SourceSelector sel("bg.mp3");
    assert(!sel.drained(0));
    assert(sel.generation() == 0);
    assert(sel.current().kind == SOURCE_BACKGROUND);

    std::cout << "  PASS" << std::endl;
}

struct StaleProducer {
    SourceSelector *selector;
    BroadcastBuffer *buffer;
    uint64_t generation;
    int appended;
};

static thread_return produce_until_replaced(void *arg) {
    StaleProducer *p = static_cast<StaleProducer *>(arg);
    unsigned char chunk[8] = {'B', 'B', 'B', 'B', 'B', 'B', 'B', 'B'};
    while (p->selector->append_if_current(p->generation, p->buffer, chunk, sizeof(chunk)))
        p->appended++;
    return 0;
}

void test_no_append_after_preempt() {
    std::cout << "Testing appends stop at the switch..." << std::endl;

    SourceSelector sel("bg.mp3");
    BroadcastBuffer buf(64, 8);
    StaleProducer producer = {&sel, &buf, sel.generation(), 0};

    Thread th;
    assert(th.start(produce_until_replaced, &producer));
    while (buf.next_sequence() < 100) msleep(1);
    sel.preempt("tts/a.mp3");
    uint64_t mark = buf.next_sequence();
    th.join();

    // the background producer got nothing in once preempt returned
    assert(buf.next_sequence() == mark);
    assert((uint64_t)producer.appended == mark);

    unsigned char chunk[8] = {0};
    assert(!sel.append_if_current(0, &buf, chunk, sizeof(chunk)));
    assert(sel.append_if_current(sel.generation(), &buf, chunk, sizeof(chunk)));
    assert(buf.next_sequence() == mark + 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    log_set_quiet(true);

    std::cout << "=== SourceSelector Tests ===" << std::endl;
    test_starts_on_background();
    test_speech_preempts_and_drains_back();
    test_newer_speech_wins();
    test_background_drain_is_ignored();
    test_no_append_after_preempt();
    std::cout << "All SourceSelector tests passed." << std::endl;
    return 0;
}
