#ifndef SAYCAST_SOURCE_SELECTOR_H
#define SAYCAST_SOURCE_SELECTOR_H

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <time.h>

#include "saycast/thread.h"

namespace saycast {

class BroadcastBuffer;

enum SourceKind {
    SOURCE_BACKGROUND,
    SOURCE_SPEECH
};

const char *source_kind_name(SourceKind kind);

struct BroadcastSource {
    BroadcastSource() : kind(SOURCE_BACKGROUND), generation(0), started(0) {}

    SourceKind kind;
    std::string path;
    uint64_t generation;  // bumped on every change
    time_t started;
};

// Owns "what should be playing". Speech always preempts, a drained speech
// source falls back to the background loop.
class SourceSelector {
public:
    explicit SourceSelector(const std::string &background_file);

    BroadcastSource current() const;
    uint64_t generation() const;
    const std::string &background() const { return background_; }

    // Makes path the current source, abandoning whatever played before.
    void preempt(const std::string &speech_path);

    // The pipeline finished `generation`. Reverts to background when that
    // speech source is still current; returns true if it did.
    bool drained(uint64_t generation);

    // Appends a chunk of `generation` to buffer unless the source changed.
    // Holds the selector lock across the append, so once preempt() returns
    // no chunk of the replaced source can follow. Lock order is selector,
    // then buffer.
    bool append_if_current(uint64_t generation, BroadcastBuffer *buffer,
                           const unsigned char *data, size_t len);

private:
    SourceSelector(const SourceSelector &);
    SourceSelector &operator=(const SourceSelector &);

    const std::string background_;
    BroadcastSource current_;
    mutable Mutex mutex_;
};

}  // namespace saycast

#endif  // SAYCAST_SOURCE_SELECTOR_H
