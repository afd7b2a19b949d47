#include "saycast/source_selector.h"

#include "saycast/broadcast_buffer.h"
#include "saycast/log.h"

namespace saycast {

const char *source_kind_name(SourceKind kind) {
    return kind == SOURCE_SPEECH ? "speech" : "background";
}

SourceSelector::SourceSelector(const std::string &background_file)
    : background_(background_file) {
    current_.kind = SOURCE_BACKGROUND;
    current_.path = background_;
    current_.generation = 0;
    current_.started = time(NULL);
}

BroadcastSource SourceSelector::current() const {
    ScopedLock lock(mutex_);
    return current_;
}

uint64_t SourceSelector::generation() const {
    ScopedLock lock(mutex_);
    return current_.generation;
}

void SourceSelector::preempt(const std::string &speech_path) {
    ScopedLock lock(mutex_);
    if (current_.kind == SOURCE_SPEECH)
        logmsg(LOG_BLUE, 1, "Abandoning %s for newer speech\n", current_.path.c_str());
    current_.kind = SOURCE_SPEECH;
    current_.path = speech_path;
    current_.generation++;
    current_.started = time(NULL);
    logmsg(LOG_GREEN, 1, "Now playing speech: %s\n", speech_path.c_str());
}

bool SourceSelector::drained(uint64_t generation) {
    ScopedLock lock(mutex_);
    if (current_.generation != generation || current_.kind != SOURCE_SPEECH)
        return false;
    current_.kind = SOURCE_BACKGROUND;
    current_.path = background_;
    current_.generation++;
    current_.started = time(NULL);
    logmsg(LOG_GREEN, 1, "Speech finished, back to background\n");
    return true;
}

bool SourceSelector::append_if_current(uint64_t generation, BroadcastBuffer *buffer,
                                       const unsigned char *data, size_t len) {
    ScopedLock lock(mutex_);
    if (current_.generation != generation) return false;
    buffer->append(data, len);
    return true;
}

}  // namespace saycast
