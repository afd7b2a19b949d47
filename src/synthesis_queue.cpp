#include "saycast/synthesis_queue.h"

#include <deque>

#include "saycast/log.h"
#include "saycast/speech_store.h"
#include "saycast/synthesis_engine.h"

namespace saycast {

namespace {

Mutex id_mutex;
unsigned long next_job_id = 0;

unsigned long allocate_job_id() {
    ScopedLock lock(id_mutex);
    return ++next_job_id;
}

// Binds one job to the engine for SpeechStore::commit.
struct EngineWriter {
    SynthesisEngine *engine;
    SynthesisJobPtr job;

    bool operator()(const std::string &temp_path, std::string *error) const {
        return engine->synthesize(job->text(), job->voice_id(), temp_path, error);
    }
};

}  // namespace

SynthesisJob::SynthesisJob(const std::string &text, const std::string &voice_id)
    : text_(text), voice_id_(voice_id), id_(allocate_job_id()), completed_(false) {}

bool SynthesisJob::wait(int timeout_ms) const {
    ScopedLock lock(mutex_);
    int64_t deadline = monotonic_ms() + timeout_ms;
    while (!completed_) {
        int64_t left = deadline - monotonic_ms();
        if (left <= 0) break;
        done_.wait_for(mutex_, (int)left);
    }
    return completed_;
}

bool SynthesisJob::completed() const {
    ScopedLock lock(mutex_);
    return completed_;
}

bool SynthesisJob::succeeded() const {
    ScopedLock lock(mutex_);
    return completed_ && error_.empty();
}

std::string SynthesisJob::result_path() const {
    ScopedLock lock(mutex_);
    return result_path_;
}

std::string SynthesisJob::error() const {
    ScopedLock lock(mutex_);
    return error_;
}

void SynthesisJob::finish(const std::string &path) {
    ScopedLock lock(mutex_);
    result_path_ = path;
    completed_ = true;
    done_.broadcast();
}

void SynthesisJob::fail(const std::string &error) {
    ScopedLock lock(mutex_);
    error_ = error.empty() ? "synthesis failed" : error;
    completed_ = true;
    done_.broadcast();
}

SynthesisQueue::SynthesisQueue(SynthesisEngine *engine, SpeechStore *store)
    : engine_(engine), store_(store), processed_(0) {}

SynthesisQueue::~SynthesisQueue() {
    stop();
}

bool SynthesisQueue::enqueue(const std::string &text, const std::string &voice_id,
                             SynthesisJobPtr *job, std::string *error) {
    if (text.empty()) {
        if (error) *error = "Missing text";
        return false;
    }
    SynthesisJobPtr j = std::make_shared<SynthesisJob>(text, voice_id);
    if (!jobs_.push(j)) {
        if (error) *error = "Synthesis queue is stopped";
        return false;
    }
    logmsg(LOG_CYAN, 1, "Queued speech job #%lu (%d chars, voice %s)\n",
           j->id(), (int)text.size(), voice_id.c_str());
    if (job) *job = j;
    return true;
}

bool SynthesisQueue::start() {
    return worker_.start(&SynthesisQueue::worker_entry, this);
}

void SynthesisQueue::stop() {
    jobs_.close();
    worker_.join();
    std::deque<SynthesisJobPtr> rest = jobs_.drain();
    for (size_t i = 0; i < rest.size(); i++) rest[i]->fail("queue stopped");
}

unsigned long SynthesisQueue::processed() const {
    ScopedLock lock(stats_mutex_);
    return processed_;
}

thread_return SynthesisQueue::worker_entry(void *arg) {
    static_cast<SynthesisQueue *>(arg)->worker_loop();
    return 0;
}

void SynthesisQueue::worker_loop() {
    logmsg(LOG_GREEN, 1, "Synthesis worker started\n");
    for (;;) {
        SynthesisJobPtr job;
        Channel<SynthesisJobPtr>::PopStatus st = jobs_.pop(&job, -1);
        if (st == Channel<SynthesisJobPtr>::POP_CLOSED) break;
        if (st != Channel<SynthesisJobPtr>::POP_OK) continue;
        process(job);
    }
    logmsg(LOG_GREEN, 1, "Synthesis worker stopped\n");
}

void SynthesisQueue::process(const SynthesisJobPtr &job) {
    int64_t started = monotonic_ms();
    EngineWriter writer;
    writer.engine = engine_;
    writer.job = job;

    std::string path, error;
    if (store_->commit(writer, &path, &error)) {
        logmsg(LOG_CYAN, 1, "Speech job #%lu done in %ld ms: %s\n",
               job->id(), (long)(monotonic_ms() - started), path.c_str());
        job->finish(path);
    } else {
        logmsg(LOG_RED, 1, "Speech job #%lu failed: %s\n", job->id(), error.c_str());
        job->fail(error);
    }

    ScopedLock lock(stats_mutex_);
    processed_++;
}

}  // namespace saycast
