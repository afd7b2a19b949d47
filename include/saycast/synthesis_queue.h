#ifndef SAYCAST_SYNTHESIS_QUEUE_H
#define SAYCAST_SYNTHESIS_QUEUE_H

#include <memory>
#include <string>

#include "saycast/channel.h"
#include "saycast/thread.h"

namespace saycast {

class SpeechStore;
class SynthesisEngine;

// One speech request. The caller holds a handle to it while the worker
// fills in the outcome.
class SynthesisJob {
public:
    SynthesisJob(const std::string &text, const std::string &voice_id);

    const std::string &text() const { return text_; }
    const std::string &voice_id() const { return voice_id_; }
    unsigned long id() const { return id_; }

    // Waits up to timeout_ms for the job to finish. Returns completed().
    bool wait(int timeout_ms) const;

    bool completed() const;
    bool succeeded() const;
    std::string result_path() const;
    std::string error() const;

    void finish(const std::string &path);
    void fail(const std::string &error);

private:
    SynthesisJob(const SynthesisJob &);
    SynthesisJob &operator=(const SynthesisJob &);

    const std::string text_;
    const std::string voice_id_;
    const unsigned long id_;

    bool completed_;
    std::string result_path_;
    std::string error_;

    mutable Mutex mutex_;
    mutable Condition done_;
};

typedef std::shared_ptr<SynthesisJob> SynthesisJobPtr;

// FIFO of synthesis jobs served by a single worker thread, so exactly one
// job talks to the engine at any time.
class SynthesisQueue {
public:
    SynthesisQueue(SynthesisEngine *engine, SpeechStore *store);
    ~SynthesisQueue();

    // Empty text is rejected here and never queued.
    bool enqueue(const std::string &text, const std::string &voice_id,
                 SynthesisJobPtr *job, std::string *error);

    bool start();
    // Lets the job in flight finish; jobs still queued fail.
    void stop();

    size_t pending() const { return jobs_.size(); }
    unsigned long processed() const;

private:
    SynthesisQueue(const SynthesisQueue &);
    SynthesisQueue &operator=(const SynthesisQueue &);

    static thread_return worker_entry(void *arg);
    void worker_loop();
    void process(const SynthesisJobPtr &job);

    SynthesisEngine *engine_;
    SpeechStore *store_;
    Channel<SynthesisJobPtr> jobs_;
    Thread worker_;

    mutable Mutex stats_mutex_;
    unsigned long processed_;
};

}  // namespace saycast

#endif  // SAYCAST_SYNTHESIS_QUEUE_H
