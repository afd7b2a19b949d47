#ifndef SAYCAST_TRANSCODE_PIPELINE_H
#define SAYCAST_TRANSCODE_PIPELINE_H

#include <stdint.h>
#include <string>
#include <vector>

#include "saycast/source_selector.h"
#include "saycast/thread.h"

namespace saycast {

class BroadcastBuffer;
class Process;

struct PipelineOptions {
    PipelineOptions();

    // {input} {bitrate} {samplerate} {channels} are substituted.
    std::string command;
    int bitrate_kbps;
    int samplerate;
    int channels;
    size_t chunk_size;
    int restart_backoff_ms;
    int kill_grace_ms;
    // Consecutive failures after which a speech source counts as drained.
    int max_source_failures;
};

struct PipelineStats {
    PipelineStats() : restarts(0), failures(0), preemptions(0), chunks(0) {}

    unsigned long restarts;
    unsigned long failures;
    unsigned long preemptions;
    uint64_t chunks;
};

// Producer thread: keeps one transcoder process running against the
// selector's current source and appends its output to the buffer in fixed
// size chunks. A source change kills the process mid stream.
class TranscodePipeline {
public:
    TranscodePipeline(const PipelineOptions &opts, SourceSelector *selector, BroadcastBuffer *buffer);
    ~TranscodePipeline();

    bool start();
    // The producer terminates its live transcoder and exits.
    void stop();

    bool running() const;
    PipelineStats stats() const;

    std::vector<std::string> command_for(const std::string &input) const;

private:
    TranscodePipeline(const TranscodePipeline &);
    TranscodePipeline &operator=(const TranscodePipeline &);

    enum RunResult {
        RUN_DRAINED,
        RUN_PREEMPTED,
        RUN_FAILED,
        RUN_STOPPED
    };

    static thread_return thread_entry(void *arg);
    void loop();
    RunResult run_once(const BroadcastSource &src, Process *proc);
    bool stop_requested() const;
    bool source_changed(const BroadcastSource &src) const;
    void backoff();

    const PipelineOptions opts_;
    SourceSelector *selector_;
    BroadcastBuffer *buffer_;
    Thread thread_;

    mutable Mutex mutex_;
    Condition wake_;
    bool stopping_;
    bool running_;
    PipelineStats stats_;
};

}  // namespace saycast

#endif  // SAYCAST_TRANSCODE_PIPELINE_H
