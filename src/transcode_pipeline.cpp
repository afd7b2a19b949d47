#include "saycast/transcode_pipeline.h"

#include <stdio.h>

#include "saycast/broadcast_buffer.h"
#include "saycast/log.h"
#include "saycast/process.h"

namespace saycast {

// Upper bound on how long a source switch or stop waits for the read loop.
static const int kPollMs = 100;

PipelineOptions::PipelineOptions()
    : command("ffmpeg -hide_banner -loglevel error -re -i {input} -vn -acodec libmp3lame "
              "-b:a {bitrate}k -ar {samplerate} -ac {channels} -f mp3 pipe:1"),
      bitrate_kbps(128),
      samplerate(44100),
      channels(2),
      chunk_size(4096),
      restart_backoff_ms(1000),
      kill_grace_ms(2000),
      max_source_failures(3) {}

TranscodePipeline::TranscodePipeline(const PipelineOptions &opts, SourceSelector *selector,
                                     BroadcastBuffer *buffer)
    : opts_(opts), selector_(selector), buffer_(buffer), stopping_(false), running_(false) {}

TranscodePipeline::~TranscodePipeline() {
    stop();
}

std::vector<std::string> TranscodePipeline::command_for(const std::string &input) const {
    char bitrate[16], rate[16], channels[16];
    snprintf(bitrate, sizeof(bitrate), "%d", opts_.bitrate_kbps);
    snprintf(rate, sizeof(rate), "%d", opts_.samplerate);
    snprintf(channels, sizeof(channels), "%d", opts_.channels);

    std::vector<std::pair<std::string, std::string> > vars;
    vars.push_back(std::make_pair(std::string("input"), input));
    vars.push_back(std::make_pair(std::string("bitrate"), std::string(bitrate)));
    vars.push_back(std::make_pair(std::string("samplerate"), std::string(rate)));
    vars.push_back(std::make_pair(std::string("channels"), std::string(channels)));
    return expand_command(opts_.command, vars);
}

bool TranscodePipeline::start() {
    {
        ScopedLock lock(mutex_);
        if (running_) return false;
        stopping_ = false;
        running_ = true;
    }
    if (!thread_.start(&TranscodePipeline::thread_entry, this)) {
        ScopedLock lock(mutex_);
        running_ = false;
        return false;
    }
    return true;
}

void TranscodePipeline::stop() {
    {
        ScopedLock lock(mutex_);
        stopping_ = true;
        wake_.broadcast();
    }
    thread_.join();
    ScopedLock lock(mutex_);
    running_ = false;
}

bool TranscodePipeline::running() const {
    ScopedLock lock(mutex_);
    return running_;
}

PipelineStats TranscodePipeline::stats() const {
    ScopedLock lock(mutex_);
    return stats_;
}

bool TranscodePipeline::stop_requested() const {
    ScopedLock lock(mutex_);
    return stopping_;
}

bool TranscodePipeline::source_changed(const BroadcastSource &src) const {
    return selector_->generation() != src.generation;
}

void TranscodePipeline::backoff() {
    ScopedLock lock(mutex_);
    int64_t deadline = monotonic_ms() + opts_.restart_backoff_ms;
    while (!stopping_) {
        int64_t left = deadline - monotonic_ms();
        if (left <= 0) break;
        wake_.wait_for(mutex_, (int)left);
    }
}

thread_return TranscodePipeline::thread_entry(void *arg) {
    static_cast<TranscodePipeline *>(arg)->loop();
    return 0;
}

void TranscodePipeline::loop() {
    logmsg(LOG_GREEN, 1, "Transcode pipeline started\n");
    uint64_t failing_generation = 0;
    int failures = 0;

    while (!stop_requested()) {
        BroadcastSource src = selector_->current();
        std::vector<std::string> argv = command_for(src.path);

        {
            ScopedLock lock(mutex_);
            stats_.restarts++;
        }

        Process proc;
        std::string error;
        RunResult result;
        if (!proc.start(argv, &error)) {
            logmsg(LOG_RED, 1, "Transcoder did not start: %s\n", error.c_str());
            result = RUN_FAILED;
        } else {
            logmsg(LOG_BLUE, 1, "Transcoding %s %s (pid %d)\n",
                   source_kind_name(src.kind), src.path.c_str(), (int)proc.pid());
            result = run_once(src, &proc);
        }

        if (result == RUN_STOPPED) break;

        if (result == RUN_PREEMPTED) {
            ScopedLock lock(mutex_);
            stats_.preemptions++;
            failures = 0;
            continue;
        }

        if (result == RUN_DRAINED) {
            failures = 0;
            if (src.kind == SOURCE_SPEECH)
                selector_->drained(src.generation);
            continue;
        }

        {
            ScopedLock lock(mutex_);
            stats_.failures++;
        }
        if (failing_generation == src.generation && failures > 0) {
            failures++;
        } else {
            failing_generation = src.generation;
            failures = 1;
        }
        if (src.kind == SOURCE_SPEECH && failures >= opts_.max_source_failures) {
            logmsg(LOG_RED, 1, "Giving up on %s after %d attempts\n", src.path.c_str(), failures);
            selector_->drained(src.generation);
            failures = 0;
        }
        backoff();
    }
    logmsg(LOG_GREEN, 1, "Transcode pipeline stopped\n");
}

TranscodePipeline::RunResult TranscodePipeline::run_once(const BroadcastSource &src, Process *proc) {
    std::vector<unsigned char> chunk(opts_.chunk_size);
    size_t filled = 0;
    size_t produced = 0;
    bool eof = false;

    while (!eof) {
        if (stop_requested()) {
            proc->terminate(opts_.kill_grace_ms);
            return RUN_STOPPED;
        }
        if (source_changed(src)) {
            logmsg(LOG_BLUE, 1, "Source changed, stopping transcoder for %s\n", src.path.c_str());
            proc->terminate(opts_.kill_grace_ms);
            return RUN_PREEMPTED;
        }

        ssize_t n = proc->read_some(&chunk[filled], chunk.size() - filled, kPollMs);
        if (n == Process::kTimedOut) continue;
        if (n < 0) {
            logmsg(LOG_RED, 1, "Lost transcoder output for %s\n", src.path.c_str());
            proc->terminate(opts_.kill_grace_ms);
            return RUN_FAILED;
        }
        if (n == 0) eof = true;
        else filled += (size_t)n;

        if (filled == chunk.size() || (eof && filled > 0)) {
            // no chunk of a replaced source may reach the buffer
            if (!selector_->append_if_current(src.generation, buffer_, &chunk[0], filled)) {
                proc->terminate(opts_.kill_grace_ms);
                return RUN_PREEMPTED;
            }
            produced += filled;
            filled = 0;
            ScopedLock lock(mutex_);
            stats_.chunks++;
        }
    }

    ExitStatus st = proc->wait();
    if (stop_requested()) return RUN_STOPPED;
    if (!st.ok()) {
        logmsg(LOG_RED, 1, "Transcoder for %s ended abnormally (%s)\n",
               src.path.c_str(), st.describe().c_str());
        return RUN_FAILED;
    }
    if (produced == 0) {
        logmsg(LOG_RED, 1, "Transcoder produced no audio for %s\n", src.path.c_str());
        return RUN_FAILED;
    }
    logmsg(LOG_BLUE, 1, "Drained %s (%lu bytes)\n", src.path.c_str(), (unsigned long)produced);
    return RUN_DRAINED;
}

}  // namespace saycast
