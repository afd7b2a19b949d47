#include "saycast/station.h"

#include <sys/stat.h>

#include "saycast/broadcast_buffer.h"
#include "saycast/http_server.h"
#include "saycast/log.h"
#include "saycast/source_selector.h"
#include "saycast/speech_store.h"
#include "saycast/synthesis_engine.h"
#include "saycast/synthesis_queue.h"
#include "saycast/transcode_pipeline.h"
#include "saycast/voice_registry.h"

namespace saycast {

Station::Station(const Config &cfg)
    : cfg_(cfg),
      engine_(new CommandSynthesisEngine(cfg.synth_command, cfg.synth_timeout_sec, cfg.kill_grace_ms)),
      started_(false) {
    build();
}

Station::Station(const Config &cfg, std::unique_ptr<SynthesisEngine> engine)
    : cfg_(cfg), engine_(std::move(engine)), started_(false) {
    build();
}

Station::~Station() {
    stop();
}

void Station::build() {
    buffer_.reset(new BroadcastBuffer((size_t)cfg_.buffer_chunks, (size_t)cfg_.chunk_size));
    selector_.reset(new SourceSelector(cfg_.background_file));
    store_.reset(new SpeechStore(cfg_.speech_folder, cfg_.speech_keep));
    voices_.reset(new VoiceRegistry(cfg_.voices_file, cfg_.default_voice));
    queue_.reset(new SynthesisQueue(engine_.get(), store_.get()));

    SourceSelector *selector = selector_.get();
    store_->set_publish_listener([selector](const std::string &path) { selector->preempt(path); });

    PipelineOptions popts;
    popts.command = cfg_.transcoder_command;
    popts.bitrate_kbps = cfg_.stream_bitrate;
    popts.samplerate = cfg_.sample_rate;
    popts.channels = cfg_.channels;
    popts.chunk_size = (size_t)cfg_.chunk_size;
    popts.restart_backoff_ms = cfg_.restart_backoff_ms;
    popts.kill_grace_ms = cfg_.kill_grace_ms;
    popts.max_source_failures = cfg_.max_source_failures;
    pipeline_.reset(new TranscodePipeline(popts, selector_.get(), buffer_.get()));

    HttpOptions hopts;
    hopts.port = cfg_.http_port;
    hopts.max_clients = cfg_.max_clients;
    hopts.client_timeout_sec = cfg_.client_timeout_sec;
    hopts.enable_webui = cfg_.enable_webui != 0;
    hopts.webui_folder = cfg_.webui_folder;
    hopts.enable_ssl = cfg_.enable_ssl != 0;
    hopts.ssl_cert_file = cfg_.ssl_cert_file;
    hopts.ssl_key_file = cfg_.ssl_key_file;
    hopts.synth_wait_ms = cfg_.synth_wait_ms;
    hopts.listener_wait_ms = cfg_.listener_wait_ms;

    StationServices services;
    services.buffer = buffer_.get();
    services.selector = selector_.get();
    services.store = store_.get();
    services.voices = voices_.get();
    services.queue = queue_.get();
    http_.reset(new HttpServer(hopts, services));
}

bool Station::start(std::string *error) {
    struct stat st;
    if (stat(cfg_.background_file.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        if (error) *error = "background file " + cfg_.background_file + " is missing";
        return false;
    }
    if (!store_->open(error)) return false;
    if (!voices_->open(error)) return false;

    if (!queue_->start()) {
        if (error) *error = "cannot start synthesis worker";
        return false;
    }
    if (!pipeline_->start()) {
        if (error) *error = "cannot start transcode pipeline";
        queue_->stop();
        return false;
    }
    if (!http_->start(error)) {
        pipeline_->stop();
        queue_->stop();
        return false;
    }
    started_ = true;
    logmsg(LOG_GREEN, 1, "Station on air, background %s\n", cfg_.background_file.c_str());
    return true;
}

void Station::stop() {
    if (!started_) return;
    started_ = false;
    logmsg(LOG_GREEN, 1, "Station shutting down\n");
    // closing the buffer releases every listener session
    buffer_->close();
    http_->stop();
    queue_->stop();
    pipeline_->stop();
}

}  // namespace saycast
