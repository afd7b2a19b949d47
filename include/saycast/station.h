#ifndef SAYCAST_STATION_H
#define SAYCAST_STATION_H

#include <memory>
#include <string>

#include "saycast/config.h"

namespace saycast {

class BroadcastBuffer;
class HttpServer;
class SourceSelector;
class SpeechStore;
class SynthesisEngine;
class SynthesisQueue;
class TranscodePipeline;
class VoiceRegistry;

// Owns and wires the whole broadcast: buffer, selector, speech store, voice
// registry, synthesis worker, transcode pipeline and the HTTP surface.
class Station {
public:
    explicit Station(const Config &cfg);
    // Uses engine instead of the configured synthesis command.
    Station(const Config &cfg, std::unique_ptr<SynthesisEngine> engine);
    ~Station();

    // Fails on configuration that cannot work: no background file, an
    // unusable speech folder or voice registry, a port that will not bind.
    bool start(std::string *error);
    void stop();

    BroadcastBuffer *buffer() { return buffer_.get(); }
    SourceSelector *selector() { return selector_.get(); }
    SpeechStore *store() { return store_.get(); }
    VoiceRegistry *voices() { return voices_.get(); }
    SynthesisQueue *queue() { return queue_.get(); }
    HttpServer *http() { return http_.get(); }

private:
    Station(const Station &);
    Station &operator=(const Station &);

    void build();

    const Config cfg_;
    std::unique_ptr<SynthesisEngine> engine_;
    std::unique_ptr<BroadcastBuffer> buffer_;
    std::unique_ptr<SourceSelector> selector_;
    std::unique_ptr<SpeechStore> store_;
    std::unique_ptr<VoiceRegistry> voices_;
    std::unique_ptr<SynthesisQueue> queue_;
    std::unique_ptr<TranscodePipeline> pipeline_;
    std::unique_ptr<HttpServer> http_;
    bool started_;
};

}  // namespace saycast

#endif  // SAYCAST_STATION_H
