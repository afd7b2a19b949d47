#ifndef SAYCAST_SYNTHESIS_ENGINE_H
#define SAYCAST_SYNTHESIS_ENGINE_H

#include <string>

namespace saycast {

// Text to speech backend. Writes audio for text, spoken with voice_id, into
// output_path. On failure returns false with a reason in *error (unknown
// voice, service failure, ...).
class SynthesisEngine {
public:
    virtual ~SynthesisEngine() {}

    virtual bool synthesize(const std::string &text, const std::string &voice_id,
                            const std::string &output_path, std::string *error) = 0;
};

// Runs an external command per request, e.g.
//   edge-tts --voice {voice} --text {text} --write-media {output}
class CommandSynthesisEngine : public SynthesisEngine {
public:
    CommandSynthesisEngine(const std::string &command_template, int timeout_sec, int kill_grace_ms);

    bool synthesize(const std::string &text, const std::string &voice_id,
                    const std::string &output_path, std::string *error);

private:
    const std::string command_template_;
    const int timeout_sec_;
    const int kill_grace_ms_;
};

}  // namespace saycast

#endif  // SAYCAST_SYNTHESIS_ENGINE_H
