#ifndef SAYCAST_VOICE_REGISTRY_H
#define SAYCAST_VOICE_REGISTRY_H

#include <map>
#include <string>

#include "saycast/thread.h"

namespace saycast {

// Logical voice name -> engine voice identifier, persisted as a JSON object.
// Always holds a "default" entry. Every change rewrites the whole document
// through a temp file and rename.
class VoiceRegistry {
public:
    VoiceRegistry(const std::string &file, const std::string &engine_default);

    // Loads the document, creating it when missing.
    bool open(std::string *error);

    bool lookup(const std::string &name, std::string *voice_id) const;
    bool set(const std::string &name, const std::string &voice_id, std::string *error);
    std::map<std::string, std::string> snapshot() const;

    // Precedence: named entry, then the registry default, then the engine
    // default. An explicit name that is not registered is an error.
    bool resolve(const std::string &name, std::string *voice_id, std::string *error) const;

    // Points "default" at the identifier registered under name.
    bool use(const std::string &name, std::string *voice_id, std::string *error);

    const std::string &file() const { return file_; }

private:
    VoiceRegistry(const VoiceRegistry &);
    VoiceRegistry &operator=(const VoiceRegistry &);

    bool save_locked(std::string *error) const;

    const std::string file_;
    const std::string engine_default_;
    std::map<std::string, std::string> voices_;
    mutable Mutex mutex_;
};

}  // namespace saycast

#endif  // SAYCAST_VOICE_REGISTRY_H
