#ifndef SAYCAST_SPEECH_STORE_H
#define SAYCAST_SPEECH_STORE_H

#include <functional>
#include <string>
#include <vector>

#include "saycast/thread.h"

namespace saycast {

// Fills the file at temp_path. Returns false and sets *error on failure.
typedef std::function<bool(const std::string &temp_path, std::string *error)> SpeechWriter;

// Called with the final path of every published file.
typedef std::function<void(const std::string &path)> PublishListener;

// Folder of synthesized speech files. Files appear atomically (written under
// a temp name, then renamed) and only the newest `keep` survive.
class SpeechStore {
public:
    SpeechStore(const std::string &folder, int keep);

    // Creates the folder, clears stale temp files, applies retention.
    bool open(std::string *error);

    void set_publish_listener(const PublishListener &listener);

    // Runs writer against a fresh temp file and publishes the result.
    bool commit(const SpeechWriter &writer, std::string *path, std::string *error);

    // Published files, newest first by modification time.
    std::vector<std::string> list() const;

    // Resolves a bare file name to a published path.
    bool find(const std::string &name, std::string *path) const;

    static bool is_published_name(const std::string &name);

private:
    SpeechStore(const SpeechStore &);
    SpeechStore &operator=(const SpeechStore &);

    std::string make_name();
    void enforce_retention();

    const std::string folder_;
    const int keep_;
    unsigned long counter_;
    PublishListener listener_;
    Mutex mutex_;
};

}  // namespace saycast

#endif  // SAYCAST_SPEECH_STORE_H
