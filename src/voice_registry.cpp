#include "saycast/voice_registry.h"

#include <errno.h>
#include <fstream>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "saycast/log.h"

using json = nlohmann::json;

namespace saycast {

static const char *kDefaultKey = "default";

VoiceRegistry::VoiceRegistry(const std::string &file, const std::string &engine_default)
    : file_(file), engine_default_(engine_default) {}

bool VoiceRegistry::open(std::string *error) {
    ScopedLock lock(mutex_);
    voices_.clear();

    std::ifstream in(file_.c_str());
    if (!in) {
        logmsg(LOG_YELLOW, 1, "No voice registry at %s, creating one\n", file_.c_str());
        voices_[kDefaultKey] = engine_default_;
        return save_locked(error);
    }

    std::stringstream ss;
    ss << in.rdbuf();
    json doc = json::parse(ss.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        if (error) *error = file_ + " is not a JSON object";
        return false;
    }
    for (json::const_iterator it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string()) {
            logmsg(LOG_YELLOW, 1, "Voice '%s' is not a string, skipped\n", it.key().c_str());
            continue;
        }
        voices_[it.key()] = it.value().get<std::string>();
    }

    if (voices_.find(kDefaultKey) == voices_.end()) {
        voices_[kDefaultKey] = engine_default_;
        logmsg(LOG_YELLOW, 1, "Voice registry had no default, using %s\n", engine_default_.c_str());
        return save_locked(error);
    }
    logmsg(LOG_GREEN, 1, "Loaded %d voices\n", (int)voices_.size());
    return true;
}

bool VoiceRegistry::save_locked(std::string *error) const {
    json doc = json::object();
    for (std::map<std::string, std::string>::const_iterator it = voices_.begin(); it != voices_.end(); ++it)
        doc[it->first] = it->second;
    std::string body = doc.dump(2) + "\n";

    std::string temp = file_ + ".tmp";
    FILE *f = fopen(temp.c_str(), "wb");
    if (!f) {
        if (error) *error = "cannot write " + temp + ": " + strerror(errno);
        return false;
    }
    bool ok = fwrite(body.data(), 1, body.size(), f) == body.size();
    ok = (fflush(f) == 0) && ok;
    ok = (fsync(fileno(f)) == 0) && ok;
    ok = (fclose(f) == 0) && ok;
    if (!ok) {
        if (error) *error = "short write to " + temp;
        unlink(temp.c_str());
        return false;
    }
    if (rename(temp.c_str(), file_.c_str()) != 0) {
        if (error) *error = "cannot replace " + file_ + ": " + strerror(errno);
        unlink(temp.c_str());
        return false;
    }
    return true;
}

bool VoiceRegistry::lookup(const std::string &name, std::string *voice_id) const {
    ScopedLock lock(mutex_);
    std::map<std::string, std::string>::const_iterator it = voices_.find(name);
    if (it == voices_.end()) return false;
    if (voice_id) *voice_id = it->second;
    return true;
}

bool VoiceRegistry::set(const std::string &name, const std::string &voice_id, std::string *error) {
    if (name.empty() || voice_id.empty()) {
        if (error) *error = "Missing name or value";
        return false;
    }
    ScopedLock lock(mutex_);
    std::map<std::string, std::string> previous = voices_;
    voices_[name] = voice_id;
    if (!save_locked(error)) {
        voices_.swap(previous);
        return false;
    }
    logmsg(LOG_CYAN, 1, "Voice %s -> %s\n", name.c_str(), voice_id.c_str());
    return true;
}

std::map<std::string, std::string> VoiceRegistry::snapshot() const {
    ScopedLock lock(mutex_);
    return voices_;
}

bool VoiceRegistry::resolve(const std::string &name, std::string *voice_id, std::string *error) const {
    ScopedLock lock(mutex_);
    if (!name.empty()) {
        std::map<std::string, std::string>::const_iterator it = voices_.find(name);
        if (it == voices_.end()) {
            if (error) *error = "Unknown voice: " + name;
            return false;
        }
        *voice_id = it->second;
        return true;
    }
    std::map<std::string, std::string>::const_iterator def = voices_.find(kDefaultKey);
    if (def != voices_.end() && !def->second.empty()) {
        *voice_id = def->second;
        return true;
    }
    *voice_id = engine_default_;
    return true;
}

bool VoiceRegistry::use(const std::string &name, std::string *voice_id, std::string *error) {
    std::string id;
    if (!lookup(name, &id)) {
        if (error) *error = "Voice not found";
        return false;
    }
    if (!set(kDefaultKey, id, error)) return false;
    if (voice_id) *voice_id = id;
    return true;
}

}  // namespace saycast
