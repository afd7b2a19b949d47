#include "saycast/speech_store.h"

#include <algorithm>
#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include "saycast/log.h"

namespace saycast {

namespace {

const char *kPrefix = "tts-";
const char *kExt = ".mp3";
const char *kTempExt = ".tmp";

struct Entry {
    std::string path;
    std::string name;
    struct timespec mtime;
};

bool newer_first(const Entry &a, const Entry &b) {
    if (a.mtime.tv_sec != b.mtime.tv_sec) return a.mtime.tv_sec > b.mtime.tv_sec;
    if (a.mtime.tv_nsec != b.mtime.tv_nsec) return a.mtime.tv_nsec > b.mtime.tv_nsec;
    return a.name > b.name;
}

bool ends_with(const std::string &s, const char *suffix) {
    size_t n = strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

bool make_dirs(const std::string &path) {
    std::string partial;
    for (size_t i = 0; i <= path.size(); i++) {
        if (i == path.size() || path[i] == '/') {
            partial = path.substr(0, i);
            if (!partial.empty() && mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST)
                return false;
        }
    }
    return true;
}

std::vector<Entry> scan_folder(const std::string &folder) {
    std::vector<Entry> found;
    DIR *d = opendir(folder.c_str());
    if (!d) return found;
    struct dirent *de;
    while ((de = readdir(d))) {
        std::string name = de->d_name;
        if (!SpeechStore::is_published_name(name)) continue;
        Entry e;
        e.name = name;
        e.path = folder + "/" + name;
        struct stat st;
        if (stat(e.path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        e.mtime = st.st_mtim;
        found.push_back(e);
    }
    closedir(d);
    std::sort(found.begin(), found.end(), newer_first);
    return found;
}

}  // namespace

SpeechStore::SpeechStore(const std::string &folder, int keep)
    : folder_(folder), keep_(keep > 0 ? keep : 1), counter_(0) {}

bool SpeechStore::is_published_name(const std::string &name) {
    return !name.empty() && name[0] != '.' && ends_with(name, kExt);
}

bool SpeechStore::open(std::string *error) {
    if (!make_dirs(folder_)) {
        if (error) *error = "cannot create " + folder_ + ": " + strerror(errno);
        return false;
    }
    DIR *d = opendir(folder_.c_str());
    if (!d) {
        if (error) *error = "cannot open " + folder_ + ": " + strerror(errno);
        return false;
    }
    struct dirent *de;
    std::vector<std::string> stale;
    while ((de = readdir(d))) {
        std::string name = de->d_name;
        if (name.size() > 1 && name[0] == '.' && ends_with(name, kTempExt))
            stale.push_back(folder_ + "/" + name);
    }
    closedir(d);
    for (size_t i = 0; i < stale.size(); i++) {
        logmsg(LOG_YELLOW, 1, "Removing unfinished %s\n", stale[i].c_str());
        unlink(stale[i].c_str());
    }

    ScopedLock lock(mutex_);
    enforce_retention();
    return true;
}

void SpeechStore::set_publish_listener(const PublishListener &listener) {
    ScopedLock lock(mutex_);
    listener_ = listener;
}

std::string SpeechStore::make_name() {
    struct timeval tv;
    gettimeofday(&tv, NULL);
    struct tm t;
    localtime_r(&tv.tv_sec, &t);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &t);
    char name[96];
    snprintf(name, sizeof(name), "%s%s-%06ld-%06lu%s", kPrefix, stamp, (long)tv.tv_usec, ++counter_, kExt);
    return name;
}

bool SpeechStore::commit(const SpeechWriter &writer, std::string *path, std::string *error) {
    std::string final_path;
    std::string temp_path;
    {
        ScopedLock lock(mutex_);
        std::string name = make_name();
        final_path = folder_ + "/" + name;
        temp_path = folder_ + "/." + name + kTempExt;
    }

    std::string werr;
    if (!writer(temp_path, &werr)) {
        unlink(temp_path.c_str());
        if (error) *error = werr.empty() ? "synthesis produced no output" : werr;
        return false;
    }

    struct stat st;
    if (stat(temp_path.c_str(), &st) != 0 || st.st_size == 0) {
        unlink(temp_path.c_str());
        if (error) *error = "synthesis produced no output";
        return false;
    }

    if (rename(temp_path.c_str(), final_path.c_str()) != 0) {
        int err = errno;
        unlink(temp_path.c_str());
        if (error) *error = "cannot publish " + final_path + ": " + strerror(err);
        return false;
    }
    logmsg(LOG_CYAN, 1, "Published %s (%ld bytes)\n", final_path.c_str(), (long)st.st_size);

    PublishListener listener;
    {
        ScopedLock lock(mutex_);
        listener = listener_;
    }
    if (listener) listener(final_path);

    {
        ScopedLock lock(mutex_);
        enforce_retention();
    }

    if (path) *path = final_path;
    return true;
}

void SpeechStore::enforce_retention() {
    std::vector<Entry> files = scan_folder(folder_);
    for (size_t i = (size_t)keep_; i < files.size(); i++) {
        if (unlink(files[i].path.c_str()) == 0) {
            logmsg(LOG_CYAN, 1, "Retention removed %s\n", files[i].name.c_str());
        } else if (errno != ENOENT) {
            logmsg(LOG_YELLOW, 1, "Cannot remove %s: %s\n", files[i].path.c_str(), strerror(errno));
        }
    }
}

std::vector<std::string> SpeechStore::list() const {
    std::vector<Entry> files = scan_folder(folder_);
    std::vector<std::string> paths;
    for (size_t i = 0; i < files.size(); i++) paths.push_back(files[i].path);
    return paths;
}

bool SpeechStore::find(const std::string &name, std::string *path) const {
    if (name.find('/') != std::string::npos || name == ".." || !is_published_name(name))
        return false;
    std::string candidate = folder_ + "/" + name;
    struct stat st;
    if (stat(candidate.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    if (path) *path = candidate;
    return true;
}

}  // namespace saycast
