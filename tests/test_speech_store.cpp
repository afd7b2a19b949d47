// Tests for SpeechStore: atomic publish, retention, listing.

#include "saycast/speech_store.h"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "saycast/log.h"
#include "test_util.h"

using namespace saycast;

struct ContentWriter {
    std::string content;
    SpeechStore *store;
    std::string seen_temp;

    bool operator()(const std::string &temp_path, std::string *error) {
        (void)error;
        seen_temp = temp_path;
        // half written file must stay invisible
        testutil::write_file(temp_path, content.substr(0, content.size() / 2));
        assert(store->list().empty() || store->list()[0] != temp_path);
        testutil::write_file(temp_path, content);
        return true;
    }
};

static bool failing_writer(const std::string &temp_path, std::string *error) {
    testutil::write_file(temp_path, "partial");
    *error = "engine said no";
    return false;
}

static std::string base(const std::string &p) {
    return p.substr(p.rfind('/') + 1);
}

void test_commit_publishes_atomically() {
    std::cout << "Testing atomic commit..." << std::endl;

    std::string dir = testutil::make_temp_dir("store");
    SpeechStore store(dir + "/tts", 5);
    std::string error;
    assert(store.open(&error));

    std::vector<std::string> published;
    store.set_publish_listener([&published](const std::string &p) { published.push_back(p); });

    ContentWriter w;
    w.content = "ID3 fake speech bytes";
    w.store = &store;
    std::string path;
    assert(store.commit(std::ref(w), &path, &error));

    // temp file lived beside the final one, hidden by its leading dot
    assert(w.seen_temp.find(dir + "/tts/.") == 0);
    assert(!testutil::exists(w.seen_temp));
    assert(testutil::read_file(path) == w.content);
    assert(base(path).find("tts-") == 0);
    assert(published.size() == 1 && published[0] == path);

    std::vector<std::string> files = store.list();
    assert(files.size() == 1 && files[0] == path);

    testutil::remove_tree(dir);
    std::cout << "  PASS" << std::endl;
}

void test_failed_writer_leaves_nothing() {
    std::cout << "Testing failed synthesis cleanup..." << std::endl;

    std::string dir = testutil::make_temp_dir("store");
    SpeechStore store(dir, 5);
    std::string error;
    assert(store.open(&error));

    bool notified = false;
    store.set_publish_listener([&notified](const std::string &) { notified = true; });

    std::string path;
    assert(!store.commit(failing_writer, &path, &error));
    assert(error == "engine said no");
    assert(!notified);
    assert(testutil::dir_entries(dir).empty());

    testutil::remove_tree(dir);
    std::cout << "  PASS" << std::endl;
}

void test_retention_keeps_newest_five() {
    std::cout << "Testing retention of five files..." << std::endl;

    std::string dir = testutil::make_temp_dir("store");
    SpeechStore store(dir, 5);
    std::string error;
    assert(store.open(&error));

    std::vector<std::string> paths;
    for (int i = 0; i < 6; i++) {
        ContentWriter w;
        w.content = std::string("speech ") + (char)('0' + i);
        w.store = &store;
        std::string path;
        assert(store.commit(std::ref(w), &path, &error));
        paths.push_back(path);
    }

    std::vector<std::string> files = store.list();
    assert(files.size() == 5);
    assert(!testutil::exists(paths[0]));
    for (int i = 1; i < 6; i++) assert(testutil::exists(paths[i]));
    // newest first
    assert(files[0] == paths[5]);
    assert(files[4] == paths[1]);

    testutil::remove_tree(dir);
    std::cout << "  PASS" << std::endl;
}

void test_open_cleans_up_and_trims() {
    std::cout << "Testing open cleanup..." << std::endl;

    std::string dir = testutil::make_temp_dir("store");
    testutil::write_file(dir + "/.tts-stale.mp3.tmp", "half");
    testutil::write_file(dir + "/a.mp3", "a");
    testutil::write_file(dir + "/b.mp3", "b");
    testutil::write_file(dir + "/c.mp3", "c");
    testutil::write_file(dir + "/notes.txt", "not audio");

    SpeechStore store(dir, 2);
    std::string error;
    assert(store.open(&error));
    assert(!testutil::exists(dir + "/.tts-stale.mp3.tmp"));
    assert(store.list().size() == 2);
    assert(testutil::exists(dir + "/notes.txt"));

    testutil::remove_tree(dir);
    std::cout << "  PASS" << std::endl;
}

void test_find_rejects_paths() {
    std::cout << "Testing find..." << std::endl;

    std::string dir = testutil::make_temp_dir("store");
    testutil::write_file(dir + "/hello.mp3", "x");
    SpeechStore store(dir, 5);
    std::string error;
    assert(store.open(&error));

    std::string path;
    assert(store.find("hello.mp3", &path));
    assert(path == dir + "/hello.mp3");
    assert(!store.find("missing.mp3", &path));
    assert(!store.find("../hello.mp3", &path));
    assert(!store.find("sub/hello.mp3", &path));
    assert(!store.find(".hidden.mp3", &path));

    testutil::remove_tree(dir);
    std::cout << "  PASS" << std::endl;
}

int main() {
    log_set_quiet(true);

    std::cout << "=== SpeechStore Tests ===" << std::endl;
    test_commit_publishes_atomically();
    test_failed_writer_leaves_nothing();
    test_retention_keeps_newest_five();
    test_open_cleans_up_and_trims();
    test_find_rejects_paths();
    std::cout << "All SpeechStore tests passed." << std::endl;
    return 0;
}
