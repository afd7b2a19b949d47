// Tests for the HTTP routes, driven through HttpServer::handle without
// opening a socket.

#include "saycast/http_server.h"

#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "saycast/broadcast_buffer.h"
#include "saycast/log.h"
#include "saycast/source_selector.h"
#include "saycast/speech_store.h"
#include "saycast/synthesis_engine.h"
#include "saycast/synthesis_queue.h"
#include "saycast/thread.h"
#include "saycast/voice_registry.h"
#include "test_util.h"

using namespace saycast;
using json = nlohmann::json;

class ScriptedEngine : public SynthesisEngine {
public:
    bool synthesize(const std::string &text, const std::string &voice_id,
                    const std::string &output_path, std::string *error) {
        if (text == "slow") msleep(300);
        if (text == "explode") {
            *error = "voice service unavailable";
            return false;
        }
        if (text == "latin1") {
            *error = "Fehler: Stimme \xfc" "ber";
            return false;
        }
        if (voice_id.compare(0, 3, "xx-") == 0) {
            *error = "No voice named " + voice_id;
            return false;
        }
        testutil::write_file(output_path, voice_id + ":" + text);
        return true;
    }
};

// A whole station minus the pipeline and sockets.
struct RouteFixture {
    std::string dir;
    SourceSelector *selector;
    BroadcastBuffer buffer;
    SpeechStore *store;
    VoiceRegistry *voices;
    ScriptedEngine engine;
    SynthesisQueue *queue;

    RouteFixture() : buffer(16, 512) {
        dir = testutil::make_temp_dir("http");
        testutil::write_file(dir + "/background.mp3", "not really mp3");
        testutil::write_file(dir + "/voices.json",
                             "{\"default\": \"en-IN-PrabhatNeural\", \"aria\": \"en-US-AriaNeural\"}");
        mkdir((dir + "/player").c_str(), 0755);
        testutil::write_file(dir + "/player/index.html", "<html>radio</html>");

        selector = new SourceSelector(dir + "/background.mp3");
        store = new SpeechStore(dir + "/tts", 5);
        voices = new VoiceRegistry(dir + "/voices.json", "en-IN-PrabhatNeural");
        std::string error;
        assert(store->open(&error));
        assert(voices->open(&error));
        SourceSelector *sel = selector;
        store->set_publish_listener([sel](const std::string &path) { sel->preempt(path); });
        queue = new SynthesisQueue(&engine, store);
        assert(queue->start());
    }

    ~RouteFixture() {
        delete queue;
        delete voices;
        delete store;
        delete selector;
        testutil::remove_tree(dir);
    }

    StationServices services() {
        StationServices s;
        s.buffer = &buffer;
        s.selector = selector;
        s.store = store;
        s.voices = voices;
        s.queue = queue;
        return s;
    }

    HttpOptions options(int synth_wait_ms) {
        HttpOptions o;
        o.port = 0;
        o.webui_folder = dir + "/player";
        o.synth_wait_ms = synth_wait_ms;
        return o;
    }
};

static HttpRequest request(const char *method, const std::string &path, const std::string &body = "") {
    HttpRequest r;
    r.method = method;
    r.path = path;
    r.body = body;
    return r;
}

static json body_of(const HttpResponse &resp) {
    return json::parse(resp.body);
}

void test_helpers() {
    std::cout << "Testing url_decode and content types..." << std::endl;

    assert(url_decode("tts-1%20a.mp3") == "tts-1 a.mp3");
    assert(url_decode("a+b") == "a b");
    assert(url_decode("bad%zz") == "bad%zz");
    assert(std::string(content_type_for("a.mp3")) == "audio/mpeg");
    assert(std::string(content_type_for("style.css")) == "text/css");
    assert(std::string(content_type_for("index.html")) == "text/html");

    std::cout << "  PASS" << std::endl;
}

void test_say_validation() {
    std::cout << "Testing /say validation..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());

    HttpResponse r = server.handle(request("POST", "/say", "{}"));
    assert(r.status == 400);
    assert(body_of(r)["error"] == "Missing text");

    r = server.handle(request("POST", "/say", "not json"));
    assert(r.status == 400);

    r = server.handle(request("POST", "/say", "{\"text\": \"hi\", \"voice\": \"klingon\"}"));
    assert(r.status == 400);
    assert(body_of(r)["error"] == "Unknown voice: klingon");

    r = server.handle(request("GET", "/say"));
    assert(r.status == 405);

    assert(st.queue->processed() == 0);
    std::cout << "  PASS" << std::endl;
}

void test_say_goes_on_air() {
    std::cout << "Testing /say success..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());

    HttpResponse r = server.handle(request("POST", "/say", "{\"text\": \"Good evening\", \"voiceId\": \"aria\"}"));
    assert(r.status == 200);
    json b = body_of(r);
    assert(b["status"] == "ok");
    assert(b["voice"] == "en-US-AriaNeural");
    std::string name = b["audio_path"].get<std::string>();
    assert(name.find('/') == std::string::npos);

    BroadcastSource src = st.selector->current();
    assert(src.kind == SOURCE_SPEECH);
    assert(testutil::read_file(src.path) == "en-US-AriaNeural:Good evening");

    r = server.handle(request("GET", "/songs"));
    assert(r.status == 200);
    b = body_of(r);
    assert(b["songs"].size() == 1 && b["songs"][0] == name);

    // no voice means the registry default
    r = server.handle(request("POST", "/say", "{\"text\": \"again\"}"));
    assert(r.status == 200);
    assert(body_of(r)["voice"] == "en-IN-PrabhatNeural");

    r = server.handle(request("POST", "/say", "{\"text\": \"named\", \"voice\": \"aria\"}"));
    assert(r.status == 200);
    assert(body_of(r)["voice"] == "en-US-AriaNeural");

    std::cout << "  PASS" << std::endl;
}

void test_say_passes_engine_voice_ids_through() {
    std::cout << "Testing /say with engine voice ids..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());

    // not in the registry, goes to the engine as is
    HttpResponse r = server.handle(request("POST", "/say", "{\"text\": \"Namaste\", \"voiceId\": \"hi-IN-MadhurNeural\"}"));
    assert(r.status == 200);
    assert(body_of(r)["voice"] == "hi-IN-MadhurNeural");
    assert(testutil::read_file(st.selector->current().path) == "hi-IN-MadhurNeural:Namaste");

    // an id the engine does not know fails the job, not the request
    r = server.handle(request("POST", "/say", "{\"text\": \"hello\", \"voiceId\": \"xx-Nobody\"}"));
    assert(r.status == 500);
    assert(body_of(r)["error"] == "No voice named xx-Nobody");
    msleep(50);
    assert(st.queue->processed() == 2);

    // registry names are still checked up front
    r = server.handle(request("POST", "/say", "{\"text\": \"hello\", \"voice\": \"xx-Nobody\"}"));
    assert(r.status == 400);
    assert(st.queue->pending() == 0);
    assert(st.queue->processed() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_say_reports_engine_failure_and_slow_jobs() {
    std::cout << "Testing /say failure and queued replies..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());
    HttpResponse r = server.handle(request("POST", "/say", "{\"text\": \"explode\"}"));
    assert(r.status == 500);
    assert(body_of(r)["error"] == "voice service unavailable");
    assert(st.selector->current().kind == SOURCE_BACKGROUND);

    // error text that is not UTF-8 still makes a JSON reply
    r = server.handle(request("POST", "/say", "{\"text\": \"latin1\"}"));
    assert(r.status == 500);
    assert(body_of(r)["error"].get<std::string>().find("Fehler: Stimme ") == 0);

    HttpServer impatient(st.options(10), st.services());
    r = impatient.handle(request("POST", "/say", "{\"text\": \"slow\"}"));
    assert(r.status == 202);
    assert(body_of(r)["status"] == "queued");

    std::cout << "  PASS" << std::endl;
}

void test_say_with_a_failing_command() {
    std::cout << "Testing /say with a failing synthesis command..." << std::endl;

    RouteFixture st;
    testutil::write_file(st.dir + "/synth.sh", "printf 'Fehler: Stimme \\374ber\\n'\nexit 3\n");
    CommandSynthesisEngine engine("sh " + st.dir + "/synth.sh {voice} {output}", 10, 500);
    SynthesisQueue queue(&engine, st.store);
    assert(queue.start());

    StationServices services = st.services();
    services.queue = &queue;
    HttpServer server(st.options(3000), services);
    HttpResponse r = server.handle(request("POST", "/say", "{\"text\": \"hallo\"}"));
    assert(r.status == 500);
    assert(body_of(r)["error"] == "sh failed (exit code 3): Fehler: Stimme ?ber");
    assert(st.selector->current().kind == SOURCE_BACKGROUND);

    queue.stop();
    std::cout << "  PASS" << std::endl;
}

void test_play() {
    std::cout << "Testing /play..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());
    testutil::write_file(st.dir + "/tts/old news.mp3", "x");

    HttpResponse r = server.handle(request("GET", "/play/missing.mp3"));
    assert(r.status == 404);
    assert(body_of(r)["error"] == "File not found");
    r = server.handle(request("GET", "/play/..%2Fbackground.mp3"));
    assert(r.status == 404);

    r = server.handle(request("POST", "/play/old%20news.mp3"));
    assert(r.status == 200);
    assert(body_of(r)["message"] == "Now playing: old news.mp3");
    assert(st.selector->current().path == st.dir + "/tts/old news.mp3");

    std::cout << "  PASS" << std::endl;
}

void test_voice_routes() {
    std::cout << "Testing voice routes..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());

    HttpResponse r = server.handle(request("GET", "/voices"));
    assert(r.status == 200);
    assert(body_of(r)["aria"] == "en-US-AriaNeural");

    r = server.handle(request("POST", "/voice", "{\"name\": \"hindi\"}"));
    assert(r.status == 400);
    assert(body_of(r)["error"] == "Missing name or value");

    r = server.handle(request("POST", "/voice", "{\"name\": \"hindi\", \"value\": \"hi-IN-MadhurNeural\"}"));
    assert(r.status == 200);
    assert(body_of(r)["voices"]["hindi"] == "hi-IN-MadhurNeural");

    r = server.handle(request("POST", "/use/nobody"));
    assert(r.status == 404);
    r = server.handle(request("GET", "/use/hindi"));
    assert(r.status == 405);
    r = server.handle(request("POST", "/use/hindi"));
    assert(r.status == 200);
    assert(body_of(r)["voice"] == "hi-IN-MadhurNeural");

    json saved = json::parse(testutil::read_file(st.dir + "/voices.json"));
    assert(saved["default"] == "hi-IN-MadhurNeural");

    std::cout << "  PASS" << std::endl;
}

void test_status_and_static_files() {
    std::cout << "Testing /status and the web player..." << std::endl;

    RouteFixture st;
    HttpServer server(st.options(2000), st.services());

    HttpResponse r = server.handle(request("GET", "/status"));
    assert(r.status == 200);
    json b = body_of(r);
    assert(b["kind"] == "background");
    assert(b["source"] == "background.mp3");
    assert(b["listeners"] == 0);

    r = server.handle(request("GET", "/"));
    assert(r.status == 200);
    assert(r.body == "<html>radio</html>");
    assert(r.content_type == "text/html");

    r = server.handle(request("GET", "/../voices.json"));
    assert(r.status == 404);
    r = server.handle(request("GET", "/nothing.css"));
    assert(r.status == 404);

    // a path without the leading slash must not reach files beside the folder
    testutil::write_file(st.dir + "/player.cfg", "secret");
    r = server.handle(request("GET", ".cfg"));
    assert(r.status == 404);
    r = server.handle(request("GET", ""));
    assert(r.status == 404);

    r = server.handle(request("OPTIONS", "/say"));
    assert(r.status == 204);

    r = server.handle(request("DELETE", "/songs"));
    assert(r.status == 405);

    std::cout << "  PASS" << std::endl;
}

int main() {
    log_set_quiet(true);

    std::cout << "=== HTTP Route Tests ===" << std::endl;
    test_helpers();
    test_say_validation();
    test_say_goes_on_air();
    test_say_passes_engine_voice_ids_through();
    test_say_reports_engine_failure_and_slow_jobs();
    test_say_with_a_failing_command();
    test_play();
    test_voice_routes();
    test_status_and_static_files();
    std::cout << "All HTTP route tests passed." << std::endl;
    return 0;
}
