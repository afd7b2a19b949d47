#ifndef SAYCAST_HTTP_SERVER_H
#define SAYCAST_HTTP_SERVER_H

#include <map>
#include <set>
#include <string>

#include "saycast/thread.h"

#ifdef SAYCAST_WITH_SSL
typedef struct ssl_ctx_st SSL_CTX;
#endif

namespace saycast {

class BroadcastBuffer;
class Connection;
class SourceSelector;
class SpeechStore;
class SynthesisQueue;
class VoiceRegistry;

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;
};

struct HttpResponse {
    HttpResponse() : status(200), content_type("application/json; charset=UTF-8") {}

    int status;
    std::string content_type;
    std::string body;
};

struct HttpOptions {
    HttpOptions()
        : port(5002), max_clients(32), client_timeout_sec(10), enable_webui(true),
          webui_folder("player"), enable_ssl(false), synth_wait_ms(500), listener_wait_ms(1000) {}

    int port;  // 0 picks a free port
    int max_clients;
    int client_timeout_sec;
    bool enable_webui;
    std::string webui_folder;
    bool enable_ssl;
    std::string ssl_cert_file;
    std::string ssl_key_file;
    int synth_wait_ms;
    int listener_wait_ms;
};

// The pieces of the station the HTTP routes talk to. Not owned.
struct StationServices {
    StationServices() : buffer(0), selector(0), store(0), voices(0), queue(0) {}

    BroadcastBuffer *buffer;
    SourceSelector *selector;
    SpeechStore *store;
    VoiceRegistry *voices;
    SynthesisQueue *queue;
};

std::string url_decode(const std::string &s);
const char *content_type_for(const std::string &filename);

// Thread per connection HTTP/1.0 server. /stream connections turn into
// listener sessions, everything else is answered and closed.
class HttpServer {
public:
    HttpServer(const HttpOptions &opts, const StationServices &services);
    ~HttpServer();

    bool start(std::string *error);
    // Stops accepting, shuts down every open connection and waits for
    // their threads to finish.
    void stop();

    int port() const { return bound_port_; }
    int listeners() const;

    // Answers every route except /stream.
    HttpResponse handle(const HttpRequest &req);

private:
    HttpServer(const HttpServer &);
    HttpServer &operator=(const HttpServer &);

    struct ConnectionTask {
        HttpServer *server;
        int fd;
        std::string peer;
    };

    static thread_return accept_entry(void *arg);
    static thread_return connection_entry(void *arg);
    void accept_loop();
    void serve(int fd, const std::string &peer);
    void stream(Connection *conn, const std::string &peer);
    bool acquire_listener_slot();
    void release_listener_slot();

    HttpResponse say(const HttpRequest &req);
    HttpResponse songs();
    HttpResponse play(const std::string &name);
    HttpResponse voices();
    HttpResponse add_voice(const HttpRequest &req);
    HttpResponse use_voice(const std::string &name);
    HttpResponse status();
    HttpResponse static_file(const std::string &path);

    const HttpOptions opts_;
    const StationServices services_;

    int listen_fd_;
    int bound_port_;
    Thread accept_thread_;
#ifdef SAYCAST_WITH_SSL
    SSL_CTX *ssl_ctx_;
#endif

    mutable Mutex mutex_;
    Condition idle_;
    bool stopping_;
    int connections_;
    std::set<int> open_fds_;
    int listeners_;
};

}  // namespace saycast

#endif  // SAYCAST_HTTP_SERVER_H
