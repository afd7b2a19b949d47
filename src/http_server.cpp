#include "saycast/http_server.h"

#include <arpa/inet.h>
#include <ctype.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>
#include <set>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#ifdef SAYCAST_WITH_SSL
#include <openssl/err.h>
#include <openssl/ssl.h>
#endif

#include "saycast/broadcast_buffer.h"
#include "saycast/listener_session.h"
#include "saycast/log.h"
#include "saycast/mp3_info.h"
#include "saycast/source_selector.h"
#include "saycast/speech_store.h"
#include "saycast/synthesis_queue.h"
#include "saycast/voice_registry.h"

using json = nlohmann::json;

#define MAX_HEADER_BYTES 16384
#define MAX_BODY_BYTES 65536

namespace saycast {

namespace {

const char *kCorsHeaders =
    "Access-Control-Allow-Origin: *\r\n"
    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
    "Access-Control-Allow-Headers: Content-Type\r\n";

const char *reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

HttpResponse json_response(int status, const json &body) {
    HttpResponse r;
    r.status = status;
    // engine output is not always UTF-8
    r.body = body.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    return r;
}

HttpResponse error_response(int status, const std::string &message) {
    json body;
    body["error"] = message;
    return json_response(status, body);
}

std::string base_name(const std::string &path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string lower(const std::string &s) {
    std::string out = s;
    for (size_t i = 0; i < out.size(); i++)
        if (out[i] >= 'A' && out[i] <= 'Z') out[i] = (char)(out[i] - 'A' + 'a');
    return out;
}

bool starts_with(const std::string &s, const char *prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

}  // namespace

std::string url_decode(const std::string &s) {
    std::string out;
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '%' && i + 2 < s.size() && isxdigit((unsigned char)s[i + 1]) && isxdigit((unsigned char)s[i + 2])) {
            char hex[3] = {s[i + 1], s[i + 2], 0};
            out += (char)strtol(hex, NULL, 16);
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

const char *content_type_for(const std::string &filename) {
    const char *f = filename.c_str();
    if (strstr(f, ".css")) return "text/css";
    if (strstr(f, ".js")) return "application/javascript";
    if (strstr(f, ".png")) return "image/png";
    if (strstr(f, ".jpeg")) return "image/jpeg";
    if (strstr(f, ".jpg")) return "image/jpg";
    if (strstr(f, ".mp3")) return "audio/mpeg";
    if (strstr(f, ".ico")) return "image/x-icon";
    if (strstr(f, ".svg")) return "image/svg+xml";
    if (strstr(f, ".json")) return "application/json";
    return "text/html";
}

// One accepted socket, optionally wrapped in TLS. The fd itself belongs to
// the server, which closes it once the connection is unregistered.
class Connection : public Transport {
public:
#ifdef SAYCAST_WITH_SSL
    Connection(int fd, SSL *ssl) : fd_(fd), ssl_(ssl) {}
#else
    explicit Connection(int fd) : fd_(fd) {}
#endif

    ~Connection() {
#ifdef SAYCAST_WITH_SSL
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
        }
#endif
    }

    int recv_some(char *buf, size_t len) {
#ifdef SAYCAST_WITH_SSL
        if (ssl_) return SSL_read(ssl_, buf, (int)len);
#endif
        ssize_t n;
        do {
            n = recv(fd_, buf, len, 0);
        } while (n < 0 && errno == EINTR);
        return (int)n;
    }

    bool write(const unsigned char *data, size_t len) {
        size_t off = 0;
        while (off < len) {
#ifdef SAYCAST_WITH_SSL
            if (ssl_) {
                int n = SSL_write(ssl_, data + off, (int)(len - off));
                if (n <= 0) return false;
                off += (size_t)n;
                continue;
            }
#endif
            ssize_t n = send(fd_, data + off, len - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            off += (size_t)n;
        }
        return true;
    }

    bool write_str(const std::string &s) {
        return write((const unsigned char *)s.data(), s.size());
    }

    bool closed() {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN | POLLRDHUP;
        pfd.revents = 0;
        if (poll(&pfd, 1, 0) <= 0) return false;
        if (pfd.revents & (POLLERR | POLLHUP | POLLRDHUP | POLLNVAL)) return true;
        if (pfd.revents & POLLIN) {
            char c;
            ssize_t n = recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT);
            return n == 0;
        }
        return false;
    }

private:
    Connection(const Connection &);
    Connection &operator=(const Connection &);

    int fd_;
#ifdef SAYCAST_WITH_SSL
    SSL *ssl_;
#endif
};

static bool read_request(Connection *conn, HttpRequest *req, int *status) {
    std::string data;
    char buf[4096];
    size_t header_end;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > MAX_HEADER_BYTES) { *status = 413; return false; }
        int r = conn->recv_some(buf, sizeof(buf));
        if (r <= 0) { *status = 0; return false; }
        data.append(buf, (size_t)r);
    }

    size_t line_end = data.find("\r\n");
    std::string request_line = data.substr(0, line_end);
    char method[16], target[2048];
    if (sscanf(request_line.c_str(), "%15s %2047s", method, target) != 2) {
        *status = 400;
        return false;
    }
    req->method = method;
    std::string t = target;
    size_t q = t.find('?');
    req->path = q == std::string::npos ? t : t.substr(0, q);
    req->query = q == std::string::npos ? "" : t.substr(q + 1);

    size_t pos = line_end + 2;
    while (pos < header_end) {
        size_t eol = data.find("\r\n", pos);
        std::string line = data.substr(pos, eol - pos);
        pos = eol + 2;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string value = line.substr(colon + 1);
        size_t b = value.find_first_not_of(" \t");
        req->headers[lower(line.substr(0, colon))] = b == std::string::npos ? "" : value.substr(b);
    }

    size_t want = 0;
    std::map<std::string, std::string>::const_iterator cl = req->headers.find("content-length");
    if (cl != req->headers.end()) want = (size_t)strtoul(cl->second.c_str(), NULL, 10);
    if (want > MAX_BODY_BYTES) { *status = 413; return false; }

    req->body = data.substr(header_end + 4);
    while (req->body.size() < want) {
        int r = conn->recv_some(buf, sizeof(buf));
        if (r <= 0) { *status = 400; return false; }
        req->body.append(buf, (size_t)r);
    }
    if (req->body.size() > want) req->body.resize(want);
    return true;
}

static bool send_response(Connection *conn, const HttpResponse &resp) {
    char header[512];
    snprintf(header, sizeof(header),
             "HTTP/1.1 %d %s\r\n"
             "Content-Type: %s\r\n"
             "Content-Length: %lu\r\n"
             "Connection: close\r\n"
             "%s\r\n",
             resp.status, reason_phrase(resp.status), resp.content_type.c_str(),
             (unsigned long)resp.body.size(), kCorsHeaders);
    return conn->write_str(header) && conn->write_str(resp.body);
}

HttpServer::HttpServer(const HttpOptions &opts, const StationServices &services)
    : opts_(opts),
      services_(services),
      listen_fd_(-1),
      bound_port_(0),
#ifdef SAYCAST_WITH_SSL
      ssl_ctx_(NULL),
#endif
      stopping_(false),
      connections_(0),
      listeners_(0) {}

HttpServer::~HttpServer() {
    stop();
#ifdef SAYCAST_WITH_SSL
    if (ssl_ctx_) SSL_CTX_free(ssl_ctx_);
#endif
}

bool HttpServer::start(std::string *error) {
#ifdef SAYCAST_WITH_SSL
    if (opts_.enable_ssl) {
        ssl_ctx_ = SSL_CTX_new(TLS_server_method());
        if (!ssl_ctx_) {
            if (error) *error = "Failed to create SSL context";
            return false;
        }
        if (SSL_CTX_use_certificate_file(ssl_ctx_, opts_.ssl_cert_file.c_str(), SSL_FILETYPE_PEM) <= 0 ||
            SSL_CTX_use_PrivateKey_file(ssl_ctx_, opts_.ssl_key_file.c_str(), SSL_FILETYPE_PEM) <= 0) {
            if (error) *error = "Failed to load SSL cert/key";
            return false;
        }
    }
#else
    if (opts_.enable_ssl)
        logmsg(LOG_YELLOW, 1, "enable_ssl is set but this build has no TLS support\n");
#endif

    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        if (error) *error = std::string("socket: ") + strerror(errno);
        return false;
    }
    int yes = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, (char *)&yes, sizeof(yes));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons((unsigned short)opts_.port);
    addr.sin_addr.s_addr = INADDR_ANY;
    if (bind(listen_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0 || listen(listen_fd_, 16) < 0) {
        if (error) *error = std::string("bind: ") + strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    socklen_t alen = sizeof(addr);
    getsockname(listen_fd_, (struct sockaddr *)&addr, &alen);
    bound_port_ = ntohs(addr.sin_port);

    {
        ScopedLock lock(mutex_);
        stopping_ = false;
    }
    if (!accept_thread_.start(&HttpServer::accept_entry, this)) {
        if (error) *error = "cannot start accept thread";
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    logmsg(LOG_GREEN, 1, "HTTP server port %d%s\n", bound_port_,
           opts_.enable_ssl ? " (TLS)" : "");
    return true;
}

void HttpServer::stop() {
    {
        ScopedLock lock(mutex_);
        if (stopping_ || listen_fd_ < 0) return;
        stopping_ = true;
    }
    shutdown(listen_fd_, SHUT_RDWR);
    accept_thread_.join();
    close(listen_fd_);
    listen_fd_ = -1;

    // unblock every connection thread stuck in recv or send
    ScopedLock lock(mutex_);
    for (std::set<int>::const_iterator it = open_fds_.begin(); it != open_fds_.end(); ++it)
        shutdown(*it, SHUT_RDWR);
    while (connections_ > 0) {
        if (!idle_.wait_for(mutex_, 1000))
            logmsg(LOG_YELLOW, 1, "Waiting for %d connections to close\n", connections_);
    }
}

int HttpServer::listeners() const {
    ScopedLock lock(mutex_);
    return listeners_;
}

thread_return HttpServer::accept_entry(void *arg) {
    static_cast<HttpServer *>(arg)->accept_loop();
    return 0;
}

thread_return HttpServer::connection_entry(void *arg) {
    ConnectionTask *task = static_cast<ConnectionTask *>(arg);
    HttpServer *server = task->server;
    int fd = task->fd;
    server->serve(fd, task->peer);
    delete task;

    {
        ScopedLock lock(server->mutex_);
        server->open_fds_.erase(fd);
    }
    close(fd);

    ScopedLock lock(server->mutex_);
    server->connections_--;
    server->idle_.broadcast();
    return 0;
}

void HttpServer::accept_loop() {
    for (;;) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int fd = accept4(listen_fd_, (struct sockaddr *)&client_addr, &client_len, SOCK_CLOEXEC);
        if (fd < 0) {
            ScopedLock lock(mutex_);
            if (stopping_) break;
            if (errno != EINTR && errno != ECONNABORTED) msleep(50);
            continue;
        }

        char client_ip[64];
        inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
        char peer[96];
        snprintf(peer, sizeof(peer), "%s:%d", client_ip, ntohs(client_addr.sin_port));

        struct timeval tv;
        tv.tv_sec = 2;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (char *)&tv, sizeof(tv));
        tv.tv_sec = opts_.client_timeout_sec;
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, (char *)&tv, sizeof(tv));

        ConnectionTask *task = new ConnectionTask;
        task->server = this;
        task->fd = fd;
        task->peer = peer;

        {
            ScopedLock lock(mutex_);
            connections_++;
            open_fds_.insert(fd);
        }
        pthread_t tid;
        if (pthread_create(&tid, NULL, &HttpServer::connection_entry, task) != 0) {
            logmsg(LOG_RED, 1, "Cannot start connection thread for %s\n", peer);
            delete task;
            ScopedLock lock(mutex_);
            open_fds_.erase(fd);
            close(fd);
            connections_--;
            idle_.broadcast();
            continue;
        }
        pthread_detach(tid);
    }
}

void HttpServer::serve(int fd, const std::string &peer) {
#ifdef SAYCAST_WITH_SSL
    SSL *ssl = NULL;
    if (ssl_ctx_) {
        ssl = SSL_new(ssl_ctx_);
        SSL_set_fd(ssl, fd);
        if (SSL_accept(ssl) <= 0) {
            SSL_free(ssl);
            return;
        }
    }
    Connection conn(fd, ssl);
#else
    Connection conn(fd);
#endif

    HttpRequest req;
    int status = 0;
    if (!read_request(&conn, &req, &status)) {
        if (status != 0) send_response(&conn, error_response(status, reason_phrase(status)));
        return;
    }

    if (req.method == "GET" && req.path == "/stream") {
        stream(&conn, peer);
        return;
    }

    HttpResponse resp;
    try {
        resp = handle(req);
    } catch (const std::exception &e) {
        logmsg(LOG_RED, 1, "%s %s %s failed: %s\n", peer.c_str(), req.method.c_str(), req.path.c_str(), e.what());
        resp = error_response(500, "Internal error");
    }
    if (resp.status >= 400)
        logmsg(LOG_YELLOW, 1, "%s %s %s -> %d\n", peer.c_str(), req.method.c_str(), req.path.c_str(), resp.status);
    send_response(&conn, resp);
}

bool HttpServer::acquire_listener_slot() {
    ScopedLock lock(mutex_);
    if (listeners_ >= opts_.max_clients) return false;
    listeners_++;
    return true;
}

void HttpServer::release_listener_slot() {
    ScopedLock lock(mutex_);
    listeners_--;
}

void HttpServer::stream(Connection *conn, const std::string &peer) {
    if (!acquire_listener_slot()) {
        logmsg(LOG_YELLOW, 1, "Client refused: %s\n", peer.c_str());
        send_response(conn, error_response(503, "Too many listeners"));
        return;
    }
    logmsg(LOG_PURPLE, 1, "Client added %s (%d/%d)\n", peer.c_str(), listeners(), opts_.max_clients);

    std::string header =
        "HTTP/1.0 200 OK\r\n"
        "Content-Type: audio/mpeg\r\n"
        "Cache-Control: no-cache, no-store\r\n"
        "Pragma: no-cache\r\n";
    header += kCorsHeaders;
    header += "Connection: close\r\n\r\n";

    if (conn->write_str(header)) {
        ListenerSession session(services_.buffer, conn, opts_.listener_wait_ms);
        session.run();
        logmsg(LOG_PURPLE, 1, "Client disconnected %s after %llu bytes\n", peer.c_str(),
               (unsigned long long)session.stats().bytes);
    }
    release_listener_slot();
}

HttpResponse HttpServer::handle(const HttpRequest &req) {
    if (req.method == "OPTIONS") {
        HttpResponse r;
        r.status = 204;
        r.content_type = "text/plain";
        return r;
    }

    const std::string &p = req.path;
    if (p == "/say") {
        if (req.method != "POST") return error_response(405, "Use POST");
        return say(req);
    }
    if (p == "/songs" && req.method == "GET") return songs();
    if (starts_with(p, "/play/") && (req.method == "GET" || req.method == "POST"))
        return play(url_decode(p.substr(6)));
    if (p == "/voices" && req.method == "GET") return voices();
    if (p == "/voice") {
        if (req.method != "POST") return error_response(405, "Use POST");
        return add_voice(req);
    }
    if (starts_with(p, "/use/")) {
        if (req.method != "POST") return error_response(405, "Use POST");
        return use_voice(url_decode(p.substr(5)));
    }
    if (p == "/status" && req.method == "GET") return status();
    if (req.method == "GET" && opts_.enable_webui) return static_file(url_decode(p));
    if (req.method != "GET") return error_response(405, "Method not allowed");
    return error_response(404, "Not Found");
}

HttpResponse HttpServer::say(const HttpRequest &req) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) return error_response(400, "Body must be a JSON object");

    std::string text, voice_name, engine_id;
    if (body.contains("text") && body["text"].is_string()) text = body["text"].get<std::string>();
    if (body.contains("voice") && body["voice"].is_string()) voice_name = body["voice"].get<std::string>();
    if (body.contains("voiceId") && body["voiceId"].is_string()) engine_id = body["voiceId"].get<std::string>();
    if (text.empty()) return error_response(400, "Missing text");

    // voice names a registry entry; voiceId is an engine identifier, which
    // may also be a registry name. An id the engine rejects fails the job.
    std::string voice_id, error;
    if (!voice_name.empty() || engine_id.empty()) {
        if (!services_.voices->resolve(voice_name, &voice_id, &error)) return error_response(400, error);
    } else if (!services_.voices->lookup(engine_id, &voice_id)) {
        voice_id = engine_id;
    }

    SynthesisJobPtr job;
    if (!services_.queue->enqueue(text, voice_id, &job, &error)) return error_response(400, error);

    if (!job->wait(opts_.synth_wait_ms)) {
        json r;
        r["status"] = "queued";
        r["job"] = job->id();
        r["voice"] = voice_id;
        return json_response(202, r);
    }
    if (!job->succeeded()) return error_response(500, job->error());

    json r;
    r["status"] = "ok";
    r["audio_path"] = base_name(job->result_path());
    r["voice"] = voice_id;
    return json_response(200, r);
}

HttpResponse HttpServer::songs() {
    std::vector<std::string> files = services_.store->list();
    json names = json::array();
    for (size_t i = 0; i < files.size(); i++) names.push_back(base_name(files[i]));
    json r;
    r["songs"] = names;
    return json_response(200, r);
}

HttpResponse HttpServer::play(const std::string &name) {
    std::string path;
    if (!services_.store->find(name, &path)) return error_response(404, "File not found");
    services_.selector->preempt(path);
    json r;
    r["message"] = "Now playing: " + name;
    return json_response(200, r);
}

HttpResponse HttpServer::voices() {
    std::map<std::string, std::string> all = services_.voices->snapshot();
    json r = json::object();
    for (std::map<std::string, std::string>::const_iterator it = all.begin(); it != all.end(); ++it)
        r[it->first] = it->second;
    return json_response(200, r);
}

HttpResponse HttpServer::add_voice(const HttpRequest &req) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) return error_response(400, "Body must be a JSON object");
    std::string name, value;
    if (body.contains("name") && body["name"].is_string()) name = body["name"].get<std::string>();
    if (body.contains("value") && body["value"].is_string()) value = body["value"].get<std::string>();
    if (name.empty() || value.empty()) return error_response(400, "Missing name or value");

    std::string error;
    if (!services_.voices->set(name, value, &error)) return error_response(500, error);
    std::map<std::string, std::string> all = services_.voices->snapshot();
    json out;
    out["status"] = "ok";
    out["voices"] = json::object();
    for (std::map<std::string, std::string>::const_iterator it = all.begin(); it != all.end(); ++it)
        out["voices"][it->first] = it->second;
    return json_response(200, out);
}

HttpResponse HttpServer::use_voice(const std::string &name) {
    std::string voice_id, error;
    if (!services_.voices->lookup(name, NULL)) return error_response(404, "Voice not found");
    if (!services_.voices->use(name, &voice_id, &error)) return error_response(500, error);
    json r;
    r["status"] = "ok";
    r["voice"] = voice_id;
    return json_response(200, r);
}

HttpResponse HttpServer::status() {
    BroadcastSource src = services_.selector->current();
    json r;
    r["source"] = base_name(src.path);
    r["kind"] = source_kind_name(src.kind);
    r["duration"] = mp3_duration(src.path);
    r["elapsed"] = (long)(time(NULL) - src.started);
    r["listeners"] = listeners();
    r["slots"] = opts_.max_clients;
    r["sequence"] = services_.buffer->live_edge();
    r["pending"] = services_.queue->pending();
    return json_response(200, r);
}

HttpResponse HttpServer::static_file(const std::string &path) {
    std::string name = path;
    if (name.empty() || name[0] != '/' || name.find("..") != std::string::npos)
        return error_response(404, "Not Found");
    if (name == "/") name = "/index.html";

    std::string full = opts_.webui_folder + name;
    struct stat st;
    if (stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return error_response(404, "Not Found");

    FILE *f = fopen(full.c_str(), "rb");
    if (!f) return error_response(404, "Not Found");
    HttpResponse r;
    r.content_type = content_type_for(name);
    r.body.resize((size_t)st.st_size);
    size_t n = r.body.empty() ? 0 : fread(&r.body[0], 1, r.body.size(), f);
    fclose(f);
    if (n != r.body.size()) return error_response(500, "Cannot read " + name);
    return r;
}

}  // namespace saycast
