#include "saycast/config.h"

#include <stdio.h>
#include <stdlib.h>

#include "saycast/log.h"

#define BUFFER 2048

namespace saycast {

Config::Config()
    : http_port(5002),
      max_clients(32),
      client_timeout_sec(10),
      enable_webui(1),
      webui_folder("player"),
      enable_ssl(0),
      ssl_cert_file("cert.pem"),
      ssl_key_file("key.pem"),
      background_file("assets/background.mp3"),
      speech_folder("tts"),
      speech_keep(5),
      voices_file("voices.json"),
      default_voice("en-IN-PrabhatNeural"),
      synth_command("edge-tts --voice {voice} --text {text} --write-media {output}"),
      synth_timeout_sec(60),
      synth_wait_ms(500),
      transcoder_command("ffmpeg -hide_banner -loglevel error -re -i {input} -vn "
                         "-acodec libmp3lame -b:a {bitrate}k -ar {samplerate} "
                         "-ac {channels} -f mp3 pipe:1"),
      stream_bitrate(128),
      sample_rate(44100),
      channels(2),
      chunk_size(4096),
      buffer_chunks(256),
      restart_backoff_ms(1000),
      kill_grace_ms(2000),
      listener_wait_ms(1000),
      max_source_failures(3) {}

static std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool apply_config_value(Config *cfg, const std::string &key, const std::string &val) {
    int n = atoi(val.c_str());
    if (key == "http_port") cfg->http_port = n;
    else if (key == "max_clients") cfg->max_clients = n;
    else if (key == "client_timeout_sec") cfg->client_timeout_sec = n;
    else if (key == "enable_webui") cfg->enable_webui = n;
    else if (key == "webui_folder") cfg->webui_folder = val;
    else if (key == "enable_ssl") cfg->enable_ssl = n;
    else if (key == "ssl_cert_file") cfg->ssl_cert_file = val;
    else if (key == "ssl_key_file") cfg->ssl_key_file = val;
    else if (key == "background_file") cfg->background_file = val;
    else if (key == "speech_folder") cfg->speech_folder = val;
    else if (key == "speech_keep") cfg->speech_keep = n;
    else if (key == "voices_file") cfg->voices_file = val;
    else if (key == "default_voice") cfg->default_voice = val;
    else if (key == "synth_command") cfg->synth_command = val;
    else if (key == "synth_timeout_sec") cfg->synth_timeout_sec = n;
    else if (key == "synth_wait_ms") cfg->synth_wait_ms = n;
    else if (key == "transcoder_command") cfg->transcoder_command = val;
    else if (key == "stream_bitrate") cfg->stream_bitrate = n;
    else if (key == "sample_rate") cfg->sample_rate = n;
    else if (key == "channels") cfg->channels = n;
    else if (key == "chunk_size") cfg->chunk_size = n;
    else if (key == "buffer_chunks") cfg->buffer_chunks = n;
    else if (key == "restart_backoff_ms") cfg->restart_backoff_ms = n;
    else if (key == "kill_grace_ms") cfg->kill_grace_ms = n;
    else if (key == "listener_wait_ms") cfg->listener_wait_ms = n;
    else if (key == "max_source_failures") cfg->max_source_failures = n;
    else return false;
    return true;
}

bool load_config(const char *file, Config *cfg) {
    FILE *f = fopen(file, "r");
    if (!f) { logmsg(LOG_RED, 1, "No config file %s, using defaults\n", file); return false; }
    char line[BUFFER];
    int lineno = 0;
    while (fgets(line, sizeof(line), f)) {
        lineno++;
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        size_t eq = s.find('=');
        if (eq == std::string::npos) {
            logmsg(LOG_YELLOW, 1, "%s:%d: ignoring line without '='\n", file, lineno);
            continue;
        }
        std::string key = trim(s.substr(0, eq));
        std::string val = trim(s.substr(eq + 1));
        if (!apply_config_value(cfg, key, val))
            logmsg(LOG_YELLOW, 1, "%s:%d: unknown key '%s'\n", file, lineno, key.c_str());
    }
    fclose(f);

    if (cfg->speech_keep < 1) cfg->speech_keep = 1;
    if (cfg->chunk_size < 512) cfg->chunk_size = 512;
    if (cfg->buffer_chunks < 2) cfg->buffer_chunks = 2;
    if (cfg->max_clients < 1) cfg->max_clients = 1;
    return true;
}

}  // namespace saycast
