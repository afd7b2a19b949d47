#ifndef SAYCAST_CONFIG_H
#define SAYCAST_CONFIG_H

#include <string>

namespace saycast {

struct Config {
    Config();

    int http_port;
    int max_clients;
    int client_timeout_sec;
    int enable_webui;
    std::string webui_folder;
    int enable_ssl;
    std::string ssl_cert_file;
    std::string ssl_key_file;

    std::string background_file;
    std::string speech_folder;
    int speech_keep;
    std::string voices_file;
    std::string default_voice;

    std::string synth_command;
    int synth_timeout_sec;
    int synth_wait_ms;

    std::string transcoder_command;
    int stream_bitrate;
    int sample_rate;
    int channels;
    int chunk_size;
    int buffer_chunks;
    int restart_backoff_ms;
    int kill_grace_ms;
    int listener_wait_ms;
    int max_source_failures;
};

// Reads key=value lines into cfg. Keys not present keep their defaults.
// Returns false when the file cannot be opened.
bool load_config(const char *file, Config *cfg);

// Applies one key=value pair. Returns false for unknown keys.
bool apply_config_value(Config *cfg, const std::string &key, const std::string &val);

}  // namespace saycast

#endif  // SAYCAST_CONFIG_H
