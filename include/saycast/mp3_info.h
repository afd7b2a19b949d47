#ifndef SAYCAST_MP3_INFO_H
#define SAYCAST_MP3_INFO_H

#include <string>

namespace saycast {

struct Mp3Header {
    Mp3Header() : version(0), layer(0), bitrate_kbps(0), samplerate(0), channel_mode(0) {}

    int version;       // 3 = MPEG1, 2 = MPEG2, 0 = MPEG2.5
    int layer;
    int bitrate_kbps;
    int samplerate;
    int channel_mode;  // 3 = mono
};

// Decodes a 4 byte frame header. Returns false when hdr is not a sync word
// or carries reserved values.
bool parse_mp3_header(const unsigned char *hdr, Mp3Header *out);

// Playing time in seconds. Uses the Xing/Info or VBRI frame count when
// present, otherwise file size over the first frame's bitrate. 0 if unknown.
int mp3_duration(const std::string &filename);

}  // namespace saycast

#endif  // SAYCAST_MP3_INFO_H
