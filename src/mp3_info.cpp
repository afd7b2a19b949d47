#include "saycast/mp3_info.h"

#include <stdio.h>
#include <string.h>

namespace saycast {

namespace {

const int sr_tbl_mpeg1[4] = {44100, 48000, 32000, 0};
const int sr_tbl_mpeg2[4] = {22050, 24000, 16000, 0};
const int sr_tbl_mpeg25[4] = {11025, 12000, 8000, 0};

const int br_tbl_mpeg1[16] = {0,32,40,48,56,64,80,96,112,128,160,192,224,256,320,0};
const int br_tbl_mpeg2[16] = {0,8,16,24,32,40,48,56,64,80,96,112,128,144,160,0};

class FileCloser {
public:
    explicit FileCloser(FILE *f) : f_(f) {}
    ~FileCloser() { if (f_) fclose(f_); }

private:
    FILE *f_;
};

unsigned int be32(const unsigned char *b) {
    return ((unsigned int)b[0] << 24) | ((unsigned int)b[1] << 16) | ((unsigned int)b[2] << 8) | b[3];
}

}  // namespace

bool parse_mp3_header(const unsigned char *hdr, Mp3Header *out) {
    if (hdr[0] != 0xFF || (hdr[1] & 0xE0) != 0xE0) return false;

    Mp3Header h;
    h.version      = (hdr[1] >> 3) & 3;
    h.layer        = (hdr[1] >> 1) & 3;
    int br_index   = (hdr[2] >> 4) & 0x0F;
    int sr_index   = (hdr[2] >> 2) & 0x03;
    h.channel_mode = (hdr[3] >> 6) & 0x03;

    if (h.version == 1 || h.layer == 0 || sr_index == 3) return false;

    if (h.version == 3) h.samplerate = sr_tbl_mpeg1[sr_index];
    else if (h.version == 2) h.samplerate = sr_tbl_mpeg2[sr_index];
    else h.samplerate = sr_tbl_mpeg25[sr_index];

    h.bitrate_kbps = (h.version == 3) ? br_tbl_mpeg1[br_index] : br_tbl_mpeg2[br_index];
    *out = h;
    return true;
}

int mp3_duration(const std::string &filename) {
    if (filename.empty()) return 0;

    FILE *f = fopen(filename.c_str(), "rb");
    if (!f) return 0;
    FileCloser closer(f);

    fseek(f, 0, SEEK_END);
    long filesize = ftell(f);
    fseek(f, 0, SEEK_SET);
    if (filesize <= 0) return 0;

    unsigned char header[10];
    if (fread(header, 1, 10, f) == 10 && memcmp(header, "ID3", 3) == 0) {
        int tagSize = (header[6] & 0x7F) << 21 |
                      (header[7] & 0x7F) << 14 |
                      (header[8] & 0x7F) << 7  |
                      (header[9] & 0x7F);
        fseek(f, 10 + tagSize, SEEK_SET);
    } else {
        fseek(f, 0, SEEK_SET);
    }

    unsigned char hdr[4];
    Mp3Header h;
    bool found = false;
    while (fread(hdr, 1, 4, f) == 4) {
        if (parse_mp3_header(hdr, &h)) {
            found = true;
            break;
        }
        fseek(f, -3, SEEK_CUR);
    }
    if (!found || h.samplerate <= 0) return 0;

    int samples_per_frame = (h.version == 3) ? 1152 : 576;
    int sideinfo = (h.version == 3) ? ((h.channel_mode == 3) ? 17 : 32)
                                    : ((h.channel_mode == 3) ? 9  : 17);

    // Xing/Info tag sits right after the side info of the first frame.
    long frame_start = ftell(f) - 4;
    fseek(f, frame_start + 4 + sideinfo, SEEK_SET);
    unsigned char tag[12];
    if (fread(tag, 1, 12, f) == 12 && (!memcmp(tag, "Xing", 4) || !memcmp(tag, "Info", 4))) {
        unsigned int flags = be32(tag + 4);
        if (flags & 0x0001) {
            unsigned int frames = be32(tag + 8);
            if (frames > 0)
                return (int)((long)frames * samples_per_frame / h.samplerate);
        }
    }

    // VBRI is always 32 bytes past the frame header.
    fseek(f, frame_start + 4 + 32, SEEK_SET);
    unsigned char vbri[18];
    if (fread(vbri, 1, 18, f) == 18 && !memcmp(vbri, "VBRI", 4)) {
        unsigned int frames = be32(vbri + 14);
        if (frames > 0)
            return (int)((long)frames * samples_per_frame / h.samplerate);
    }

    if (h.bitrate_kbps > 0)
        return (int)((filesize * 8) / (h.bitrate_kbps * 1000L));
    return 0;
}

}  // namespace saycast
