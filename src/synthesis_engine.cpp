#include "saycast/synthesis_engine.h"

#include <vector>

#include "saycast/log.h"
#include "saycast/process.h"
#include "saycast/thread.h"

namespace saycast {

// First line of the command's output, with anything outside printable
// ASCII replaced, ready to go into a JSON error.
static std::string first_line(const std::string &captured) {
    std::string line = captured.substr(0, captured.find('\n'));
    for (size_t i = 0; i < line.size(); i++) {
        unsigned char c = (unsigned char)line[i];
        if (c < 0x20 || c > 0x7e) line[i] = '?';
    }
    return line;
}

CommandSynthesisEngine::CommandSynthesisEngine(const std::string &command_template,
                                               int timeout_sec, int kill_grace_ms)
    : command_template_(command_template),
      timeout_sec_(timeout_sec),
      kill_grace_ms_(kill_grace_ms) {}

bool CommandSynthesisEngine::synthesize(const std::string &text, const std::string &voice_id,
                                        const std::string &output_path, std::string *error) {
    if (text.empty()) {
        if (error) *error = "Missing text";
        return false;
    }

    std::vector<std::pair<std::string, std::string> > vars;
    vars.push_back(std::make_pair(std::string("text"), text));
    vars.push_back(std::make_pair(std::string("voice"), voice_id));
    vars.push_back(std::make_pair(std::string("output"), output_path));
    std::vector<std::string> argv = expand_command(command_template_, vars);

    Process proc;
    if (!proc.start(argv, error)) return false;

    // The command's stdout is only kept for the error message.
    std::string captured;
    unsigned char buf[1024];
    int64_t deadline = monotonic_ms() + (int64_t)timeout_sec_ * 1000;
    for (;;) {
        int64_t left = deadline - monotonic_ms();
        if (left <= 0) {
            proc.terminate(kill_grace_ms_);
            if (error) *error = "synthesis timed out";
            return false;
        }
        ssize_t n = proc.read_some(buf, sizeof(buf), (int)left);
        if (n == 0) break;
        if (n == Process::kTimedOut) continue;
        if (n < 0) {
            proc.terminate(kill_grace_ms_);
            if (error) *error = "lost the synthesis command's output";
            return false;
        }
        if (captured.size() < 512) captured.append((const char *)buf, (size_t)n);
    }

    ExitStatus st = proc.wait();
    if (!st.ok()) {
        if (error) {
            *error = argv[0] + " failed (" + st.describe() + ")";
            if (!captured.empty()) *error += ": " + first_line(captured);
        }
        return false;
    }
    return true;
}

}  // namespace saycast
