#ifndef SAYCAST_PROCESS_H
#define SAYCAST_PROCESS_H

#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace saycast {

struct ExitStatus {
    ExitStatus() : exited(false), code(-1), signaled(false), signal(0) {}

    bool exited;
    int code;
    bool signaled;
    int signal;

    bool ok() const { return exited && code == 0; }
    std::string describe() const;
};

// Splits a command template on whitespace and substitutes {name}
// placeholders inside each word. Values are never re-split, so a file name
// containing spaces stays one argument.
std::vector<std::string> expand_command(const std::string &tmpl,
                                        const std::vector<std::pair<std::string, std::string> > &vars);

// One child process with its stdout captured through a pipe. stdin is
// /dev/null, stderr is inherited. The destructor terminates a child that is
// still running.
class Process {
public:
    Process();
    ~Process();

    // Fails when fork fails or the program cannot be executed.
    bool start(const std::vector<std::string> &argv, std::string *error);

    static const ssize_t kTimedOut = -2;

    // Waits up to timeout_ms (negative: forever) for output.
    // Returns >0 bytes read, 0 on end of stream, -1 on error, kTimedOut.
    ssize_t read_some(unsigned char *buf, size_t len, int timeout_ms);

    // Reads until len bytes arrived or the stream ended.
    // Returns the byte count, -1 on a read error.
    ssize_t read_full(unsigned char *buf, size_t len);

    // SIGTERM, then SIGKILL when the child outlives grace_ms. Reaps it.
    void terminate(int grace_ms);

    // Blocks until the child exits.
    ExitStatus wait();

    bool running() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }

private:
    Process(const Process &);
    Process &operator=(const Process &);

    void close_pipe();

    pid_t pid_;
    int out_fd_;
    ExitStatus status_;
};

}  // namespace saycast

#endif  // SAYCAST_PROCESS_H
