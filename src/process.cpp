#include "saycast/process.h"

#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include "saycast/thread.h"

namespace saycast {

const ssize_t Process::kTimedOut;

std::string ExitStatus::describe() const {
    char buf[64];
    if (exited) snprintf(buf, sizeof(buf), "exit code %d", code);
    else if (signaled) snprintf(buf, sizeof(buf), "killed by signal %d", signal);
    else snprintf(buf, sizeof(buf), "not started");
    return buf;
}

std::vector<std::string> expand_command(const std::string &tmpl,
                                        const std::vector<std::pair<std::string, std::string> > &vars) {
    std::vector<std::string> argv;
    size_t i = 0;
    while (i < tmpl.size()) {
        while (i < tmpl.size() && isspace((unsigned char)tmpl[i])) i++;
        if (i >= tmpl.size()) break;
        size_t start = i;
        while (i < tmpl.size() && !isspace((unsigned char)tmpl[i])) i++;
        std::string word = tmpl.substr(start, i - start);
        for (size_t v = 0; v < vars.size(); v++) {
            const std::string key = "{" + vars[v].first + "}";
            size_t pos = 0;
            while ((pos = word.find(key, pos)) != std::string::npos) {
                word.replace(pos, key.size(), vars[v].second);
                pos += vars[v].second.size();
            }
        }
        argv.push_back(word);
    }
    return argv;
}

static void decode_status(int raw, ExitStatus *st) {
    if (WIFEXITED(raw)) {
        st->exited = true;
        st->code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        st->signaled = true;
        st->signal = WTERMSIG(raw);
    }
}

Process::Process() : pid_(0), out_fd_(-1) {}

Process::~Process() {
    if (pid_ > 0) terminate(1000);
    close_pipe();
}

void Process::close_pipe() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

bool Process::start(const std::vector<std::string> &argv, std::string *error) {
    if (pid_ > 0) {
        if (error) *error = "process already running";
        return false;
    }
    if (argv.empty()) {
        if (error) *error = "empty command";
        return false;
    }
    status_ = ExitStatus();

    int outp[2], errp[2];
    if (pipe2(outp, O_CLOEXEC) != 0) {
        if (error) *error = std::string("pipe: ") + strerror(errno);
        return false;
    }
    if (pipe2(errp, O_CLOEXEC) != 0) {
        if (error) *error = std::string("pipe: ") + strerror(errno);
        close(outp[0]); close(outp[1]);
        return false;
    }

    std::vector<char *> args;
    for (size_t i = 0; i < argv.size(); i++) args.push_back(const_cast<char *>(argv[i].c_str()));
    args.push_back(NULL);

    pid_t pid = fork();
    if (pid < 0) {
        if (error) *error = std::string("fork: ") + strerror(errno);
        close(outp[0]); close(outp[1]); close(errp[0]); close(errp[1]);
        return false;
    }

    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(outp[1], STDOUT_FILENO);
        execvp(args[0], &args[0]);
        int err = errno;
        ssize_t w = write(errp[1], &err, sizeof(err));
        (void)w;
        _exit(127);
    }

    close(outp[1]);
    close(errp[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(errp[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(errp[0]);

    pid_ = pid;
    out_fd_ = outp[0];

    if (n == (ssize_t)sizeof(child_errno)) {
        wait();
        if (error) *error = "cannot execute " + argv[0] + ": " + strerror(child_errno);
        return false;
    }
    return true;
}

ssize_t Process::read_some(unsigned char *buf, size_t len, int timeout_ms) {
    if (out_fd_ < 0) return 0;
    struct pollfd pfd;
    pfd.fd = out_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int r;
    do {
        r = poll(&pfd, 1, timeout_ms);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return kTimedOut;
    if (r < 0) return -1;

    ssize_t n;
    do {
        n = read(out_fd_, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

ssize_t Process::read_full(unsigned char *buf, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = read_some(buf + got, len - got, -1);
        if (n == kTimedOut) continue;
        if (n < 0) return -1;
        if (n == 0) break;
        got += (size_t)n;
    }
    return (ssize_t)got;
}

void Process::terminate(int grace_ms) {
    if (pid_ <= 0) return;
    close_pipe();
    kill(pid_, SIGTERM);

    int raw = 0;
    int64_t deadline = monotonic_ms() + grace_ms;
    for (;;) {
        pid_t r = waitpid(pid_, &raw, WNOHANG);
        if (r == pid_) {
            decode_status(raw, &status_);
            pid_ = 0;
            return;
        }
        if (r < 0 && errno != EINTR) {
            pid_ = 0;
            return;
        }
        if (monotonic_ms() >= deadline) break;
        msleep(10);
    }

    kill(pid_, SIGKILL);
    while (waitpid(pid_, &raw, 0) < 0) {
        if (errno != EINTR) {
            pid_ = 0;
            return;
        }
    }
    decode_status(raw, &status_);
    pid_ = 0;
}

ExitStatus Process::wait() {
    if (pid_ <= 0) return status_;
    int raw = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &raw, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) decode_status(raw, &status_);
    pid_ = 0;
    close_pipe();
    return status_;
}

}  // namespace saycast
