#include <signal.h>

#include <string>

#include "saycast/config.h"
#include "saycast/log.h"
#include "saycast/station.h"
#include "saycast/thread.h"

using namespace saycast;

static volatile sig_atomic_t running = 1;

static void handle_sigint(int sig) { (void)sig; running = 0; }

int main(int argc, char **argv) {
    signal(SIGINT, handle_sigint);
    signal(SIGTERM, handle_sigint);
    signal(SIGPIPE, SIG_IGN);

    title();

    const char *cfg_file = argc > 1 ? argv[1] : "saycast.cfg";
    Config cfg;
    load_config(cfg_file, &cfg);

    Station station(cfg);
    std::string error;
    if (!station.start(&error)) {
        logmsg(LOG_RED, 1, "Cannot start: %s\n", error.c_str());
        return 1;
    }

    while (running)
        msleep(200);

    station.stop();
    logmsg(LOG_GREEN, 1, "Bye\n");
    return 0;
}
