#include "saycast/log.h"

#include <stdio.h>
#include <time.h>
#include <pthread.h>

#define RESET       "\033[0m"
#define RED         "\033[1;31m"
#define GREEN       "\033[1;32m"
#define BLUE        "\033[1;34m"
#define YELLOW      "\033[1;33m"
#define CYAN        "\033[1;36m"

namespace saycast {

static pthread_mutex_t log_lock = PTHREAD_MUTEX_INITIALIZER;
static bool log_quiet = false;

void title() {
    printf(YELLOW "=====================================================================\n" RESET);
    printf(YELLOW "| " RESET);
    printf(RED "SAYCAST " RESET);
    printf(GREEN "SPEECH " RESET);
    printf(CYAN "RADIO " RESET);
    printf(YELLOW "| " RESET);
    printf(BLUE "  Text to speech over a shared live MP3 stream" RESET);
    printf(YELLOW " |\n" RESET);
    printf(YELLOW "=====================================================================\n\n" RESET);
}

void log_set_quiet(bool quiet) {
    pthread_mutex_lock(&log_lock);
    log_quiet = quiet;
    pthread_mutex_unlock(&log_lock);
}

void vlogmsg(LogColorLevel level, int timed, const char *fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestr[64];
    strftime(timestr, sizeof(timestr), "[%d.%m.%Y / %H:%M:%S]: ", &t);

    const char *color = "\033[0m";
    switch (level) {
        case LOG_RED: color = "\033[31m"; break;
        case LOG_GREEN: color = "\033[32m"; break;
        case LOG_YELLOW: color = "\033[33m"; break;
        case LOG_BLUE: color = "\033[34m"; break;
        case LOG_PURPLE: color = "\033[35m"; break;
        case LOG_CYAN: color = "\033[36m"; break;
        case LOG_WHITE: color = "\033[37m"; break;
    }

    pthread_mutex_lock(&log_lock);
    if (!log_quiet) {
        if (timed == 1)
            printf("%s%s", color, timestr);
        else
            printf("%s", color);
        vprintf(fmt, args);
        printf("\033[0m");
        fflush(stdout);
    }
    pthread_mutex_unlock(&log_lock);
}

void logmsg(LogColorLevel level, int timed, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlogmsg(level, timed, fmt, args);
    va_end(args);
}

}  // namespace saycast
