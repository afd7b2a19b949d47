#ifndef SAYCAST_LOG_H
#define SAYCAST_LOG_H

#include <stdarg.h>

namespace saycast {

enum LogColorLevel {
    LOG_RED,
    LOG_GREEN,
    LOG_YELLOW,
    LOG_BLUE,
    LOG_PURPLE,
    LOG_CYAN,
    LOG_WHITE
};

void title();

// printf-style console log. timed=1 prefixes "[dd.mm.YYYY / HH:MM:SS]: ".
// Safe to call from any thread, lines never interleave.
void logmsg(LogColorLevel level, int timed, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

void vlogmsg(LogColorLevel level, int timed, const char *fmt, va_list args);

// Tests run with the console silenced.
void log_set_quiet(bool quiet);

}  // namespace saycast

#endif  // SAYCAST_LOG_H
