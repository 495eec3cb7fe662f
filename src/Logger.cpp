#include "Logger.h"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <sys/time.h>

static int verbosity_level = 0;
static double start_time = getAbsoluteTime();

void setVerbosityLevel(int level) {
    verbosity_level = level;
}

double getAbsoluteTime() {
    timeval time;
    gettimeofday(&time, NULL);
    return (double)time.tv_sec + (double)time.tv_usec * .000001;
}

double getTime() {
    return getAbsoluteTime() - start_time;
}

void log(int verbosityLevel, const char* fmt ...) {
    if (verbosityLevel <= verbosity_level) {
        va_list args;
        va_start(args, fmt);
        printf("[%.3f] ", getTime());
        vprintf(fmt, args);
        va_end(args);
        fflush(stdout);
    }
}

void exitError(const char* fmt ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "[%.3f] Error: ", getTime());
    vfprintf(stderr, fmt, args);
    va_end(args);
    fflush(stderr);
    exit(1);
}
