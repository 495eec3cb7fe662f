#pragma once

void setVerbosityLevel(int level);

double getAbsoluteTime();

// seconds since the program started
double getTime();

/**
 * Printf-style logging, prefixed with the elapsed time. Messages with a
 * verbosity above the current level are dropped.
 */
void log(int verbosityLevel, const char* fmt ...);

void exitError(const char* fmt ...);
