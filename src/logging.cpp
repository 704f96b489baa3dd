/*=============================================================================

  DIVSIM - Diversification simulator
  Logging

=============================================================================*/

#include <stdarg.h>
#include <stdio.h>

#include "logging.h"


namespace divsim {

// log state
static int g_loglevel = LOG_QUIET;
static FILE *g_logstream = stderr;
static bool g_logowned = false;


void printError(const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);

    fprintf(stderr, "error: ");
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
    va_end(ap);

    // mirror into the log file when one is open
    if (g_logstream != stderr) {
        va_start(ap, fmt);
        fprintf(g_logstream, "error: ");
        vfprintf(g_logstream, fmt, ap);
        fprintf(g_logstream, "\n");
        va_end(ap);
    }
}


void printWarning(const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);

    fprintf(stderr, "warning: ");
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
    va_end(ap);

    if (g_logstream != stderr) {
        va_start(ap, fmt);
        fprintf(g_logstream, "warning: ");
        vfprintf(g_logstream, fmt, ap);
        fprintf(g_logstream, "\n");
        va_end(ap);
    }
}


void printLog(int level, const char *fmt, ...)
{
    if (level > g_loglevel)
        return;

    va_list ap;
    va_start(ap, fmt);
    vfprintf(g_logstream, fmt, ap);
    va_end(ap);
    fflush(g_logstream);
}


bool openLogFile(const char *filename)
{
    FILE *stream = fopen(filename, "w");

    if (stream == NULL) {
        printError("cannot open log file '%s'", filename);
        return false;
    }

    closeLogFile();
    g_logstream = stream;
    g_logowned = true;
    return true;
}


void openLogFile(FILE *stream)
{
    closeLogFile();
    g_logstream = stream;
    g_logowned = false;
}


void closeLogFile()
{
    if (g_logowned)
        fclose(g_logstream);
    g_logstream = stderr;
    g_logowned = false;
}


FILE *getLogFile()
{
    return g_logstream;
}


void setLogLevel(int level)
{
    g_loglevel = level;
}

int getLogLevel()
{
    return g_loglevel;
}

bool isLogLevel(int level)
{
    return level <= g_loglevel;
}


} // namespace divsim
