/*=============================================================================

  DIVSIM - Diversification simulator
  Logging

=============================================================================*/

#ifndef DIVSIM_LOGGING_H
#define DIVSIM_LOGGING_H

#include <stdio.h>
#include <time.h>


namespace divsim {

// logging levels
enum {
    LOG_QUIET=0,
    LOG_LOW,
    LOG_MEDIUM,
    LOG_HIGH
};


void printError(const char *fmt, ...);
void printWarning(const char *fmt, ...);
void printLog(int level, const char *fmt, ...);

bool openLogFile(const char *filename);
void openLogFile(FILE *stream);
void closeLogFile();
FILE *getLogFile();

void setLogLevel(int level);
int getLogLevel();
bool isLogLevel(int level);


// processor time stopwatch
class Timer
{
public:
    Timer(bool begin=true) :
        start_time(0),
        total(0),
        running(false)
    {
        if (begin)
            start();
    }

    void start()
    {
        running = true;
        start_time = clock();
    }

    clock_t stop()
    {
        clock_t d = clock() - start_time;
        if (running)
            total += d;
        running = false;
        return d;
    }

    // elapsed seconds since start
    float time()
    {
        return float(clock() - start_time) / CLOCKS_PER_SEC;
    }

    float totalTime()
    {
        return float(total) / CLOCKS_PER_SEC;
    }

    clock_t start_time;
    clock_t total;
    bool running;
};


} // namespace divsim

#endif // DIVSIM_LOGGING_H
