/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef UTILS_H
#define UTILS_H

#include <Config.hpp>
#include <stdio.h>
#include <string>

// Console trace for the bridge. Off when DEBUGMODE is false.
#ifndef DEBUGMODE
#define DEBUGMODE true
#endif

namespace Debug {
    void begin(FILE* out = stdout);     // Console stream (stdout by default)

    void println(const char* s);
    void println(const std::string& s);
    void println();
    void printf(const char* fmt, ...);

    /**
     * @brief Hold the console for the calling thread.
     *
     * Lines from this thread are buffered until groupStop() writes them in
     * one burst; other threads wait for the release.
     */
    void groupStart();
    void groupStop(bool addTrailingNewline = false);
}

#if DEBUGMODE
    #define DEBUG_PRINTLN(...)    Debug::println(__VA_ARGS__)
    #define DEBUG_PRINTF(...)     Debug::printf(__VA_ARGS__)
    #define DEBUGGSTART()         Debug::groupStart()
    #define DEBUGGSTOP()          Debug::groupStop(false)
#else
    #define DEBUG_PRINTLN(...)    do {} while (0)
    #define DEBUG_PRINTF(...)     do {} while (0)
    #define DEBUGGSTART()         do {} while (0)
    #define DEBUGGSTOP()          do {} while (0)
#endif

#endif // UTILS_H
