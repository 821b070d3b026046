/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#include <Utils.hpp>

#include <stdarg.h>
#include <string.h>
#include <condition_variable>
#include <mutex>
#include <thread>

#define DBG_LINE_MAX        1024    // One formatted line
#define DBG_GROUP_MAX       8192    // Buffered burst before an early flush

namespace {

FILE*                   s_console = stdout;
std::mutex              s_consoleMtx;

std::mutex              s_burstMtx;
std::condition_variable s_burstCv;
bool                    s_burstOpen = false;
std::thread::id         s_burstOwner;
std::string             s_burst;

void write_(const char* data, size_t n, bool nl) {
    std::lock_guard<std::mutex> lk(s_consoleMtx);
    if (n) fwrite(data, 1, n, s_console);
    if (nl) fputc('\n', s_console);
    fflush(s_console);
}

void flushBurst_(bool nl) {
    write_(s_burst.data(), s_burst.size(), nl);
    s_burst.clear();
}

void emit_(const char* s, bool nl) {
    if (!s) s = "";
    const size_t n = strnlen(s, DBG_LINE_MAX - 1);

    std::unique_lock<std::mutex> lk(s_burstMtx);
    if (s_burstOpen && s_burstOwner == std::this_thread::get_id()) {
        if (s_burst.size() + n + 1 > DBG_GROUP_MAX) flushBurst_(false);
        s_burst.append(s, n);
        if (nl) s_burst.push_back('\n');
        return;
    }
    s_burstCv.wait(lk, [] { return !s_burstOpen; });
    write_(s, n, nl);
}

} // namespace

namespace Debug {

void begin(FILE* out) {
    std::lock_guard<std::mutex> lk(s_consoleMtx);
    s_console = out ? out : stdout;
}

void println(const char* s)         { emit_(s, true); }
void println(const std::string& s)  { emit_(s.c_str(), true); }
void println()                      { emit_("", true); }

void printf(const char* fmt, ...) {
    char line[DBG_LINE_MAX];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(line, sizeof(line), fmt ? fmt : "", ap);
    va_end(ap);
    emit_(line, false);
}

void groupStart() {
    std::unique_lock<std::mutex> lk(s_burstMtx);
    const std::thread::id me = std::this_thread::get_id();
    if (s_burstOpen && s_burstOwner == me) return;

    s_burstCv.wait(lk, [] { return !s_burstOpen; });
    s_burstOpen  = true;
    s_burstOwner = me;
    s_burst.clear();
}

void groupStop(bool addTrailingNewline) {
    {
        std::lock_guard<std::mutex> lk(s_burstMtx);
        if (!s_burstOpen || s_burstOwner != std::this_thread::get_id()) return;
        flushBurst_(addTrailingNewline);
        s_burstOpen  = false;
        s_burstOwner = std::thread::id();
    }
    s_burstCv.notify_all();
}

} // namespace Debug
