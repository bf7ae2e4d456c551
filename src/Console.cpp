#include "../include/Console.hpp"
#include <iostream>
#include <ostream>
#ifndef _WIN32
#include <unistd.h>
#include <sys/ioctl.h>
#endif

using namespace packager;
using namespace std;

int Console::terminal_width() {
    int term_width = 80;
#ifndef _WIN32
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        term_width = w.ws_col;
    }
#endif
    return term_width;
}

bool Console::colors_enabled(const ostream &log) {
#ifdef _WIN32
    (void) log;
    return false;
#else
    return &log == &cout && isatty(STDOUT_FILENO) == 1;
#endif
}

void Console::status(ostream &log, const string &msg, const string &state, const bool error) {
    const bool color = colors_enabled(log);
    const int term_width = color ? terminal_width() : 80;

    // Colors: Stars (Green), Brackets (White), Status (Green/Red)
    const string star = color ? "\033[32m*\033[0m" : "*";
    const string open = color ? "\033[37m[\033[0m" : "[";
    const string close = color ? "\033[37m]\033[0m" : "]";
    string status_text = state;
    if (color) status_text = error ? "\033[31;1m" + state + "\033[0m" : "\033[32;1m" + state + "\033[0m";
    const string status_block = " " + open + " " + status_text + " " + close;

    const int msg_display_len = 3 + static_cast<int>(msg.length());
    int padding = term_width - msg_display_len - static_cast<int>(state.length()) - 5;
    if (padding < 1) padding = 1;

    log << " " << star << " " << msg;
    for (int i = 0; i < padding; ++i) log << " ";
    log << status_block << endl;
}

void Console::info(ostream &log, const string &msg) {
    const string star = colors_enabled(log) ? "\033[32m*\033[0m" : "*";
    log << " " << star << " " << msg << endl;
}
