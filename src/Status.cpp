#include "../include/Status.hpp"
#include "../include/Report.hpp"
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {
    int terminal_width(const int fd) {
        winsize w{};
        if (fd >= 0 && isatty(fd) && ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            return w.ws_col;
        }
        return 80;
    }

    // Colors only when the stream is a terminal, so captured logs stay plain.
    bool use_color(const int fd) {
        return fd >= 0 && isatty(fd) != 0;
    }
} // namespace

int prefixrun::stream_descriptor(const std::ostream &os) {
    if (&os == &std::cout) return STDOUT_FILENO;
    if (&os == &std::cerr || &os == &std::clog) return STDERR_FILENO;
    return -1;
}

void prefixrun::print_status(std::ostream &log, const std::string &msg, const std::string &status, const bool error) {
    const int fd = stream_descriptor(log);
    const bool color = use_color(fd);
    const std::string star = color ? "\033[32m*\033[0m" : "*";
    const std::string open = color ? "\033[37m[\033[0m" : "[";
    const std::string close = color ? "\033[37m]\033[0m" : "]";
    std::string status_text = status;
    if (color) status_text = (error ? "\033[31;1m" : "\033[32;1m") + status + "\033[0m";
    const std::string status_block = " " + open + " " + status_text + " " + close;

    const int msg_display_len = 3 + static_cast<int>(display_width(msg));
    const int status_display_len = 5 + static_cast<int>(display_width(status));
    int padding = terminal_width(fd) - msg_display_len - status_display_len;
    if (padding < 1) padding = 1;

    log << " " << star << " " << msg << std::string(static_cast<size_t>(padding), ' ') << status_block << std::endl;
}

void prefixrun::print_info(std::ostream &log, const std::string &msg) {
    const std::string star = use_color(stream_descriptor(log)) ? "\033[32m*\033[0m" : "*";
    log << " " << star << " " << msg << std::endl;
}
