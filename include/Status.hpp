#pragma once
#include <iosfwd>
#include <string>

namespace prefixrun {
    // File descriptor behind std::cout, std::cerr or std::clog; -1 for any other stream.
    [[nodiscard]] int stream_descriptor(const std::ostream &os);

    // OpenRC style status line: " * message ........ [ ok ]"
    // Colors and terminal width come from the descriptor behind log; other streams get plain 80 columns.
    void print_status(std::ostream &log, const std::string &msg, const std::string &status, bool error = false);

    // Plain " * message" line without a status block.
    void print_info(std::ostream &log, const std::string &msg);
} // namespace prefixrun
