#pragma once
#include <iosfwd>
#include <string>

namespace packager {
    // OpenRC-style status lines:  * message ............ [ ok ]
    // Colour is only emitted when writing to std::cout attached to a terminal.
    class Console {
    public:
        static void status(std::ostream &log, const std::string &msg, const std::string &state, bool error = false);

        // Plain "* message" line without a status block.
        static void info(std::ostream &log, const std::string &msg);

        [[nodiscard]] static bool colors_enabled(const std::ostream &log);

        [[nodiscard]] static int terminal_width();
    };
} // namespace packager
