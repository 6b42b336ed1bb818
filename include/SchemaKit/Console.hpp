#pragma once

#include <string>

namespace SchemaKit {

/**
 * \brief Colored status lines for the command line tool.
 *
 * info (green) and debug (yellow) go to std::cout, error (red) to std::cerr.
 * Colors are only emitted when the stream is attached to a terminal.
 */
class Console {
public:
    static void info(const std::string& message);
    static void debug(const std::string& message);
    static void error(const std::string& message);
};

} // namespace SchemaKit
