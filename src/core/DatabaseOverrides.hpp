#pragma once
#include <istream>
#include <string>
#include <vector>
#include "Database.hpp"

namespace whodat {

/**
 * Reader for the line-based override file.
 *
 *   # comment
 *   0003:054c:09cc = gamepad | gamepad | hid-device
 *   *:046d:c52b    = mouse   |         | usb-device
 *   0005:*         =         |         | uniq
 *
 * Key is bus:vendor:product in hex, with '*' for any bus or for a bus-only
 * default. Value is physical type, comma-separated capabilities and the
 * grouping rule; empty fields mean none. Malformed lines are skipped and
 * reported.
 */
class DatabaseOverrides {
public:
    struct Problem {
        int line;
        std::string message;
    };

    static OverrideTable parse(std::istream& in, std::vector<Problem>* problems = nullptr);

    // Throws std::runtime_error if the file cannot be opened
    static OverrideTable loadFile(const std::string& path);
};

} // namespace whodat
