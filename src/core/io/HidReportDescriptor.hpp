#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "RawDeviceInfo.hpp"

namespace whodat {

/**
 * Minimal HID report descriptor walker.
 *
 * Only the items needed for classification are interpreted: Usage Page
 * (global), Usage (local, including 32-bit extended usages) and
 * Collection/End Collection (main). Everything else is skipped by size.
 */
class HidReportDescriptor {
public:
    struct Summary {
        std::vector<HidUsage> applications;  // top-level application collections, in order
        std::vector<uint16_t> usagePages;    // every usage page referenced, in first-seen order
    };

    // Returns std::nullopt and fills error when the descriptor is truncated
    // or its collections are unbalanced.
    static std::optional<Summary> parse(const uint8_t* data, size_t size, std::string* error = nullptr);
    static std::optional<Summary> parse(const std::vector<uint8_t>& data, std::string* error = nullptr) {
        return parse(data.data(), data.size(), error);
    }
};

} // namespace whodat
