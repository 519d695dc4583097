#include "HidReportDescriptor.hpp"
#include <algorithm>

namespace whodat {

namespace {

enum ItemType : uint8_t {
    ITEM_MAIN = 0,
    ITEM_GLOBAL = 1,
    ITEM_LOCAL = 2,
};

constexpr uint8_t LONG_ITEM_PREFIX = 0xfe;

constexpr uint8_t MAIN_COLLECTION = 0x0a;
constexpr uint8_t MAIN_END_COLLECTION = 0x0c;
constexpr uint8_t GLOBAL_USAGE_PAGE = 0x00;
constexpr uint8_t GLOBAL_PUSH = 0x0a;
constexpr uint8_t GLOBAL_POP = 0x0b;
constexpr uint8_t LOCAL_USAGE = 0x00;

constexpr uint32_t COLLECTION_APPLICATION = 0x01;

void addPage(std::vector<uint16_t>& pages, uint16_t page) {
    if (std::find(pages.begin(), pages.end(), page) == pages.end()) {
        pages.push_back(page);
    }
}

std::nullopt_t fail(std::string* error, const std::string& message) {
    if (error) *error = message;
    return std::nullopt;
}

} // namespace

std::optional<HidReportDescriptor::Summary> HidReportDescriptor::parse(
    const uint8_t* data, size_t size, std::string* error) {
    Summary summary;
    uint16_t usagePage = 0;
    std::vector<uint16_t> pageStack;
    std::vector<uint32_t> usages;  // page << 16 | usage
    int depth = 0;

    size_t pos = 0;
    while (pos < size) {
        uint8_t prefix = data[pos++];

        if (prefix == LONG_ITEM_PREFIX) {
            if (pos + 2 > size) {
                return fail(error, "truncated long item at offset " + std::to_string(pos - 1));
            }
            size_t dataSize = data[pos];
            pos += 2 + dataSize;
            if (pos > size) {
                return fail(error, "long item overruns descriptor");
            }
            continue;
        }

        size_t len = prefix & 0x03;
        if (len == 3) len = 4;
        if (pos + len > size) {
            return fail(error, "truncated item at offset " + std::to_string(pos - 1));
        }

        uint32_t value = 0;
        for (size_t i = 0; i < len; i++) {
            value |= static_cast<uint32_t>(data[pos + i]) << (8 * i);
        }
        pos += len;

        uint8_t type = (prefix >> 2) & 0x03;
        uint8_t tag = (prefix >> 4) & 0x0f;

        switch (type) {
            case ITEM_GLOBAL:
                if (tag == GLOBAL_USAGE_PAGE) {
                    usagePage = static_cast<uint16_t>(value);
                    addPage(summary.usagePages, usagePage);
                } else if (tag == GLOBAL_PUSH) {
                    pageStack.push_back(usagePage);
                } else if (tag == GLOBAL_POP) {
                    if (pageStack.empty()) {
                        return fail(error, "pop without push");
                    }
                    usagePage = pageStack.back();
                    pageStack.pop_back();
                }
                break;

            case ITEM_LOCAL:
                if (tag == LOCAL_USAGE) {
                    if (len == 4) {
                        usages.push_back(value);
                        addPage(summary.usagePages, static_cast<uint16_t>(value >> 16));
                    } else {
                        usages.push_back((static_cast<uint32_t>(usagePage) << 16) | value);
                    }
                }
                break;

            case ITEM_MAIN:
                if (tag == MAIN_COLLECTION) {
                    if (depth == 0 && value == COLLECTION_APPLICATION && !usages.empty()) {
                        uint32_t u = usages.front();
                        summary.applications.push_back(
                            HidUsage{static_cast<uint16_t>(u >> 16), static_cast<uint16_t>(u & 0xffff)});
                    }
                    depth++;
                } else if (tag == MAIN_END_COLLECTION) {
                    if (depth == 0) {
                        return fail(error, "end collection without collection");
                    }
                    depth--;
                }
                // Local items only apply to the next main item
                usages.clear();
                break;

            default:
                break;
        }
    }

    if (depth != 0) {
        return fail(error, "unterminated collection");
    }
    return summary;
}

} // namespace whodat
