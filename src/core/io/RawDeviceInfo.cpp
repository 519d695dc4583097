#include "RawDeviceInfo.hpp"
#include <algorithm>

namespace whodat {

const char* toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Evdev: return "evdev";
        case NodeKind::Hidraw: return "hidraw";
    }
    return "unknown";
}

bool RawDeviceInfo::hasApplication(uint16_t page, uint16_t usage) const {
    return std::find(applications.begin(), applications.end(), HidUsage{page, usage}) != applications.end();
}

bool RawDeviceInfo::hasUsagePage(uint16_t page) const {
    return std::find(usagePages.begin(), usagePages.end(), page) != usagePages.end();
}

// Inclusive range
int RawDeviceInfo::countKeysInRange(int start, int end) const {
    int count = 0;
    for (int i = std::max(start, 0); i <= end && i < KEY_CNT; i++) {
        if (keys.test(i)) count++;
    }
    return count;
}

} // namespace whodat
