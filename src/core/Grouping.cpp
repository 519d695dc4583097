#include "Grouping.hpp"
#include <filesystem>
#include <regex>
#include <fmt/format.h>

namespace whodat {

namespace fs = std::filesystem;

namespace {

// usb1/1-2 style device directories; interfaces carry a ':' ("1-2:1.0")
bool isUsbDeviceDir(const std::string& name) {
    static const std::regex usbDevice(R"(^(usb\d+|\d+-\d+(\.\d+)*)$)");
    return std::regex_match(name, usbDevice);
}

bool isHidDeviceDir(const std::string& name) {
    static const std::regex hidDevice(R"(^[0-9A-Fa-f]{4}:[0-9A-Fa-f]{4}:[0-9A-Fa-f]{4}\.[0-9A-Fa-f]{4}$)");
    return std::regex_match(name, hidDevice);
}

template<typename Pred>
std::string findAncestor(const std::string& sysfsPath, Pred pred, bool deepest) {
    std::string found;
    fs::path prefix;
    for (const auto& part : fs::path(sysfsPath)) {
        prefix /= part;
        if (pred(part.string())) {
            found = prefix.string();
            if (!deepest) break;
        }
    }
    return found;
}

} // namespace

const char* toString(GroupingRule rule) {
    switch (rule) {
        case GroupingRule::None: return "none";
        case GroupingRule::UsbDevice: return "usb-device";
        case GroupingRule::HidDevice: return "hid-device";
        case GroupingRule::Uniq: return "uniq";
    }
    return "none";
}

std::optional<GroupingRule> groupingRuleFromString(const std::string& tag) {
    if (tag == "none") return GroupingRule::None;
    if (tag == "usb-device") return GroupingRule::UsbDevice;
    if (tag == "hid-device") return GroupingRule::HidDevice;
    if (tag == "uniq") return GroupingRule::Uniq;
    return std::nullopt;
}

std::string findUsbDeviceAncestor(const std::string& sysfsPath) {
    // Hubs are USB devices too; the unit itself is the deepest one
    return findAncestor(sysfsPath, isUsbDeviceDir, true);
}

std::string findHidDeviceAncestor(const std::string& sysfsPath) {
    return findAncestor(sysfsPath, isHidDeviceDir, true);
}

std::optional<std::string> deriveGroupingKey(GroupingRule rule, const RawDeviceInfo& raw,
                                             const std::string& sysfsPath) {
    std::string anchor;
    switch (rule) {
        case GroupingRule::None:
            return std::nullopt;
        case GroupingRule::UsbDevice:
            anchor = findUsbDeviceAncestor(sysfsPath);
            break;
        case GroupingRule::HidDevice:
            anchor = findHidDeviceAncestor(sysfsPath);
            break;
        case GroupingRule::Uniq:
            anchor = raw.uniq;
            break;
    }
    if (anchor.empty()) {
        return std::nullopt;
    }
    return fmt::format("{}:{:04x}:{:04x}:{:04x}:{}", toString(rule), raw.busType,
                       raw.vendor, raw.product, anchor);
}

} // namespace whodat
