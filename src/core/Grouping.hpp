#pragma once
#include <optional>
#include <string>
#include "io/RawDeviceInfo.hpp"

namespace whodat {

// How sibling kernel nodes of one physical unit are recognised.
enum class GroupingRule : uint8_t {
    None,
    UsbDevice,  // same USB device in the sysfs tree
    HidDevice,  // same HID device (bus:vendor:product.instance) in the sysfs tree
    Uniq,       // same unique id, usually a Bluetooth address
};

const char* toString(GroupingRule rule);
std::optional<GroupingRule> groupingRuleFromString(const std::string& tag);

/**
 * Derives the grouping key of a node under the given rule.
 *
 * sysfsPath is the canonical /sys/devices/... path of the node, or empty
 * when unknown. Returns std::nullopt when the rule is None or the node
 * does not carry the information the rule needs. Keys are prefixed with
 * the rule and the bus/vendor/product so different units never collide.
 */
std::optional<std::string> deriveGroupingKey(GroupingRule rule, const RawDeviceInfo& raw,
                                             const std::string& sysfsPath);

// Deepest ancestor of path matching predicate, or empty.
std::string findUsbDeviceAncestor(const std::string& sysfsPath);
std::string findHidDeviceAncestor(const std::string& sysfsPath);

} // namespace whodat
