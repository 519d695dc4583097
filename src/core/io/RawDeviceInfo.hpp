#pragma once
#include <bitset>
#include <cstdint>
#include <string>
#include <vector>
#include <linux/input.h>

namespace whodat {

enum class NodeKind : uint8_t {
    Evdev,
    Hidraw,
};

const char* toString(NodeKind kind);

// A top-level HID application collection, e.g. Generic Desktop / Mouse
struct HidUsage {
    uint16_t page = 0;
    uint16_t usage = 0;

    bool operator==(const HidUsage& other) const {
        return page == other.page && usage == other.usage;
    }
};

namespace hid {
constexpr uint16_t PAGE_GENERIC_DESKTOP = 0x01;
constexpr uint16_t PAGE_SIMULATION = 0x02;
constexpr uint16_t PAGE_KEYBOARD = 0x07;
constexpr uint16_t PAGE_BUTTON = 0x09;
constexpr uint16_t PAGE_CONSUMER = 0x0c;
constexpr uint16_t PAGE_DIGITIZER = 0x0d;

constexpr uint16_t GD_POINTER = 0x01;
constexpr uint16_t GD_MOUSE = 0x02;
constexpr uint16_t GD_JOYSTICK = 0x04;
constexpr uint16_t GD_GAMEPAD = 0x05;
constexpr uint16_t GD_KEYBOARD = 0x06;
constexpr uint16_t GD_KEYPAD = 0x07;
constexpr uint16_t GD_MULTI_AXIS = 0x08;

constexpr uint16_t DIGITIZER_PEN = 0x02;
constexpr uint16_t DIGITIZER_TOUCHSCREEN = 0x04;
constexpr uint16_t DIGITIZER_TOUCHPAD = 0x05;
} // namespace hid

/**
 * Identity and raw capability bits of one kernel node, as read by Probe.
 *
 * For evdev nodes the bitmaps mirror EVIOCGBIT/EVIOCGPROP. For hidraw nodes
 * the bitmaps stay empty and the report descriptor's application
 * collections and usage pages are recorded instead.
 */
struct RawDeviceInfo {
    NodeKind kind = NodeKind::Evdev;
    uint16_t busType = 0;
    uint16_t vendor = 0;
    uint16_t product = 0;
    uint16_t version = 0;
    std::string name;
    std::string phys;
    std::string uniq;

    std::bitset<EV_CNT> events;
    std::bitset<KEY_CNT> keys;
    std::bitset<REL_CNT> relAxes;
    std::bitset<ABS_CNT> absAxes;
    std::bitset<SW_CNT> switches;
    std::bitset<INPUT_PROP_CNT> properties;

    std::vector<HidUsage> applications;
    std::vector<uint16_t> usagePages;

    bool hasEventType(int type) const { return type >= 0 && type < EV_CNT && events.test(type); }
    bool hasKey(int code) const { return code >= 0 && code < KEY_CNT && keys.test(code); }
    bool hasRelativeAxis(int axis) const { return axis >= 0 && axis < REL_CNT && relAxes.test(axis); }
    bool hasAbsoluteAxis(int axis) const { return axis >= 0 && axis < ABS_CNT && absAxes.test(axis); }
    bool hasProperty(int prop) const { return prop >= 0 && prop < INPUT_PROP_CNT && properties.test(prop); }
    bool hasApplication(uint16_t page, uint16_t usage) const;
    bool hasUsagePage(uint16_t page) const;

    int countKeysInRange(int start, int end) const;
    int countAbsoluteAxes() const { return static_cast<int>(absAxes.count()); }
};

} // namespace whodat
