#include "Capability.hpp"
#include <algorithm>
#include <array>
#include <sstream>

namespace whodat {

namespace {

constexpr std::array<const char*, kCapabilityCount> kCapabilityTags = {
    "keyboard",
    "pointer",
    "pointingstick",
    "touchpad",
    "clickpad",
    "pressurepad",
    "touchscreen",
    "trackball",
    "joystick",
    "gamepad",
    "tablet",
    "tablet-screen",
    "tablet-external",
    "tablet-pad",
    "switch",
};

constexpr std::array<const char*, 12> kPhysicalTypeTags = {
    "keyboard",
    "mouse",
    "pointingstick",
    "touchpad",
    "touchscreen",
    "trackball",
    "tablet",
    "joystick",
    "gamepad",
    "racing-wheel",
    "foot-pedal",
    "game-controller",
};

} // namespace

const char* toString(Capability capability) {
    return kCapabilityTags[static_cast<size_t>(capability)];
}

const char* toString(PhysicalType type) {
    return kPhysicalTypeTags[static_cast<size_t>(type)];
}

const char* toString(AbstractType type) {
    switch (type) {
        case AbstractType::Keyboard: return "keyboard";
        case AbstractType::Pointer: return "pointer";
        case AbstractType::Touchscreen: return "touchscreen";
        case AbstractType::Tablet: return "tablet";
        case AbstractType::GamingDevice: return "gaming-device";
        case AbstractType::Switch: return "switch";
    }
    return "unknown";
}

std::optional<Capability> capabilityFromString(const std::string& tag) {
    for (size_t i = 0; i < kCapabilityTags.size(); ++i) {
        if (tag == kCapabilityTags[i]) {
            return static_cast<Capability>(i);
        }
    }
    return std::nullopt;
}

std::optional<PhysicalType> physicalTypeFromString(const std::string& tag) {
    for (size_t i = 0; i < kPhysicalTypeTags.size(); ++i) {
        if (tag == kPhysicalTypeTags[i]) {
            return static_cast<PhysicalType>(i);
        }
    }
    return std::nullopt;
}

CapabilitySet::CapabilitySet(std::initializer_list<Capability> capabilities) {
    for (Capability c : capabilities) {
        set(c);
    }
}

size_t CapabilitySet::size() const {
    size_t count = 0;
    for (uint32_t m = mask; m != 0; m &= m - 1) {
        count++;
    }
    return count;
}

std::vector<Capability> CapabilitySet::toVector() const {
    std::vector<Capability> result;
    for (int i = 0; i < kCapabilityCount; ++i) {
        auto c = static_cast<Capability>(i);
        if (has(c)) result.push_back(c);
    }
    return result;
}

std::vector<std::string> CapabilitySet::sortedTags() const {
    std::vector<std::string> tags;
    for (Capability c : toVector()) {
        tags.emplace_back(whodat::toString(c));
    }
    std::sort(tags.begin(), tags.end());
    return tags;
}

std::string CapabilitySet::toString() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& tag : sortedTags()) {
        if (!first) oss << ", ";
        oss << tag;
        first = false;
    }
    oss << "}";
    return oss.str();
}

AbstractType abstractTypeOf(const CapabilitySet& capabilities) {
    AbstractType type = AbstractType::Switch;
    for (Capability c : capabilities.toVector()) {
        switch (c) {
            case Capability::Switch:
                break;
            case Capability::Keyboard:
                if (type == AbstractType::Switch) type = AbstractType::Keyboard;
                break;
            case Capability::Pointer:
                if (type != AbstractType::Keyboard) type = AbstractType::Pointer;
                break;
            case Capability::Pointingstick:
            case Capability::Touchpad:
            case Capability::Clickpad:
            case Capability::Pressurepad:
            case Capability::Trackball:
                type = AbstractType::Pointer;
                break;
            case Capability::Touchscreen:
                type = AbstractType::Touchscreen;
                break;
            case Capability::Joystick:
            case Capability::Gamepad:
                type = AbstractType::GamingDevice;
                break;
            case Capability::Tablet:
            case Capability::TabletScreen:
            case Capability::TabletExternal:
            case Capability::TabletPad:
                type = AbstractType::Tablet;
                break;
        }
    }
    return type;
}

} // namespace whodat
