#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace whodat {

// High-level category of input a kernel device node can produce.
// Capabilities are not mutually exclusive; a device may carry several.
enum class Capability : uint8_t {
    Keyboard,
    Pointer,
    Pointingstick,
    Touchpad,
    Clickpad,      // touchpad with a hinge instead of separate buttons
    Pressurepad,   // touchpad that detects clicks by pressure
    Touchscreen,
    Trackball,
    Joystick,
    Gamepad,
    Tablet,
    TabletScreen,  // tablet built into a screen, exclusive with TabletExternal
    TabletExternal,
    TabletPad,     // buttons, rings and strips of a tablet
    Switch,
};

constexpr int kCapabilityCount = static_cast<int>(Capability::Switch) + 1;

// What the device is sold or used as. Exactly one per device, or unknown.
enum class PhysicalType : uint8_t {
    Keyboard,
    Mouse,
    Pointingstick,
    Touchpad,
    Touchscreen,
    Trackball,
    Tablet,
    Joystick,
    Gamepad,
    RacingWheel,
    FootPedal,
    GameController,
};

// Coarse category of a whole physical device.
enum class AbstractType : uint8_t {
    Keyboard,
    Pointer,
    Touchscreen,
    Tablet,
    GamingDevice,
    Switch,
};

const char* toString(Capability capability);
const char* toString(PhysicalType type);
const char* toString(AbstractType type);

std::optional<Capability> capabilityFromString(const std::string& tag);
std::optional<PhysicalType> physicalTypeFromString(const std::string& tag);

/**
 * Set of capabilities stored as a bitmask.
 *
 * The set only grows: there is no way to remove a capability once added.
 * Iteration order is the declaration order of Capability.
 */
class CapabilitySet {
public:
    CapabilitySet() = default;
    CapabilitySet(std::initializer_list<Capability> capabilities);

    void set(Capability capability) { mask |= bit(capability); }
    bool has(Capability capability) const { return (mask & bit(capability)) != 0; }
    bool empty() const { return mask == 0; }
    size_t size() const;

    // True if every capability in this set is also in other
    bool isSubsetOf(const CapabilitySet& other) const { return (mask & ~other.mask) == 0; }

    CapabilitySet& operator|=(const CapabilitySet& other) {
        mask |= other.mask;
        return *this;
    }
    friend CapabilitySet operator|(CapabilitySet a, const CapabilitySet& b) { return a |= b; }
    bool operator==(const CapabilitySet& other) const { return mask == other.mask; }
    bool operator!=(const CapabilitySet& other) const { return mask != other.mask; }

    std::vector<Capability> toVector() const;

    // Tags sorted alphabetically, the canonical order used on the wire
    std::vector<std::string> sortedTags() const;

    std::string toString() const;
    uint32_t bits() const { return mask; }

private:
    static constexpr uint32_t bit(Capability capability) {
        return 1u << static_cast<uint32_t>(capability);
    }

    uint32_t mask = 0;
};

// Folds a physical device's capabilities, in declaration order, into one
// coarse category. A device with nothing but switches is a Switch.
AbstractType abstractTypeOf(const CapabilitySet& capabilities);

} // namespace whodat
