#pragma once
#include "Capability.hpp"
#include "io/RawDeviceInfo.hpp"

namespace whodat {

/**
 * Maps raw capability bits to the canonical capability set.
 *
 * Classification runs an ordered table of independent rules, each adding at
 * most one capability, and then adds the implied parent capabilities
 * (a clickpad is a touchpad, a touchpad is a pointer, ...). The result only
 * depends on the input bits.
 */
class Classifier {
public:
    static CapabilitySet classify(const RawDeviceInfo& raw);

    // Wide axis plus many buttons: two sticks or a hat, or a HID gamepad collection
    static bool gamepadLayout(const RawDeviceInfo& raw);

private:
    static CapabilitySet classifyEvdev(const RawDeviceInfo& raw);
    static CapabilitySet classifyHidraw(const RawDeviceInfo& raw);
    static void addImplied(CapabilitySet& caps);
};

} // namespace whodat
