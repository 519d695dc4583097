#include "Resolver.hpp"
#include "Classifier.hpp"
#include "utils/Logger.hpp"

namespace whodat {

const char* toString(Resolution::Source source) {
    switch (source) {
        case Resolution::Source::None: return "none";
        case Resolution::Source::Database: return "database";
        case Resolution::Source::Heuristic: return "heuristic";
    }
    return "none";
}

Resolution Resolver::resolve(const RawDeviceInfo& raw, const CapabilitySet& classified) const {
    Resolution result;
    result.capabilities = classified;

    if (auto match = database.lookup(raw.busType, raw.vendor, raw.product)) {
        result.capabilities |= match->entry.capabilities;
        result.grouping = match->entry.grouping;
        if (match->entry.physicalType) {
            result.physicalType = match->entry.physicalType;
            result.source = Resolution::Source::Database;
            return result;
        }
    }

    if (auto type = heuristic(raw, result.capabilities)) {
        result.physicalType = type;
        result.source = Resolution::Source::Heuristic;
        debug("Heuristic picked {} for '{}' ({})", toString(*type), raw.name,
              result.capabilities.toString());
    }
    return result;
}

std::optional<PhysicalType> Resolver::heuristic(const RawDeviceInfo& raw, const CapabilitySet& caps) {
    if (caps == CapabilitySet{Capability::Pointer}) {
        return PhysicalType::Mouse;
    }
    if (caps == CapabilitySet{Capability::Keyboard}) {
        return PhysicalType::Keyboard;
    }

    static const CapabilitySet touchpadFamily = {
        Capability::Pointer, Capability::Touchpad, Capability::Clickpad, Capability::Pressurepad};
    if (caps.has(Capability::Touchpad) && caps.has(Capability::Pointer) &&
        caps.isSubsetOf(touchpadFamily)) {
        return PhysicalType::Touchpad;
    }

    if (Classifier::gamepadLayout(raw)) {
        return PhysicalType::Gamepad;
    }
    return std::nullopt;
}

} // namespace whodat
