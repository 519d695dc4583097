#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Capability.hpp"
#include "Errors.hpp"
#include "Resolver.hpp"
#include "io/RawDeviceInfo.hpp"

namespace whodat {

class Database;
class DeviceNode;

// Index of a physical-device aggregate inside a Registry
using PhysicalDeviceIndex = uint64_t;

/**
 * Immutable description of one identified device.
 *
 * Only Builder, the codec and the registry create Devices. A
 * default-constructed Device is incomplete and cannot be serialized.
 */
class Device {
public:
    Device() = default;
    Device(std::string name, uint16_t bus, uint16_t vendor, uint16_t product,
           CapabilitySet capabilities, std::optional<PhysicalType> physicalType);

    bool complete() const { return ids.has_value(); }

    const std::string& name() const { return deviceName; }
    uint16_t bus() const { return ids ? ids->bus : 0; }
    uint16_t vendor() const { return ids ? ids->vendor : 0; }
    uint16_t product() const { return ids ? ids->product : 0; }

    const CapabilitySet& capabilities() const { return caps; }
    std::optional<PhysicalType> physicalType() const { return type; }
    bool hasCapability(Capability capability) const { return caps.has(capability); }

    // Set only on devices handed out by a Registry
    std::optional<PhysicalDeviceIndex> parent() const { return parentIndex; }
    Device withParent(PhysicalDeviceIndex index) const;

    // Throws SerializeError
    std::string serialize() const;
    // Throws DeserializeError
    static Device deserialize(const std::string& payload);

    std::string toString() const;

private:
    struct Ids {
        uint16_t bus;
        uint16_t vendor;
        uint16_t product;
    };

    std::optional<Ids> ids;
    std::string deviceName;
    CapabilitySet caps;
    std::optional<PhysicalType> type;
    std::optional<PhysicalDeviceIndex> parentIndex;
};

struct BuildResult {
    Device device;
    Resolution resolution;

    // Absent when built from usb ids alone
    std::optional<RawDeviceInfo> raw;

    // Non-fatal problems, e.g. BuildError::Code::IdMismatch
    std::vector<BuildError> diagnostics;
};

/**
 * Assembles a Device from whatever the caller has.
 *
 * Exactly one primary source is accepted: an evdev fd, a hidraw fd, a
 * DeviceNode or a complete RawDeviceInfo. A usb id may be given alone
 * or together with a primary source, in which case the source wins and
 * the disagreement is reported as a diagnostic.
 *
 *   auto result = Builder().evdev(fd).build();
 *   if (result.device.physicalType() == PhysicalType::Gamepad) ...
 */
class Builder {
public:
    Builder& evdev(int fd);
    Builder& hidraw(int fd);
    Builder& node(const DeviceNode& node);
    Builder& usbId(uint16_t vendor, uint16_t product, uint16_t bus = BUS_USB);
    Builder& raw(RawDeviceInfo info);
    Builder& name(std::string name);
    Builder& database(const Database& db);

    // Throws BuildError (NoSource, AmbiguousSource) or ProbeError
    BuildResult build() const;

private:
    struct UsbId {
        uint16_t vendor;
        uint16_t product;
        uint16_t bus;
    };

    int sourceCount() const;
    RawDeviceInfo acquire() const;

    std::optional<int> evdevFd;
    std::optional<int> hidrawFd;
    const DeviceNode* nodeSource = nullptr;
    std::optional<RawDeviceInfo> rawSource;
    std::optional<UsbId> usb;
    std::optional<std::string> nameOverride;
    const Database* db = nullptr;
};

} // namespace whodat
