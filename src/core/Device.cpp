#include "Device.hpp"
#include "Classifier.hpp"
#include "Codec.hpp"
#include "Database.hpp"
#include "io/DeviceNode.hpp"
#include "io/Probe.hpp"
#include "utils/Logger.hpp"
#include <sstream>
#include <fmt/format.h>

namespace whodat {

Device::Device(std::string name, uint16_t bus, uint16_t vendor, uint16_t product,
               CapabilitySet capabilities, std::optional<PhysicalType> physicalType)
    : ids(Ids{bus, vendor, product}),
      deviceName(std::move(name)),
      caps(capabilities),
      type(physicalType) {}

Device Device::withParent(PhysicalDeviceIndex index) const {
    Device copy = *this;
    copy.parentIndex = index;
    return copy;
}

std::string Device::serialize() const {
    return Codec::encode(*this);
}

Device Device::deserialize(const std::string& payload) {
    return Codec::decode(payload);
}

std::string Device::toString() const {
    std::stringstream ss;
    ss << "Device: " << deviceName << "\n";
    ss << "  Bus: " << Probe::busName(bus())
       << fmt::format(", Vendor: {:04x}, Product: {:04x}", vendor(), product()) << "\n";
    ss << "  Physical type: " << (type ? whodat::toString(*type) : "unknown") << "\n";
    ss << "  Capabilities: " << (caps.empty() ? "none" : caps.toString()) << "\n";
    if (parentIndex) {
        ss << "  Parent: " << *parentIndex << "\n";
    }
    return ss.str();
}

Builder& Builder::evdev(int fd) {
    evdevFd = fd;
    return *this;
}

Builder& Builder::hidraw(int fd) {
    hidrawFd = fd;
    return *this;
}

Builder& Builder::node(const DeviceNode& source) {
    nodeSource = &source;
    return *this;
}

Builder& Builder::usbId(uint16_t vendor, uint16_t product, uint16_t bus) {
    usb = UsbId{vendor, product, bus};
    return *this;
}

Builder& Builder::raw(RawDeviceInfo info) {
    rawSource = std::move(info);
    return *this;
}

Builder& Builder::name(std::string value) {
    nameOverride = std::move(value);
    return *this;
}

Builder& Builder::database(const Database& value) {
    db = &value;
    return *this;
}

int Builder::sourceCount() const {
    return (evdevFd ? 1 : 0) + (hidrawFd ? 1 : 0) + (nodeSource ? 1 : 0) + (rawSource ? 1 : 0);
}

RawDeviceInfo Builder::acquire() const {
    if (rawSource) return *rawSource;
    if (nodeSource) return nodeSource->probe();
    if (evdevFd) return Probe::run(*evdevFd, NodeKind::Evdev);
    return Probe::run(*hidrawFd, NodeKind::Hidraw);
}

BuildResult Builder::build() const {
    int sources = sourceCount();
    if (sources > 1) {
        throw BuildError(BuildError::Code::AmbiguousSource,
                         fmt::format("{} identity sources given, expected one", sources));
    }
    if (sources == 0 && !usb) {
        throw BuildError(BuildError::Code::NoSource, "no identity source given");
    }

    const Database& database = db ? *db : Database::Global();
    Resolver resolver(database);
    BuildResult result;

    if (sources == 0) {
        // Nothing to classify; the database alone decides
        RawDeviceInfo ids;
        ids.busType = usb->bus;
        ids.vendor = usb->vendor;
        ids.product = usb->product;
        result.resolution = resolver.resolve(ids, CapabilitySet{});

        std::string deviceName = nameOverride.value_or("");
        if (deviceName.empty()) {
            if (auto match = database.lookup(ids.busType, ids.vendor, ids.product)) {
                if (match->kind != DeviceKey::Kind::Bus) deviceName = match->entry.description;
            }
        }
        result.device = Device(deviceName, ids.busType, ids.vendor, ids.product,
                               result.resolution.capabilities, result.resolution.physicalType);
        return result;
    }

    RawDeviceInfo probed = acquire();

    if (usb && (usb->vendor != probed.vendor || usb->product != probed.product || usb->bus != probed.busType)) {
        BuildError mismatch(BuildError::Code::IdMismatch,
                            fmt::format("given id {:04x}:{:04x}:{:04x} but node reports {:04x}:{:04x}:{:04x}",
                                        usb->bus, usb->vendor, usb->product,
                                        probed.busType, probed.vendor, probed.product));
        warning("'{}': {}, using the node's ids", probed.name, mismatch.what());
        result.diagnostics.push_back(mismatch);
    }

    CapabilitySet classified = Classifier::classify(probed);
    result.resolution = resolver.resolve(probed, classified);

    result.device = Device(nameOverride.value_or(probed.name), probed.busType, probed.vendor, probed.product,
                           result.resolution.capabilities, result.resolution.physicalType);
    debug("Built '{}': type={} caps={} via {}", result.device.name(),
          result.device.physicalType() ? toString(*result.device.physicalType()) : "unknown",
          result.device.capabilities().toString(), toString(result.resolution.source));
    result.raw = std::move(probed);
    return result;
}

} // namespace whodat
