#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "Registry.hpp"

namespace whodat {

struct DeviceResource {
    uint32_t version = 0;
    std::string path;
    std::string name;
    uint16_t bus = 0;
    uint16_t vendor = 0;
    uint16_t product = 0;
    std::optional<std::string> parent;
};

struct PhysicalDeviceResource {
    uint32_t version = 0;
    std::string path;
    std::optional<PhysicalType> physicalType;
    AbstractType abstractType = AbstractType::Switch;
    CapabilitySet capabilities;
};

/**
 * Request surface of the identification daemon.
 *
 * Devices are published as object paths under /org/freedesktop/whodat:
 * e/<n> for kernel nodes and p/<n> for physical devices. A transport
 * binds these calls to its own wire protocol.
 */
class Service {
public:
    static constexpr uint32_t VERSION = 1;
    static constexpr const char* ROOT = "/org/freedesktop/whodat";

    explicit Service(Registry& registry);

    uint32_t version() const { return VERSION; }

    // Return the object path of the device; the same node always maps to the same path
    std::string identifyEvdev(int fd);
    std::string identifyHidraw(int fd);
    std::string identify(const DeviceNode& node);

    // Throw RegistryError::StaleHandle for unknown or removed paths
    DeviceResource device(const std::string& path) const;
    PhysicalDeviceResource physicalDevice(const std::string& path) const;
    SubscriptionId subscribeRemoved(const std::string& path, RemovalCallback callback);

    // Called by the device monitor when a kernel node disappears
    void nodeRemoved(const KernelId& id);

    static std::string physicalPath(PhysicalDeviceIndex index);

private:
    std::string publish(const DeviceHandle& handle);
    DeviceHandle lookup(const std::string& path) const;
    PhysicalDeviceHandle lookupPhysical(const std::string& path) const;

    Registry& registry;

    mutable std::mutex mutex;
    std::unordered_map<KernelId, std::string, KernelIdHash> paths;
    std::map<std::string, DeviceHandle> published;
    uint64_t nextDevice = 0;
};

} // namespace whodat
