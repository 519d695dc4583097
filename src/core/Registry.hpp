#pragma once
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "Capability.hpp"
#include "Device.hpp"
#include "io/Probe.hpp"

namespace whodat {

class Database;
class DeviceNode;

enum class HandleState : uint8_t {
    Active,
    Removed,  // terminal
};

const char* toString(HandleState state);

using SubscriptionId = uint64_t;
using RemovalCallback = std::function<void()>;

// Snapshot of an aggregate of sibling kernel nodes.
struct PhysicalDevice {
    PhysicalDeviceIndex index = 0;
    std::string groupingKey;
    std::optional<PhysicalType> physicalType;
    CapabilitySet capabilities;
    AbstractType abstractType = AbstractType::Switch;
    std::set<KernelId> constituents;
};

namespace detail {

struct DeviceSlot;
struct PhysicalSlot;

} // namespace detail

/**
 * Reference to a registered Device.
 *
 * Copies refer to the same entry. Once the entry is removed every
 * operation except identity() and state() throws RegistryError::StaleHandle.
 */
class DeviceHandle {
public:
    KernelId identity() const;
    HandleState state() const;

    Device device() const;

    // The callback runs once, outside registry locks, when the entry is removed
    SubscriptionId onRemoved(RemovalCallback callback) const;
    void unsubscribe(SubscriptionId id) const;

    bool operator==(const DeviceHandle& other) const { return slot == other.slot; }
    bool operator!=(const DeviceHandle& other) const { return slot != other.slot; }

private:
    friend class Registry;
    explicit DeviceHandle(std::shared_ptr<detail::DeviceSlot> slot) : slot(std::move(slot)) {}

    std::shared_ptr<detail::DeviceSlot> slot;
};

class PhysicalDeviceHandle {
public:
    PhysicalDeviceIndex index() const;
    HandleState state() const;

    PhysicalDevice snapshot() const;

    SubscriptionId onRemoved(RemovalCallback callback) const;
    void unsubscribe(SubscriptionId id) const;

    bool operator==(const PhysicalDeviceHandle& other) const { return slot == other.slot; }
    bool operator!=(const PhysicalDeviceHandle& other) const { return slot != other.slot; }

private:
    friend class Registry;
    explicit PhysicalDeviceHandle(std::shared_ptr<detail::PhysicalSlot> slot) : slot(std::move(slot)) {}

    std::shared_ptr<detail::PhysicalSlot> slot;
};

/**
 * Cache of identified kernel nodes, grouped into physical devices.
 *
 * Each kernel identity is built at most once: concurrent first lookups of
 * the same identity share one build and all receive its handle or its
 * error. Different identities build in parallel. A failed build leaves
 * the registry untouched.
 *
 * Locks are taken table first, then aggregate. Removal callbacks run
 * after all locks are released.
 */
class Registry {
public:
    explicit Registry(const Database& database);
    Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Throws ProbeError or BuildError
    DeviceHandle deviceFromIdentitySource(const DeviceNode& node);
    DeviceHandle deviceFromEvdev(int fd);
    DeviceHandle deviceFromHidraw(int fd);

    // Throws RegistryError::StaleHandle if nothing is registered under id
    void remove(const KernelId& id);

    std::optional<DeviceHandle> find(const KernelId& id) const;

    // Throws RegistryError::StaleHandle for an unknown or removed index
    PhysicalDeviceHandle physicalDevice(PhysicalDeviceIndex index) const;

    // std::nullopt if the device was not grouped
    std::optional<PhysicalDeviceHandle> physicalDeviceOf(const DeviceHandle& handle) const;

    std::vector<DeviceHandle> devices() const;
    std::vector<PhysicalDeviceHandle> physicalDevices() const;
    size_t size() const;

private:
    DeviceHandle insert(const KernelId& id, const BuildResult& result,
                        const std::optional<std::string>& groupingKey);

    const Database& database;

    mutable std::mutex tableMutex;
    std::unordered_map<KernelId, std::shared_ptr<detail::DeviceSlot>, KernelIdHash> entries;
    std::unordered_map<KernelId, std::shared_future<DeviceHandle>, KernelIdHash> pending;
    std::unordered_map<std::string, PhysicalDeviceIndex> groups;
    std::map<PhysicalDeviceIndex, std::shared_ptr<detail::PhysicalSlot>> aggregates;
    PhysicalDeviceIndex nextIndex = 1;
};

} // namespace whodat
