#include "Registry.hpp"
#include "Database.hpp"
#include "Errors.hpp"
#include "Grouping.hpp"
#include "io/DeviceNode.hpp"
#include "utils/Logger.hpp"

namespace whodat {

namespace detail {

struct DeviceSlot {
    DeviceSlot(KernelId id, Device device) : id(id), device(std::move(device)) {}

    const KernelId id;
    const Device device;

    mutable std::mutex mutex;
    bool removed = false;
    std::map<SubscriptionId, RemovalCallback> subscribers;
    SubscriptionId nextSubscription = 1;
};

struct PhysicalSlot {
    explicit PhysicalSlot(PhysicalDeviceIndex index, std::string key) {
        data.index = index;
        data.groupingKey = std::move(key);
    }

    mutable std::mutex mutex;
    PhysicalDevice data;
    bool removed = false;
    std::map<SubscriptionId, RemovalCallback> subscribers;
    SubscriptionId nextSubscription = 1;
};

} // namespace detail

namespace {

[[noreturn]] void stale(const std::string& what) {
    throw RegistryError(RegistryError::Code::StaleHandle, what);
}

template<typename Slot>
SubscriptionId subscribe(Slot& slot, RemovalCallback callback, const std::string& what) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.removed) stale(what + " was removed");
    SubscriptionId id = slot.nextSubscription++;
    slot.subscribers.emplace(id, std::move(callback));
    return id;
}

template<typename Slot>
void unsubscribeFrom(Slot& slot, SubscriptionId id) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.subscribers.erase(id);
}

// Marks the slot removed and hands back the callbacks to run; caller holds no lock on slot
template<typename Slot>
std::vector<RemovalCallback> retire(Slot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.removed = true;
    std::vector<RemovalCallback> callbacks;
    for (auto& [id, callback] : slot.subscribers) {
        callbacks.push_back(std::move(callback));
    }
    slot.subscribers.clear();
    return callbacks;
}

void notify(const std::vector<RemovalCallback>& callbacks, const std::string& what) {
    for (const auto& callback : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            error("Removal callback for {} threw: {}", what, e.what());
        }
    }
}

} // namespace

const char* toString(HandleState state) {
    switch (state) {
        case HandleState::Active: return "active";
        case HandleState::Removed: return "removed";
    }
    return "removed";
}

// DeviceHandle

KernelId DeviceHandle::identity() const {
    return slot->id;
}

HandleState DeviceHandle::state() const {
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->removed ? HandleState::Removed : HandleState::Active;
}

Device DeviceHandle::device() const {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) stale("device " + slot->id.toString() + " was removed");
    return slot->device;
}

SubscriptionId DeviceHandle::onRemoved(RemovalCallback callback) const {
    return subscribe(*slot, std::move(callback), "device " + slot->id.toString());
}

void DeviceHandle::unsubscribe(SubscriptionId id) const {
    unsubscribeFrom(*slot, id);
}

// PhysicalDeviceHandle

PhysicalDeviceIndex PhysicalDeviceHandle::index() const {
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->data.index;
}

HandleState PhysicalDeviceHandle::state() const {
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->removed ? HandleState::Removed : HandleState::Active;
}

PhysicalDevice PhysicalDeviceHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) stale("physical device " + std::to_string(slot->data.index) + " was removed");
    return slot->data;
}

SubscriptionId PhysicalDeviceHandle::onRemoved(RemovalCallback callback) const {
    return subscribe(*slot, std::move(callback), "physical device " + std::to_string(index()));
}

void PhysicalDeviceHandle::unsubscribe(SubscriptionId id) const {
    unsubscribeFrom(*slot, id);
}

// Registry

Registry::Registry(const Database& database) : database(database) {}

Registry::Registry() : Registry(Database::Global()) {}

DeviceHandle Registry::deviceFromEvdev(int fd) {
    FdDeviceNode node(fd, NodeKind::Evdev);
    return deviceFromIdentitySource(node);
}

DeviceHandle Registry::deviceFromHidraw(int fd) {
    FdDeviceNode node(fd, NodeKind::Hidraw);
    return deviceFromIdentitySource(node);
}

DeviceHandle Registry::deviceFromIdentitySource(const DeviceNode& node) {
    KernelId id = node.identity();

    std::promise<DeviceHandle> promise;
    std::shared_future<DeviceHandle> inFlight;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        auto it = entries.find(id);
        if (it != entries.end()) {
            return DeviceHandle(it->second);
        }
        auto building = pending.find(id);
        if (building != pending.end()) {
            inFlight = building->second;
        } else {
            pending.emplace(id, promise.get_future().share());
        }
    }

    if (inFlight.valid()) {
        debug("Waiting for in-flight build of {}", id.toString());
        return inFlight.get();
    }

    try {
        BuildResult result = Builder().node(node).database(database).build();
        std::optional<std::string> key;
        if (result.raw) {
            key = deriveGroupingKey(result.resolution.grouping, *result.raw, node.sysfsPath());
        }
        DeviceHandle handle = insert(id, result, key);
        promise.set_value(handle);
        return handle;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(tableMutex);
            pending.erase(id);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

DeviceHandle Registry::insert(const KernelId& id, const BuildResult& result,
                              const std::optional<std::string>& groupingKey) {
    std::lock_guard<std::mutex> lock(tableMutex);

    Device device = result.device;
    if (groupingKey) {
        std::shared_ptr<detail::PhysicalSlot> aggregate;
        auto group = groups.find(*groupingKey);
        if (group != groups.end()) {
            aggregate = aggregates.at(group->second);
        } else {
            PhysicalDeviceIndex index = nextIndex++;
            aggregate = std::make_shared<detail::PhysicalSlot>(index, *groupingKey);
            groups.emplace(*groupingKey, index);
            aggregates.emplace(index, aggregate);
            info("New physical device {} for {}", index, *groupingKey);
        }

        std::lock_guard<std::mutex> groupLock(aggregate->mutex);
        PhysicalDevice& data = aggregate->data;
        data.constituents.insert(id);
        data.capabilities |= device.capabilities();
        if (!data.physicalType) {
            data.physicalType = device.physicalType();
        }
        data.abstractType = abstractTypeOf(data.capabilities);
        device = device.withParent(data.index);
        debug("Physical device {} now has {} nodes, caps {}", data.index, data.constituents.size(),
              data.capabilities.toString());
    }

    auto slot = std::make_shared<detail::DeviceSlot>(id, device);
    entries.emplace(id, slot);
    pending.erase(id);
    info("Registered {} '{}' as {}", id.toString(), device.name(),
         device.physicalType() ? toString(*device.physicalType()) : "unknown");
    return DeviceHandle(slot);
}

void Registry::remove(const KernelId& id) {
    std::vector<RemovalCallback> deviceCallbacks;
    std::vector<RemovalCallback> aggregateCallbacks;
    std::string aggregateName;

    {
        std::lock_guard<std::mutex> lock(tableMutex);
        auto it = entries.find(id);
        if (it == entries.end()) {
            stale("no device registered as " + id.toString());
        }
        std::shared_ptr<detail::DeviceSlot> slot = it->second;
        entries.erase(it);

        if (auto parent = slot->device.parent()) {
            auto agg = aggregates.find(*parent);
            if (agg != aggregates.end()) {
                std::shared_ptr<detail::PhysicalSlot> aggregate = agg->second;
                bool empty = false;
                {
                    std::lock_guard<std::mutex> groupLock(aggregate->mutex);
                    aggregate->data.constituents.erase(id);
                    empty = aggregate->data.constituents.empty();
                }
                if (empty) {
                    groups.erase(aggregate->data.groupingKey);
                    aggregates.erase(agg);
                    aggregateCallbacks = retire(*aggregate);
                    aggregateName = "physical device " + std::to_string(*parent);
                    info("Physical device {} removed", *parent);
                }
            }
        }
        deviceCallbacks = retire(*slot);
        info("Removed {}", id.toString());
    }

    notify(deviceCallbacks, id.toString());
    notify(aggregateCallbacks, aggregateName);
}

std::optional<DeviceHandle> Registry::find(const KernelId& id) const {
    std::lock_guard<std::mutex> lock(tableMutex);
    auto it = entries.find(id);
    if (it == entries.end()) return std::nullopt;
    return DeviceHandle(it->second);
}

PhysicalDeviceHandle Registry::physicalDevice(PhysicalDeviceIndex index) const {
    std::lock_guard<std::mutex> lock(tableMutex);
    auto it = aggregates.find(index);
    if (it == aggregates.end()) {
        stale("no physical device " + std::to_string(index));
    }
    return PhysicalDeviceHandle(it->second);
}

std::optional<PhysicalDeviceHandle> Registry::physicalDeviceOf(const DeviceHandle& handle) const {
    auto parent = handle.device().parent();
    if (!parent) return std::nullopt;
    return physicalDevice(*parent);
}

std::vector<DeviceHandle> Registry::devices() const {
    std::lock_guard<std::mutex> lock(tableMutex);
    std::vector<DeviceHandle> result;
    result.reserve(entries.size());
    for (const auto& [id, slot] : entries) {
        result.push_back(DeviceHandle(slot));
    }
    return result;
}

std::vector<PhysicalDeviceHandle> Registry::physicalDevices() const {
    std::lock_guard<std::mutex> lock(tableMutex);
    std::vector<PhysicalDeviceHandle> result;
    for (const auto& [index, slot] : aggregates) {
        result.push_back(PhysicalDeviceHandle(slot));
    }
    return result;
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(tableMutex);
    return entries.size();
}

} // namespace whodat
