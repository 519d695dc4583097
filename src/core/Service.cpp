#include "Service.hpp"
#include "Errors.hpp"
#include "io/DeviceNode.hpp"
#include "utils/Logger.hpp"
#include <stdexcept>
#include <fmt/format.h>

namespace whodat {

Service::Service(Registry& registry) : registry(registry) {}

std::string Service::physicalPath(PhysicalDeviceIndex index) {
    return fmt::format("{}/p/{}", ROOT, index);
}

std::string Service::identifyEvdev(int fd) {
    return publish(registry.deviceFromEvdev(fd));
}

std::string Service::identifyHidraw(int fd) {
    return publish(registry.deviceFromHidraw(fd));
}

std::string Service::identify(const DeviceNode& node) {
    return publish(registry.deviceFromIdentitySource(node));
}

std::string Service::publish(const DeviceHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = paths.find(handle.identity());
    if (it != paths.end()) {
        auto current = published.find(it->second);
        if (current != published.end() && current->second == handle &&
            current->second.state() == HandleState::Active) {
            return it->second;
        }
        // Removed from the registry without nodeRemoved, then registered again
        debug("Dropping stale path {} for {}", it->second, handle.identity().toString());
        published.erase(it->second);
        paths.erase(it);
    }
    std::string path = fmt::format("{}/e/{}", ROOT, nextDevice++);
    paths.emplace(handle.identity(), path);
    published.emplace(path, handle);
    debug("Published {} at {}", handle.identity().toString(), path);
    return path;
}

DeviceHandle Service::lookup(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = published.find(path);
    if (it == published.end()) {
        throw RegistryError(RegistryError::Code::StaleHandle, "no device at " + path);
    }
    return it->second;
}

PhysicalDeviceHandle Service::lookupPhysical(const std::string& path) const {
    std::string prefix = std::string(ROOT) + "/p/";
    if (path.rfind(prefix, 0) != 0) {
        throw RegistryError(RegistryError::Code::StaleHandle, "no physical device at " + path);
    }
    PhysicalDeviceIndex index = 0;
    try {
        size_t used = 0;
        index = std::stoull(path.substr(prefix.size()), &used);
        if (used != path.size() - prefix.size()) {
            throw std::invalid_argument(path);
        }
    } catch (const std::logic_error&) {
        throw RegistryError(RegistryError::Code::StaleHandle, "no physical device at " + path);
    }
    return registry.physicalDevice(index);
}

DeviceResource Service::device(const std::string& path) const {
    Device dev = lookup(path).device();

    DeviceResource resource;
    resource.version = VERSION;
    resource.path = path;
    resource.name = dev.name();
    resource.bus = dev.bus();
    resource.vendor = dev.vendor();
    resource.product = dev.product();
    if (auto parent = dev.parent()) {
        resource.parent = physicalPath(*parent);
    }
    return resource;
}

PhysicalDeviceResource Service::physicalDevice(const std::string& path) const {
    PhysicalDevice snapshot = lookupPhysical(path).snapshot();

    PhysicalDeviceResource resource;
    resource.version = VERSION;
    resource.path = path;
    resource.physicalType = snapshot.physicalType;
    resource.abstractType = snapshot.abstractType;
    resource.capabilities = snapshot.capabilities;
    return resource;
}

SubscriptionId Service::subscribeRemoved(const std::string& path, RemovalCallback callback) {
    if (path.rfind(std::string(ROOT) + "/p/", 0) == 0) {
        return lookupPhysical(path).onRemoved(std::move(callback));
    }
    return lookup(path).onRemoved(std::move(callback));
}

void Service::nodeRemoved(const KernelId& id) {
    registry.remove(id);

    std::lock_guard<std::mutex> lock(mutex);
    auto it = paths.find(id);
    if (it != paths.end()) {
        debug("Unpublished {}", it->second);
        published.erase(it->second);
        paths.erase(it);
    }
}

} // namespace whodat
