#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <sys/types.h>
#include "RawDeviceInfo.hpp"

namespace whodat {

// Stable identity of a kernel node: its device number plus the node kind.
struct KernelId {
    dev_t rdev = 0;
    NodeKind kind = NodeKind::Evdev;

    bool operator==(const KernelId& other) const { return rdev == other.rdev && kind == other.kind; }
    bool operator!=(const KernelId& other) const { return !(*this == other); }
    bool operator<(const KernelId& other) const {
        return rdev != other.rdev ? rdev < other.rdev : kind < other.kind;
    }

    std::string toString() const;
};

struct KernelIdHash {
    size_t operator()(const KernelId& id) const {
        return std::hash<uint64_t>()(static_cast<uint64_t>(id.rdev) << 1 |
                                     static_cast<uint64_t>(id.kind));
    }
};

/**
 * Reads identity and capability bits from an already-open device node.
 *
 * Only ioctl queries are issued; no event data is read and nothing is
 * written, so whatever access the caller needed to open the node is
 * sufficient. Every function either fully succeeds or throws ProbeError.
 */
class Probe {
public:
    static RawDeviceInfo run(int fd, NodeKind kind);
    static KernelId identify(int fd, NodeKind kind);

    static bool isSupportedBus(uint16_t busType);
    static std::string busName(uint16_t busType);

private:
    static RawDeviceInfo evdev(int fd);
    static RawDeviceInfo hidraw(int fd);
};

} // namespace whodat
