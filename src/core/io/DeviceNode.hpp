#pragma once
#include <memory>
#include <string>
#include "Probe.hpp"
#include "RawDeviceInfo.hpp"

namespace whodat {

/**
 * One kernel device node the engine can identify.
 *
 * The production implementation wraps a file descriptor handed over by a
 * privileged collaborator; tests substitute their own nodes.
 */
class DeviceNode {
public:
    virtual ~DeviceNode() = default;

    virtual NodeKind kind() const = 0;

    // Cheap: does not run the full probe
    virtual KernelId identity() const = 0;

    // Throws ProbeError
    virtual RawDeviceInfo probe() const = 0;

    // Canonical /sys/devices/... path of the node, empty if unknown
    virtual std::string sysfsPath() const = 0;
};

// DeviceNode over a file descriptor. Owns the descriptor only when asked to.
class FdDeviceNode : public DeviceNode {
public:
    FdDeviceNode(int fd, NodeKind kind, bool ownsFd = false);
    ~FdDeviceNode() override;

    FdDeviceNode(const FdDeviceNode&) = delete;
    FdDeviceNode& operator=(const FdDeviceNode&) = delete;

    // Opens path read-only and non-blocking. hidraw* nodes are opened as
    // Hidraw, everything else as Evdev. Throws ProbeError.
    static std::unique_ptr<FdDeviceNode> open(const std::string& path);

    NodeKind kind() const override { return nodeKind; }
    KernelId identity() const override;
    RawDeviceInfo probe() const override;
    std::string sysfsPath() const override;

    int fd() const { return descriptor; }

private:
    int descriptor;
    NodeKind nodeKind;
    bool owned;
};

} // namespace whodat
