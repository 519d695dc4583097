#include "DeviceNode.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/sysmacros.h>
#include <unistd.h>
#include <fmt/format.h>

namespace whodat {

FdDeviceNode::FdDeviceNode(int fd, NodeKind kind, bool ownsFd)
    : descriptor(fd), nodeKind(kind), owned(ownsFd) {}

FdDeviceNode::~FdDeviceNode() {
    if (owned && descriptor >= 0) {
        close(descriptor);
    }
}

std::unique_ptr<FdDeviceNode> FdDeviceNode::open(const std::string& path) {
    std::string base = std::filesystem::path(path).filename().string();
    NodeKind kind = base.rfind("hidraw", 0) == 0 ? NodeKind::Hidraw : NodeKind::Evdev;

    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        auto code = (err == EACCES || err == EPERM) ? ProbeError::Code::PermissionDenied
                                                    : ProbeError::Code::QueryFailed;
        throw ProbeError(code, fmt::format("Failed to open {}: {}", path, std::strerror(err)));
    }
    debug("Opened {} as {} node (fd {})", path, toString(kind), fd);
    return std::make_unique<FdDeviceNode>(fd, kind, true);
}

KernelId FdDeviceNode::identity() const {
    return Probe::identify(descriptor, nodeKind);
}

RawDeviceInfo FdDeviceNode::probe() const {
    return Probe::run(descriptor, nodeKind);
}

std::string FdDeviceNode::sysfsPath() const {
    KernelId id = identity();
    std::string link = fmt::format("/sys/dev/char/{}:{}", major(id.rdev), minor(id.rdev));
    std::error_code ec;
    auto resolved = std::filesystem::canonical(link, ec);
    if (ec) {
        debug("No sysfs entry for {}: {}", link, ec.message());
        return "";
    }
    return resolved.string();
}

} // namespace whodat
