#include "Probe.hpp"
#include "HidReportDescriptor.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <vector>
#include <linux/hidraw.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <fmt/format.h>

namespace whodat {

namespace {

template<size_t N>
constexpr size_t byteCount() {
    return (N + 7) / 8;
}

[[noreturn]] void throwQueryError(int err, const std::string& what, bool identifying) {
    ProbeError::Code code = ProbeError::Code::QueryFailed;
    if (err == EACCES || err == EPERM) {
        code = ProbeError::Code::PermissionDenied;
    } else if (identifying && (err == ENOTTY || err == EINVAL)) {
        code = ProbeError::Code::NotADeviceNode;
    }
    throw ProbeError(code, fmt::format("{} failed: {}", what, std::strerror(err)));
}

template<size_t N>
void readBits(int fd, unsigned long request, std::bitset<N>& out, const char* what) {
    uint8_t buf[byteCount<N>()];
    std::memset(buf, 0, sizeof(buf));
    if (ioctl(fd, request, buf) < 0) {
        throwQueryError(errno, what, false);
    }
    for (size_t i = 0; i < N; i++) {
        if (buf[i / 8] & (1u << (i % 8))) {
            out.set(i);
        }
    }
}

// phys and uniq are optional; most virtual devices have neither
std::string readOptionalString(int fd, unsigned long request) {
    char buf[256];
    std::memset(buf, 0, sizeof(buf));
    if (ioctl(fd, request, buf) < 0) {
        return "";
    }
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

void checkBus(const RawDeviceInfo& info) {
    if (!Probe::isSupportedBus(info.busType)) {
        throw ProbeError(ProbeError::Code::UnsupportedBusType,
                         fmt::format("bus type 0x{:02x} is not supported", info.busType));
    }
}

} // namespace

std::string KernelId::toString() const {
    return fmt::format("{}:{}:{}", whodat::toString(kind), major(rdev), minor(rdev));
}

KernelId Probe::identify(int fd, NodeKind kind) {
    struct stat st;
    if (fstat(fd, &st) < 0) {
        throwQueryError(errno, "fstat", false);
    }
    if (!S_ISCHR(st.st_mode)) {
        throw ProbeError(ProbeError::Code::NotADeviceNode, "not a character device");
    }
    return KernelId{st.st_rdev, kind};
}

RawDeviceInfo Probe::run(int fd, NodeKind kind) {
    identify(fd, kind);
    RawDeviceInfo info = (kind == NodeKind::Evdev) ? evdev(fd) : hidraw(fd);
    debug("Probed {} node '{}' bus={} {:04x}:{:04x}", whodat::toString(kind), info.name,
          busName(info.busType), info.vendor, info.product);
    return info;
}

RawDeviceInfo Probe::evdev(int fd) {
    RawDeviceInfo info;
    info.kind = NodeKind::Evdev;

    // The first evdev ioctl decides whether this is an evdev node at all
    int driverVersion = 0;
    if (ioctl(fd, EVIOCGVERSION, &driverVersion) < 0) {
        throwQueryError(errno, "EVIOCGVERSION", true);
    }

    struct input_id inputId;
    if (ioctl(fd, EVIOCGID, &inputId) < 0) {
        throwQueryError(errno, "EVIOCGID", false);
    }
    info.busType = inputId.bustype;
    info.vendor = inputId.vendor;
    info.product = inputId.product;
    info.version = inputId.version;
    checkBus(info);

    char name[256];
    std::memset(name, 0, sizeof(name));
    if (ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name) < 0) {
        throwQueryError(errno, "EVIOCGNAME", false);
    }
    info.name = name;
    info.phys = readOptionalString(fd, EVIOCGPHYS(255));
    info.uniq = readOptionalString(fd, EVIOCGUNIQ(255));

    readBits(fd, EVIOCGBIT(0, byteCount<EV_CNT>()), info.events, "EVIOCGBIT(events)");
    if (info.events.test(EV_KEY)) {
        readBits(fd, EVIOCGBIT(EV_KEY, byteCount<KEY_CNT>()), info.keys, "EVIOCGBIT(EV_KEY)");
    }
    if (info.events.test(EV_REL)) {
        readBits(fd, EVIOCGBIT(EV_REL, byteCount<REL_CNT>()), info.relAxes, "EVIOCGBIT(EV_REL)");
    }
    if (info.events.test(EV_ABS)) {
        readBits(fd, EVIOCGBIT(EV_ABS, byteCount<ABS_CNT>()), info.absAxes, "EVIOCGBIT(EV_ABS)");
    }
    if (info.events.test(EV_SW)) {
        readBits(fd, EVIOCGBIT(EV_SW, byteCount<SW_CNT>()), info.switches, "EVIOCGBIT(EV_SW)");
    }
    readBits(fd, EVIOCGPROP(byteCount<INPUT_PROP_CNT>()), info.properties, "EVIOCGPROP");

    return info;
}

RawDeviceInfo Probe::hidraw(int fd) {
    RawDeviceInfo info;
    info.kind = NodeKind::Hidraw;

    struct hidraw_devinfo devinfo;
    std::memset(&devinfo, 0, sizeof(devinfo));
    if (ioctl(fd, HIDIOCGRAWINFO, &devinfo) < 0) {
        throwQueryError(errno, "HIDIOCGRAWINFO", true);
    }
    info.busType = static_cast<uint16_t>(devinfo.bustype);
    info.vendor = static_cast<uint16_t>(devinfo.vendor);
    info.product = static_cast<uint16_t>(devinfo.product);
    checkBus(info);

    char name[256];
    std::memset(name, 0, sizeof(name));
    if (ioctl(fd, HIDIOCGRAWNAME(sizeof(name) - 1), name) < 0) {
        throwQueryError(errno, "HIDIOCGRAWNAME", false);
    }
    info.name = name;
    info.phys = readOptionalString(fd, HIDIOCGRAWPHYS(255));
    info.uniq = readOptionalString(fd, HIDIOCGRAWUNIQ(255));

    int descriptorSize = 0;
    if (ioctl(fd, HIDIOCGRDESCSIZE, &descriptorSize) < 0) {
        throwQueryError(errno, "HIDIOCGRDESCSIZE", false);
    }
    if (descriptorSize < 0 || descriptorSize > HID_MAX_DESCRIPTOR_SIZE) {
        throw ProbeError(ProbeError::Code::QueryFailed,
                         fmt::format("invalid report descriptor size {}", descriptorSize));
    }

    struct hidraw_report_descriptor descriptor;
    std::memset(&descriptor, 0, sizeof(descriptor));
    descriptor.size = static_cast<uint32_t>(descriptorSize);
    if (ioctl(fd, HIDIOCGRDESC, &descriptor) < 0) {
        throwQueryError(errno, "HIDIOCGRDESC", false);
    }

    std::string parseError;
    auto summary = HidReportDescriptor::parse(descriptor.value, descriptor.size, &parseError);
    if (!summary) {
        throw ProbeError(ProbeError::Code::QueryFailed, "malformed report descriptor: " + parseError);
    }
    info.applications = std::move(summary->applications);
    info.usagePages = std::move(summary->usagePages);
    return info;
}

bool Probe::isSupportedBus(uint16_t busType) {
    switch (busType) {
        case BUS_PCI:
        case BUS_USB:
        case BUS_BLUETOOTH:
        case BUS_VIRTUAL:
        case BUS_ISA:
        case BUS_I8042:
        case BUS_RS232:
        case BUS_PARPORT:
        case BUS_ADB:
        case BUS_I2C:
        case BUS_HOST:
        case BUS_SPI:
        case BUS_RMI:
        case BUS_INTEL_ISHTP:
        case BUS_AMD_SFH:
            return true;
        default:
            return false;
    }
}

std::string Probe::busName(uint16_t busType) {
    switch (busType) {
        case BUS_PCI: return "pci";
        case BUS_USB: return "usb";
        case BUS_BLUETOOTH: return "bluetooth";
        case BUS_VIRTUAL: return "virtual";
        case BUS_ISA: return "isa";
        case BUS_I8042: return "i8042";
        case BUS_RS232: return "rs232";
        case BUS_PARPORT: return "parport";
        case BUS_ADB: return "adb";
        case BUS_I2C: return "i2c";
        case BUS_HOST: return "host";
        case BUS_SPI: return "spi";
        case BUS_RMI: return "rmi";
        case BUS_INTEL_ISHTP: return "ishtp";
        case BUS_AMD_SFH: return "amd-sfh";
        default: return fmt::format("0x{:02x}", busType);
    }
}

} // namespace whodat
