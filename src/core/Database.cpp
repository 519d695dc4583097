#include "Database.hpp"
#include "utils/Logger.hpp"
#include <linux/input.h>
#include <fmt/format.h>

namespace whodat {

namespace {

DatabaseEntry entry(std::optional<PhysicalType> type, CapabilitySet caps, GroupingRule grouping,
                    const char* description) {
    DatabaseEntry e;
    e.physicalType = type;
    e.capabilities = caps;
    e.grouping = grouping;
    e.description = description;
    return e;
}

const char* keyKindName(DeviceKey::Kind kind) {
    switch (kind) {
        case DeviceKey::Kind::Exact: return "exact";
        case DeviceKey::Kind::Product: return "vendor/product";
        case DeviceKey::Kind::Bus: return "bus default";
    }
    return "unknown";
}

} // namespace

std::string DeviceKey::toString() const {
    switch (kind) {
        case Kind::Exact: return fmt::format("{:04x}:{:04x}:{:04x}", bus, vendor, product);
        case Kind::Product: return fmt::format("*:{:04x}:{:04x}", vendor, product);
        case Kind::Bus: return fmt::format("{:04x}:*", bus);
    }
    return "";
}

const OverrideTable& builtinTable() {
    using K = DeviceKey;
    using P = PhysicalType;
    using C = Capability;
    using G = GroupingRule;

    static const OverrideTable table = {
        // Sony. Gamepad, touchpad and motion nodes hang off one HID device on USB and Bluetooth.
        {K::anyBus(0x054c, 0x0268), entry(P::Gamepad, {C::Gamepad}, G::HidDevice, "Sony PLAYSTATION(R)3 Controller")},
        {K::anyBus(0x054c, 0x05c4), entry(P::Gamepad, {C::Gamepad}, G::HidDevice, "Sony DualShock 4")},
        {K::anyBus(0x054c, 0x09cc), entry(P::Gamepad, {C::Gamepad}, G::HidDevice, "Sony DualShock 4 (2nd gen)")},
        {K::anyBus(0x054c, 0x0ce6), entry(P::Gamepad, {C::Gamepad}, G::HidDevice, "Sony DualSense")},
        {K::anyBus(0x054c, 0x0df2), entry(P::Gamepad, {C::Gamepad}, G::HidDevice, "Sony DualSense Edge")},

        // Microsoft. xpad on USB, hid-microsoft over Bluetooth.
        {K::exact(BUS_USB, 0x045e, 0x028e), entry(P::Gamepad, {C::Gamepad}, G::UsbDevice, "Microsoft Xbox 360 Controller")},
        {K::exact(BUS_USB, 0x045e, 0x02dd), entry(P::Gamepad, {C::Gamepad}, G::UsbDevice, "Microsoft Xbox One Controller")},
        {K::exact(BUS_USB, 0x045e, 0x02ea), entry(P::Gamepad, {C::Gamepad}, G::UsbDevice, "Microsoft Xbox One S Controller")},
        {K::exact(BUS_USB, 0x045e, 0x0b12), entry(P::Gamepad, {C::Gamepad}, G::UsbDevice, "Microsoft Xbox Series X|S Controller")},
        {K::exact(BUS_BLUETOOTH, 0x045e, 0x0b13), entry(P::Gamepad, {C::Gamepad}, G::Uniq, "Microsoft Xbox Wireless Controller")},

        // Nintendo
        {K::anyBus(0x057e, 0x2006), entry(P::GameController, {}, G::HidDevice, "Nintendo Joy-Con (L)")},
        {K::anyBus(0x057e, 0x2007), entry(P::GameController, {}, G::HidDevice, "Nintendo Joy-Con (R)")},
        {K::anyBus(0x057e, 0x2009), entry(P::Gamepad, {C::Gamepad}, G::HidDevice, "Nintendo Switch Pro Controller")},

        // Valve
        {K::anyBus(0x28de, 0x1102), entry(P::GameController, {}, G::UsbDevice, "Valve Steam Controller")},
        {K::anyBus(0x28de, 0x1142), entry(P::GameController, {}, G::UsbDevice, "Valve Steam Controller Dongle")},
        {K::anyBus(0x28de, 0x1205), entry(P::GameController, {}, G::UsbDevice, "Valve Steam Deck")},

        // Racing wheels
        {K::anyBus(0x046d, 0xc24f), entry(P::RacingWheel, {C::Joystick}, G::UsbDevice, "Logitech G29 Driving Force")},
        {K::anyBus(0x046d, 0xc262), entry(P::RacingWheel, {C::Joystick}, G::UsbDevice, "Logitech G920 Driving Force")},
        {K::anyBus(0x046d, 0xc266), entry(P::RacingWheel, {C::Joystick}, G::UsbDevice, "Logitech G923")},
        {K::anyBus(0x044f, 0xb66e), entry(P::RacingWheel, {C::Joystick}, G::UsbDevice, "Thrustmaster T300RS")},

        // Flight sticks
        {K::anyBus(0x046d, 0xc215), entry(P::Joystick, {C::Joystick}, G::UsbDevice, "Logitech Extreme 3D Pro")},
        {K::anyBus(0x044f, 0xb10a), entry(P::Joystick, {C::Joystick}, G::UsbDevice, "Thrustmaster T.16000M")},

        // Pedals
        {K::anyBus(0x05f3, 0x00ff), entry(P::FootPedal, {}, G::UsbDevice, "VEC Infinity USB Foot Pedal")},

        // Trackballs
        {K::anyBus(0x047d, 0x1020), entry(P::Trackball, {C::Trackball}, G::UsbDevice, "Kensington Expert Mouse")},
        {K::anyBus(0x046d, 0xc408), entry(P::Trackball, {C::Trackball}, G::UsbDevice, "Logitech Marble Mouse")},

        // Tablets
        {K::anyBus(0x056a, 0x0357), entry(P::Tablet, {}, G::UsbDevice, "Wacom Intuos Pro M")},

        // Bus defaults only decide how siblings are grouped
        {K::busDefault(BUS_USB), entry(std::nullopt, {}, G::UsbDevice, "USB")},
        {K::busDefault(BUS_BLUETOOTH), entry(std::nullopt, {}, G::Uniq, "Bluetooth")},
        {K::busDefault(BUS_I2C), entry(std::nullopt, {}, G::HidDevice, "I2C")},
    };
    return table;
}

std::once_flag Database::initFlag;
std::unique_ptr<Database> Database::instance;

Database::Database(const OverrideTable& overrides) {
    merge(builtinTable());
    merge(overrides);
}

Database Database::empty() {
    return Database(EmptyTag{});
}

void Database::merge(const OverrideTable& table) {
    for (const auto& [key, value] : table) {
        entries[key] = value;
    }
}

std::optional<DatabaseMatch> Database::lookup(uint16_t bus, uint16_t vendor, uint16_t product) const {
    const DeviceKey keys[] = {
        DeviceKey::exact(bus, vendor, product),
        DeviceKey::anyBus(vendor, product),
        DeviceKey::busDefault(bus),
    };
    for (const auto& key : keys) {
        auto it = entries.find(key);
        if (it != entries.end()) {
            debug("Database hit ({}) for {:04x}:{:04x}:{:04x}: {}", keyKindName(key.kind), bus,
                  vendor, product, it->second.description);
            return DatabaseMatch{key.kind, it->second};
        }
    }
    debug("Database miss for {:04x}:{:04x}:{:04x}", bus, vendor, product);
    return std::nullopt;
}

void Database::Initialize(const OverrideTable& overrides) {
    std::call_once(initFlag, [&overrides]() {
        instance = std::make_unique<Database>(overrides);
        info("Device database loaded: {} entries, {} overrides", instance->size(), overrides.size());
    });
}

const Database& Database::Global() {
    Initialize();
    return *instance;
}

} // namespace whodat
