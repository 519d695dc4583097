#include "Classifier.hpp"

#ifndef INPUT_PROP_PRESSUREPAD
#define INPUT_PROP_PRESSUREPAD 0x07
#endif

namespace whodat {

namespace {

struct Rule {
    Capability capability;
    bool (*matches)(const RawDeviceInfo& raw);
};

bool hasPenTool(const RawDeviceInfo& raw) {
    return raw.hasKey(BTN_TOOL_PEN);
}

bool hasAbsXY(const RawDeviceInfo& raw) {
    return raw.hasEventType(EV_ABS) && raw.hasAbsoluteAxis(ABS_X) && raw.hasAbsoluteAxis(ABS_Y);
}

bool hasMtXY(const RawDeviceInfo& raw) {
    return raw.hasEventType(EV_ABS) && raw.hasAbsoluteAxis(ABS_MT_POSITION_X) &&
           raw.hasAbsoluteAxis(ABS_MT_POSITION_Y);
}

bool isKeyboard(const RawDeviceInfo& raw) {
    if (!raw.hasEventType(EV_KEY)) return false;

    // Letters are not contiguous in evdev codes: Q-P, A-L, Z-M
    int letters = raw.countKeysInRange(KEY_Q, KEY_P) + raw.countKeysInRange(KEY_A, KEY_L) +
                  raw.countKeysInRange(KEY_Z, KEY_M);
    int digits = raw.countKeysInRange(KEY_1, KEY_0);
    return letters >= 20 && digits >= 8 && raw.hasKey(KEY_SPACE) && raw.hasKey(KEY_ENTER);
}

bool isPointer(const RawDeviceInfo& raw) {
    return raw.hasEventType(EV_REL) && raw.hasRelativeAxis(REL_X) && raw.hasRelativeAxis(REL_Y) &&
           raw.hasKey(BTN_LEFT);
}

bool isPointingstick(const RawDeviceInfo& raw) {
    return raw.hasProperty(INPUT_PROP_POINTING_STICK) && raw.hasEventType(EV_REL) &&
           raw.hasRelativeAxis(REL_X) && raw.hasRelativeAxis(REL_Y);
}

bool isTouchpad(const RawDeviceInfo& raw) {
    return (hasMtXY(raw) || hasAbsXY(raw)) && raw.hasKey(BTN_TOOL_FINGER) && !hasPenTool(raw) &&
           !raw.hasProperty(INPUT_PROP_DIRECT);
}

bool isClickpad(const RawDeviceInfo& raw) {
    return isTouchpad(raw) && raw.hasProperty(INPUT_PROP_BUTTONPAD);
}

bool isPressurepad(const RawDeviceInfo& raw) {
    return isTouchpad(raw) && raw.hasProperty(INPUT_PROP_PRESSUREPAD);
}

bool isTouchscreen(const RawDeviceInfo& raw) {
    bool positions = hasMtXY(raw) || (hasAbsXY(raw) && raw.hasKey(BTN_TOUCH));
    return positions && raw.hasProperty(INPUT_PROP_DIRECT) && !hasPenTool(raw);
}

bool isTablet(const RawDeviceInfo& raw) {
    return (hasPenTool(raw) || raw.hasKey(BTN_STYLUS)) && hasAbsXY(raw);
}

bool isTabletScreen(const RawDeviceInfo& raw) {
    return isTablet(raw) && raw.hasProperty(INPUT_PROP_DIRECT);
}

bool isTabletExternal(const RawDeviceInfo& raw) {
    return isTablet(raw) && !raw.hasProperty(INPUT_PROP_DIRECT);
}

bool isTabletPad(const RawDeviceInfo& raw) {
    bool ringOrStrip = raw.hasAbsoluteAxis(ABS_WHEEL) || raw.hasAbsoluteAxis(ABS_THROTTLE) ||
                       raw.hasAbsoluteAxis(ABS_MISC);
    return raw.hasKey(BTN_0) && ringOrStrip && !hasPenTool(raw);
}

bool isJoystick(const RawDeviceInfo& raw) {
    return raw.hasEventType(EV_ABS) && raw.countAbsoluteAxes() >= 2 &&
           raw.countKeysInRange(BTN_JOYSTICK, BTN_DEAD) >= 1;
}

bool isGamepad(const RawDeviceInfo& raw) {
    return raw.countKeysInRange(BTN_GAMEPAD, BTN_THUMBR) >= 4 && hasAbsXY(raw);
}

bool isSwitch(const RawDeviceInfo& raw) {
    return raw.hasEventType(EV_SW) && raw.switches.any();
}

// Rules are independent; each adds at most one capability.
const Rule kEvdevRules[] = {
    {Capability::Keyboard, isKeyboard},
    {Capability::Pointer, isPointer},
    {Capability::Pointingstick, isPointingstick},
    {Capability::Touchpad, isTouchpad},
    {Capability::Clickpad, isClickpad},
    {Capability::Pressurepad, isPressurepad},
    {Capability::Touchscreen, isTouchscreen},
    {Capability::Tablet, isTablet},
    {Capability::TabletScreen, isTabletScreen},
    {Capability::TabletExternal, isTabletExternal},
    {Capability::TabletPad, isTabletPad},
    {Capability::Joystick, isJoystick},
    {Capability::Gamepad, isGamepad},
    {Capability::Switch, isSwitch},
};

struct HidRule {
    uint16_t page;
    uint16_t usage;
    Capability capability;
};

const HidRule kHidRules[] = {
    {hid::PAGE_GENERIC_DESKTOP, hid::GD_POINTER, Capability::Pointer},
    {hid::PAGE_GENERIC_DESKTOP, hid::GD_MOUSE, Capability::Pointer},
    {hid::PAGE_GENERIC_DESKTOP, hid::GD_KEYBOARD, Capability::Keyboard},
    {hid::PAGE_GENERIC_DESKTOP, hid::GD_KEYPAD, Capability::Keyboard},
    {hid::PAGE_GENERIC_DESKTOP, hid::GD_JOYSTICK, Capability::Joystick},
    {hid::PAGE_GENERIC_DESKTOP, hid::GD_GAMEPAD, Capability::Gamepad},
    {hid::PAGE_DIGITIZER, hid::DIGITIZER_PEN, Capability::Tablet},
    {hid::PAGE_DIGITIZER, hid::DIGITIZER_TOUCHSCREEN, Capability::Touchscreen},
    {hid::PAGE_DIGITIZER, hid::DIGITIZER_TOUCHPAD, Capability::Touchpad},
};

} // namespace

CapabilitySet Classifier::classify(const RawDeviceInfo& raw) {
    CapabilitySet caps = raw.kind == NodeKind::Hidraw ? classifyHidraw(raw) : classifyEvdev(raw);
    addImplied(caps);
    return caps;
}

CapabilitySet Classifier::classifyEvdev(const RawDeviceInfo& raw) {
    CapabilitySet caps;
    for (const auto& rule : kEvdevRules) {
        if (rule.matches(raw)) {
            caps.set(rule.capability);
        }
    }
    return caps;
}

CapabilitySet Classifier::classifyHidraw(const RawDeviceInfo& raw) {
    CapabilitySet caps;
    for (const auto& rule : kHidRules) {
        if (raw.hasApplication(rule.page, rule.usage)) {
            caps.set(rule.capability);
        }
    }
    return caps;
}

void Classifier::addImplied(CapabilitySet& caps) {
    if (caps.has(Capability::Pressurepad)) caps.set(Capability::Clickpad);
    if (caps.has(Capability::Clickpad)) caps.set(Capability::Touchpad);
    if (caps.has(Capability::Touchpad)) caps.set(Capability::Pointer);
    if (caps.has(Capability::Pointingstick)) caps.set(Capability::Pointer);
    if (caps.has(Capability::TabletScreen) || caps.has(Capability::TabletExternal)) {
        caps.set(Capability::Tablet);
    }
}

bool Classifier::gamepadLayout(const RawDeviceInfo& raw) {
    if (raw.kind == NodeKind::Hidraw) {
        return raw.hasApplication(hid::PAGE_GENERIC_DESKTOP, hid::GD_GAMEPAD);
    }
    if (!isGamepad(raw)) return false;

    bool rightStick = raw.hasAbsoluteAxis(ABS_RX) && raw.hasAbsoluteAxis(ABS_RY);
    bool hat = raw.hasAbsoluteAxis(ABS_HAT0X) && raw.hasAbsoluteAxis(ABS_HAT0Y);
    return rightStick || hat;
}

} // namespace whodat
