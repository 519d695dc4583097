#include <gtest/gtest.h>
#include "TestDevices.hpp"
#include "core/Classifier.hpp"

using namespace whodat;
using namespace whodat::test;

TEST(ClassifierTest, MouseIsPointerOnly) {
    EXPECT_EQ(Classifier::classify(mouse()), CapabilitySet{Capability::Pointer});
}

TEST(ClassifierTest, RelativeMotionWithoutPrimaryButtonIsNotPointer) {
    RawDeviceInfo raw = evdevInfo("Wheel only", BUS_USB, 1, 2);
    setRel(raw, {REL_X, REL_Y});
    setKeys(raw, {BTN_RIGHT});
    EXPECT_TRUE(Classifier::classify(raw).empty());
}

TEST(ClassifierTest, FullKeyboard) {
    EXPECT_EQ(Classifier::classify(keyboard()), CapabilitySet{Capability::Keyboard});
}

TEST(ClassifierTest, MediaKeysAreNotAKeyboard) {
    RawDeviceInfo raw = evdevInfo("Consumer Control", BUS_USB, 1, 2);
    setKeys(raw, {KEY_VOLUMEUP, KEY_VOLUMEDOWN, KEY_MUTE, KEY_PLAYPAUSE, KEY_ENTER, KEY_SPACE});
    EXPECT_FALSE(Classifier::classify(raw).has(Capability::Keyboard));
}

TEST(ClassifierTest, ClickpadImpliesTouchpadAndPointer) {
    CapabilitySet caps = Classifier::classify(touchpad());
    EXPECT_EQ(caps, (CapabilitySet{Capability::Pointer, Capability::Touchpad, Capability::Clickpad}));
}

TEST(ClassifierTest, PressurepadImpliesClickpad) {
    RawDeviceInfo raw = touchpad();
    raw.properties.reset(INPUT_PROP_BUTTONPAD);
    raw.properties.set(0x07);  // INPUT_PROP_PRESSUREPAD
    CapabilitySet caps = Classifier::classify(raw);
    EXPECT_TRUE(caps.has(Capability::Pressurepad));
    EXPECT_TRUE(caps.has(Capability::Clickpad));
    EXPECT_TRUE(caps.has(Capability::Touchpad));
    EXPECT_TRUE(caps.has(Capability::Pointer));
}

TEST(ClassifierTest, Pointingstick) {
    RawDeviceInfo raw = evdevInfo("TPPS/2 IBM TrackPoint", BUS_I8042, 0x0002, 0x000a);
    setRel(raw, {REL_X, REL_Y});
    setKeys(raw, {BTN_LEFT, BTN_RIGHT, BTN_MIDDLE});
    raw.properties.set(INPUT_PROP_POINTER);
    raw.properties.set(INPUT_PROP_POINTING_STICK);
    EXPECT_EQ(Classifier::classify(raw), (CapabilitySet{Capability::Pointer, Capability::Pointingstick}));
}

TEST(ClassifierTest, Touchscreen) {
    RawDeviceInfo raw = evdevInfo("ELAN Touchscreen", BUS_USB, 0x04f3, 0x2494);
    setAbs(raw, {ABS_X, ABS_Y, ABS_MT_SLOT, ABS_MT_POSITION_X, ABS_MT_POSITION_Y});
    setKeys(raw, {BTN_TOUCH});
    raw.properties.set(INPUT_PROP_DIRECT);
    EXPECT_EQ(Classifier::classify(raw), CapabilitySet{Capability::Touchscreen});
}

TEST(ClassifierTest, ExternalTablet) {
    RawDeviceInfo raw = evdevInfo("Wacom Intuos Pro M Pen", BUS_USB, 0x056a, 0x0357);
    setAbs(raw, {ABS_X, ABS_Y, ABS_PRESSURE, ABS_TILT_X, ABS_TILT_Y});
    setKeys(raw, {BTN_TOOL_PEN, BTN_TOOL_RUBBER, BTN_TOUCH, BTN_STYLUS, BTN_STYLUS2});
    CapabilitySet caps = Classifier::classify(raw);
    EXPECT_EQ(caps, (CapabilitySet{Capability::Tablet, Capability::TabletExternal}));
}

TEST(ClassifierTest, ScreenTabletIsNotATouchscreen) {
    RawDeviceInfo raw = evdevInfo("Wacom Cintiq Pen", BUS_USB, 0x056a, 0x0390);
    setAbs(raw, {ABS_X, ABS_Y, ABS_PRESSURE});
    setKeys(raw, {BTN_TOOL_PEN, BTN_TOUCH, BTN_STYLUS});
    raw.properties.set(INPUT_PROP_DIRECT);
    CapabilitySet caps = Classifier::classify(raw);
    EXPECT_TRUE(caps.has(Capability::TabletScreen));
    EXPECT_TRUE(caps.has(Capability::Tablet));
    EXPECT_FALSE(caps.has(Capability::TabletExternal));
    EXPECT_FALSE(caps.has(Capability::Touchscreen));
}

TEST(ClassifierTest, TabletPad) {
    RawDeviceInfo raw = evdevInfo("Wacom Intuos Pro M Pad", BUS_USB, 0x056a, 0x0357);
    setAbs(raw, {ABS_X, ABS_Y, ABS_WHEEL});
    setKeys(raw, {BTN_0, BTN_1, BTN_2, BTN_3, BTN_STYLUS});
    CapabilitySet caps = Classifier::classify(raw);
    EXPECT_TRUE(caps.has(Capability::TabletPad));
}

TEST(ClassifierTest, Joystick) {
    RawDeviceInfo raw = evdevInfo("Logitech Extreme 3D", BUS_USB, 0x046d, 0xc215);
    setAbs(raw, {ABS_X, ABS_Y, ABS_RZ, ABS_THROTTLE, ABS_HAT0X, ABS_HAT0Y});
    setKeys(raw, {BTN_TRIGGER, BTN_THUMB, BTN_THUMB2, BTN_TOP});
    EXPECT_EQ(Classifier::classify(raw), CapabilitySet{Capability::Joystick});
}

TEST(ClassifierTest, Gamepad) {
    EXPECT_EQ(Classifier::classify(ds4Gamepad()), CapabilitySet{Capability::Gamepad});
    EXPECT_TRUE(Classifier::gamepadLayout(ds4Gamepad()));
}

TEST(ClassifierTest, GamepadLayoutNeedsSticksOrHat) {
    RawDeviceInfo raw = evdevInfo("Minimal pad", BUS_USB, 1, 2);
    setAbs(raw, {ABS_X, ABS_Y});
    setKeys(raw, {BTN_SOUTH, BTN_EAST, BTN_NORTH, BTN_WEST});
    EXPECT_TRUE(Classifier::classify(raw).has(Capability::Gamepad));
    EXPECT_FALSE(Classifier::gamepadLayout(raw));

    setAbs(raw, {ABS_HAT0X, ABS_HAT0Y});
    EXPECT_TRUE(Classifier::gamepadLayout(raw));
}

TEST(ClassifierTest, LidSwitch) {
    RawDeviceInfo raw = evdevInfo("Lid Switch", BUS_HOST, 0, 5);
    raw.events.set(EV_SW);
    raw.switches.set(SW_LID);
    EXPECT_EQ(Classifier::classify(raw), CapabilitySet{Capability::Switch});
}

TEST(ClassifierTest, EventTypeWithoutBitsAddsNothing) {
    RawDeviceInfo raw = evdevInfo("Empty", BUS_VIRTUAL, 0, 0);
    raw.events.set(EV_SW);
    raw.events.set(EV_REL);
    EXPECT_TRUE(Classifier::classify(raw).empty());
}

TEST(ClassifierTest, HidrawApplicationCollections) {
    RawDeviceInfo raw;
    raw.kind = NodeKind::Hidraw;
    raw.applications = {{hid::PAGE_GENERIC_DESKTOP, hid::GD_MOUSE},
                        {hid::PAGE_GENERIC_DESKTOP, hid::GD_KEYBOARD},
                        {hid::PAGE_CONSUMER, 0x01}};
    EXPECT_EQ(Classifier::classify(raw), (CapabilitySet{Capability::Pointer, Capability::Keyboard}));

    raw.applications = {{hid::PAGE_DIGITIZER, hid::DIGITIZER_TOUCHPAD}};
    EXPECT_EQ(Classifier::classify(raw), (CapabilitySet{Capability::Pointer, Capability::Touchpad}));

    raw.applications = {{hid::PAGE_GENERIC_DESKTOP, hid::GD_GAMEPAD}};
    EXPECT_EQ(Classifier::classify(raw), CapabilitySet{Capability::Gamepad});
    EXPECT_TRUE(Classifier::gamepadLayout(raw));
}

TEST(ClassifierTest, HidrawIgnoresEvdevBits) {
    RawDeviceInfo raw = mouse();
    raw.kind = NodeKind::Hidraw;
    EXPECT_TRUE(Classifier::classify(raw).empty());
}
