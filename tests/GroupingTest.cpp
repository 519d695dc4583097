#include <gtest/gtest.h>
#include "TestDevices.hpp"
#include "core/Grouping.hpp"

using namespace whodat;
using namespace whodat::test;

namespace {

const std::string kHid = "0003:054C:09CC.0005";
const std::string kEvent = usbSysfs("1-2", kHid, "input/input23/event5");
const std::string kHidraw = usbSysfs("1-2", kHid, "hidraw/hidraw2");

} // namespace

TEST(GroupingTest, UsbDeviceAncestor) {
    EXPECT_EQ(findUsbDeviceAncestor(kEvent), "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-2");
    EXPECT_EQ(findUsbDeviceAncestor(
                  "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-2/1-2.4/1-2.4:1.0/0003:046D:C52B.0001/hidraw/hidraw0"),
              "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-2/1-2.4");
    EXPECT_EQ(findUsbDeviceAncestor("/sys/devices/platform/i8042/serio1/input/input5/event4"), "");
}

TEST(GroupingTest, HidDeviceAncestor) {
    EXPECT_EQ(findHidDeviceAncestor(kHidraw),
              "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-2/1-2:1.3/0003:054C:09CC.0005");
    EXPECT_EQ(findHidDeviceAncestor("/sys/devices/virtual/input/input9/event9"), "");
}

TEST(GroupingTest, SiblingsShareKeys) {
    RawDeviceInfo gamepad = ds4Gamepad();
    RawDeviceInfo touch = ds4Touchpad();

    for (GroupingRule rule : {GroupingRule::UsbDevice, GroupingRule::HidDevice, GroupingRule::Uniq}) {
        auto a = deriveGroupingKey(rule, gamepad, kEvent);
        auto b = deriveGroupingKey(rule, touch, kHidraw);
        ASSERT_TRUE(a.has_value()) << toString(rule);
        EXPECT_EQ(a, b) << toString(rule);
        EXPECT_EQ(a->rfind(std::string(toString(rule)) + ":0003:054c:09cc:", 0), 0u) << *a;
    }
}

TEST(GroupingTest, DifferentPortsDoNotCollide) {
    auto a = deriveGroupingKey(GroupingRule::UsbDevice, ds4Gamepad(), kEvent);
    auto b = deriveGroupingKey(GroupingRule::UsbDevice, ds4Gamepad(),
                               usbSysfs("1-3", "0003:054C:09CC.0006", "input/input30/event9"));
    ASSERT_TRUE(a && b);
    EXPECT_NE(*a, *b);
}

TEST(GroupingTest, NoKeyWithoutEvidence) {
    RawDeviceInfo raw = mouse();
    EXPECT_FALSE(deriveGroupingKey(GroupingRule::None, raw, kEvent).has_value());
    EXPECT_FALSE(deriveGroupingKey(GroupingRule::Uniq, raw, kEvent).has_value());
    EXPECT_FALSE(deriveGroupingKey(GroupingRule::UsbDevice, raw, "").has_value());
    EXPECT_FALSE(deriveGroupingKey(GroupingRule::HidDevice, raw, "/sys/devices/virtual/input/input3/event3").has_value());
}

TEST(GroupingTest, RuleTags) {
    EXPECT_EQ(groupingRuleFromString("usb-device"), GroupingRule::UsbDevice);
    EXPECT_EQ(groupingRuleFromString(toString(GroupingRule::Uniq)), GroupingRule::Uniq);
    EXPECT_FALSE(groupingRuleFromString("bus").has_value());
}
