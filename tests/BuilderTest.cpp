#include <gtest/gtest.h>
#include "TestDevices.hpp"
#include "core/Database.hpp"
#include "core/Device.hpp"

using namespace whodat;
using namespace whodat::test;

TEST(BuilderTest, NoSourceIsFatal) {
    try {
        Builder().name("Only a name").build();
        FAIL() << "expected BuildError";
    } catch (const BuildError& e) {
        EXPECT_EQ(e.code(), BuildError::Code::NoSource);
    }
}

TEST(BuilderTest, TwoSourcesAreAmbiguous) {
    FakeDeviceNode node(64, mouse());
    try {
        Builder().node(node).raw(keyboard()).build();
        FAIL() << "expected BuildError";
    } catch (const BuildError& e) {
        EXPECT_EQ(e.code(), BuildError::Code::AmbiguousSource);
    }
    EXPECT_EQ(node.probes.load(), 0);
}

TEST(BuilderTest, UsbIdOfKnownGamepad) {
    Database db;
    BuildResult result = Builder().usbId(0x054c, 0x09cc).database(db).build();
    const Device& device = result.device;
    EXPECT_TRUE(device.complete());
    EXPECT_EQ(device.physicalType(), PhysicalType::Gamepad);
    EXPECT_TRUE(device.hasCapability(Capability::Gamepad));
    EXPECT_EQ(device.bus(), BUS_USB);
    EXPECT_EQ(device.vendor(), 0x054c);
    EXPECT_EQ(device.product(), 0x09cc);
    EXPECT_FALSE(device.name().empty());
    EXPECT_FALSE(result.raw.has_value());
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(BuilderTest, GamepadTouchpadNodeAloneIsStillAGamepad) {
    Database db;
    FakeDeviceNode node(70, ds4Touchpad());
    BuildResult result = Builder().node(node).database(db).build();
    EXPECT_EQ(result.device.physicalType(), PhysicalType::Gamepad);
    EXPECT_TRUE(result.device.hasCapability(Capability::Gamepad));
    EXPECT_TRUE(result.device.hasCapability(Capability::Touchpad));
    EXPECT_EQ(result.device.name(), "Sony Interactive Entertainment Wireless Controller Touchpad");
    EXPECT_EQ(node.probes.load(), 1);
}

TEST(BuilderTest, UnknownUsbIdHasNothing) {
    Database db;
    BuildResult result = Builder().usbId(0xdead, 0xbeef).database(db).build();
    EXPECT_FALSE(result.device.physicalType().has_value());
    EXPECT_TRUE(result.device.capabilities().empty());
    EXPECT_TRUE(result.device.complete());
    EXPECT_EQ(result.device.name(), "");
}

TEST(BuilderTest, RelativeMouseWithoutDatabaseHit) {
    Database db = Database::empty();
    BuildResult result = Builder().raw(mouse()).database(db).build();
    EXPECT_EQ(result.device.capabilities(), CapabilitySet{Capability::Pointer});
    EXPECT_EQ(result.device.physicalType(), PhysicalType::Mouse);
    EXPECT_EQ(result.resolution.source, Resolution::Source::Heuristic);
}

TEST(BuilderTest, MismatchedUsbIdIsReportedAndNodeWins) {
    Database db;
    FakeDeviceNode node(71, ds4Gamepad());
    BuildResult result = Builder().node(node).usbId(0x045e, 0x028e).database(db).build();
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code(), BuildError::Code::IdMismatch);
    EXPECT_EQ(result.device.vendor(), 0x054c);
    EXPECT_EQ(result.device.product(), 0x09cc);
}

TEST(BuilderTest, MatchingUsbIdIsQuiet) {
    Database db;
    BuildResult result = Builder().raw(ds4Gamepad()).usbId(0x054c, 0x09cc).database(db).build();
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(BuilderTest, NameOverride) {
    BuildResult result = Builder().raw(mouse()).name("Left hand mouse").database(Database::Global()).build();
    EXPECT_EQ(result.device.name(), "Left hand mouse");
}

TEST(BuilderTest, ProbeErrorAbortsBuild) {
    FakeDeviceNode node(72, mouse());
    node.failWith = ProbeError::Code::PermissionDenied;
    try {
        Builder().node(node).build();
        FAIL() << "expected ProbeError";
    } catch (const ProbeError& e) {
        EXPECT_EQ(e.code(), ProbeError::Code::PermissionDenied);
    }
}

TEST(DeviceTest, DefaultIsIncomplete) {
    Device device;
    EXPECT_FALSE(device.complete());
    EXPECT_FALSE(device.parent().has_value());
    EXPECT_TRUE(device.capabilities().empty());
}

TEST(DeviceTest, WithParentCopies) {
    Device device("Mouse", BUS_USB, 1, 2, {Capability::Pointer}, PhysicalType::Mouse);
    Device child = device.withParent(7);
    EXPECT_FALSE(device.parent().has_value());
    EXPECT_EQ(child.parent(), 7u);
    EXPECT_EQ(child.name(), "Mouse");
    EXPECT_EQ(child.physicalType(), PhysicalType::Mouse);
}
