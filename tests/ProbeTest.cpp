#include <gtest/gtest.h>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include "core/Errors.hpp"
#include "core/io/DeviceNode.hpp"
#include "core/io/Probe.hpp"

using namespace whodat;

namespace {

ProbeError::Code probeError(int fd, NodeKind kind) {
    try {
        Probe::run(fd, kind);
    } catch (const ProbeError& e) {
        return e.code();
    }
    ADD_FAILURE() << "probe succeeded";
    return ProbeError::Code::QueryFailed;
}

} // namespace

TEST(ProbeTest, RegularFileIsNotADeviceNode) {
    FILE* file = std::tmpfile();
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(probeError(fileno(file), NodeKind::Evdev), ProbeError::Code::NotADeviceNode);
    EXPECT_EQ(probeError(fileno(file), NodeKind::Hidraw), ProbeError::Code::NotADeviceNode);
    std::fclose(file);
}

TEST(ProbeTest, OtherCharacterDeviceIsNotADeviceNode) {
    int fd = open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);
    EXPECT_EQ(probeError(fd, NodeKind::Evdev), ProbeError::Code::NotADeviceNode);
    EXPECT_EQ(probeError(fd, NodeKind::Hidraw), ProbeError::Code::NotADeviceNode);
    close(fd);
}

TEST(ProbeTest, BadDescriptorFailsTheQuery) {
    EXPECT_EQ(probeError(-1, NodeKind::Evdev), ProbeError::Code::QueryFailed);
}

TEST(ProbeTest, IdentifyUsesDeviceNumber) {
    int fd = open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);
    KernelId a = Probe::identify(fd, NodeKind::Evdev);
    KernelId b = Probe::identify(fd, NodeKind::Hidraw);
    EXPECT_EQ(a.rdev, b.rdev);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.toString(), "evdev:1:3");
    close(fd);
}

TEST(ProbeTest, SupportedBuses) {
    EXPECT_TRUE(Probe::isSupportedBus(BUS_USB));
    EXPECT_TRUE(Probe::isSupportedBus(BUS_BLUETOOTH));
    EXPECT_TRUE(Probe::isSupportedBus(BUS_I2C));
    EXPECT_TRUE(Probe::isSupportedBus(BUS_AMD_SFH));
    EXPECT_FALSE(Probe::isSupportedBus(BUS_GSC));
    EXPECT_FALSE(Probe::isSupportedBus(0));
    EXPECT_EQ(Probe::busName(BUS_USB), "usb");
    EXPECT_EQ(Probe::busName(0x7f), "0x7f");
}

TEST(FdDeviceNodeTest, OpenMissingNodeFails) {
    try {
        FdDeviceNode::open("/dev/input/event-does-not-exist");
        FAIL() << "expected ProbeError";
    } catch (const ProbeError& e) {
        EXPECT_EQ(e.code(), ProbeError::Code::QueryFailed);
    }
}

TEST(FdDeviceNodeTest, KindFollowsNodeName) {
    auto node = FdDeviceNode::open("/dev/null");
    EXPECT_EQ(node->kind(), NodeKind::Evdev);
    EXPECT_THROW(node->probe(), ProbeError);
}
