#include <gtest/gtest.h>
#include <sstream>
#include "core/Database.hpp"
#include "core/DatabaseOverrides.hpp"

using namespace whodat;

TEST(DatabaseTest, ExactBeatsVendorProductBeatsBus) {
    OverrideTable overrides = {
        {DeviceKey::exact(BUS_BLUETOOTH, 0x1111, 0x2222), {PhysicalType::Keyboard, {}, GroupingRule::Uniq, "exact"}},
        {DeviceKey::anyBus(0x1111, 0x2222), {PhysicalType::Mouse, {}, GroupingRule::UsbDevice, "pair"}},
    };
    Database db(overrides);

    auto exact = db.lookup(BUS_BLUETOOTH, 0x1111, 0x2222);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->kind, DeviceKey::Kind::Exact);
    EXPECT_EQ(exact->entry.physicalType, PhysicalType::Keyboard);

    auto pair = db.lookup(BUS_USB, 0x1111, 0x2222);
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(pair->kind, DeviceKey::Kind::Product);
    EXPECT_EQ(pair->entry.physicalType, PhysicalType::Mouse);

    auto bus = db.lookup(BUS_USB, 0x1111, 0x3333);
    ASSERT_TRUE(bus.has_value());
    EXPECT_EQ(bus->kind, DeviceKey::Kind::Bus);
    EXPECT_FALSE(bus->entry.physicalType.has_value());
    EXPECT_EQ(bus->entry.grouping, GroupingRule::UsbDevice);
}

TEST(DatabaseTest, MissOnUnknownBus) {
    Database db;
    EXPECT_FALSE(db.lookup(BUS_I8042, 0x0002, 0x0007).has_value());
    EXPECT_FALSE(Database::empty().lookup(BUS_USB, 0x054c, 0x09cc).has_value());
}

TEST(DatabaseTest, BuiltinKnowsDualShock4) {
    Database db;
    for (uint16_t bus : {BUS_USB, BUS_BLUETOOTH}) {
        auto match = db.lookup(bus, 0x054c, 0x09cc);
        ASSERT_TRUE(match.has_value());
        EXPECT_EQ(match->entry.physicalType, PhysicalType::Gamepad);
        EXPECT_TRUE(match->entry.capabilities.has(Capability::Gamepad));
        EXPECT_EQ(match->entry.grouping, GroupingRule::HidDevice);
    }
}

TEST(DatabaseTest, BuiltinBusDefaults) {
    Database db;
    EXPECT_EQ(db.lookup(BUS_BLUETOOTH, 0xaaaa, 0xbbbb)->entry.grouping, GroupingRule::Uniq);
    EXPECT_EQ(db.lookup(BUS_I2C, 0x04f3, 0x3140)->entry.grouping, GroupingRule::HidDevice);
}

TEST(DatabaseTest, OverrideWinsOnCollision) {
    OverrideTable overrides = {
        {DeviceKey::anyBus(0x054c, 0x09cc), {PhysicalType::GameController, {}, GroupingRule::None, "mine"}},
    };
    Database db(overrides);
    auto match = db.lookup(BUS_USB, 0x054c, 0x09cc);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->entry.physicalType, PhysicalType::GameController);
    EXPECT_TRUE(match->entry.capabilities.empty());
    EXPECT_EQ(match->entry.description, "mine");
    EXPECT_EQ(db.size(), Database().size());
}

TEST(DatabaseTest, GlobalIsInitializedOnce) {
    Database::Initialize();
    const Database& first = Database::Global();
    Database::Initialize({{DeviceKey::anyBus(0x1, 0x1), {PhysicalType::Mouse, {}, GroupingRule::None, ""}}});
    EXPECT_EQ(&first, &Database::Global());
    EXPECT_FALSE(Database::Global().lookup(BUS_USB, 0x1, 0x1)->entry.physicalType.has_value());
}

TEST(DeviceKeyTest, ToString) {
    EXPECT_EQ(DeviceKey::exact(0x3, 0x54c, 0x9cc).toString(), "0003:054c:09cc");
    EXPECT_EQ(DeviceKey::anyBus(0x54c, 0x9cc).toString(), "*:054c:09cc");
    EXPECT_EQ(DeviceKey::busDefault(0x5).toString(), "0005:*");
}

TEST(DatabaseOverridesTest, ParsesAllKeyForms) {
    std::istringstream in(
        "# local additions\n"
        "0003:046d:c52b = mouse | pointer | usb-device\n"
        "*:1234:abcd    = racing-wheel | joystick, gamepad |\n"
        "0018:*         =  |  | hid-device   # touchpads on i2c\n"
        "\n");
    std::vector<DatabaseOverrides::Problem> problems;
    OverrideTable table = DatabaseOverrides::parse(in, &problems);
    EXPECT_TRUE(problems.empty());
    ASSERT_EQ(table.size(), 3u);

    const auto& mouse = table.at(DeviceKey::exact(BUS_USB, 0x046d, 0xc52b));
    EXPECT_EQ(mouse.physicalType, PhysicalType::Mouse);
    EXPECT_EQ(mouse.capabilities, CapabilitySet{Capability::Pointer});
    EXPECT_EQ(mouse.grouping, GroupingRule::UsbDevice);

    const auto& wheel = table.at(DeviceKey::anyBus(0x1234, 0xabcd));
    EXPECT_EQ(wheel.physicalType, PhysicalType::RacingWheel);
    EXPECT_EQ(wheel.capabilities, (CapabilitySet{Capability::Joystick, Capability::Gamepad}));
    EXPECT_EQ(wheel.grouping, GroupingRule::None);

    const auto& i2c = table.at(DeviceKey::busDefault(BUS_I2C));
    EXPECT_FALSE(i2c.physicalType.has_value());
    EXPECT_TRUE(i2c.capabilities.empty());
    EXPECT_EQ(i2c.grouping, GroupingRule::HidDevice);
}

TEST(DatabaseOverridesTest, MalformedLinesAreSkippedWithLineNumbers) {
    std::istringstream in(
        "0003:046d:c52b mouse | | \n"
        "0003:046d = mouse | | \n"
        "0003:zzzz:0001 = mouse | | \n"
        "0003:046d:c52b = hovercraft | | \n"
        "0003:046d:c52b = mouse | lasers | \n"
        "0003:046d:c52b = mouse | | sideways\n"
        "0003:046d:c52b = mouse\n"
        "0003:046d:c52c = keyboard | keyboard | usb-device\n");
    std::vector<DatabaseOverrides::Problem> problems;
    OverrideTable table = DatabaseOverrides::parse(in, &problems);

    ASSERT_EQ(problems.size(), 7u);
    for (int i = 0; i < 7; i++) {
        EXPECT_EQ(problems[i].line, i + 1);
    }
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.begin()->second.physicalType, PhysicalType::Keyboard);
}

TEST(DatabaseOverridesTest, MissingFileThrows) {
    EXPECT_THROW(DatabaseOverrides::loadFile("/nonexistent/whodat/overrides"), std::runtime_error);
}
