#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "Capability.hpp"
#include "Grouping.hpp"

namespace whodat {

// Lookup key. Degraded keys leave bus or vendor/product unset.
struct DeviceKey {
    enum class Kind : uint8_t {
        Exact,    // bus, vendor, product
        Product,  // vendor, product on any bus
        Bus,      // generic default for a bus
    };

    Kind kind = Kind::Exact;
    uint16_t bus = 0;
    uint16_t vendor = 0;
    uint16_t product = 0;

    static DeviceKey exact(uint16_t bus, uint16_t vendor, uint16_t product) {
        return {Kind::Exact, bus, vendor, product};
    }
    static DeviceKey anyBus(uint16_t vendor, uint16_t product) {
        return {Kind::Product, 0, vendor, product};
    }
    static DeviceKey busDefault(uint16_t bus) {
        return {Kind::Bus, bus, 0, 0};
    }

    bool operator<(const DeviceKey& other) const {
        return std::tie(kind, bus, vendor, product) <
               std::tie(other.kind, other.bus, other.vendor, other.product);
    }
    bool operator==(const DeviceKey& other) const {
        return kind == other.kind && bus == other.bus && vendor == other.vendor &&
               product == other.product;
    }

    std::string toString() const;
};

struct DatabaseEntry {
    std::optional<PhysicalType> physicalType;
    CapabilitySet capabilities;  // unioned into the classified set
    GroupingRule grouping = GroupingRule::None;
    std::string description;
};

struct DatabaseMatch {
    DeviceKey::Kind kind;
    DatabaseEntry entry;
};

using OverrideTable = std::map<DeviceKey, DatabaseEntry>;

/**
 * Static table of known devices.
 *
 * Lookup tries the exact (bus, vendor, product) triple, then the
 * vendor/product pair on any bus, then the bus default. The table is
 * read-only once constructed; overrides are merged at construction and
 * win on collision.
 */
class Database {
public:
    // Built-in table plus overrides
    explicit Database(const OverrideTable& overrides = {});

    static Database empty();

    std::optional<DatabaseMatch> lookup(uint16_t bus, uint16_t vendor, uint16_t product) const;

    size_t size() const { return entries.size(); }

    // Process-wide instance. The first Initialize wins; Global()
    // initializes with no overrides if nobody did.
    static void Initialize(const OverrideTable& overrides = {});
    static const Database& Global();

private:
    struct EmptyTag {};
    explicit Database(EmptyTag) {}

    void merge(const OverrideTable& table);

    std::map<DeviceKey, DatabaseEntry> entries;

    static std::once_flag initFlag;
    static std::unique_ptr<Database> instance;
};

const OverrideTable& builtinTable();

} // namespace whodat
