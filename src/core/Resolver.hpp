#pragma once
#include <optional>
#include "Capability.hpp"
#include "Database.hpp"
#include "Grouping.hpp"
#include "io/RawDeviceInfo.hpp"

namespace whodat {

struct Resolution {
    enum class Source : uint8_t {
        None,       // no physical type
        Database,
        Heuristic,
    };

    std::optional<PhysicalType> physicalType;
    CapabilitySet capabilities;
    GroupingRule grouping = GroupingRule::None;
    Source source = Source::None;
};

const char* toString(Resolution::Source source);

// Combines the database and classified capabilities into a physical type.
class Resolver {
public:
    explicit Resolver(const Database& database) : database(database) {}

    Resolution resolve(const RawDeviceInfo& raw, const CapabilitySet& classified) const;

    // First matching heuristic wins; std::nullopt if none match
    static std::optional<PhysicalType> heuristic(const RawDeviceInfo& raw, const CapabilitySet& caps);

private:
    const Database& database;
};

} // namespace whodat
