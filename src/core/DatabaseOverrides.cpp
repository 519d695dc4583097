#include "DatabaseOverrides.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace whodat {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(trim(part));
    }
    if (!s.empty() && s.back() == delim) {
        parts.emplace_back();
    }
    return parts;
}

bool parseHex16(const std::string& s, uint16_t& out) {
    if (s.empty() || s.size() > 4) return false;
    try {
        size_t used = 0;
        unsigned long value = std::stoul(s, &used, 16);
        if (used != s.size()) return false;
        out = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseKey(const std::string& text, DeviceKey& key, std::string& error) {
    auto fields = split(text, ':');
    uint16_t bus = 0, vendor = 0, product = 0;

    if (fields.size() == 2 && fields[1] == "*") {
        if (!parseHex16(fields[0], bus)) {
            error = "invalid bus '" + fields[0] + "'";
            return false;
        }
        key = DeviceKey::busDefault(bus);
        return true;
    }
    if (fields.size() != 3) {
        error = "expected bus:vendor:product";
        return false;
    }
    if (!parseHex16(fields[1], vendor) || !parseHex16(fields[2], product)) {
        error = "invalid vendor/product '" + fields[1] + ":" + fields[2] + "'";
        return false;
    }
    if (fields[0] == "*") {
        key = DeviceKey::anyBus(vendor, product);
        return true;
    }
    if (!parseHex16(fields[0], bus)) {
        error = "invalid bus '" + fields[0] + "'";
        return false;
    }
    key = DeviceKey::exact(bus, vendor, product);
    return true;
}

bool parseValue(const std::string& text, DatabaseEntry& entry, std::string& error) {
    auto fields = split(text, '|');
    if (fields.size() != 3) {
        error = "expected 'type | capabilities | grouping'";
        return false;
    }

    if (!fields[0].empty()) {
        auto type = physicalTypeFromString(fields[0]);
        if (!type) {
            error = "unknown physical type '" + fields[0] + "'";
            return false;
        }
        entry.physicalType = type;
    }

    if (!fields[1].empty()) {
        for (const auto& tag : split(fields[1], ',')) {
            auto capability = capabilityFromString(tag);
            if (!capability) {
                error = "unknown capability '" + tag + "'";
                return false;
            }
            entry.capabilities.set(*capability);
        }
    }

    if (!fields[2].empty()) {
        auto rule = groupingRuleFromString(fields[2]);
        if (!rule) {
            error = "unknown grouping rule '" + fields[2] + "'";
            return false;
        }
        entry.grouping = *rule;
    }
    return true;
}

} // namespace

OverrideTable DatabaseOverrides::parse(std::istream& in, std::vector<Problem>* problems) {
    OverrideTable table;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        lineNumber++;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        std::string error;
        DeviceKey key;
        DatabaseEntry entry;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            error = "missing '='";
        } else if (parseKey(trim(line.substr(0, eq)), key, error) &&
                   parseValue(line.substr(eq + 1), entry, error)) {
            entry.description = "override line " + std::to_string(lineNumber);
            table[key] = entry;
            continue;
        }

        warning("Override line {} skipped: {}", lineNumber, error);
        if (problems) {
            problems->push_back({lineNumber, error});
        }
    }
    return table;
}

OverrideTable DatabaseOverrides::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open override file: " + path);
    }
    OverrideTable table = parse(file);
    info("Loaded {} database overrides from {}", table.size(), path);
    return table;
}

} // namespace whodat
