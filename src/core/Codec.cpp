#include "Codec.hpp"
#include "Device.hpp"
#include "Errors.hpp"
#include "utils/Logger.hpp"
#include <nlohmann/json.hpp>

namespace whodat {

using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(const std::string& message) {
    throw DeserializeError(DeserializeError::Code::MalformedInput, message);
}

uint16_t readId(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number_unsigned()) {
        malformed(std::string("missing or invalid '") + field + "'");
    }
    auto value = it->get<uint64_t>();
    if (value > 0xffff) {
        malformed(std::string("'") + field + "' out of range");
    }
    return static_cast<uint16_t>(value);
}

} // namespace

std::string Codec::encode(const Device& device) {
    if (!device.complete()) {
        throw SerializeError(SerializeError::Code::Incomplete, "device has no identity");
    }

    json j;
    j["format"] = FORMAT;
    j["version"] = VERSION;
    j["bus"] = device.bus();
    j["vendor"] = device.vendor();
    j["product"] = device.product();
    j["name"] = device.name();
    j["capabilities"] = device.capabilities().sortedTags();
    if (auto type = device.physicalType()) {
        j["physical_type"] = toString(*type);
    }
    return j.dump();
}

Device Codec::decode(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        malformed(std::string("not JSON: ") + e.what());
    }
    if (!j.is_object()) {
        malformed("payload is not an object");
    }

    // Version before anything else
    auto version = j.find("version");
    if (version == j.end() || !version->is_number_integer()) {
        malformed("missing or invalid 'version'");
    }
    // Unsigned values past INT64_MAX must not wrap into the negative range
    bool newer = version->is_number_unsigned()
                     ? version->get<uint64_t>() > static_cast<uint64_t>(VERSION)
                     : version->get<int64_t>() > VERSION;
    if (newer) {
        throw DeserializeError(DeserializeError::Code::UnsupportedVersion,
                               "payload version " + version->dump() + " is newer than " +
                                   std::to_string(VERSION));
    }
    if (version->get<int64_t>() < 1) {
        malformed("invalid version " + std::to_string(version->get<int64_t>()));
    }

    auto format = j.find("format");
    if (format == j.end() || !format->is_string() || format->get<std::string>() != FORMAT) {
        malformed("missing or wrong 'format'");
    }

    uint16_t bus = readId(j, "bus");
    uint16_t vendor = readId(j, "vendor");
    uint16_t product = readId(j, "product");

    auto name = j.find("name");
    if (name == j.end() || !name->is_string()) {
        malformed("missing or invalid 'name'");
    }

    auto tags = j.find("capabilities");
    if (tags == j.end() || !tags->is_array()) {
        malformed("missing or invalid 'capabilities'");
    }
    CapabilitySet caps;
    for (const auto& tag : *tags) {
        if (!tag.is_string()) {
            malformed("capability tag is not a string");
        }
        if (auto capability = capabilityFromString(tag.get<std::string>())) {
            caps.set(*capability);
        } else {
            debug("Dropping unknown capability tag '{}'", tag.get<std::string>());
        }
    }

    std::optional<PhysicalType> type;
    auto physical = j.find("physical_type");
    if (physical != j.end() && !physical->is_null()) {
        if (!physical->is_string()) {
            malformed("invalid 'physical_type'");
        }
        type = physicalTypeFromString(physical->get<std::string>());
        if (!type) {
            debug("Unknown physical type '{}', treating as unknown", physical->get<std::string>());
        }
    }

    return Device(name->get<std::string>(), bus, vendor, product, caps, type);
}

} // namespace whodat
