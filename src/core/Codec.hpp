#pragma once
#include <string>

namespace whodat {

class Device;

/**
 * Versioned JSON payload for passing a Device between processes.
 *
 *   {"format":"whodat.device","version":1,"bus":3,"vendor":1356,
 *    "product":2508,"name":"...","capabilities":["gamepad"],
 *    "physical_type":"gamepad"}
 *
 * Unknown fields and capability tags are ignored on decode; a newer
 * version is rejected before anything else is read.
 */
class Codec {
public:
    static constexpr const char* FORMAT = "whodat.device";
    static constexpr int VERSION = 1;

    // Throws SerializeError::Incomplete for a default-constructed Device
    static std::string encode(const Device& device);

    // Throws DeserializeError
    static Device decode(const std::string& payload);
};

} // namespace whodat
