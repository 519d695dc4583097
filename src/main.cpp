#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "core/ConfigManager.hpp"
#include "core/Database.hpp"
#include "core/DatabaseOverrides.hpp"
#include "core/Device.hpp"
#include "core/Registry.hpp"
#include "core/io/DeviceNode.hpp"
#include "utils/Logger.hpp"

using namespace whodat;

namespace {

void printUsage() {
    std::cout << "Usage: whodat [options] <command> [args]\n";
    std::cout << "Commands:\n";
    std::cout << "  show PATH       Identify one /dev/input/event* or /dev/hidraw* node\n";
    std::cout << "  tree PATH...    Identify several nodes and print the physical devices\n";
    std::cout << "  dump PATH       Print the serialized description of one node\n";
    std::cout << "  parse           Read a serialized description from stdin and print it\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE   Use FILE instead of the default config\n";
    std::cout << "  --debug, -d     Enable debug logging\n";
    std::cout << "  --help, -h      Show this help\n";
}

void printPhysical(const PhysicalDevice& physical) {
    std::cout << "Physical device " << physical.index << " (" << physical.groupingKey << ")\n";
    std::cout << "  Physical type: "
              << (physical.physicalType ? toString(*physical.physicalType) : "unknown") << "\n";
    std::cout << "  Abstract type: " << toString(physical.abstractType) << "\n";
    std::cout << "  Capabilities: " << physical.capabilities.toString() << "\n";
}

int cmdShow(Registry& registry, const std::string& path) {
    auto node = FdDeviceNode::open(path);
    DeviceHandle handle = registry.deviceFromIdentitySource(*node);
    std::cout << path << "\n" << handle.device().toString();
    if (auto physical = registry.physicalDeviceOf(handle)) {
        printPhysical(physical->snapshot());
    } else {
        std::cout << "Not grouped with other nodes\n";
    }
    return 0;
}

int cmdTree(Registry& registry, const std::vector<std::string>& paths) {
    int failures = 0;
    for (const auto& path : paths) {
        try {
            auto node = FdDeviceNode::open(path);
            registry.deviceFromIdentitySource(*node);
        } catch (const std::exception& e) {
            error("{}: {}", path, e.what());
            failures++;
        }
    }

    for (const auto& handle : registry.physicalDevices()) {
        PhysicalDevice physical = handle.snapshot();
        printPhysical(physical);
        for (const auto& id : physical.constituents) {
            if (auto device = registry.find(id)) {
                std::cout << "    " << id.toString() << "  " << device->device().name() << "\n";
            }
        }
    }
    for (const auto& handle : registry.devices()) {
        Device device = handle.device();
        if (!device.parent()) {
            std::cout << "Ungrouped " << handle.identity().toString() << "  " << device.name() << "  "
                      << (device.physicalType() ? toString(*device.physicalType()) : "unknown") << "\n";
        }
    }
    return failures == 0 ? 0 : 1;
}

int cmdDump(Registry& registry, const std::string& path) {
    auto node = FdDeviceNode::open(path);
    std::cout << registry.deviceFromIdentitySource(*node).device().serialize() << "\n";
    return 0;
}

int cmdParse() {
    std::string payload((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    Device device = Device::deserialize(payload);
    std::cout << device.toString();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    bool debugMode = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                error("--config needs a file argument");
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    try {
        auto& config = Configs::Get();
        if (!configPath.empty()) {
            if (!config.Load(configPath)) {
                error("Config file {} not found", configPath);
                return 1;
            }
        } else {
            config.Load();
        }
        Logger::getInstance().initializeWithConfig();
        if (debugMode) {
            config.Set<std::string>("Log.Level", "debug");
        }
        debug("Config path: {}", config.getPath());

        std::string overrideFile = config.GetOverrideFile();
        Database::Initialize(overrideFile.empty() ? OverrideTable{}
                                                  : DatabaseOverrides::loadFile(overrideFile));
    } catch (const std::exception& e) {
        error("Critical: Failed to initialize: {}", e.what());
        return 1;
    }

    if (args.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = args[0];
    std::vector<std::string> operands(args.begin() + 1, args.end());

    try {
        Registry registry;
        if (command == "show" && operands.size() == 1) {
            return cmdShow(registry, operands[0]);
        } else if (command == "tree" && !operands.empty()) {
            return cmdTree(registry, operands);
        } else if (command == "dump" && operands.size() == 1) {
            return cmdDump(registry, operands[0]);
        } else if (command == "parse" && operands.empty()) {
            return cmdParse();
        }
        error("Unknown command or wrong arguments: {}", command);
        printUsage();
        return 1;
    } catch (const std::exception& e) {
        error("{}", e.what());
        return 1;
    }
}
