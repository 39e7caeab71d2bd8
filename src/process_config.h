#ifndef PROCESS_CONFIG_H
#define PROCESS_CONFIG_H

#include <stdint.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "lib/interface_inventory.h"

class ConfigParseException : public std::runtime_error {
public:
    ConfigParseException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }

    static ConfigParseException missing(const std::string &field)
    {
        return ConfigParseException("Config missing field " + field);
    }
};


struct EmulatorConfig {
    std::string tcPath = "/usr/sbin/tc";
    std::string ipPath = "/usr/sbin/ip";
    // upper bound for a single ip/tc invocation
    int commandTimeoutMs = 5000;
    // k-th configured link gets bridge <bridgePrefix><k>
    std::string bridgePrefix = "br-wan";
    std::string stateFile = "/var/lib/wanem/state.yaml";
    // empty: guess from the address table on first use
    std::string managementInterface;
    int setupThreads = 2;


    template <class T> T parseField(const YAML::Node &parent, const std::string &key)
    {
        if (!parent[key]) {
            throw ConfigParseException("'" + key + "' not found, required");
        }

        try {
            return parent[key].as<T>();
        } catch (const YAML::BadConversion &e) {
            throw ConfigParseException("'" + key + "': " + e.msg + ".");
        }
    }

    template <class T> T parseField(const YAML::Node &parent, const std::string &key, const T &default_value)
    {
        if (!parent[key]) {
            return default_value;
        }

        try {
            return parent[key].as<T>();
        } catch (const YAML::BadConversion &e) {
            throw ConfigParseException("'" + key + "': " + e.msg + ".");
        }
    }

    void parseEmulatorConfig(const YAML::Node &root)
    {
        const YAML::Node &emulatorNode = root["emulator"];
        if (!emulatorNode) {
            throw ConfigParseException::missing("emulator");
        }

        try {
            tcPath = parseField<std::string>(emulatorNode, "tc_path", tcPath);
            ipPath = parseField<std::string>(emulatorNode, "ip_path", ipPath);
            commandTimeoutMs = parseField<int>(emulatorNode, "command_timeout_ms", commandTimeoutMs);
            bridgePrefix = parseField<std::string>(emulatorNode, "bridge_prefix", bridgePrefix);
            stateFile = parseField<std::string>(emulatorNode, "state_file", stateFile);
            managementInterface = parseField<std::string>(emulatorNode, "management_interface", managementInterface);
            setupThreads = parseField<int>(emulatorNode, "setup_threads", setupThreads);
        } catch (const ConfigParseException &e) {
            throw ConfigParseException("Error parsing emulator " + std::string(e.what()));
        }

        if (commandTimeoutMs <= 0) {
            throw ConfigParseException("'command_timeout_ms' must be positive");
        }
        if (setupThreads < 1) {
            throw ConfigParseException("'setup_threads' must be at least 1");
        }
        // bridges we create must be recognisable as bridges by the inventory
        if (!isBridgeName(bridgePrefix)) {
            throw ConfigParseException("'bridge_prefix' must start with " + std::string(kBridgeNamePrefix));
        }
        if (stateFile.empty()) {
            throw ConfigParseException("'state_file' must not be empty");
        }
    }

    void parseConfig(const std::string &configFilename)
    {
        YAML::Node config;

        try {
            config = YAML::LoadFile(configFilename);
        } catch (const YAML::BadFile &e) {
            throw ConfigParseException("Error loading config file:" + e.msg + ".");
        } catch (const YAML::ParserException &e) {
            throw ConfigParseException("Error parsing config file: " + e.msg + ".");
        }

        parseEmulatorConfig(config);

        LOG(INFO) << "Config parsed successfully";
    }
};

#endif
