#include "interface_inventory.h"
#include "utils.h"

#include <glog/logging.h>

#include <algorithm>
#include <sstream>

const char* const kBridgeNamePrefix = "br-";

const char* roleToString(NetworkInterface::Role role) {
    switch (role) {
    case NetworkInterface::ROLE_LOOPBACK:
        return "loopback";
    case NetworkInterface::ROLE_MANAGEMENT:
        return "management";
    case NetworkInterface::ROLE_BRIDGE:
        return "bridge";
    case NetworkInterface::ROLE_MEMBER:
        return "member";
    case NetworkInterface::ROLE_ELIGIBLE:
    default:
        return "eligible";
    }
}

std::string stripSubInterfaceSuffix(const std::string& name) {
    return name.substr(0, name.find('@'));
}

bool isBridgeName(const std::string& name) {
    return name.rfind(kBridgeNamePrefix, 0) == 0;
}

std::vector<LinkEntry> parseLinkTable(const std::string& text) {
    std::vector<LinkEntry> entries;
    for (const auto& line : splitLines(text)) {
        // "2: ens18: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 ... master br-wan1 state UP ..."
        size_t first = line.find(": ");
        if (first == std::string::npos) {
            continue;
        }
        size_t second = line.find(": ", first + 2);
        if (second == std::string::npos) {
            continue;
        }

        LinkEntry entry;
        entry.name = stripSubInterfaceSuffix(trim(line.substr(first + 2, second - first - 2)));
        if (entry.name.empty()) {
            continue;
        }
        std::string rest = line.substr(second + 2);

        size_t open = rest.find('<');
        size_t close = rest.find('>');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            std::istringstream flags(rest.substr(open + 1, close - open - 1));
            std::string flag;
            while (std::getline(flags, flag, ',')) {
                if (flag == "UP") {
                    entry.up = true;
                } else if (flag == "LOOPBACK") {
                    entry.loopback = true;
                }
            }
        }

        std::istringstream tokens(rest);
        std::string token;
        while (tokens >> token) {
            if (token == "master" && (tokens >> token)) {
                entry.master = token;
                break;
            }
        }

        if (entry.name == "lo") {
            entry.loopback = true;
        }
        entries.push_back(entry);
    }
    return entries;
}

std::vector<std::pair<std::string, std::string>> parseAddressTable(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> rows;
    for (const auto& line : splitLines(text)) {
        // "2: ens18    inet 10.240.54.8/24 brd 10.240.54.255 scope global ens18 ..."
        std::istringstream tokens(line);
        std::string index, name, family, address;
        if (!(tokens >> index >> name >> family >> address)) {
            continue;
        }
        if (family != "inet") {
            continue;
        }
        rows.emplace_back(stripSubInterfaceSuffix(name), address);
    }
    return rows;
}

InterfaceInventory::InterfaceInventory(CommandRunner& runner, std::string ip_path)
    : runner_(runner), ip_path_(std::move(ip_path)) {}

bool InterfaceInventory::readLinkTable(std::vector<LinkEntry>& entries) {
    CommandResult result = runner_.run({ip_path_, "-o", "link", "show"});
    if (!result.ok()) {
        LOG(WARNING) << "Interface inventory unavailable, ip link show failed: " << result.diagnostic();
        return false;
    }
    entries = parseLinkTable(result.out);
    return true;
}

bool InterfaceInventory::readAddressTable(std::vector<std::pair<std::string, std::string>>& rows) {
    CommandResult result = runner_.run({ip_path_, "-o", "addr", "show"});
    if (!result.ok()) {
        LOG(WARNING) << "Address table unavailable, ip addr show failed: " << result.diagnostic();
        return false;
    }
    rows = parseAddressTable(result.out);
    return true;
}

std::map<std::string, std::vector<std::string>> InterfaceInventory::addressMap() {
    std::map<std::string, std::vector<std::string>> addresses;
    std::vector<std::pair<std::string, std::string>> rows;
    if (!readAddressTable(rows)) {
        return addresses;
    }
    for (const auto& [name, address] : rows) {
        addresses[name].push_back(address);
    }
    return addresses;
}

std::vector<NetworkInterface> InterfaceInventory::listInterfaces(const std::string& management) {
    std::vector<NetworkInterface> interfaces;
    std::vector<LinkEntry> entries;
    if (!readLinkTable(entries)) {
        return interfaces;
    }

    // addresses are decoration only; a failed address query still lists links
    std::map<std::string, std::vector<std::string>> addresses = addressMap();

    for (const auto& entry : entries) {
        NetworkInterface iface;
        iface.name = entry.name;
        iface.master = entry.master;
        iface.up = entry.up;
        auto found = addresses.find(entry.name);
        if (found != addresses.end()) {
            iface.ipv4 = found->second;
        }

        if (entry.loopback) {
            iface.role = NetworkInterface::ROLE_LOOPBACK;
        } else if (isBridgeName(entry.name)) {
            iface.role = NetworkInterface::ROLE_BRIDGE;
        } else if (!management.empty() && entry.name == management) {
            iface.role = NetworkInterface::ROLE_MANAGEMENT;
        } else if (!entry.master.empty()) {
            iface.role = NetworkInterface::ROLE_MEMBER;
        } else {
            iface.role = NetworkInterface::ROLE_ELIGIBLE;
        }
        interfaces.push_back(iface);
    }

    std::sort(interfaces.begin(), interfaces.end(),
              [](const NetworkInterface& a, const NetworkInterface& b) { return a.name < b.name; });
    return interfaces;
}

std::optional<std::string> InterfaceInventory::inferManagementInterface() {
    std::vector<std::pair<std::string, std::string>> rows;
    if (!readAddressTable(rows)) {
        return std::nullopt;
    }
    for (const auto& row : rows) {
        if (row.first != "lo") {
            LOG(INFO) << "Guessing management interface: " << row.first << " (" << row.second << ")";
            return row.first;
        }
    }
    return std::nullopt;
}

std::vector<std::string> InterfaceInventory::eligibleInterfaces(const std::string& management) {
    std::vector<std::string> names;
    std::vector<LinkEntry> entries;
    if (!readLinkTable(entries)) {
        return names;
    }
    for (const auto& entry : entries) {
        if (entry.loopback || isBridgeName(entry.name)) {
            continue;
        }
        if (!management.empty() && entry.name == management) {
            continue;
        }
        names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}
