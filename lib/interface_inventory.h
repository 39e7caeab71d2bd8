#ifndef INTERFACE_INVENTORY_H
#define INTERFACE_INVENTORY_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "command_runner.h"

// Devices whose name starts with this are bridges, ours or not.
extern const char* const kBridgeNamePrefix;

struct NetworkInterface {
    enum Role { ROLE_LOOPBACK, ROLE_MANAGEMENT, ROLE_BRIDGE, ROLE_MEMBER, ROLE_ELIGIBLE };

    std::string name;
    Role role = ROLE_ELIGIBLE;
    std::string master;   // bridge this device is enslaved to, if any
    bool up = false;
    std::vector<std::string> ipv4;
};

const char* roleToString(NetworkInterface::Role role);

// One row of `ip -o link show`.
struct LinkEntry {
    std::string name;
    std::string master;
    bool up = false;
    bool loopback = false;
};

// "veth0@if4" -> "veth0", "eth0.100@eth0" -> "eth0.100"
std::string stripSubInterfaceSuffix(const std::string& name);

std::vector<LinkEntry> parseLinkTable(const std::string& text);

// (device, address/prefix) for every inet row, in table order
std::vector<std::pair<std::string, std::string>> parseAddressTable(const std::string& text);

bool isBridgeName(const std::string& name);

// Read-only view of the host's links. A failed query degrades to an empty
// answer; nothing here throws.
class InterfaceInventory {
public:
    InterfaceInventory(CommandRunner& runner, std::string ip_path);

    std::vector<NetworkInterface> listInterfaces(const std::string& management = "");

    // First device carrying an IPv4 address, in address-table order.
    std::optional<std::string> inferManagementInterface();

    // All devices minus loopback, management and bridge-named ones, sorted.
    std::vector<std::string> eligibleInterfaces(const std::string& management);

    std::map<std::string, std::vector<std::string>> addressMap();

private:
    bool readLinkTable(std::vector<LinkEntry>& entries);
    bool readAddressTable(std::vector<std::pair<std::string, std::string>>& rows);

    CommandRunner& runner_;
    std::string ip_path_;
};

#endif // INTERFACE_INVENTORY_H
