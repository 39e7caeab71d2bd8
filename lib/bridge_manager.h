#ifndef BRIDGE_MANAGER_H
#define BRIDGE_MANAGER_H

#include <string>
#include <vector>

#include "command_runner.h"
#include "device_locks.h"

struct BridgeResult {
    bool ok = true;
    std::string step;     // failing step: "validate", "create", "attach", "delete"
    std::string reason;   // the command's own diagnostic, verbatim

    static BridgeResult success() { return BridgeResult{}; }
    static BridgeResult failure(const std::string& step, const std::string& reason) {
        return BridgeResult{false, step, reason};
    }
};

struct BridgePort {
    std::string name;
    bool up = false;
};

// Fresh read of the kernel's view of one bridge; never cached.
struct BridgeTopology {
    std::string name;
    bool exists = false;
    bool up = false;
    std::vector<BridgePort> members;
};

class BridgeManager {
public:
    BridgeManager(CommandRunner& runner, DeviceLocks& locks, std::string ip_path);

    // Tears the pair down to a detached baseline and rebuilds the bridge
    // from scratch. Only creating the bridge and enslaving the two ports
    // decide the verdict; every other step is best effort.
    BridgeResult reconcileBridge(const std::string& bridge, const std::string& inner, const std::string& outer);

    // Absent bridge is a no-op success.
    BridgeResult destroyBridge(const std::string& bridge);

    BridgeTopology readBridgeTopology(const std::string& bridge);

private:
    bool bridgeExists(const std::string& bridge);
    BridgeResult destroyLocked(const std::string& bridge);
    void bestEffort(const std::vector<std::string>& argv);

    CommandRunner& runner_;
    DeviceLocks& locks_;
    std::string ip_path_;
};

#endif // BRIDGE_MANAGER_H
