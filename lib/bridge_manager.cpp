#include "bridge_manager.h"
#include "interface_inventory.h"
#include "utils.h"

#include <glog/logging.h>

BridgeManager::BridgeManager(CommandRunner& runner, DeviceLocks& locks, std::string ip_path)
    : runner_(runner), locks_(locks), ip_path_(std::move(ip_path)) {}

void BridgeManager::bestEffort(const std::vector<std::string>& argv) {
    CommandResult result = runner_.run(argv);
    if (!result.ok()) {
        LOG(WARNING) << "Ignoring failure of '" << describeCommand(argv) << "': " << result.diagnostic();
    }
}

bool BridgeManager::bridgeExists(const std::string& bridge) {
    return runner_.run({ip_path_, "link", "show", "dev", bridge}).ok();
}

BridgeResult BridgeManager::destroyLocked(const std::string& bridge) {
    if (!bridgeExists(bridge)) {
        return BridgeResult::success();
    }

    bestEffort({ip_path_, "link", "set", "dev", bridge, "down"});
    CommandResult result = runner_.run({ip_path_, "link", "delete", "dev", bridge, "type", "bridge"});
    if (!result.ok()) {
        LOG(ERROR) << "Failed to delete bridge " << bridge << ": " << result.diagnostic();
        return BridgeResult::failure("delete", result.diagnostic());
    }
    LOG(INFO) << "Deleted bridge " << bridge;
    return BridgeResult::success();
}

BridgeResult BridgeManager::reconcileBridge(const std::string& bridge, const std::string& inner,
                                            const std::string& outer) {
    for (const auto& name : {bridge, inner, outer}) {
        if (!isSafeDeviceName(name)) {
            return BridgeResult::failure("validate", "invalid device name '" + name + "'");
        }
    }
    if (inner == outer) {
        return BridgeResult::failure("validate", "inner and outer interface are both " + inner);
    }
    if (bridge == inner || bridge == outer) {
        return BridgeResult::failure("validate", "bridge name " + bridge + " collides with a member port");
    }

    DeviceLocks::Guard guard = locks_.lock({bridge, inner, outer});
    LOG(INFO) << "Reconciling bridge " << bridge << " with ports " << inner << " and " << outer;

    // detached baseline: whatever bridge the ports were in before is left alone
    for (const auto& port : {inner, outer}) {
        bestEffort({ip_path_, "link", "set", "dev", port, "down"});
        bestEffort({ip_path_, "link", "set", "dev", port, "nomaster"});
    }

    BridgeResult destroyed = destroyLocked(bridge);
    if (!destroyed.ok) {
        LOG(WARNING) << "Stale bridge " << bridge << " could not be removed, trying to recreate anyway";
    }

    CommandResult created = runner_.run({ip_path_, "link", "add", "name", bridge, "type", "bridge"});
    if (!created.ok()) {
        LOG(ERROR) << "Failed to create bridge " << bridge << ": " << created.diagnostic();
        return BridgeResult::failure("create", created.diagnostic());
    }

    BridgeResult verdict = BridgeResult::success();
    for (const auto& port : {inner, outer}) {
        CommandResult attached = runner_.run({ip_path_, "link", "set", "dev", port, "master", bridge});
        if (!attached.ok()) {
            LOG(ERROR) << "Failed to attach " << port << " to " << bridge << ": " << attached.diagnostic();
            if (verdict.ok) {
                verdict = BridgeResult::failure("attach", port + ": " + attached.diagnostic());
            }
        }
        bestEffort({ip_path_, "link", "set", "dev", port, "up"});
    }

    bestEffort({ip_path_, "link", "set", "dev", bridge, "up"});

    if (verdict.ok) {
        LOG(INFO) << "Bridge " << bridge << " is up with ports " << inner << " and " << outer;
    }
    return verdict;
}

BridgeResult BridgeManager::destroyBridge(const std::string& bridge) {
    if (!isSafeDeviceName(bridge)) {
        return BridgeResult::failure("validate", "invalid device name '" + bridge + "'");
    }
    DeviceLocks::Guard guard = locks_.lock({bridge});
    return destroyLocked(bridge);
}

BridgeTopology BridgeManager::readBridgeTopology(const std::string& bridge) {
    BridgeTopology topology;
    topology.name = bridge;

    CommandResult result = runner_.run({ip_path_, "-o", "link", "show"});
    if (!result.ok()) {
        LOG(WARNING) << "Cannot read topology of " << bridge << ": " << result.diagnostic();
        return topology;
    }

    for (const auto& entry : parseLinkTable(result.out)) {
        if (entry.name == bridge) {
            topology.exists = true;
            topology.up = entry.up;
        } else if (entry.master == bridge) {
            topology.members.push_back(BridgePort{entry.name, entry.up});
        }
    }
    return topology;
}
