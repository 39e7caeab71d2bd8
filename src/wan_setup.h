#ifndef WAN_SETUP_H
#define WAN_SETUP_H

#include <string>
#include <vector>

#include "process_config.h"
#include "state_store.h"
#include "lib/bridge_manager.h"
#include "lib/impairment_controller.h"
#include "lib/interface_inventory.h"
#include "lib/link_health.h"
#include "lib/link_registry.h"
#include "lib/qdisc_state.h"

// One inner/outer pair the operator wants bridged. An empty name becomes
// "WAN <k>".
struct LinkRequest {
    std::string name;
    std::string inner;
    std::string outer;
};

struct LinkOutcome {
    WanLink link;
    BridgeResult bridge;
};

struct LinkStatus {
    WanLink link;
    ImpairmentState inner_state;
    LinkHealth health;
};

// Setup, reset and per-link shaping on top of the reconciliation core.
// Owns the registry contents and keeps the state file in step with it.
class WanSetup {
public:
    WanSetup(const EmulatorConfig& config, InterfaceInventory& inventory, BridgeManager& bridges,
             ImpairmentController& impairments, QdiscReader& qdiscs, LinkRegistry& registry,
             StateStore& store);

    // Recorded value, else the inferred one (which is then recorded).
    std::string managementInterface();

    std::vector<NetworkInterface> interfaces();
    std::vector<std::string> setupCandidates();

    // Validates the whole desired set first and throws std::invalid_argument
    // without touching the kernel if it is unusable. Otherwise tears down
    // every existing link, rebuilds all bridges in parallel and records the
    // new set, including links whose bridge failed.
    std::vector<LinkOutcome> configure(const std::vector<LinkRequest>& requests);

    void reset();

    // Only inner interfaces of configured links are accepted.
    ImpairmentResult apply(const std::string& inner, const ImpairmentRequest& request);
    bool clear(const std::string& inner);

    ImpairmentState show(const std::string& interface);
    std::vector<LinkStatus> status();

private:
    // Recorded, configured or inferred management interface; records nothing.
    std::string resolveManagementInterface();
    std::string notInnerReason(const std::string& interface) const;
    std::vector<WanLink> planLinks(const std::vector<LinkRequest>& requests, const std::string& management);
    void teardown(const std::vector<WanLink>& links);

    const EmulatorConfig& config_;
    InterfaceInventory& inventory_;
    BridgeManager& bridges_;
    ImpairmentController& impairments_;
    QdiscReader& qdiscs_;
    LinkRegistry& registry_;
    StateStore& store_;
};

#endif // WAN_SETUP_H
