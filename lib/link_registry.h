#ifndef LINK_REGISTRY_H
#define LINK_REGISTRY_H

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "impairment_controller.h"

struct WanLink {
    std::string name;     // operator label, e.g. "WAN 1"
    std::string bridge;
    std::string inner;    // faces the emulated side; impairment goes here
    std::string outer;    // faces the real upstream

    // exact values of the last apply, independent of kernel rounding;
    // dropped when the interface is cleared
    std::optional<ImpairmentRequest> last_requested;
};

// The set of WanLinks the core operates on. Never edited link-by-link:
// a reconfiguration swaps in the complete desired set.
class LinkRegistry {
public:
    std::vector<WanLink> snapshot() const;

    // Throws std::invalid_argument and keeps the old set if the new one
    // breaks an invariant.
    void replaceAll(std::vector<WanLink> links);

    std::optional<WanLink> findByInterface(const std::string& name) const;
    std::optional<WanLink> findByInner(const std::string& inner) const;

    bool setLastRequested(const std::string& inner, const ImpairmentRequest& request);
    bool clearLastRequested(const std::string& inner);

    std::string managementInterface() const;
    void setManagementInterface(const std::string& name);

    bool empty() const;

    static void validate(const std::vector<WanLink>& links);

private:
    mutable std::shared_mutex mutex_;
    std::vector<WanLink> links_;
    std::string management_;
};

#endif // LINK_REGISTRY_H
