#include "wan_setup.h"
#include "threadPool.h"

#include <glog/logging.h>

#include <algorithm>
#include <stdexcept>

WanSetup::WanSetup(const EmulatorConfig& config, InterfaceInventory& inventory, BridgeManager& bridges,
                   ImpairmentController& impairments, QdiscReader& qdiscs, LinkRegistry& registry,
                   StateStore& store)
    : config_(config),
      inventory_(inventory),
      bridges_(bridges),
      impairments_(impairments),
      qdiscs_(qdiscs),
      registry_(registry),
      store_(store)
{
}

std::string WanSetup::resolveManagementInterface() {
    std::string management = registry_.managementInterface();
    if (!management.empty()) {
        return management;
    }
    if (!config_.managementInterface.empty()) {
        return config_.managementInterface;
    }
    std::optional<std::string> guessed = inventory_.inferManagementInterface();
    if (!guessed) {
        LOG(WARNING) << "No management interface configured and none could be inferred";
        return "";
    }
    return *guessed;
}

std::string WanSetup::managementInterface() {
    std::string management = resolveManagementInterface();
    if (!management.empty() && registry_.managementInterface() != management) {
        registry_.setManagementInterface(management);
        store_.save(registry_);
    }
    return management;
}

std::vector<NetworkInterface> WanSetup::interfaces() {
    return inventory_.listInterfaces(managementInterface());
}

std::vector<std::string> WanSetup::setupCandidates() {
    return inventory_.eligibleInterfaces(managementInterface());
}

std::vector<WanLink> WanSetup::planLinks(const std::vector<LinkRequest>& requests,
                                         const std::string& management) {

    std::vector<WanLink> links;
    for (size_t i = 0; i < requests.size(); ++i) {
        const LinkRequest& request = requests[i];
        WanLink link;
        link.name = request.name.empty() ? "WAN " + std::to_string(i + 1) : request.name;
        link.bridge = config_.bridgePrefix + std::to_string(i + 1);
        link.inner = request.inner;
        link.outer = request.outer;

        if (!management.empty() && (link.inner == management || link.outer == management)) {
            throw std::invalid_argument("link '" + link.name + "' would enslave the management interface " +
                                        management);
        }
        for (const auto& port : {link.inner, link.outer}) {
            if (isBridgeName(port)) {
                throw std::invalid_argument("link '" + link.name + "' uses bridge " + port + " as a port");
            }
        }
        links.push_back(link);
    }
    LinkRegistry::validate(links);
    return links;
}

void WanSetup::teardown(const std::vector<WanLink>& links) {
    for (const auto& link : links) {
        LOG(INFO) << "Tearing down " << link.name << " (" << link.bridge << ")";
        impairments_.clearImpairment(link.inner);
        impairments_.clearImpairment(link.outer);
        BridgeResult destroyed = bridges_.destroyBridge(link.bridge);
        if (!destroyed.ok) {
            LOG(ERROR) << "Could not delete " << link.bridge << ": " << destroyed.reason;
        }
    }
}

std::vector<LinkOutcome> WanSetup::configure(const std::vector<LinkRequest>& requests) {
    // nothing is recorded until the whole set is known to be usable
    const std::string management = resolveManagementInterface();
    std::vector<WanLink> links = planLinks(requests, management);

    teardown(registry_.snapshot());

    std::vector<LinkOutcome> outcomes(links.size());
    {
        // bridges of different links share no device, so they rebuild in parallel
        size_t workers = std::max<size_t>(1, std::min<size_t>(links.size(), config_.setupThreads));
        ThreadPool pool(workers);
        for (size_t i = 0; i < links.size(); ++i) {
            outcomes[i].link = links[i];
            pool.enqueue([this, &outcomes, i] {
                const WanLink& link = outcomes[i].link;
                outcomes[i].bridge = bridges_.reconcileBridge(link.bridge, link.inner, link.outer);
            });
        }
        pool.waitIdle();
    }

    registry_.replaceAll(links);
    registry_.setManagementInterface(management);
    store_.save(registry_);

    for (const auto& outcome : outcomes) {
        if (outcome.bridge.ok) {
            LOG(INFO) << outcome.link.name << ": " << outcome.link.bridge << " ready";
        } else {
            LOG(ERROR) << outcome.link.name << ": " << outcome.link.bridge << " failed at "
                       << outcome.bridge.step << ": " << outcome.bridge.reason;
        }
    }
    return outcomes;
}

void WanSetup::reset() {
    teardown(registry_.snapshot());
    registry_.replaceAll({});
    registry_.setManagementInterface("");
    store_.remove();
    LOG(INFO) << "Configuration reset, bridges removed and qdiscs cleared";
}

std::string WanSetup::notInnerReason(const std::string& interface) const {
    std::optional<WanLink> link = registry_.findByInterface(interface);
    if (link) {
        return interface + " is the outer side of " + link->name + ", shape " + link->inner + " instead";
    }
    return interface + " is not the inner interface of a configured WAN link";
}

ImpairmentResult WanSetup::apply(const std::string& inner, const ImpairmentRequest& request) {
    if (!registry_.findByInner(inner)) {
        return ImpairmentResult{false, ImpairmentResult::STAGE_VALIDATE, notInnerReason(inner)};
    }

    ImpairmentResult result = impairments_.applyImpairment(inner, request);
    if (result.ok || result.partial()) {
        registry_.setLastRequested(inner, request);
    } else if (result.stage == ImpairmentResult::STAGE_NETEM) {
        // the interface was left without any qdisc
        registry_.clearLastRequested(inner);
    } else {
        // refused before any command ran; kernel and record are unchanged
        return result;
    }
    store_.save(registry_);
    return result;
}

bool WanSetup::clear(const std::string& inner) {
    if (!registry_.findByInner(inner)) {
        LOG(ERROR) << notInnerReason(inner);
        return false;
    }
    if (!impairments_.clearImpairment(inner)) {
        return false;
    }
    registry_.clearLastRequested(inner);
    store_.save(registry_);
    return true;
}

ImpairmentState WanSetup::show(const std::string& interface) {
    return qdiscs_.readQdiscState(interface);
}

std::vector<LinkStatus> WanSetup::status() {
    std::vector<LinkStatus> statuses;
    for (const auto& link : registry_.snapshot()) {
        LinkStatus status;
        status.link = link;
        status.inner_state = qdiscs_.readQdiscState(link.inner);
        status.health = computeHealth(status.inner_state);
        statuses.push_back(status);
    }
    return statuses;
}
