#include "link_registry.h"
#include "utils.h"

#include <mutex>
#include <set>
#include <stdexcept>

void LinkRegistry::validate(const std::vector<WanLink>& links) {
    std::set<std::string> bridges;
    std::set<std::string> ports;

    for (const auto& link : links) {
        for (const auto& name : {link.bridge, link.inner, link.outer}) {
            if (!isSafeDeviceName(name)) {
                throw std::invalid_argument("invalid device name '" + name + "' in link '" + link.name + "'");
            }
        }
        if (link.inner == link.outer) {
            throw std::invalid_argument("link '" + link.name + "' uses " + link.inner + " as both inner and outer");
        }
        if (!bridges.insert(link.bridge).second) {
            throw std::invalid_argument("bridge " + link.bridge + " is used by more than one link");
        }
        for (const auto& port : {link.inner, link.outer}) {
            if (!ports.insert(port).second) {
                throw std::invalid_argument("interface " + port + " is used by more than one link");
            }
        }
    }

    for (const auto& bridge : bridges) {
        if (ports.count(bridge) != 0) {
            throw std::invalid_argument("bridge " + bridge + " is also used as a member port");
        }
    }
}

std::vector<WanLink> LinkRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return links_;
}

void LinkRegistry::replaceAll(std::vector<WanLink> links) {
    validate(links);
    std::unique_lock lock(mutex_);
    links_.swap(links);
}

std::optional<WanLink> LinkRegistry::findByInterface(const std::string& name) const {
    std::shared_lock lock(mutex_);
    for (const auto& link : links_) {
        if (link.inner == name || link.outer == name) {
            return link;
        }
    }
    return std::nullopt;
}

std::optional<WanLink> LinkRegistry::findByInner(const std::string& inner) const {
    std::shared_lock lock(mutex_);
    for (const auto& link : links_) {
        if (link.inner == inner) {
            return link;
        }
    }
    return std::nullopt;
}

bool LinkRegistry::setLastRequested(const std::string& inner, const ImpairmentRequest& request) {
    std::unique_lock lock(mutex_);
    for (auto& link : links_) {
        if (link.inner == inner) {
            link.last_requested = request;
            return true;
        }
    }
    return false;
}

bool LinkRegistry::clearLastRequested(const std::string& inner) {
    std::unique_lock lock(mutex_);
    for (auto& link : links_) {
        if (link.inner == inner) {
            link.last_requested.reset();
            return true;
        }
    }
    return false;
}

std::string LinkRegistry::managementInterface() const {
    std::shared_lock lock(mutex_);
    return management_;
}

void LinkRegistry::setManagementInterface(const std::string& name) {
    std::unique_lock lock(mutex_);
    management_ = name;
}

bool LinkRegistry::empty() const {
    std::shared_lock lock(mutex_);
    return links_.empty();
}
