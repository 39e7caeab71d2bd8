#include "state_store.h"
#include "process_config.h"
#include "lib/utils.h"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace {

template <class T> T readField(const YAML::Node &parent, const std::string &key, const T &default_value)
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

WanLink parseLink(const YAML::Node &node)
{
    WanLink link;
    link.name = readField<std::string>(node, "name", "");
    link.bridge = readField<std::string>(node, "bridge", "");
    link.inner = readField<std::string>(node, "inner", "");
    link.outer = readField<std::string>(node, "outer", "");

    const YAML::Node &requested = node["last_requested"];
    if (requested) {
        ImpairmentRequest request;
        request.delay_ms = readField<double>(requested, "delay_ms", 0.0);
        request.jitter_ms = readField<double>(requested, "jitter_ms", 0.0);
        request.loss_pct = readField<double>(requested, "loss_pct", 0.0);
        request.rate_mbit = readField<double>(requested, "rate_mbit", 0.0);
        link.last_requested = request;
    }
    return link;
}

} // namespace

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

void StateStore::load(LinkRegistry& registry) const {
    std::ifstream existing(path_);
    if (!existing.good()) {
        LOG(INFO) << "No state file at " << path_ << ", starting with no WAN links";
        return;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_);
    } catch (const YAML::Exception &e) {
        throw ConfigParseException("Error loading state file " + path_ + ": " + e.msg + ".");
    }

    std::vector<WanLink> links;
    const YAML::Node &linkNodes = root["wan_links"];
    if (linkNodes) {
        if (!linkNodes.IsSequence()) {
            throw ConfigParseException("'wan_links' in " + path_ + " must be a list");
        }
        for (const auto &node : linkNodes) {
            links.push_back(parseLink(node));
        }
    }
    std::string management = readField<std::string>(root, "management_interface", "");

    try {
        registry.replaceAll(std::move(links));
    } catch (const std::invalid_argument &e) {
        throw ConfigParseException("Invalid state file " + path_ + ": " + e.what());
    }
    registry.setManagementInterface(management);

    LOG(INFO) << "Loaded " << registry.snapshot().size() << " WAN links from " << path_;
}

bool StateStore::loadOrDiscard(LinkRegistry& registry) const {
    try {
        load(registry);
    } catch (const ConfigParseException& e) {
        LOG(ERROR) << e.what() << " Ignoring " << path_;
        return false;
    }
    return true;
}

void StateStore::save(const LinkRegistry& registry) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "management_interface" << YAML::Value << registry.managementInterface();
    out << YAML::Key << "updated_at" << YAML::Value << get_current_time();
    out << YAML::Key << "wan_links" << YAML::Value << YAML::BeginSeq;
    for (const auto &link : registry.snapshot()) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << link.name;
        out << YAML::Key << "bridge" << YAML::Value << link.bridge;
        out << YAML::Key << "inner" << YAML::Value << link.inner;
        out << YAML::Key << "outer" << YAML::Value << link.outer;
        if (link.last_requested) {
            out << YAML::Key << "last_requested" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "delay_ms" << YAML::Value << link.last_requested->delay_ms;
            out << YAML::Key << "jitter_ms" << YAML::Value << link.last_requested->jitter_ms;
            out << YAML::Key << "loss_pct" << YAML::Value << link.last_requested->loss_pct;
            out << YAML::Key << "rate_mbit" << YAML::Value << link.last_requested->rate_mbit;
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot write " + tmp + ": " + std::strerror(errno));
        }
        file << out.c_str() << "\n";
        if (!file.good()) {
            throw std::runtime_error("short write to " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        throw std::runtime_error("cannot replace " + path_ + ": " + std::strerror(errno));
    }
    LOG(INFO) << "Saved WAN link state to " << path_;
}

bool StateStore::remove() const {
    if (std::remove(path_.c_str()) != 0 && errno != ENOENT) {
        LOG(ERROR) << "Failed to remove state file " << path_ << ": " << std::strerror(errno);
        return false;
    }
    return true;
}
