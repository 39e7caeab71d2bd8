#ifndef STATE_STORE_H
#define STATE_STORE_H

#include <string>

#include "lib/link_registry.h"

// YAML file holding the WanLinks and the recorded management interface.
class StateStore {
public:
    explicit StateStore(std::string path);

    // Missing file leaves the registry empty. A malformed file throws
    // ConfigParseException and leaves the registry untouched.
    void load(LinkRegistry& registry) const;

    // As load, but a malformed file is logged and skipped. Returns false
    // when that happened.
    bool loadOrDiscard(LinkRegistry& registry) const;

    // Writes <path>.tmp and renames it over <path>. Throws std::runtime_error.
    void save(const LinkRegistry& registry) const;

    bool remove() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

#endif // STATE_STORE_H
