#pragma once

#include "ArchiveOptions.hpp"

#include <map>
#include <string>
#include <vector>

// Named, ready-made option bundles. Base presets ("store", "ultra", ...) set
// the archive type and level; mix-ins (names starting with '.') only carry a
// few keys meant to be merged over a base.
class PresetRegistry {
public:
    static const PresetRegistry& Instance();

    // Returns an independent copy. Throws NotFoundError for unknown names.
    ArchiveOptions Resolve(const std::string& name) const;
    bool Contains(const std::string& name) const;
    std::vector<std::string> Names() const;

    // Merges the named presets in order over an empty container.
    ArchiveOptions Compose(const std::vector<std::string>& names) const;

private:
    PresetRegistry();

    std::map<std::string, ArchiveOptions> presets_;
};
