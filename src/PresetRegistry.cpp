#include "PresetRegistry.hpp"

namespace {
const std::vector<std::string> kDefaultExcludes = {"desktop.ini", "thumbs.db*"};
const std::vector<std::string> kObmodFiles = {"*.ini", "*.esm", "*.esp"};

ArchiveOptions ZipBase(int level) {
    ArchiveOptions options;
    options.Type("zip").Level(level);
    options.Set("mcu", "on");
    options.Exclude(kDefaultExcludes);
    return options;
}

ArchiveOptions SevenZipBase(int level) {
    ArchiveOptions options;
    options.Type("7z").LargePages(true).Level(level).Multithreading(true).Exclude(kDefaultExcludes);
    return options;
}

ArchiveOptions MixIn(std::initializer_list<ArchiveOptions::Entry> entries) {
    return ArchiveOptions(entries);
}
} // namespace

const PresetRegistry& PresetRegistry::Instance() {
    static const PresetRegistry instance;
    return instance;
}

PresetRegistry::PresetRegistry() {
    presets_.emplace("store", ZipBase(0));
    presets_.emplace("normal", ZipBase(5));
    presets_.emplace("fastest", SevenZipBase(1));
    presets_.emplace("fast", SevenZipBase(3));
    presets_.emplace("normal-7z", SevenZipBase(5).Solid("512m"));
    presets_.emplace("maximum", SevenZipBase(7).Solid("1g"));
    presets_.emplace("ultra", SevenZipBase(9).Solid("2g"));
    presets_.emplace("extreme", SevenZipBase(9).Multithreading(2).Methods(Lzma2Method().DictSize(29)));

    presets_.emplace(".qs", MixIn({{"mqs", "on"}}));
    presets_.emplace(".e1g", MixIn({{"mqs", "on"}, {"ms", "e1g"}}));
    presets_.emplace(".e2g", MixIn({{"mqs", "on"}, {"ms", "e2g"}}));
    presets_.emplace(".e4g", MixIn({{"mqs", "on"}, {"ms", "e4g"}}));
    presets_.emplace(".mt", MixIn({{"mmt", "on"}}));
    presets_.emplace(".mt2", MixIn({{"mmt", 2}}));
    presets_.emplace(".mt4", MixIn({{"mmt", 4}}));
    presets_.emplace(".mt8", MixIn({{"mmt", 8}}));

    ArchiveOptions obmodPass1;
    obmodPass1.Type("7z").LargePages(true).Level(9).Solid("1g").Exclude(kDefaultExcludes).Exclude(kObmodFiles);
    presets_.emplace("obmod-pass1", std::move(obmodPass1));

    ArchiveOptions obmodPass2;
    obmodPass2.Type("7z").LargePages(true).Level(9).Solid(false).Exclude({"*"}).Include(kObmodFiles);
    presets_.emplace("obmod-pass2", std::move(obmodPass2));
}

ArchiveOptions PresetRegistry::Resolve(const std::string& name) const {
    const auto it = presets_.find(name);
    if (it == presets_.end()) {
        throw NotFoundError("unknown preset: '" + name + "'");
    }
    return it->second;
}

bool PresetRegistry::Contains(const std::string& name) const {
    return presets_.count(name) != 0;
}

std::vector<std::string> PresetRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(presets_.size());
    for (const auto& entry : presets_) {
        names.push_back(entry.first);
    }
    return names;
}

ArchiveOptions PresetRegistry::Compose(const std::vector<std::string>& names) const {
    std::vector<ArchiveOptions> resolved;
    resolved.reserve(names.size());
    for (const auto& name : names) {
        resolved.push_back(Resolve(name));
    }

    ArchiveOptions composed;
    composed.MergeAll(resolved);
    return composed;
}
