#include "ArchiveOptions.hpp"

#include <sstream>

namespace {
std::string OnOff(bool enabled) {
    return enabled ? "on" : "off";
}

std::string Join(const std::set<std::string>& values) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& value : values) {
        if (!first) {
            out << ", ";
        }
        out << "'" << value << "'";
        first = false;
    }
    out << "}";
    return out.str();
}

bool IsSwitchFamilyM(const std::string& key) {
    return !key.empty() && key.front() == 'm';
}

} // namespace

const char* ToString(ValueKind kind) {
    switch (kind) {
    case ValueKind::Atomic:
        return "atomic";
    case ValueKind::Set:
        return "set";
    case ValueKind::Sequence:
        return "sequence";
    case ValueKind::Mapping:
        return "mapping";
    }
    return "unknown";
}

OptionValue::OptionValue()
    : value_(std::string()) {}

OptionValue::OptionValue(const char* value)
    : value_(std::string(value == nullptr ? "" : value)) {}

OptionValue::OptionValue(std::string value)
    : value_(std::move(value)) {}

OptionValue::OptionValue(int value)
    : value_(std::to_string(value)) {}

OptionValue::OptionValue(int64_t value)
    : value_(std::to_string(value)) {}

OptionValue::OptionValue(Set value)
    : value_(std::move(value)) {}

OptionValue::OptionValue(Sequence value)
    : value_(std::move(value)) {}

OptionValue::OptionValue(Mapping value)
    : value_(std::move(value)) {}

OptionValue OptionValue::Empty(ValueKind kind) {
    switch (kind) {
    case ValueKind::Set:
        return OptionValue(Set());
    case ValueKind::Sequence:
        return OptionValue(Sequence());
    case ValueKind::Mapping:
        return OptionValue(Mapping());
    case ValueKind::Atomic:
        break;
    }
    return OptionValue();
}

ValueKind OptionValue::Kind() const {
    return static_cast<ValueKind>(value_.index());
}

const std::string& OptionValue::AsScalar() const {
    if (const auto* value = std::get_if<std::string>(&value_)) {
        return *value;
    }
    throw TypeMismatchError(std::string("expected an atomic value, holds a ") + ::ToString(Kind()));
}

const OptionValue::Set& OptionValue::AsSet() const {
    if (const auto* value = std::get_if<Set>(&value_)) {
        return *value;
    }
    throw TypeMismatchError(std::string("expected a set, holds a ") + ::ToString(Kind()));
}

const OptionValue::Sequence& OptionValue::AsSequence() const {
    if (const auto* value = std::get_if<Sequence>(&value_)) {
        return *value;
    }
    throw TypeMismatchError(std::string("expected a sequence, holds a ") + ::ToString(Kind()));
}

const OptionValue::Mapping& OptionValue::AsMapping() const {
    if (const auto* value = std::get_if<Mapping>(&value_)) {
        return *value;
    }
    throw TypeMismatchError(std::string("expected a mapping, holds a ") + ::ToString(Kind()));
}

OptionValue::Set& OptionValue::AsSet() {
    return const_cast<Set&>(static_cast<const OptionValue&>(*this).AsSet());
}

OptionValue::Sequence& OptionValue::AsSequence() {
    return const_cast<Sequence&>(static_cast<const OptionValue&>(*this).AsSequence());
}

OptionValue::Mapping& OptionValue::AsMapping() {
    return const_cast<Mapping&>(static_cast<const OptionValue&>(*this).AsMapping());
}

bool OptionValue::operator==(const OptionValue& other) const {
    return value_ == other.value_;
}

bool OptionValue::operator!=(const OptionValue& other) const {
    return !(*this == other);
}

OptionSchema& OptionSchema::Declare(const std::string& key, ValueKind kind, std::set<std::string> accepted) {
    KeySpec spec;
    spec.kind = kind;
    spec.accepted = std::move(accepted);
    specs_[key] = std::move(spec);
    return *this;
}

const KeySpec* OptionSchema::Find(const std::string& key) const {
    const auto it = specs_.find(key);
    return it == specs_.end() ? nullptr : &it->second;
}

std::shared_ptr<const OptionSchema> OptionSchema::SevenZip() {
    static const std::shared_ptr<const OptionSchema> schema = [] {
        const std::set<std::string> levels = {"0", "1", "3", "5", "7", "9"};
        const std::set<std::string> onOff = {"on", "off"};
        const std::set<std::string> toggle = {"", "-"};

        auto built = std::make_shared<OptionSchema>();
        built->Declare("ao", ValueKind::Atomic, {"a", "s", "t", "u"})
            .Declare("o", ValueKind::Atomic)
            .Declare("p", ValueKind::Atomic)
            .Declare("t", ValueKind::Atomic)
            .Declare("i", ValueKind::Set)
            .Declare("x", ValueKind::Set)
            .Declare("ai", ValueKind::Set)
            .Declare("ax", ValueKind::Set)
            .Declare("v", ValueKind::Sequence)
            .Declare("r", ValueKind::Atomic, {"", "-", "0"})
            .Declare("slp", ValueKind::Atomic, toggle)
            .Declare("ssc", ValueKind::Atomic, toggle)
            .Declare("y", ValueKind::Atomic, {""})
            .Declare("mx", ValueKind::Atomic, levels)
            .Declare("myx", ValueKind::Atomic, levels)
            .Declare("mqs", ValueKind::Atomic, onOff)
            .Declare("mhc", ValueKind::Atomic, onOff)
            .Declare("mhe", ValueKind::Atomic, onOff);
        return std::shared_ptr<const OptionSchema>(std::move(built));
    }();
    return schema;
}

ArchiveOptions::ArchiveOptions(std::shared_ptr<const OptionSchema> schema)
    : schema_(schema ? std::move(schema) : std::make_shared<const OptionSchema>()) {}

ArchiveOptions::ArchiveOptions(std::initializer_list<Entry> initial, std::shared_ptr<const OptionSchema> schema)
    : ArchiveOptions(std::move(schema)) {
    for (const auto& [key, value] : initial) {
        Set(key, value);
    }
}

bool ArchiveOptions::Contains(const std::string& key) const {
    return FindEntry(key) != nullptr;
}

const OptionValue* ArchiveOptions::Find(const std::string& key) const {
    const Entry* entry = FindEntry(key);
    return entry == nullptr ? nullptr : &entry->second;
}

const OptionValue& ArchiveOptions::Get(const std::string& key) const {
    const Entry* entry = FindEntry(key);
    if (entry == nullptr) {
        throw NotFoundError("option '" + key + "' is not set");
    }
    return entry->second;
}

void ArchiveOptions::Set(const std::string& key, OptionValue value) {
    Validate(key, value);

    if (Entry* entry = FindEntry(key)) {
        entry->second = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

bool ArchiveOptions::Erase(const std::string& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<std::string> ArchiveOptions::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& entry : entries_) {
        keys.push_back(entry.first);
    }
    return keys;
}

size_t ArchiveOptions::Size() const {
    return entries_.size();
}

bool ArchiveOptions::Empty() const {
    return entries_.empty() && chain_.Empty();
}

const MethodChain& ArchiveOptions::Chain() const {
    return chain_;
}

const OptionSchema& ArchiveOptions::Schema() const {
    return *schema_;
}

ArchiveOptions& ArchiveOptions::Merge(const ArchiveOptions& other) {
    if (&other == this) {
        const ArchiveOptions copy(other);
        return Merge(copy);
    }

    for (const auto& [key, value] : other.entries_) {
        Validate(key, value);
    }

    for (const auto& [key, value] : other.entries_) {
        Combine(key, value);
    }
    chain_.Extend(other.chain_);
    return *this;
}

ArchiveOptions& ArchiveOptions::MergeAll(const std::vector<ArchiveOptions>& others) {
    ArchiveOptions staged(*this);
    for (const auto& other : others) {
        staged.Merge(other);
    }
    *this = std::move(staged);
    return *this;
}

ArchiveOptions ArchiveOptions::operator|(const ArchiveOptions& other) const {
    ArchiveOptions merged(*this);
    merged.Merge(other);
    return merged;
}

ArchiveOptions& ArchiveOptions::operator|=(const ArchiveOptions& other) {
    return Merge(other);
}

std::vector<std::string> ArchiveOptions::Serialize() const {
    std::vector<std::string> args;
    for (const auto& [key, value] : entries_) {
        AppendFlags(key, value, args);
    }
    for (auto& method : chain_.Serialize()) {
        args.push_back(std::move(method));
    }
    return args;
}

std::vector<std::string> ArchiveOptions::Serialize(const std::set<std::string>& allowed) const {
    std::vector<std::string> args;
    for (const auto& [key, value] : entries_) {
        if (allowed.count(key) != 0) {
            AppendFlags(key, value, args);
        }
    }
    if (allowed.count("m") != 0) {
        for (auto& method : chain_.Serialize()) {
            args.push_back(std::move(method));
        }
    }
    return args;
}

std::string ArchiveOptions::ToString() const {
    std::ostringstream out;
    bool first = true;
    for (const auto& arg : Serialize()) {
        if (!first) {
            out << ' ';
        }
        out << arg;
        first = false;
    }
    return out.str();
}

ArchiveOptions& ArchiveOptions::OverwriteMode(const std::string& value) {
    Set("ao", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::Include(const std::vector<std::string>& patterns,
                                        const std::string& recurseType,
                                        const std::string& fileRefType) {
    return AddPatterns("i", patterns, recurseType, fileRefType);
}

ArchiveOptions& ArchiveOptions::Exclude(const std::vector<std::string>& patterns,
                                        const std::string& recurseType,
                                        const std::string& fileRefType) {
    return AddPatterns("x", patterns, recurseType, fileRefType);
}

ArchiveOptions& ArchiveOptions::Output(const std::string& path) {
    Set("o", path);
    return *this;
}

ArchiveOptions& ArchiveOptions::Password(const std::string& value) {
    Set("p", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::LargePages(bool enabled) {
    Set("slp", enabled ? "" : "-");
    return *this;
}

ArchiveOptions& ArchiveOptions::CaseSensitive(bool enabled) {
    Set("ssc", enabled ? "" : "-");
    return *this;
}

ArchiveOptions& ArchiveOptions::Yes(bool enabled) {
    if (enabled) {
        Set("y", "");
    } else {
        Erase("y");
    }
    return *this;
}

ArchiveOptions& ArchiveOptions::Type(const std::string& value) {
    Set("t", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::Recurse(const std::string& mode) {
    Set("r", mode);
    return *this;
}

ArchiveOptions& ArchiveOptions::Volume(const std::string& size) {
    const OptionValue value(OptionValue::Sequence{size});
    Validate("v", value);
    Combine("v", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::Methods(const MethodChain& chain) {
    chain_.Extend(chain);
    return *this;
}

ArchiveOptions& ArchiveOptions::Level(int value) {
    Set("mx", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::FileAnalysisLevel(int value) {
    Set("myx", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::Solid(bool enabled) {
    Set("ms", OnOff(enabled));
    return *this;
}

ArchiveOptions& ArchiveOptions::Solid(const std::string& value) {
    Set("ms", value);
    return *this;
}

ArchiveOptions& ArchiveOptions::Solid(const char* value) {
    return Solid(std::string(value == nullptr ? "" : value));
}

ArchiveOptions& ArchiveOptions::SortByType(bool enabled) {
    Set("mqs", OnOff(enabled));
    return *this;
}

ArchiveOptions& ArchiveOptions::Filter(bool enabled) {
    Set("mf", OnOff(enabled));
    return *this;
}

ArchiveOptions& ArchiveOptions::Filter(const CompressionMethod& filter) {
    if (!filter.IsFilter()) {
        throw DomainError("'" + filter.Name() + "' is a compression method, not a filter");
    }
    Set("mf", filter.Name());
    return *this;
}

ArchiveOptions& ArchiveOptions::HeaderCompression(bool enabled) {
    Set("mhc", OnOff(enabled));
    return *this;
}

ArchiveOptions& ArchiveOptions::HeaderEncryption(bool enabled) {
    Set("mhe", OnOff(enabled));
    return *this;
}

ArchiveOptions& ArchiveOptions::Multithreading(bool enabled) {
    Set("mmt", OnOff(enabled));
    return *this;
}

ArchiveOptions& ArchiveOptions::Multithreading(int threads) {
    if (threads < 1) {
        throw DomainError("thread count must be positive: " + std::to_string(threads));
    }
    Set("mmt", threads);
    return *this;
}

ArchiveOptions::Entry* ArchiveOptions::FindEntry(const std::string& key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry;
        }
    }
    return nullptr;
}

const ArchiveOptions::Entry* ArchiveOptions::FindEntry(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<ValueKind> ArchiveOptions::ExpectedKind(const std::string& key) const {
    if (const KeySpec* spec = schema_->Find(key)) {
        return spec->kind;
    }
    if (const Entry* entry = FindEntry(key)) {
        return entry->second.Kind();
    }
    return std::nullopt;
}

void ArchiveOptions::Validate(const std::string& key, const OptionValue& value) const {
    const auto expected = ExpectedKind(key);
    if (expected && *expected != value.Kind()) {
        throw TypeMismatchError(
            "option '" + key + "' holds a " + ::ToString(*expected) + ", got a " + ::ToString(value.Kind()));
    }

    const KeySpec* spec = schema_->Find(key);
    if (spec != nullptr && value.Kind() == ValueKind::Atomic && !spec->accepted.empty()
        && spec->accepted.count(value.AsScalar()) == 0) {
        throw DomainError(
            "value '" + value.AsScalar() + "' for option '" + key + "' must be in " + Join(spec->accepted));
    }
}

void ArchiveOptions::Combine(const std::string& key, const OptionValue& value) {
    Entry* entry = FindEntry(key);
    if (entry == nullptr) {
        const KeySpec* spec = schema_->Find(key);
        if (spec == nullptr || spec->kind == ValueKind::Atomic) {
            entries_.emplace_back(key, value);
            return;
        }
        entries_.emplace_back(key, OptionValue::Empty(spec->kind));
        entry = &entries_.back();
    }

    OptionValue& stored = entry->second;
    switch (stored.Kind()) {
    case ValueKind::Set: {
        const auto& incoming = value.AsSet();
        stored.AsSet().insert(incoming.begin(), incoming.end());
        break;
    }
    case ValueKind::Sequence: {
        const auto& incoming = value.AsSequence();
        auto& sequence = stored.AsSequence();
        sequence.insert(sequence.end(), incoming.begin(), incoming.end());
        break;
    }
    case ValueKind::Mapping:
        for (const auto& [name, item] : value.AsMapping()) {
            stored.AsMapping()[name] = item;
        }
        break;
    case ValueKind::Atomic:
        stored = value;
        break;
    }
}

ArchiveOptions& ArchiveOptions::AddPatterns(const std::string& key,
                                            const std::vector<std::string>& patterns,
                                            const std::string& recurseType,
                                            const std::string& fileRefType) {
    OptionValue::Set refs;
    for (const auto& pattern : patterns) {
        refs.insert(recurseType + fileRefType + pattern);
    }

    const OptionValue value(std::move(refs));
    Validate(key, value);
    Combine(key, value);
    return *this;
}

void ArchiveOptions::AppendFlags(const std::string& key, const OptionValue& value, std::vector<std::string>& args) {
    const std::string prefix = "-" + key + (IsSwitchFamilyM(key) ? "=" : "");
    switch (value.Kind()) {
    case ValueKind::Atomic:
        args.push_back(prefix + value.AsScalar());
        break;
    case ValueKind::Set:
        for (const auto& item : value.AsSet()) {
            args.push_back(prefix + item);
        }
        break;
    case ValueKind::Sequence:
        for (const auto& item : value.AsSequence()) {
            args.push_back(prefix + item);
        }
        break;
    case ValueKind::Mapping:
        for (const auto& [name, item] : value.AsMapping()) {
            args.push_back(prefix + name + "=" + item);
        }
        break;
    }
}
