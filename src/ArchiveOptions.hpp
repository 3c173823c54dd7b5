#pragma once

#include "CompressionMethod.hpp"
#include "Errors.hpp"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class ValueKind {
    Atomic,
    Set,
    Sequence,
    Mapping
};

const char* ToString(ValueKind kind);

class OptionValue {
public:
    using Set = std::set<std::string>;
    using Sequence = std::vector<std::string>;
    using Mapping = std::map<std::string, std::string>;

    OptionValue();
    OptionValue(const char* value);
    OptionValue(std::string value);
    OptionValue(int value);
    OptionValue(int64_t value);
    OptionValue(Set value);
    OptionValue(Sequence value);
    OptionValue(Mapping value);

    static OptionValue Empty(ValueKind kind);

    ValueKind Kind() const;

    // Each accessor throws TypeMismatchError when the value holds another kind.
    const std::string& AsScalar() const;
    const Set& AsSet() const;
    const Sequence& AsSequence() const;
    const Mapping& AsMapping() const;
    Set& AsSet();
    Sequence& AsSequence();
    Mapping& AsMapping();

    bool operator==(const OptionValue& other) const;
    bool operator!=(const OptionValue& other) const;

private:
    std::variant<std::string, Set, Sequence, Mapping> value_;
};

struct KeySpec {
    ValueKind kind = ValueKind::Atomic;
    // Empty means any value is accepted.
    std::set<std::string> accepted;
};

// Declares, per option key, the kind of value it holds and optionally the
// values it accepts. Keys that are not declared take the kind of their first
// stored value.
class OptionSchema {
public:
    OptionSchema& Declare(const std::string& key, ValueKind kind, std::set<std::string> accepted = {});
    const KeySpec* Find(const std::string& key) const;

    // The switches of the 7-Zip command line.
    static std::shared_ptr<const OptionSchema> SevenZip();

private:
    std::map<std::string, KeySpec> specs_;
};

class ArchiveOptions {
public:
    using Entry = std::pair<std::string, OptionValue>;

    explicit ArchiveOptions(std::shared_ptr<const OptionSchema> schema = OptionSchema::SevenZip());
    ArchiveOptions(std::initializer_list<Entry> initial,
                   std::shared_ptr<const OptionSchema> schema = OptionSchema::SevenZip());

    bool Contains(const std::string& key) const;
    const OptionValue* Find(const std::string& key) const;
    // Throws NotFoundError for unknown keys.
    const OptionValue& Get(const std::string& key) const;
    void Set(const std::string& key, OptionValue value);
    bool Erase(const std::string& key);

    std::vector<std::string> Keys() const;
    size_t Size() const;
    bool Empty() const;

    const MethodChain& Chain() const;
    const OptionSchema& Schema() const;

    // Overrides atomic values, unions sets, extends sequences, updates
    // mappings and appends the other chain. Either every key of |other| is
    // applied or, on DomainError / TypeMismatchError, none is. Chains are not
    // deduplicated: merging the same preset twice doubles its methods.
    ArchiveOptions& Merge(const ArchiveOptions& other);
    ArchiveOptions& MergeAll(const std::vector<ArchiveOptions>& others);

    ArchiveOptions operator|(const ArchiveOptions& other) const;
    ArchiveOptions& operator|=(const ArchiveOptions& other);

    std::vector<std::string> Serialize() const;
    // Only keys in |allowed| are emitted. The method chain is emitted when
    // "m" is allowed.
    std::vector<std::string> Serialize(const std::set<std::string>& allowed) const;
    std::string ToString() const;

    // -ao: a = overwrite all, s = skip existing, u = rename extracted, t = rename existing.
    ArchiveOptions& OverwriteMode(const std::string& value);
    // -i / -x. recurseType is "r", "r-" or "r0"; fileRefType is "!" (wildcard) or "@" (list file).
    ArchiveOptions& Include(const std::vector<std::string>& patterns,
                            const std::string& recurseType = "r",
                            const std::string& fileRefType = "!");
    ArchiveOptions& Exclude(const std::vector<std::string>& patterns,
                            const std::string& recurseType = "r",
                            const std::string& fileRefType = "!");
    ArchiveOptions& Output(const std::string& path);
    ArchiveOptions& Password(const std::string& value);
    ArchiveOptions& LargePages(bool enabled);
    ArchiveOptions& CaseSensitive(bool enabled);
    // Assume yes on all queries. Passing false removes the switch.
    ArchiveOptions& Yes(bool enabled = true);
    ArchiveOptions& Type(const std::string& value);
    ArchiveOptions& Recurse(const std::string& mode);
    ArchiveOptions& Volume(const std::string& size);

    template <typename... Rest>
    ArchiveOptions& Methods(const CompressionMethod& first, const Rest&... rest) {
        chain_.Append(first, rest...);
        return *this;
    }
    ArchiveOptions& Methods(const MethodChain& chain);

    // 0 = copy, 1 = fastest, 3 = fast, 5 = normal, 7 = maximum, 9 = ultra.
    ArchiveOptions& Level(int value);
    ArchiveOptions& FileAnalysisLevel(int value);
    ArchiveOptions& Solid(bool enabled);
    // "e", "{N}f", "{N}b|k|m|g|t" or a combination such as "e1g".
    ArchiveOptions& Solid(const std::string& value);
    ArchiveOptions& Solid(const char* value);
    ArchiveOptions& SortByType(bool enabled);
    ArchiveOptions& Filter(bool enabled);
    ArchiveOptions& Filter(const CompressionMethod& filter);
    ArchiveOptions& HeaderCompression(bool enabled);
    ArchiveOptions& HeaderEncryption(bool enabled);
    ArchiveOptions& Multithreading(bool enabled);
    ArchiveOptions& Multithreading(int threads);

private:
    Entry* FindEntry(const std::string& key);
    const Entry* FindEntry(const std::string& key) const;
    std::optional<ValueKind> ExpectedKind(const std::string& key) const;
    void Validate(const std::string& key, const OptionValue& value) const;
    void Combine(const std::string& key, const OptionValue& value);
    ArchiveOptions& AddPatterns(const std::string& key,
                                const std::vector<std::string>& patterns,
                                const std::string& recurseType,
                                const std::string& fileRefType);
    static void AppendFlags(const std::string& key, const OptionValue& value, std::vector<std::string>& args);

    std::shared_ptr<const OptionSchema> schema_;
    std::vector<Entry> entries_;
    MethodChain chain_;
};
