#pragma once

#include "Errors.hpp"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

using ParameterMap = std::vector<std::pair<std::string, std::string>>;

// A compression method or filter with a fixed set of allowed parameter keys.
// Serialized as "-m{N}=<Name>:<k>=<v>..." where N is the position in the chain.
class CompressionMethod {
public:
    static constexpr int kFilterSortKey = 0;
    static constexpr int kMethodSortKey = 64;

    virtual ~CompressionMethod() = default;

    const std::string& Name() const;
    int SortKey() const;
    bool IsFilter() const;
    const std::set<std::string>& AllowedKeys() const;
    const ParameterMap& Values() const;
    const std::string* Find(const std::string& key) const;

    void Set(const std::string& key, const std::string& value);
    void Set(const std::string& key, int64_t value);

    std::string Serialize(size_t index) const;

    virtual std::unique_ptr<CompressionMethod> Clone() const = 0;

protected:
    CompressionMethod(std::string name, int sortKey, std::set<std::string> allowedKeys);

    // Keeps only the entries of |initial| whose key is allowed. Unknown keys are
    // dropped without error so oversized generic mappings can be passed in.
    void AssignFiltered(const ParameterMap& initial);
    void SetName(std::string name);
    void SetChecked(const std::string& key, int64_t value, int64_t minValue, int64_t maxValue);

private:
    std::string name_;
    int sortKey_;
    std::set<std::string> allowedKeys_;
    ParameterMap values_;
};

template <typename Self>
class BasicCompressionMethod : public CompressionMethod {
public:
    static Self ConstructFiltered(const ParameterMap& initial) {
        Self method;
        method.AssignFiltered(initial);
        return method;
    }

    std::unique_ptr<CompressionMethod> Clone() const override {
        return std::make_unique<Self>(static_cast<const Self&>(*this));
    }

protected:
    using CompressionMethod::CompressionMethod;

    Self& self() {
        return static_cast<Self&>(*this);
    }
};

// Shared parameters of the LZMA family.
template <typename Self>
class BasicLzmaMethod : public BasicCompressionMethod<Self> {
public:
    // 0 = fast, 1 = normal.
    Self& FastCompression(int64_t value) {
        this->SetChecked("a", value, 0, 1);
        return this->self();
    }

    // Either a power of two exponent (24 = 16 MB) or a size with a b/k/m/g suffix.
    Self& DictSize(const std::string& value) {
        this->Set("d", value);
        return this->self();
    }

    Self& DictSize(int64_t value) {
        this->Set("d", value);
        return this->self();
    }

    Self& MatchFinder(const std::string& value) {
        this->Set("mf", value);
        return this->self();
    }

    Self& FastBytes(int64_t value) {
        this->SetChecked("fb", value, 5, 273);
        return this->self();
    }

    Self& MatchFinderCycles(int64_t value) {
        this->SetChecked("mc", value, 0, 1000000000);
        return this->self();
    }

    Self& LiteralContextBits(int64_t value) {
        this->SetChecked("lc", value, 0, 8);
        return this->self();
    }

    Self& LiteralPosBits(int64_t value) {
        this->SetChecked("lp", value, 0, 4);
        return this->self();
    }

    Self& PosBits(int64_t value) {
        this->SetChecked("pb", value, 0, 4);
        return this->self();
    }

protected:
    BasicLzmaMethod(std::string name, std::set<std::string> extraKeys = {})
        : BasicCompressionMethod<Self>(
              std::move(name), CompressionMethod::kMethodSortKey, MergeKeys(std::move(extraKeys))) {}

private:
    static std::set<std::string> MergeKeys(std::set<std::string> extraKeys) {
        extraKeys.insert({"a", "d", "mf", "fb", "mc", "lc", "lp", "pb"});
        return extraKeys;
    }
};

class LzmaMethod : public BasicLzmaMethod<LzmaMethod> {
public:
    LzmaMethod();
};

class Lzma2Method : public BasicLzmaMethod<Lzma2Method> {
public:
    Lzma2Method();

    Lzma2Method& ChunkSize(const std::string& value);
    Lzma2Method& ChunkSize(int64_t value);
};

class PpmdMethod : public BasicCompressionMethod<PpmdMethod> {
public:
    PpmdMethod();

    PpmdMethod& MemorySize(const std::string& value);
    PpmdMethod& MemorySize(int64_t value);
    PpmdMethod& ModelOrder(int64_t value);
};

class BZip2Method : public BasicCompressionMethod<BZip2Method> {
public:
    BZip2Method();
};

class DeflateMethod : public BasicCompressionMethod<DeflateMethod> {
public:
    DeflateMethod();
};

class CopyMethod : public BasicCompressionMethod<CopyMethod> {
public:
    CopyMethod();
};

class DeltaFilter : public BasicCompressionMethod<DeltaFilter> {
public:
    DeltaFilter();

    // Renames the filter to "Delta:<offset>". 4 suits 16-bit stereo WAV.
    DeltaFilter& Offset(int64_t value);
};

// Branch converter for 32-bit x86 executables.
class BcjFilter : public BasicCompressionMethod<BcjFilter> {
public:
    BcjFilter();
};

class Bcj2Filter : public BasicCompressionMethod<Bcj2Filter> {
public:
    Bcj2Filter();

    Bcj2Filter& DictSize(const std::string& value);
    Bcj2Filter& DictSize(int64_t value);
};

class ArmFilter : public BasicCompressionMethod<ArmFilter> {
public:
    ArmFilter();
};

class ArmtFilter : public BasicCompressionMethod<ArmtFilter> {
public:
    ArmtFilter();
};

class Ia64Filter : public BasicCompressionMethod<Ia64Filter> {
public:
    Ia64Filter();
};

class PpcFilter : public BasicCompressionMethod<PpcFilter> {
public:
    PpcFilter();
};

class SparcFilter : public BasicCompressionMethod<SparcFilter> {
public:
    SparcFilter();
};

// Builds a method from its 7-Zip id ("LZMA2", "BCJ", "Delta:4", ...), keeping
// only the parameters that id accepts. Throws NotFoundError for unknown ids.
std::unique_ptr<CompressionMethod> MakeCompressionMethod(const std::string& id, const ParameterMap& params = {});

// Ordered, append-only list of methods and filters. Earlier entries apply first.
class MethodChain {
public:
    MethodChain() = default;
    MethodChain(const MethodChain& other);
    MethodChain& operator=(const MethodChain& other);
    MethodChain(MethodChain&&) noexcept = default;
    MethodChain& operator=(MethodChain&&) noexcept = default;

    void Append(const CompressionMethod& method);
    void Append(std::unique_ptr<CompressionMethod> method);
    void Extend(const MethodChain& other);

    template <typename... Methods>
    void Append(const CompressionMethod& first, const Methods&... rest) {
        Append(first);
        Append(rest...);
    }

    size_t Size() const;
    bool Empty() const;
    const CompressionMethod& At(size_t index) const;

    std::vector<std::string> Serialize() const;

private:
    std::vector<std::unique_ptr<CompressionMethod>> methods_;
};
