#include "CompressionMethod.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <sstream>

namespace {
bool ParseOffset(const std::string& text, int64_t& outValue) {
    try {
        size_t index = 0;
        const long long value = std::stoll(text, &index);
        if (index == text.size()) {
            outValue = value;
            return true;
        }
    } catch (const std::exception&) {
    }

    return false;
}

template <typename Method>
std::unique_ptr<CompressionMethod> MakeFiltered(const ParameterMap& params) {
    return std::make_unique<Method>(Method::ConstructFiltered(params));
}
} // namespace

CompressionMethod::CompressionMethod(std::string name, int sortKey, std::set<std::string> allowedKeys)
    : name_(std::move(name)),
      sortKey_(sortKey),
      allowedKeys_(std::move(allowedKeys)) {}

const std::string& CompressionMethod::Name() const {
    return name_;
}

int CompressionMethod::SortKey() const {
    return sortKey_;
}

bool CompressionMethod::IsFilter() const {
    return sortKey_ < kMethodSortKey;
}

const std::set<std::string>& CompressionMethod::AllowedKeys() const {
    return allowedKeys_;
}

const ParameterMap& CompressionMethod::Values() const {
    return values_;
}

const std::string* CompressionMethod::Find(const std::string& key) const {
    for (const auto& entry : values_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

void CompressionMethod::Set(const std::string& key, const std::string& value) {
    if (allowedKeys_.count(key) == 0) {
        throw DomainError(name_ + ": unallowed key '" + key + "'");
    }

    for (auto& entry : values_) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    values_.emplace_back(key, value);
}

void CompressionMethod::Set(const std::string& key, int64_t value) {
    Set(key, std::to_string(value));
}

std::string CompressionMethod::Serialize(size_t index) const {
    std::ostringstream out;
    out << "-m" << index << "=" << name_;
    for (const auto& [key, value] : values_) {
        out << ":" << key << "=" << value;
    }
    return out.str();
}

void CompressionMethod::AssignFiltered(const ParameterMap& initial) {
    for (const auto& [key, value] : initial) {
        if (allowedKeys_.count(key) != 0) {
            Set(key, value);
        }
    }
}

void CompressionMethod::SetName(std::string name) {
    name_ = std::move(name);
}

void CompressionMethod::SetChecked(const std::string& key, int64_t value, int64_t minValue, int64_t maxValue) {
    if (value < minValue || value > maxValue) {
        std::ostringstream message;
        message << name_ << ": " << key << "=" << value
                << " outside [" << minValue << ", " << maxValue << "]";
        throw DomainError(message.str());
    }
    Set(key, value);
}

LzmaMethod::LzmaMethod()
    : BasicLzmaMethod<LzmaMethod>("LZMA") {}

Lzma2Method::Lzma2Method()
    : BasicLzmaMethod<Lzma2Method>("LZMA2", {"c"}) {}

Lzma2Method& Lzma2Method::ChunkSize(const std::string& value) {
    Set("c", value);
    return *this;
}

Lzma2Method& Lzma2Method::ChunkSize(int64_t value) {
    Set("c", value);
    return *this;
}

PpmdMethod::PpmdMethod()
    : BasicCompressionMethod<PpmdMethod>("PPMd", kMethodSortKey, {"mem", "o"}) {}

PpmdMethod& PpmdMethod::MemorySize(const std::string& value) {
    Set("mem", value);
    return *this;
}

PpmdMethod& PpmdMethod::MemorySize(int64_t value) {
    Set("mem", value);
    return *this;
}

PpmdMethod& PpmdMethod::ModelOrder(int64_t value) {
    SetChecked("o", value, 2, 32);
    return *this;
}

BZip2Method::BZip2Method()
    : BasicCompressionMethod<BZip2Method>("BZip2", kMethodSortKey, {}) {}

DeflateMethod::DeflateMethod()
    : BasicCompressionMethod<DeflateMethod>("Deflate", kMethodSortKey, {}) {}

CopyMethod::CopyMethod()
    : BasicCompressionMethod<CopyMethod>("Copy", kMethodSortKey, {}) {}

DeltaFilter::DeltaFilter()
    : BasicCompressionMethod<DeltaFilter>("Delta:1", kFilterSortKey, {}) {}

DeltaFilter& DeltaFilter::Offset(int64_t value) {
    if (value < 1 || value > 256) {
        throw DomainError("Delta: offset " + std::to_string(value) + " outside [1, 256]");
    }
    SetName("Delta:" + std::to_string(value));
    return *this;
}

BcjFilter::BcjFilter()
    : BasicCompressionMethod<BcjFilter>("BCJ", kFilterSortKey, {}) {}

Bcj2Filter::Bcj2Filter()
    : BasicCompressionMethod<Bcj2Filter>("BCJ2", kFilterSortKey, {"d"}) {}

Bcj2Filter& Bcj2Filter::DictSize(const std::string& value) {
    Set("d", value);
    return *this;
}

Bcj2Filter& Bcj2Filter::DictSize(int64_t value) {
    Set("d", value);
    return *this;
}

ArmFilter::ArmFilter()
    : BasicCompressionMethod<ArmFilter>("ARM", kFilterSortKey, {}) {}

ArmtFilter::ArmtFilter()
    : BasicCompressionMethod<ArmtFilter>("ARMT", kFilterSortKey, {}) {}

Ia64Filter::Ia64Filter()
    : BasicCompressionMethod<Ia64Filter>("IA64", kFilterSortKey, {}) {}

PpcFilter::PpcFilter()
    : BasicCompressionMethod<PpcFilter>("PPC", kFilterSortKey, {}) {}

SparcFilter::SparcFilter()
    : BasicCompressionMethod<SparcFilter>("SPARC", kFilterSortKey, {}) {}

std::unique_ptr<CompressionMethod> MakeCompressionMethod(const std::string& id, const ParameterMap& params) {
    using Factory = std::function<std::unique_ptr<CompressionMethod>(const ParameterMap&)>;
    static const std::map<std::string, Factory> factories = {
        {"LZMA", MakeFiltered<LzmaMethod>},
        {"LZMA2", MakeFiltered<Lzma2Method>},
        {"PPMd", MakeFiltered<PpmdMethod>},
        {"BZip2", MakeFiltered<BZip2Method>},
        {"Deflate", MakeFiltered<DeflateMethod>},
        {"Copy", MakeFiltered<CopyMethod>},
        {"Delta", MakeFiltered<DeltaFilter>},
        {"BCJ", MakeFiltered<BcjFilter>},
        {"BCJ2", MakeFiltered<Bcj2Filter>},
        {"ARM", MakeFiltered<ArmFilter>},
        {"ARMT", MakeFiltered<ArmtFilter>},
        {"IA64", MakeFiltered<Ia64Filter>},
        {"PPC", MakeFiltered<PpcFilter>},
        {"SPARC", MakeFiltered<SparcFilter>},
    };

    std::string base = id;
    std::string argument;
    const auto colon = id.find(':');
    if (colon != std::string::npos) {
        base = id.substr(0, colon);
        argument = id.substr(colon + 1);
    }

    const auto it = factories.find(base);
    if (it == factories.end()) {
        throw NotFoundError("unknown compression method: " + id);
    }

    auto method = it->second(params);
    if (base == "Delta" && !argument.empty()) {
        int64_t offset = 0;
        if (!ParseOffset(argument, offset)) {
            throw DomainError("Delta: offset '" + argument + "' is not a number");
        }
        static_cast<DeltaFilter&>(*method).Offset(offset);
    } else if (!argument.empty()) {
        throw DomainError(base + " takes no id argument: " + id);
    }
    return method;
}

MethodChain::MethodChain(const MethodChain& other) {
    Extend(other);
}

MethodChain& MethodChain::operator=(const MethodChain& other) {
    if (this != &other) {
        MethodChain copy(other);
        methods_ = std::move(copy.methods_);
    }
    return *this;
}

void MethodChain::Append(const CompressionMethod& method) {
    methods_.push_back(method.Clone());
}

void MethodChain::Append(std::unique_ptr<CompressionMethod> method) {
    if (method) {
        methods_.push_back(std::move(method));
    }
}

void MethodChain::Extend(const MethodChain& other) {
    std::vector<std::unique_ptr<CompressionMethod>> copies;
    copies.reserve(other.methods_.size());
    for (const auto& method : other.methods_) {
        copies.push_back(method->Clone());
    }
    for (auto& method : copies) {
        methods_.push_back(std::move(method));
    }
}

size_t MethodChain::Size() const {
    return methods_.size();
}

bool MethodChain::Empty() const {
    return methods_.empty();
}

const CompressionMethod& MethodChain::At(size_t index) const {
    return *methods_.at(index);
}

std::vector<std::string> MethodChain::Serialize() const {
    std::vector<std::string> args;
    args.reserve(methods_.size());
    for (size_t index = 0; index < methods_.size(); ++index) {
        args.push_back(methods_[index]->Serialize(index));
    }
    return args;
}
