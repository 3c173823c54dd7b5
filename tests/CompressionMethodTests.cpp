#include "CompressionMethod.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    Lzma2Method lzma2;
    lzma2.DictSize("64m").FastBytes(64).ChunkSize("256m");
    if (lzma2.Serialize(0) != "-m0=LZMA2:d=64m:fb=64:c=256m") {
        return Fail("Unexpected LZMA2 serialization: " + lzma2.Serialize(0));
    }

    bool threw = false;
    try {
        lzma2.Set("mem", "16m");
    } catch (const DomainError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("LZMA2 accepted a PPMd-only key.");
    }
    if (lzma2.Find("mem") != nullptr) {
        return Fail("Rejected key was stored anyway.");
    }

    threw = false;
    try {
        LzmaMethod().FastBytes(300);
    } catch (const DomainError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("FastBytes accepted a value above 273.");
    }

    const auto filtered = PpmdMethod::ConstructFiltered({{"mem", "192m"}, {"d", "24"}, {"o", "8"}});
    if (filtered.Serialize(2) != "-m2=PPMd:mem=192m:o=8") {
        return Fail("ConstructFiltered kept an unallowed key: " + filtered.Serialize(2));
    }

    DeltaFilter delta;
    if (delta.Name() != "Delta:1" || !delta.IsFilter()) {
        return Fail("Delta filter default name is wrong: " + delta.Name());
    }
    delta.Offset(4);
    if (delta.Serialize(0) != "-m0=Delta:4") {
        return Fail("Delta offset did not rename the filter: " + delta.Serialize(0));
    }
    if (LzmaMethod().IsFilter()) {
        return Fail("LZMA reported as a filter.");
    }

    auto made = MakeCompressionMethod("Delta:2");
    if (made->Name() != "Delta:2") {
        return Fail("Factory ignored the Delta offset: " + made->Name());
    }
    made = MakeCompressionMethod("BCJ2", {{"d", "8m"}, {"fb", "64"}});
    if (made->Serialize(1) != "-m1=BCJ2:d=8m") {
        return Fail("Factory did not filter BCJ2 parameters: " + made->Serialize(1));
    }

    threw = false;
    try {
        MakeCompressionMethod("Zstd");
    } catch (const NotFoundError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("Factory accepted an unknown method id.");
    }

    MethodChain chain;
    chain.Append(BcjFilter(), lzma2);
    if (chain.Size() != 2) {
        return Fail("Chain should hold two entries.");
    }

    // Later edits to the source method must not leak into the chain.
    lzma2.DictSize("1g");
    const auto serialized = chain.Serialize();
    if (serialized[0] != "-m0=BCJ" || serialized[1] != "-m1=LZMA2:d=64m:fb=64:c=256m") {
        return Fail("Unexpected chain serialization: " + serialized[0] + " " + serialized[1]);
    }

    MethodChain copy(chain);
    copy.Append(CopyMethod());
    if (chain.Size() != 2 || copy.Size() != 3) {
        return Fail("Chain copy shares storage with its source.");
    }
    if (copy.Serialize()[2] != "-m2=Copy") {
        return Fail("Appended method got the wrong position: " + copy.Serialize()[2]);
    }

    return 0;
}
