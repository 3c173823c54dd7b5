#include "ArchiveOptions.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::string Join(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

std::vector<std::string> Sorted(std::vector<std::string> args) {
    std::sort(args.begin(), args.end());
    return args;
}
} // namespace

int main() {
    // Disjoint atomic keys: the merge serializes as the union of both sides.
    {
        ArchiveOptions first{{"t", "7z"}, {"p", "secret"}};
        ArchiveOptions second{{"mx", 9}, {"ssw", ""}};

        std::vector<std::string> expected = first.Serialize();
        const auto secondArgs = second.Serialize();
        expected.insert(expected.end(), secondArgs.begin(), secondArgs.end());

        first.Merge(second);
        if (Sorted(first.Serialize()) != Sorted(expected)) {
            return Fail("Disjoint merge lost arguments: " + first.ToString());
        }
    }

    // Set keys union in either order.
    {
        const ArchiveOptions left{{"x", OptionValue::Set{"r!a.txt"}}};
        const ArchiveOptions right{{"x", OptionValue::Set{"r!b.txt"}}};

        const ArchiveOptions forward = left | right;
        const ArchiveOptions backward = right | left;
        const OptionValue expected(OptionValue::Set{"r!a.txt", "r!b.txt"});
        if (forward.Get("x") != expected || backward.Get("x") != expected) {
            return Fail("Set merge is not a union: " + forward.ToString() + " / " + backward.ToString());
        }
    }

    // Sequence keys concatenate in merge order.
    {
        ArchiveOptions options;
        options.Volume("100m");
        options.Merge(ArchiveOptions{{"v", OptionValue::Sequence{"200m"}}});
        if (Join(options.Serialize()) != "-v100m -v200m") {
            return Fail("Sequence merge out of order: " + options.ToString());
        }

        ArchiveOptions reversed{{"v", OptionValue::Sequence{"200m"}}};
        reversed.Volume("100m");
        if (Join(reversed.Serialize()) != "-v200m -v100m") {
            return Fail("Sequence merge should follow merge order: " + reversed.ToString());
        }
    }

    // A scalar merged into a set fails and leaves the container untouched.
    {
        ArchiveOptions options;
        options.Type("7z").Exclude({"*.tmp"});
        const std::string before = options.ToString();

        ArchiveOptions bad{{"mx", 5}};
        bad.Set("p", "secret");
        bool threw = false;
        try {
            // "x" is declared as a set, so the scalar is rejected up front.
            bad.Set("x", "*.log");
        } catch (const TypeMismatchError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Scalar accepted for a set key.");
        }

        ArchiveOptions undeclared{{"w", "C:\\temp"}};
        ArchiveOptions mixed;
        mixed.Set("mx", 7);
        mixed.Set("w", OptionValue::Set{"a"});
        const std::string undeclaredBefore = undeclared.ToString();
        threw = false;
        try {
            undeclared.Merge(mixed);
        } catch (const TypeMismatchError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Merging a set into a scalar key did not fail.");
        }
        if (undeclared.ToString() != undeclaredBefore) {
            return Fail("Failed merge left partial state: " + undeclared.ToString());
        }

        // Same conflict in the other order.
        threw = false;
        ArchiveOptions setFirst;
        setFirst.Set("w", OptionValue::Set{"a"});
        try {
            setFirst.Merge(ArchiveOptions{{"w", "C:\\temp"}});
        } catch (const TypeMismatchError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Merging a scalar into a set key did not fail.");
        }

        if (options.ToString() != before) {
            return Fail("Container changed by an unrelated failure: " + options.ToString());
        }
    }

    // MergeAll is all-or-nothing.
    {
        ArchiveOptions options{{"t", "zip"}};
        const std::vector<ArchiveOptions> others = {
            ArchiveOptions{{"mx", 9}, {"w", "tmp"}},
            ArchiveOptions{{"w", OptionValue::Set{"oops"}}},
        };
        bool threw = false;
        try {
            options.MergeAll(others);
        } catch (const TypeMismatchError&) {
            threw = true;
        }
        if (!threw || options.ToString() != "-tzip") {
            return Fail("MergeAll applied part of a failing batch: " + options.ToString());
        }
    }

    // Allowed-key filter.
    {
        const ArchiveOptions options{{"t", "7z"}, {"mx", 9}};
        const auto args = options.Serialize({"t"});
        if (args != std::vector<std::string>{"-t7z"}) {
            return Fail("Allowed-key filter leaked: " + Join(args));
        }
        if (Join(options.Serialize({"t", "mx"})) != "-t7z -mx=9") {
            return Fail("Listed keys should pass: " + Join(options.Serialize({"t", "mx"})));
        }
        if (Join(options.Serialize({"t", "m"})) != "-t7z") {
            return Fail("\"m\" admitted other keys: " + Join(options.Serialize({"t", "m"})));
        }

        ArchiveOptions chained{{"mx", 9}, {"mmt", "on"}};
        if (!chained.Serialize({"m"}).empty()) {
            return Fail("\"m\" admitted mx or mmt: " + Join(chained.Serialize({"m"})));
        }
        chained.Methods(LzmaMethod());
        if (chained.Serialize({"m"}) != std::vector<std::string>{"-m0=LZMA"}) {
            return Fail("\"m\" should admit the chain only: " + Join(chained.Serialize({"m"})));
        }
    }

    // Switches that take one value are declared atomic.
    {
        for (const char* key : {"o", "p", "t"}) {
            ArchiveOptions options;
            bool threw = false;
            try {
                options.Set(key, OptionValue::Set{"dir"});
            } catch (const TypeMismatchError&) {
                threw = true;
            }
            if (!threw || options.Find(key) != nullptr) {
                return Fail(std::string("A set was stored under -") + key);
            }
        }
    }

    // Chain positions do not depend on when other keys were set.
    {
        ArchiveOptions early;
        early.Methods(BcjFilter(), Lzma2Method().DictSize("64m"));
        early.Type("7z").Level(9);

        ArchiveOptions late;
        late.Type("7z").Level(9);
        late.Methods(BcjFilter(), Lzma2Method().DictSize("64m"));

        const std::string expected = "-t7z -mx=9 -m0=BCJ -m1=LZMA2:d=64m";
        if (early.ToString() != expected || late.ToString() != expected) {
            return Fail("Chain positions shifted: " + early.ToString() + " / " + late.ToString());
        }

        if (Join(early.Serialize({"t"})) != "-t7z") {
            return Fail("Chain emitted without \"m\" allowed.");
        }
    }

    // Merged chains are appended.
    {
        ArchiveOptions filters;
        filters.Methods(BcjFilter());
        ArchiveOptions methods;
        methods.Methods(LzmaMethod());
        filters |= methods;
        if (filters.ToString() != "-m0=BCJ -m1=LZMA") {
            return Fail("Chain merge lost an entry: " + filters.ToString());
        }
    }

    // Accepted value domains.
    {
        ArchiveOptions options;
        bool threw = false;
        try {
            options.OverwriteMode("o");
        } catch (const DomainError&) {
            threw = true;
        }
        if (!threw || options.Contains("ao")) {
            return Fail("Overwrite mode accepted an unknown value.");
        }

        threw = false;
        try {
            options.Level(4);
        } catch (const DomainError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Level accepted 4.");
        }

        threw = false;
        try {
            options.Filter(Lzma2Method());
        } catch (const DomainError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Filter accepted a compression method.");
        }

        threw = false;
        try {
            options.Multithreading(0);
        } catch (const DomainError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Multithreading accepted zero threads.");
        }
    }

    // Fluent setters.
    {
        ArchiveOptions options;
        options.OverwriteMode("s")
            .Include({"*.txt"})
            .Exclude({"*.bak"}, "r-")
            .Password("pw")
            .LargePages(false)
            .CaseSensitive(true)
            .Yes()
            .Solid("e1g")
            .SortByType(true)
            .Filter(DeltaFilter().Offset(4))
            .HeaderCompression(false)
            .HeaderEncryption(true)
            .Multithreading(4);
        const std::string expected =
            "-aos -ir!*.txt -xr-!*.bak -ppw -slp- -ssc -y -ms=e1g -mqs=on -mf=Delta:4 -mhc=off -mhe=on -mmt=4";
        if (options.ToString() != expected) {
            return Fail("Unexpected fluent serialization: " + options.ToString());
        }

        options.Yes(false);
        if (options.Contains("y")) {
            return Fail("Yes(false) should drop the switch.");
        }
    }

    // Mappings serialize one flag per entry.
    {
        ArchiveOptions options;
        options.Set("mtc", OptionValue::Mapping{{"a", "on"}, {"m", "off"}});
        if (options.ToString() != "-mtc=a=on -mtc=m=off") {
            return Fail("Unexpected mapping serialization: " + options.ToString());
        }
        options.Merge(ArchiveOptions{{"mtc", OptionValue::Mapping{{"m", "on"}}}});
        if (options.Get("mtc").AsMapping().at("m") != "on") {
            return Fail("Mapping merge did not update the entry.");
        }
    }

    // Lookups.
    {
        const ArchiveOptions options{{"t", "7z"}};
        bool threw = false;
        try {
            options.Get("p");
        } catch (const NotFoundError&) {
            threw = true;
        }
        if (!threw || options.Find("p") != nullptr) {
            return Fail("Missing key lookup should fail.");
        }
        if (!ArchiveOptions().Empty() || options.Empty()) {
            return Fail("Empty() is wrong.");
        }
    }

    // Self-merge doubles sequences but keeps sets stable.
    {
        ArchiveOptions options;
        options.Volume("1g").Exclude({"*.tmp"});
        options.Merge(options);
        if (options.ToString() != "-v1g -v1g -xr!*.tmp") {
            return Fail("Unexpected self-merge result: " + options.ToString());
        }
    }

    return 0;
}
