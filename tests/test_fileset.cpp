#include "test_support.hpp"

#include "batchtyper/core/errors.hpp"
#include "batchtyper/io/fileset.hpp"

#include <catch2/catch.hpp>

using namespace batchtyper;

namespace {
const std::vector<std::string> kExtensions{".fna", ".fasta", ".fa", ".fsa"};
}

TEST_CASE("resolve_single_file") {
    test::TempDir dir;
    auto p = test::write_file(dir / "sample.fna");

    InputSet inputs = io::resolve_inputs(p.string(), kExtensions);
    REQUIRE(inputs.size() == 1);
    REQUIRE(inputs[0].path == fs::absolute(p).lexically_normal());
    REQUIRE(inputs[0].extension == ".fna");
}

TEST_CASE("resolve_single_file_with_unknown_extension_is_not_found") {
    test::TempDir dir;
    auto p = test::write_file(dir / "notes.txt");
    REQUIRE_THROWS_AS(io::resolve_inputs(p.string(), kExtensions), InputNotFound);
}

TEST_CASE("resolve_missing_path_throws") {
    test::TempDir dir;
    REQUIRE_THROWS_AS(io::resolve_inputs((dir / "nope.fna").string(), kExtensions), InputNotFound);
}

TEST_CASE("resolve_directory_is_sorted_and_case_sensitive") {
    test::TempDir dir;
    test::write_file(dir / "b.fasta");
    test::write_file(dir / "a.fna");
    test::write_file(dir / "C.FNA");
    test::write_file(dir / ".hidden.fna");
    test::write_file(dir / "readme.txt");

    InputSet inputs = io::resolve_inputs(dir.path().string(), kExtensions);
    REQUIRE(inputs.size() == 2);
    REQUIRE(inputs[0].name() == "a.fna");
    REQUIRE(inputs[1].name() == "b.fasta");
}

TEST_CASE("resolve_empty_directory_yields_empty_set") {
    test::TempDir dir;
    REQUIRE(io::resolve_inputs(dir.path().string(), kExtensions).empty());
}

TEST_CASE("resolve_wildcard_filters_extension_case_insensitively") {
    test::TempDir dir;
    test::write_file(dir / "s1.fna");
    test::write_file(dir / "s2.FNA");
    test::write_file(dir / "s3.txt");
    test::write_file(dir / ".s4.fna");

    InputSet inputs = io::resolve_inputs((dir / "s*").string(), kExtensions);
    REQUIRE(inputs.size() == 2);
    REQUIRE(inputs[0].name() == "s1.fna");
    REQUIRE(inputs[1].name() == "s2.FNA");
    REQUIRE(inputs[1].extension == ".fna");
}

TEST_CASE("resolve_wildcard_in_directory_component") {
    test::TempDir dir;
    test::write_file(dir / "run1" / "a.fa");
    test::write_file(dir / "run2" / "b.fa");
    test::write_file(dir / "other" / "c.fa");

    InputSet inputs = io::resolve_inputs((dir / "run?" / "*.fa").string(), kExtensions);
    REQUIRE(inputs.size() == 2);
    REQUIRE(inputs[0].name() == "a.fa");
    REQUIRE(inputs[1].name() == "b.fa");
}

TEST_CASE("resolve_wildcard_without_matches_yields_empty_set") {
    test::TempDir dir;
    REQUIRE(io::resolve_inputs((dir / "*.fna").string(), kExtensions).empty());
}

TEST_CASE("derive_pattern_from_extensions") {
    test::TempDir dir;
    InputSet same{test::make_input(dir / "a.fna"), test::make_input(dir / "b.fna")};
    InputSet mixed{test::make_input(dir / "a.fna"), test::make_input(dir / "b.fasta")};
    InputSet single{test::make_input(dir / "a.fna")};

    REQUIRE(io::derive_file_pattern(same) == "*.fna");
    REQUIRE(io::derive_file_pattern(mixed) == "*");
    REQUIRE(io::derive_file_pattern(single) == "*.fna");
    REQUIRE(io::derive_file_pattern(InputSet{}) == "*.fna");
}

TEST_CASE("detected_extensions_keeps_first_seen_order") {
    test::TempDir dir;
    InputSet inputs{test::make_input(dir / "a.fna"), test::make_input(dir / "b.fasta"),
                    test::make_input(dir / "c.fna")};
    auto exts = io::detected_extensions(inputs);
    REQUIRE(exts == std::vector<std::string>{".fna", ".fasta"});
}
