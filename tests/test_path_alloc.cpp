#include <catch2/catch.hpp>
#include <string>

#include "io/path_alloc.hpp"
#include "test_util.hpp"

using namespace csvsplit;

TEST_CASE("split file names", "[path_alloc]") {
    CHECK(split_path("data/big.csv", "", 7) == fs::path("data/big_000007.csv"));
    CHECK(split_path("data/big.csv", "out", 7) == fs::path("out/big_000007.csv"));
    CHECK(split_path("big.csv", "", 1) == fs::path("big_000001.csv"));
    CHECK(split_path("data/big", "", 12) == fs::path("data/big_000012"));
    CHECK(split_path("data/big.tar.gz", "", 3) == fs::path("data/big.tar_000003.gz"));
    CHECK(split_path("big.csv", "", 1234567) == fs::path("big_1234567.csv"));
}

TEST_CASE("disambiguated names keep the extension", "[path_alloc]") {
    CHECK(disambiguated_path("out/big_000001.csv", 1) == fs::path("out/big_000001_1.csv"));
    CHECK(disambiguated_path("out/big_000001.csv", 12) == fs::path("out/big_000001_12.csv"));
    CHECK(disambiguated_path("big_000001", 2) == fs::path("big_000001_2"));
}

TEST_CASE("open_split never reuses an existing file", "[path_alloc]") {
    scratch_dir dir("alloc");
    const fs::path input = dir / "rows.csv";

    SECTION("free name is used as is") {
        allocated_output a = open_split(input, "", 1);
        CHECK(a.path == dir / "rows_000001.csv");
        CHECK(a.collisions == 0);
        CHECK(a.file.is_open());
        a.file.close();
        CHECK(fs::file_size(a.path) == 0);
    }

    SECTION("collisions get _1, _2, ...") {
        write_file(dir / "rows_000001.csv", "keep me");
        write_file(dir / "rows_000001_1.csv", "me too");

        allocated_output a = open_split(input, "", 1);
        CHECK(a.path == dir / "rows_000001_2.csv");
        CHECK(a.collisions == 2);
        a.file.write("new");
        a.file.close();

        CHECK(read_file(dir / "rows_000001.csv") == "keep me");
        CHECK(read_file(dir / "rows_000001_1.csv") == "me too");
        CHECK(read_file(dir / "rows_000001_2.csv") == "new");
    }

    SECTION("output directory takes the input's file name") {
        fs::create_directories(dir / "out");
        allocated_output a = open_split(fs::path("elsewhere") / "rows.csv", dir / "out", 3);
        CHECK(a.path == dir / "out" / "rows_000003.csv");
        CHECK(fs::exists(a.path));
    }
}

TEST_CASE("output_file is exclusive and closes once", "[output_file]") {
    scratch_dir dir("outfile");
    const fs::path p = dir / "x.bin";

    auto f = output_file::create_exclusive(p);
    REQUIRE(f);
    f->write(std::string_view("ab\0c", 4));
    CHECK(f->bytes_written() == 4);
    f->close();
    f->close();
    CHECK_FALSE(f->is_open());
    CHECK_THROWS_AS(f->write("more"), io_error);
    CHECK(read_file(p) == std::string("ab\0c", 4));

    CHECK_FALSE(output_file::create_exclusive(p));
    CHECK(read_file(p) == std::string("ab\0c", 4));

    CHECK_THROWS_AS(output_file::create_exclusive(dir / "missing" / "y.bin"), io_error);
}

TEST_CASE("moved-from output_file does not close the handle", "[output_file]") {
    scratch_dir dir("outfile_move");
    auto f = output_file::create_exclusive(dir / "m.bin");
    REQUIRE(f);
    output_file g = std::move(*f);
    CHECK(g.is_open());
    g.write("data");
    g.close();
    CHECK(read_file(dir / "m.bin") == "data");
}
