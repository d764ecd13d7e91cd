// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fcntl.h>
#include <splice/disk/file.hpp>
#include <splice/disk/reassembler.hpp>
#include "support/temp_dir.hpp"

using namespace splicer::disk;
using namespace splicer::test;
namespace fs = std::filesystem;

namespace {

std::string as_string(const std::vector<std::byte>& bytes) {
    std::string s(bytes.size(), '\0');
    for (std::size_t i = 0; i < bytes.size(); ++i) s[i] = static_cast<char>(bytes[i]);
    return s;
}

} // namespace

TEST_CASE("Scratch paths", "[reassembler]") {
    CHECK(scratch_dir_for("/tmp/out/file.iso") == fs::path("/tmp/out/.file.iso.splice"));
    CHECK(scratch_dir_for("file.iso") == fs::path(".file.iso.splice"));
    CHECK(sink_path("/tmp/.x.splice", 3) == fs::path("/tmp/.x.splice/segment_3"));
}

TEST_CASE("File write and read back", "[disk]") {
    TempDir dir;
    const auto path = (dir / "f.bin").string();

    auto out = File::create(path);
    REQUIRE(out.has_value());
    CHECK_FALSE(out->write("hello ", 6));
    CHECK_FALSE(out->write("world", 5));
    CHECK(out->bytes_written() == 11);
    CHECK_FALSE(out->flush());
    out->close();
    CHECK_FALSE(out->is_open());
    CHECK(out->write("x", 1) == DiskErrc::handle_invalid);

    auto in = File::open_read(path);
    REQUIRE(in.has_value());
    char buf[32] = {};
    auto n = in->read(buf, sizeof(buf));
    REQUIRE(n.has_value());
    CHECK(std::string(buf, *n) == "hello world");
    auto eof = in->read(buf, sizeof(buf));
    REQUIRE(eof.has_value());
    CHECK(*eof == 0);
}

TEST_CASE("File errors map to disk codes", "[disk]") {
    TempDir dir;

    SECTION("Missing file") {
        auto in = File::open_read((dir / "nope").string());
        REQUIRE_FALSE(in.has_value());
        CHECK(in.error() == DiskErrc::file_not_found);
    }

    SECTION("Parent is a regular file") {
        write_file(dir / "blocker", "x");
        auto out = File::create((dir / "blocker" / "child").string());
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error() == DiskErrc::invalid_path);
    }

    SECTION("Empty path") {
        auto out = File::create("");
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error() == DiskErrc::invalid_path);
    }
}

TEST_CASE("Merge concatenates in index order", "[reassembler]") {
    TempDir dir;
    const auto scratch = scratch_dir_for(dir / "result.txt");
    REQUIRE_FALSE(prepare_scratch_dir(scratch));

    write_file(sink_path(scratch, 0), "alpha-");
    write_file(sink_path(scratch, 1), "beta-");
    write_file(sink_path(scratch, 2), "gamma");

    // Deliberately out of order
    std::vector<MergePart> parts{
        {2, sink_path(scratch, 2), 5},
        {0, sink_path(scratch, 0), 6},
        {1, sink_path(scratch, 1), 5},
    };

    auto ec = merge(parts, dir / "result.txt");
    REQUIRE_FALSE(ec);

    CHECK(as_string(read_file(dir / "result.txt")) == "alpha-beta-gamma");
    CHECK_FALSE(fs::exists(scratch));
}

TEST_CASE("Merge truncates an existing destination", "[reassembler]") {
    TempDir dir;
    write_file(dir / "dest", "this old content is much longer than the new one");

    const auto scratch = scratch_dir_for(dir / "dest");
    REQUIRE_FALSE(prepare_scratch_dir(scratch));
    write_file(sink_path(scratch, 0), "new");

    REQUIRE_FALSE(merge({{0, sink_path(scratch, 0), std::nullopt}}, dir / "dest"));
    CHECK(as_string(read_file(dir / "dest")) == "new");
}

TEST_CASE("Merge failure keeps the sinks", "[reassembler]") {
    TempDir dir;
    const auto scratch = scratch_dir_for(dir / "out");
    REQUIRE_FALSE(prepare_scratch_dir(scratch));
    write_file(sink_path(scratch, 0), "abc");

    SECTION("Missing sink") {
        auto ec = merge({{0, sink_path(scratch, 0), 3}, {1, sink_path(scratch, 1), 3}}, dir / "out");
        CHECK(ec == DiskErrc::file_not_found);
        CHECK(fs::exists(sink_path(scratch, 0)));
    }

    SECTION("Sink size mismatch") {
        auto ec = merge({{0, sink_path(scratch, 0), 10}}, dir / "out");
        CHECK(ec == DiskErrc::read_error);
        CHECK(fs::exists(sink_path(scratch, 0)));
    }
}

TEST_CASE("remove_scratch_dir tolerates a missing directory", "[reassembler]") {
    TempDir dir;
    CHECK_FALSE(remove_scratch_dir(dir / ".absent.splice"));

    const auto scratch = scratch_dir_for(dir / "x");
    REQUIRE_FALSE(prepare_scratch_dir(scratch));
    write_file(sink_path(scratch, 0), "data");
    CHECK_FALSE(remove_scratch_dir(scratch));
    CHECK_FALSE(fs::exists(scratch));
}
