#include <catch2/catch_test_macros.hpp>
#include "line_reader.hpp"
#include "test_support.hpp"
#include <system_error>

using namespace log_collector;
using namespace log_collector::testing;

TEST_CASE("split_lines keeps the unterminated tail pending", "[lines]") {
    std::string pending;
    std::vector<std::string> lines;

    SECTION("Complete lines only") {
        auto consumed = split_lines(pending, "a\nbb\n", lines);
        REQUIRE(consumed == 5);
        REQUIRE(lines == std::vector<std::string>{"a", "bb"});
        REQUIRE(pending.empty());
    }

    SECTION("Partial line completed by a later chunk") {
        REQUIRE(split_lines(pending, "first\nsec", lines) == 6);
        REQUIRE(lines == std::vector<std::string>{"first"});
        REQUIRE(pending == "sec");

        lines.clear();
        REQUIRE(split_lines(pending, "ond\n", lines) == 7);
        REQUIRE(lines == std::vector<std::string>{"second"});
        REQUIRE(pending.empty());
    }

    SECTION("No terminator consumes nothing") {
        REQUIRE(split_lines(pending, "abc", lines) == 0);
        REQUIRE(lines.empty());
        REQUIRE(pending == "abc");
    }

    SECTION("Empty lines and CRLF") {
        split_lines(pending, "\r\nx\r\n\n", lines);
        REQUIRE(lines == std::vector<std::string>{"", "x", ""});
    }
}

TEST_CASE("tail_file returns the last complete lines", "[lines][tail]") {
    TempDir dir;
    auto path = dir.file("a.log");

    SECTION("Fewer lines than requested") {
        write_file(path, "one\ntwo\n");
        REQUIRE(tail_file(path, 5) == std::vector<std::string>{"one", "two"});
    }

    SECTION("Exactly the last N") {
        write_file(path, "1\n2\n3\n4\n");
        REQUIRE(tail_file(path, 2) == std::vector<std::string>{"3", "4"});
    }

    SECTION("Empty file") {
        write_file(path, "");
        REQUIRE(tail_file(path, 3).empty());
    }

    SECTION("Unterminated last line is excluded") {
        write_file(path, "1\n2\npart");
        REQUIRE(tail_file(path, 2) == std::vector<std::string>{"1", "2"});
    }

    SECTION("Lines crossing block boundaries") {
        std::string content;
        for (int i = 0; i < 200; i++) {
            content += "line-" + std::to_string(i) + "\n";
        }
        write_file(path, content);

        auto lines = tail_file(path, 3, 16);
        REQUIRE(lines == std::vector<std::string>{"line-197", "line-198", "line-199"});
    }

    SECTION("Zero lines requested") {
        write_file(path, "1\n");
        REQUIRE(tail_file(path, 0).empty());
    }

    SECTION("Missing file reports not-found") {
        try {
            tail_file(dir.file("missing.log"), 1);
            FAIL("expected std::system_error");
        } catch (const std::system_error& e) {
            REQUIRE(e.code() == std::errc::no_such_file_or_directory);
        }
    }
}

TEST_CASE("trailing_partial_size finds the last line boundary", "[lines]") {
    TempDir dir;
    auto path = dir.file("a.log");

    SECTION("Terminated file") {
        write_file(path, "abc\n");
        auto handle = FileHandle::open_read(path);
        REQUIRE(trailing_partial_size(handle, 4, 1024, path) == 0);
    }

    SECTION("Unterminated tail") {
        write_file(path, "abc\nde");
        auto handle = FileHandle::open_read(path);
        REQUIRE(trailing_partial_size(handle, 6, 1024, path) == 2);
    }

    SECTION("Whole file is one partial line") {
        write_file(path, "abcdef");
        auto handle = FileHandle::open_read(path);
        REQUIRE(trailing_partial_size(handle, 6, 1024, path) == 6);
    }

    SECTION("Boundary beyond the limit") {
        write_file(path, "a\n" + std::string(100, 'x'));
        auto handle = FileHandle::open_read(path);
        REQUIRE(trailing_partial_size(handle, 102, 10, path) == 0);
    }
}

TEST_CASE("FileHandle open and read", "[lines][handle]") {
    TempDir dir;
    auto path = dir.file("a.log");
    write_file(path, "0123456789");

    auto handle = FileHandle::open_read(path);
    REQUIRE(handle.is_open());
    REQUIRE(file_size(handle, path) == 10);
    REQUIRE(read_at(handle, 3, 4, path) == "3456");
    REQUIRE(read_at(handle, 8, 100, path) == "89");
    REQUIRE(read_at(handle, 10, 5, path).empty());

    FileHandle moved = std::move(handle);
    REQUIRE_FALSE(handle.is_open());
    REQUIRE(moved.is_open());

    REQUIRE_FALSE(FileHandle::open_read(dir.file("missing.log")).is_open());
}
