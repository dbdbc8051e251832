#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../include/Discovery.hpp"
#include "TmpDir.hpp"

using namespace prefixrun;

namespace {
    std::vector<std::string> names_of(const std::vector<OrderedFile> &files) {
        std::vector<std::string> out;
        for (const auto &f: files) out.push_back(f.name);
        return out;
    }
} // namespace

TEST(Discovery, ParsePrefix) {
    EXPECT_EQ(parse_prefix("1-fetch.sh"), 1);
    EXPECT_EQ(parse_prefix("10-a-b-c.py"), 10);
    EXPECT_EQ(parse_prefix("007-bond.R"), 7);
    EXPECT_EQ(parse_prefix("+3-plus.sh"), 3);
    EXPECT_EQ(parse_prefix("4-"), 4);
}

TEST(Discovery, IneligibleNames) {
    EXPECT_FALSE(parse_prefix("myproject.py").has_value()); // no hyphen
    EXPECT_FALSE(parse_prefix("a-b.sh").has_value());
    EXPECT_FALSE(parse_prefix("-1-x.sh").has_value()); // empty prefix
    EXPECT_FALSE(parse_prefix("1a-x.sh").has_value());
    EXPECT_FALSE(parse_prefix("1.5-x.sh").has_value());
    EXPECT_FALSE(parse_prefix("99999999999999999999999-x.sh").has_value()); // overflow
}

TEST(Discovery, NumericNotLexicographicOrder) {
    const auto files = order_files({"10-a.sh", "2-b.py", "1-c.py"});
    const std::vector<std::string> expected{"1-c.py", "2-b.py", "10-a.sh"};
    EXPECT_EQ(names_of(files), expected);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].order, 1);
    EXPECT_EQ(files[2].order, 10);
}

TEST(Discovery, FiltersIneligibleFiles) {
    const auto files = order_files({
        "1-transfer_data.sh", "2-build_tables.hql", "myproject.py", "random.txt", "image.jpeg", "x-y.sh"
    });
    const std::vector<std::string> expected{"1-transfer_data.sh", "2-build_tables.hql"};
    EXPECT_EQ(names_of(files), expected);
}

TEST(Discovery, DuplicatePrefixThrows) {
    EXPECT_THROW((void) order_files({"2-b.py", "02-c.sh"}), ValidationError);
    EXPECT_THROW((void) order_files({"1-a.sh", "3-c.sh", "1-b.sh"}), ValidationError);
}

TEST(Discovery, DuplicateMessageNamesBothFiles) {
    try {
        (void) order_files({"2-b.py", "02-c.sh", "5-ok.sh"});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError &e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("2-b.py"), std::string::npos);
        EXPECT_NE(msg.find("02-c.sh"), std::string::npos);
        EXPECT_EQ(msg.find("5-ok.sh"), std::string::npos);
    }
}

TEST(Discovery, DeterministicAcrossInputOrder) {
    const auto a = order_files({"3-c.sh", "1-a.sh", "2-b.sh", "notes.md"});
    const auto b = order_files({"notes.md", "2-b.sh", "3-c.sh", "1-a.sh"});
    EXPECT_EQ(names_of(a), names_of(b));
}

TEST(Discovery, EmptyListing) {
    EXPECT_TRUE(order_files({}).empty());
    EXPECT_TRUE(order_files({"README", "setup.py"}).empty());
}

TEST(Discovery, DiscoverDirectory) {
    const test_support::TmpDir dir;
    dir.write("2-model.py");
    dir.write("1-fetch.sh");
    dir.write("10-report.R");
    dir.write("helper.py");
    dir.mkdir("3-subdir");
    dir.write("3-subdir/4-nested.sh");

    const auto files = discover(dir.str());
    const std::vector<std::string> expected{"1-fetch.sh", "2-model.py", "10-report.R"};
    EXPECT_EQ(names_of(files), expected);
}

TEST(Discovery, DiscoverDuplicateInDirectoryThrows) {
    const test_support::TmpDir dir;
    dir.write("1-a.sh");
    dir.write("01-b.sh");
    EXPECT_THROW((void) discover(dir.str()), ValidationError);
}

TEST(Discovery, MissingDirectoryThrows) {
    EXPECT_THROW((void) list_directory_entries("/nonexistent/prefixrun/dir"), std::runtime_error);
}
