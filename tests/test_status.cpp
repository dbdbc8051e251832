#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include "../include/Status.hpp"

using namespace prefixrun;

TEST(Status, StreamDescriptor) {
    EXPECT_EQ(stream_descriptor(std::cout), 1);
    EXPECT_EQ(stream_descriptor(std::cerr), 2);
    EXPECT_EQ(stream_descriptor(std::clog), 2);
    std::ostringstream os;
    EXPECT_EQ(stream_descriptor(os), -1);
}

TEST(Status, CapturedStreamIsPlainAndEightyColumns) {
    std::ostringstream os;
    print_status(os, "1-build.sh", "ok");
    const std::string line = os.str();
    EXPECT_EQ(line.find('\033'), std::string::npos);
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.size() - 1, 80u);
    EXPECT_EQ(line.rfind(" * 1-build.sh ", 0), 0u);
    EXPECT_EQ(line.substr(line.size() - 7), " [ ok ]\n");
}

TEST(Status, ErrorLineAndInfoAreUncolored) {
    std::ostringstream os;
    print_status(os, "2-load.py: exec failed", "!!", true);
    print_info(os, "3-report.R: Rscript 3-report.R");
    const std::string text = os.str();
    EXPECT_EQ(text.find('\033'), std::string::npos);
    EXPECT_NE(text.find(" [ !! ]\n"), std::string::npos);
    EXPECT_NE(text.find(" * 3-report.R: Rscript 3-report.R\n"), std::string::npos);
}

TEST(Status, LongMessageKeepsOneSpaceBeforeStatus) {
    std::ostringstream os;
    print_status(os, std::string(100, 'x'), "ok");
    EXPECT_NE(os.str().find(std::string(100, 'x') + "  [ ok ]"), std::string::npos);
}
