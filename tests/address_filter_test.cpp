#include "gtest/gtest.h"
#include "whohas/address_filter.hpp"
#include "whohas/logger.hpp"
#include "whohas/utils.hpp"

#include <cstdio> // For std::remove
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

whohas::IpAddress ip(const char* text) {
    return *whohas::utils::parse_ipv4(text);
}

} // namespace

class AddressFilterTest : public ::testing::Test {
protected:
    std::ostringstream log_sink;
    whohas::Logger logger{whohas::LogLevel::DEBUG};
    std::string temp_filename = "address_filter_test_list.txt";

    void SetUp() override {
        logger.set_output(&log_sink);
    }

    void TearDown() override {
        std::remove(temp_filename.c_str());
    }

    void write_file(const std::string& content) {
        std::ofstream out(temp_filename);
        out << content;
    }
};

TEST_F(AddressFilterTest, EmptyListsAcceptEverything) {
    whohas::AddressList list(&logger);
    EXPECT_TRUE(list.empty());
    EXPECT_TRUE(list.check(ip("10.1.2.3")));
}

TEST_F(AddressFilterTest, WhitelistTakesPrecedence) {
    whohas::AddressList list(&logger);
    EXPECT_TRUE(list.add_white("10.0.0.1"));
    EXPECT_TRUE(list.add_black("10.0.0.2"));
    EXPECT_TRUE(list.check(ip("10.0.0.1")));
    // With a non-empty whitelist, anything not on it is rejected.
    EXPECT_FALSE(list.check(ip("10.0.0.2")));
    EXPECT_FALSE(list.check(ip("10.0.0.3")));
}

TEST_F(AddressFilterTest, BlacklistRejectsListedOnly) {
    whohas::AddressList list(&logger);
    list.add_black("10.0.0.2");
    EXPECT_FALSE(list.check(ip("10.0.0.2")));
    EXPECT_TRUE(list.check(ip("10.0.0.3")));
}

TEST_F(AddressFilterTest, AddressInBothListsIsRemovedFromBoth) {
    whohas::AddressList list(&logger);
    list.add_white("192.168.1.10");
    list.add_black("192.168.1.10");

    EXPECT_TRUE(list.white().empty());
    EXPECT_TRUE(list.black().empty());
    EXPECT_TRUE(list.check(ip("192.168.1.10")));
    EXPECT_NE(log_sink.str().find("removed from both"), std::string::npos);
}

TEST_F(AddressFilterTest, InvalidValueIsSkippedWithWarning) {
    whohas::AddressList list(&logger);
    EXPECT_FALSE(list.add_white("not-an-address"));
    EXPECT_FALSE(list.add_white("300.1.1.1"));
    EXPECT_TRUE(list.white().empty());
    EXPECT_NE(log_sink.str().find("skipping: not-an-address"), std::string::npos);
}

TEST_F(AddressFilterTest, FileValuesAreExpanded) {
    write_file("10.0.0.1\n"
               "  10.0.0.2  \n"
               "garbage line\n"
               "\n"
               "10.0.0.999\n"
               "10.0.0.3\n");

    whohas::AddressList list(&logger);
    EXPECT_TRUE(list.add_black(temp_filename));
    EXPECT_EQ(list.black().size(), 3u);
    EXPECT_FALSE(list.check(ip("10.0.0.1")));
    EXPECT_FALSE(list.check(ip("10.0.0.2")));
    EXPECT_FALSE(list.check(ip("10.0.0.3")));
    EXPECT_TRUE(list.check(ip("10.0.0.4")));
}

TEST_F(AddressFilterTest, AddAllCountsRejectedValues) {
    whohas::AddressList list(&logger);
    std::size_t rejected = list.add_all(whohas::ListType::WHITE, {"10.0.0.1", "bogus", "10.0.0.2", "missing.txt"});
    EXPECT_EQ(rejected, 2u);
    EXPECT_EQ(list.white().size(), 2u);
}

TEST_F(AddressFilterTest, GlobalListsApplyToBothRoles) {
    whohas::FilterLists lists(&logger);
    EXPECT_EQ(lists.add_global(whohas::ListType::BLACK, {"10.0.0.5", "nope"}, &logger), 1u);

    EXPECT_FALSE(lists.accepts(ip("10.0.0.5"), ip("10.0.0.1")));
    EXPECT_FALSE(lists.accepts(ip("10.0.0.1"), ip("10.0.0.5")));
    EXPECT_TRUE(lists.accepts(ip("10.0.0.1"), ip("10.0.0.2")));
}

TEST_F(AddressFilterTest, RolesAreIndependent) {
    whohas::FilterLists lists(&logger);
    lists.sender.add_white("10.0.0.1");
    lists.target.add_black("10.0.0.1");

    EXPECT_TRUE(lists.accepts(ip("10.0.0.1"), ip("10.0.0.2")));
    EXPECT_FALSE(lists.accepts(ip("10.0.0.2"), ip("10.0.0.3")));
    EXPECT_FALSE(lists.accepts(ip("10.0.0.1"), ip("10.0.0.1")));
}
