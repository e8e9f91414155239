#include <gtest/gtest.h>

#include "decomposition.hpp"
#include "grouping.hpp"

#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace {

ssa::Decomposition ramp_decomposition() {
    return ssa::decompose(std::vector<double>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 5);
}

TEST(Grouping, ConvertsToZeroBased) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"trend", {1}}, {"rest", {2, 3, 4, 5}}};
    ssa::ValidatedGrouping g = ssa::group(dec, spec);

    EXPECT_EQ(g.rank(), 5);
    ASSERT_EQ(g.groups().size(), 2u);
    EXPECT_EQ(g.groups().at("trend"), (std::vector<int64_t>{0}));
    EXPECT_EQ(g.groups().at("rest"), (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(g.indices("rest").numel(), 4);
}

TEST(Grouping, OverlappingGroupsAllowed) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"a", {1, 2}}, {"b", {2, 3}}};
    EXPECT_NO_THROW(ssa::group(dec, spec));
}

TEST(Grouping, DuplicatesCollapse) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"a", {3, 1, 3, 1}}};
    ssa::ValidatedGrouping g = ssa::group(dec, spec);
    EXPECT_EQ(g.groups().at("a"), (std::vector<int64_t>{2, 0}));
}

TEST(Grouping, OutOfRangeNamesGroupAndIndex) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"fine", {1}}, {"noise", {4, 6}}};
    try {
        ssa::group(dec, spec);
        FAIL() << "expected IndexOutOfRange";
    } catch (const ssa::IndexOutOfRange& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("noise"), std::string::npos);
        EXPECT_NE(msg.find("6"), std::string::npos);
    }
}

TEST(Grouping, ZeroIndexRejected) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"bad", {0}}};
    EXPECT_THROW(ssa::group(dec, spec), ssa::IndexOutOfRange);
}

TEST(Grouping, TruncationLimitsRange) {
    ssa::Decomposition dec = ssa::decompose(std::vector<double>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 5, 2);
    ssa::GroupSpec ok = {{"lead", {1, 2}}};
    ssa::GroupSpec bad = {{"lead", {1, 3}}};
    EXPECT_NO_THROW(ssa::group(dec, ok));
    EXPECT_THROW(ssa::group(dec, bad), ssa::IndexOutOfRange);
}

TEST(Grouping, UnknownGroupName) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"a", {1}}};
    ssa::ValidatedGrouping g = ssa::group(dec, spec);
    EXPECT_THROW(g.indices("b"), ssa::SsaError);
}

TEST(Grouping, OnlyGroupBuildsValidatedGrouping) {
    // Raw 0-based maps cannot bypass the range check
    static_assert(!std::is_constructible_v<ssa::ValidatedGrouping, int64_t,
                                           std::map<std::string, std::vector<int64_t>>>,
                  "ValidatedGrouping must come from group()");

    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"lead", {1, 2}}};
    ssa::ValidatedGrouping g = ssa::group(dec, spec);
    EXPECT_EQ(g.groups().at("lead"), (std::vector<int64_t>{0, 1}));
}

TEST(Grouping, ResidualIsExplicit) {
    ssa::Decomposition dec = ramp_decomposition();
    ssa::GroupSpec spec = {{"a", {1, 3}}, {"b", {3}}};

    // group() never adds a residual
    EXPECT_EQ(ssa::group(dec, spec).groups().size(), 2u);
    EXPECT_EQ(ssa::residual_indices(dec, spec), (std::vector<int64_t>{2, 4, 5}));

    ssa::GroupSpec everything = {{"all", {1, 2, 3, 4, 5}}};
    EXPECT_TRUE(ssa::residual_indices(dec, everything).empty());
}

}
