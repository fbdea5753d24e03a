#include "pcflow_test_utils.hpp"

#include <sstream>
#include <unordered_set>

using namespace pcflow;

TEST(Scope, SortsAndDeduplicates) {
    Scope s{3, 1, 2, 1};
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s.vars(), (std::vector<size_t>{1, 2, 3}));
    EXPECT_FALSE(s.empty());
    EXPECT_TRUE(Scope().empty());
}

TEST(Scope, Range) {
    EXPECT_EQ(Scope::range(4), (Scope{0, 1, 2, 3}));
    EXPECT_TRUE(Scope::range(0).empty());
}

TEST(Scope, SetOperations) {
    Scope a{0, 1, 2};
    Scope b{2, 3};
    EXPECT_EQ(a | b, (Scope{0, 1, 2, 3}));
    EXPECT_EQ(a & b, (Scope{2}));
    EXPECT_EQ(a - b, (Scope{0, 1}));
    EXPECT_TRUE((a - b).is_disjoint(b));
    EXPECT_FALSE(a.is_disjoint(b));
}

TEST(Scope, Containment) {
    Scope a{0, 1, 2};
    EXPECT_TRUE(a.contains(1));
    EXPECT_FALSE(a.contains(5));
    EXPECT_TRUE((Scope{0, 2}).is_subset_of(a));
    EXPECT_TRUE(a.is_subset_of(a));
    EXPECT_FALSE((Scope{0, 4}).is_subset_of(a));
    EXPECT_TRUE(Scope().is_subset_of(a));
}

TEST(Scope, OrderIsBySizeThenLexicographic) {
    EXPECT_TRUE((Scope{5}) < (Scope{0, 1}));
    EXPECT_TRUE((Scope{0, 1}) < (Scope{0, 2}));
    EXPECT_FALSE((Scope{0, 2}) < (Scope{0, 1}));
    EXPECT_FALSE((Scope{0, 1}) < (Scope{0, 1}));

    // A strict subset always sorts first
    Scope sub{4, 9};
    Scope sup{0, 4, 9};
    EXPECT_TRUE(sub < sup);
}

TEST(Scope, Formatting) {
    EXPECT_EQ((Scope{2, 0}).to_string(), "{0, 2}");
    EXPECT_EQ(Scope().to_string(), "{}");

    std::ostringstream oss;
    oss << Scope{7};
    EXPECT_EQ(oss.str(), "{7}");
}

TEST(Scope, HashAgreesWithEquality) {
    std::unordered_set<Scope, ScopeHash> set;
    set.insert(Scope{1, 2});
    set.insert(Scope{2, 1});
    set.insert(Scope{1});
    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(ScopeHash{}(Scope{3, 4}), ScopeHash{}(Scope{4, 3}));
}
