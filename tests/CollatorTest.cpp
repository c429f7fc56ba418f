#include "Collator.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

TEST(CollatorTest, PrimaryIgnoresCase) {
    PrimaryCollator c;
    EXPECT_EQ(c.compare("apple", "Apple"), 0);
    EXPECT_EQ(c.compare("APPLE", "apple"), 0);
    EXPECT_LT(c.compare("apple", "Banana"), 0);
    EXPECT_GT(c.compare("Cherry", "banana"), 0);
}

TEST(CollatorTest, PrimaryIgnoresAccents) {
    PrimaryCollator c;
    EXPECT_EQ(c.compare("résumé", "resume"), 0);
    EXPECT_EQ(c.compare("naïve", "NAIVE"), 0);
    EXPECT_GT(c.compare("zebra", "Éclair"), 0);
    EXPECT_LT(c.compare("élan", "fig"), 0);
}

TEST(CollatorTest, PrimaryIgnoresCaseOutsideLatin) {
    PrimaryCollator c;
    EXPECT_EQ(c.compare("ПРИВЕТ", "привет"), 0);
    EXPECT_EQ(c.compare("Москва", "МОСКВА"), 0);
    EXPECT_EQ(c.compare("ΑΛΦΑ", "αλφα"), 0);
    EXPECT_EQ(c.compare("Έψιλον", "εψιλον"), 0);
    EXPECT_LT(c.compare("Альфа", "бета"), 0);
}

TEST(CollatorTest, PrimaryShorterPrefixSortsFirst) {
    PrimaryCollator c;
    EXPECT_LT(c.compare("car", "Cart"), 0);
    EXPECT_GT(c.compare("cart", "car"), 0);
    EXPECT_LT(c.compare("", "a"), 0);
}

TEST(CollatorTest, BinaryIsByteOrder) {
    BinaryCollator c;
    EXPECT_LT(c.compare("Banana", "apple"), 0);
    EXPECT_GT(c.compare("apple", "Apple"), 0);
    EXPECT_EQ(c.compare("same", "same"), 0);
}

TEST(CollatorTest, LocaleCollatorWithClassicLocale) {
    LocaleCollator c(std::locale::classic());
    EXPECT_LT(c.compare("a", "b"), 0);
    EXPECT_GT(c.compare("b", "a"), 0);
    EXPECT_EQ(c.compare("x", "x"), 0);

    LocaleCollator named("C");
    EXPECT_LT(named.compare("abc", "abd"), 0);
}

TEST(CollatorTest, UnknownLocaleThrows) {
    EXPECT_THROW(LocaleCollator("no_SUCH-locale.xyz"), std::runtime_error);
}

TEST(CollatorTest, UsableAsSortOrder) {
    PrimaryCollator c;
    std::vector<std::string> v = {"delta", "Alpha", "charlie", "Bravo"};
    std::sort(v.begin(), v.end(), [&](const std::string& a, const std::string& b) { return c.compare(a, b) < 0; });
    EXPECT_EQ(v, (std::vector<std::string>{"Alpha", "Bravo", "charlie", "delta"}));
}
