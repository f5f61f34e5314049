#include "../framework/test_framework.hpp"
#include "jalali/common/types.hpp"

using namespace jalali;
using namespace jalali::test;

void test_string_utilities() {
    ASSERT_EQ(to_lower("HeLLo"), "hello");
    ASSERT_EQ(trim("  hello \t"), "hello");
    ASSERT_EQ(trim("   "), "");
    
    auto parts = split("1403/05/29", '/');
    ASSERT_EQ(parts.size(), 3u);
    ASSERT_EQ(parts[0], "1403");
    ASSERT_EQ(parts[1], "05");
    ASSERT_EQ(parts[2], "29");
    
    ASSERT_EQ(join({"a", "b", "c"}, "-"), "a-b-c");
    ASSERT_EQ(join({}, "-"), "");
    ASSERT_TRUE(starts_with("jalali_date_now", "jalali_"));
    ASSERT_FALSE(starts_with("now", "jalali_"));
    ASSERT_EQ(pad_left("42", 5, '0'), "00042");
    ASSERT_EQ(pad_right("42", 5, ' '), "42   ");
}

void test_split_keeps_empty_segments() {
    auto parts = split("1403//29", '/');
    ASSERT_EQ(parts.size(), 3u);
    ASSERT_TRUE(parts[1].empty());
    
    auto trailing = split("1403/05/", '/');
    ASSERT_EQ(trailing.size(), 3u);
    ASSERT_TRUE(trailing[2].empty());
    
    ASSERT_EQ(split("", '/').size(), 1u);
}

void test_version() {
    Version v = Version::parse("1.2.3");
    ASSERT_EQ(v.major, 1);
    ASSERT_EQ(v.minor, 2);
    ASSERT_EQ(v.patch, 3);
    ASSERT_EQ(v.to_string(), "1.2.3");
    
    Version pre = Version::parse("2.0.1-rc1");
    ASSERT_EQ(pre.patch, 1);
    ASSERT_EQ(pre.pre_release, "rc1");
    
    Version junk = Version::parse("x.y");
    ASSERT_EQ(junk.major, 0);
    ASSERT_EQ(junk.minor, 0);
    
    ASSERT_EQ(LIBRARY_VERSION.major, 1);
}

void test_atomic_counter() {
    AtomicCounter<> counter;
    ASSERT_EQ(counter.get(), 0u);
    
    ++counter;
    ASSERT_EQ(counter.get(), 1u);
    
    counter += 5;
    ASSERT_EQ(counter.get(), 6u);
    
    counter.reset();
    ASSERT_EQ(counter.get(), 0u);
}

int main() {
    TestSuite suite("Types Tests");
    
    suite.add_test("String Utilities", test_string_utilities);
    suite.add_test("Split Keeps Empty Segments", test_split_keeps_empty_segments);
    suite.add_test("Version", test_version);
    suite.add_test("AtomicCounter", test_atomic_counter);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
