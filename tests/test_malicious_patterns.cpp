#include "mortcalc/validation/malicious_patterns.h"

#include <catch2/catch_test_macros.hpp>

using namespace mortcalc::validation;

TEST_CASE("find_malicious_pattern: clean numeric text passes", "[validation][patterns]") {
  CHECK_FALSE(find_malicious_pattern("300000").has_value());
  CHECK_FALSE(find_malicious_pattern("6.5").has_value());
  CHECK_FALSE(find_malicious_pattern("-1e3").has_value());
  CHECK_FALSE(find_malicious_pattern("abc").has_value());
}

TEST_CASE("find_malicious_pattern: script and markup", "[validation][patterns]") {
  CHECK(find_malicious_pattern("<script>alert(1)</script>").value() == "<script.*?>.*?</script>");
  CHECK(find_malicious_pattern("<SCRIPT src=x></SCRIPT>").has_value());
  CHECK(find_malicious_pattern("javascript:alert(1)").value() == "javascript:");
  CHECK(find_malicious_pattern("JavaScript:void(0)").has_value());
  CHECK(find_malicious_pattern("100 onerror=alert(1)").value() == R"(on\w+\s*=)");
  CHECK(find_malicious_pattern("onload =x").has_value());
  CHECK(find_malicious_pattern("<b>100</b>").value() == "<.*?>");
}

TEST_CASE("find_malicious_pattern: shell metacharacters", "[validation][patterns]") {
  for (const char* text : {"100;", "100 & 2", "1|2", "`id`", "$1000"}) {
    CAPTURE(text);
    CHECK(find_malicious_pattern(text).value() == "[;&|`$]");
  }
}

TEST_CASE("find_malicious_pattern: SQL keywords, case-insensitive", "[validation][patterns]") {
  CHECK(find_malicious_pattern("1 UNION SELECT password").has_value());
  CHECK(find_malicious_pattern("1 union   select").has_value());
  CHECK(find_malicious_pattern("drop table loans").has_value());
  CHECK(find_malicious_pattern("Insert Into x").has_value());
  CHECK(find_malicious_pattern("DELETE\tFROM x").has_value());
  CHECK_FALSE(find_malicious_pattern("select").has_value());
}

TEST_CASE("find_malicious_pattern: '.' does not span lines", "[validation][patterns]") {
  // "<" and ">" on different lines do not form a tag.
  CHECK_FALSE(find_malicious_pattern("<\n>").has_value());
}

TEST_CASE("malicious_pattern_sources: fixed order", "[validation][patterns]") {
  const auto& sources = malicious_pattern_sources();
  REQUIRE(sources.size() == 9);
  CHECK(sources.front() == "<script.*?>.*?</script>");
  CHECK(sources.back() == R"(delete\s+from)");
}
