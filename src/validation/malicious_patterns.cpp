#include "mortcalc/validation/malicious_patterns.h"

#include <boost/regex.hpp>

namespace mortcalc::validation {

namespace {

struct CompiledPattern {
  std::string source;
  boost::regex re;
};

const std::vector<CompiledPattern>& compiled_patterns() {
  static const std::vector<CompiledPattern> patterns = [] {
    std::vector<CompiledPattern> out;
    for (const auto& source : malicious_pattern_sources()) {
      out.push_back(CompiledPattern{
          source, boost::regex(source, boost::regex_constants::perl |
                                           boost::regex_constants::icase |
                                           boost::regex_constants::optimize)});
    }
    return out;
  }();
  return patterns;
}

}  // namespace

const std::vector<std::string>& malicious_pattern_sources() {
  // Markup and script injection first, then shell metacharacters, then SQL.
  static const std::vector<std::string> sources = {
      R"(<script.*?>.*?</script>)",
      R"(javascript:)",
      R"(on\w+\s*=)",
      R"(<.*?>)",
      R"([;&|`$])",
      R"(union\s+select)",
      R"(drop\s+table)",
      R"(insert\s+into)",
      R"(delete\s+from)",
  };
  return sources;
}

std::optional<std::string> find_malicious_pattern(std::string_view text) {
  for (const auto& pattern : compiled_patterns()) {
    // match_not_dot_newline keeps '.' from crossing lines.
    if (boost::regex_search(text.begin(), text.end(), pattern.re,
                            boost::match_default | boost::match_not_dot_newline)) {
      return pattern.source;
    }
  }
  return std::nullopt;
}

}  // namespace mortcalc::validation
