#include "cmdgate/security/classifier.hpp"

#include "cmdgate/common/fs.hpp"

namespace cmdgate::security {

namespace {

SuspiciousPattern make_pattern(const char *label, const char *source) {
  return SuspiciousPattern{.label = label, .source = source, .regex = std::regex(source)};
}

RiskLevel risk_for_matches(const std::size_t matches) {
  if (matches > 2) {
    return RiskLevel::High;
  }
  if (matches > 0) {
    return RiskLevel::Medium;
  }
  return RiskLevel::Low;
}

} // namespace

std::string risk_level_to_string(const RiskLevel level) {
  switch (level) {
  case RiskLevel::Low:
    return "low";
  case RiskLevel::Medium:
    return "medium";
  case RiskLevel::High:
    return "high";
  }
  return "low";
}

const std::vector<SuspiciousPattern> &default_suspicious_patterns() {
  static const std::vector<SuspiciousPattern> patterns = {
      make_pattern("pipe or chain operator", R"([|&;])"),
      make_pattern("redirection into system path", R"(>\s*[/\\])"),
      make_pattern("angle-bracket redirection", R"(<.*>)"),
      make_pattern("command substitution", R"(\$\([^)]*\))"),
      make_pattern("backtick execution", R"(`[^`]*`)"),
  };
  return patterns;
}

common::Result<SuspiciousPattern> compile_pattern(const std::string &label,
                                                  const std::string &source) {
  try {
    return common::Result<SuspiciousPattern>::success(
        SuspiciousPattern{.label = label, .source = source, .regex = std::regex(source)});
  } catch (const std::regex_error &err) {
    return common::Result<SuspiciousPattern>::failure("invalid pattern '" + source +
                                                      "': " + err.what());
  }
}

ClassificationResult classify(const std::string &text,
                              const std::vector<std::string> &dangerous_terms,
                              const std::vector<SuspiciousPattern> &patterns) {
  ClassificationResult result;
  const std::string lowered = common::to_lower(text);

  for (const auto &term : dangerous_terms) {
    // An empty term would match every command.
    if (term.empty()) {
      continue;
    }
    if (lowered.find(common::to_lower(term)) != std::string::npos) {
      result.safe = false;
      result.matched_dangerous_terms.push_back(term);
      result.warnings.push_back("dangerous command detected: " + term);
    }
  }

  for (const auto &pattern : patterns) {
    if (std::regex_search(text, pattern.regex)) {
      result.safe = false;
      result.warnings.push_back("suspicious pattern: " + pattern.label + " (" + pattern.source +
                                ")");
    }
  }

  result.risk_level = risk_for_matches(result.matched_dangerous_terms.size());
  return result;
}

RiskClassifier::RiskClassifier(std::vector<std::string> dangerous_terms,
                               std::vector<SuspiciousPattern> patterns)
    : terms_(std::move(dangerous_terms)), patterns_(std::move(patterns)) {}

ClassificationResult RiskClassifier::classify(const std::string &text) const {
  return security::classify(text, terms_, patterns_);
}

} // namespace cmdgate::security
