#pragma once

#include "cmdgate/common/result.hpp"

#include <regex>
#include <string>
#include <vector>

namespace cmdgate::security {

enum class RiskLevel { Low, Medium, High };

[[nodiscard]] std::string risk_level_to_string(RiskLevel level);

struct SuspiciousPattern {
  std::string label;
  std::string source;
  std::regex regex;
};

struct ClassificationResult {
  bool safe = true;
  RiskLevel risk_level = RiskLevel::Low;
  std::vector<std::string> matched_dangerous_terms;
  std::vector<std::string> warnings;
};

/// Pipe/chain operators, redirection into system paths, angle-bracket redirection,
/// command substitution and backtick execution, in that order.
[[nodiscard]] const std::vector<SuspiciousPattern> &default_suspicious_patterns();

[[nodiscard]] common::Result<SuspiciousPattern> compile_pattern(const std::string &label,
                                                                const std::string &source);

/// Dangerous terms match as case-insensitive substrings, every occurrence in the list
/// counts (no dedup). Patterns match case-sensitively against the raw text. Risk depends
/// only on the number of term matches.
[[nodiscard]] ClassificationResult
classify(const std::string &text, const std::vector<std::string> &dangerous_terms,
         const std::vector<SuspiciousPattern> &patterns = default_suspicious_patterns());

class RiskClassifier {
public:
  explicit RiskClassifier(std::vector<std::string> dangerous_terms,
                          std::vector<SuspiciousPattern> patterns = default_suspicious_patterns());

  [[nodiscard]] ClassificationResult classify(const std::string &text) const;
  [[nodiscard]] const std::vector<std::string> &dangerous_terms() const { return terms_; }

private:
  std::vector<std::string> terms_;
  std::vector<SuspiciousPattern> patterns_;
};

} // namespace cmdgate::security
