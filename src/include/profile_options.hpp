#pragma once

#include "profile_error.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "re2/re2.h"

namespace duckdb {

// A pattern string values at one field path must match (RE2 syntax, search
// semantics: an unanchored pattern matches anywhere in the value)
struct RegexRule {
	std::string pattern;
	std::optional<std::string> note;
};

// Immutable configuration of one profiling run
struct ProfileOptions {
	static constexpr double kDefaultRequiredThreshold = 0.9;
	static constexpr double kDefaultRareFieldMaxFraction = 0.05;
	static constexpr int64_t kDefaultExamplesPerIssue = 20;

	// Fraction of documents a field must reach to count as expected, (0, 1]
	double required_threshold = kDefaultRequiredThreshold;
	// Fields present in at most this fraction are rare, [0, 1)
	double rare_field_max_fraction = kDefaultRareFieldMaxFraction;
	// Cap on every example list in the report
	int64_t examples_per_issue = kDefaultExamplesPerIssue;
	// Dotted field path -> rule. std::map keeps rules in path order
	std::map<std::string, RegexRule> regex_rules;
	bool check_field_name_variants = true;
	// Only the first sample_limit documents of each pass are read
	std::optional<int64_t> sample_limit;

	bool include_schema = true;
	bool include_issues = true;
	bool include_example = false;
	// Profile each subcollection id across all scanned documents, and add
	// subcollection documents to the example
	bool include_subcollections = false;
	// Documents per subcollection of the example document
	int64_t examples_per_subcollection = 1;

	// Throws ProfileConfigError naming the offending option
	void Validate() const;

	// Number of passes a run with these options performs at most
	int MaxPasses() const {
		return include_issues ? 2 : 1;
	}
};

// Rules from path -> pattern and path -> note maps. A note for a path with no
// pattern is CONFIG_INVALID_RULE_PATH
std::map<std::string, RegexRule> BuildRegexRules(const std::map<std::string, std::string> &patterns,
                                                 const std::map<std::string, std::string> &notes);

// Compile rule.pattern, mapping a syntax error to CONFIG_INVALID_REGEX
std::unique_ptr<re2::RE2> CompileRegexRule(const std::string &field, const RegexRule &rule);

// Whether rule matches somewhere in text
bool RegexRuleMatches(const re2::RE2 &rule, const std::string &text);

} // namespace duckdb
