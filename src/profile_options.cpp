#include "profile_options.hpp"
#include "profile_logger.hpp"
#include <cmath>

namespace duckdb {

static ProfileErrorContext OptionContext(const std::string &option) {
	return ProfileErrorContext().withOperation("validate").withOption(option);
}

std::map<std::string, RegexRule> BuildRegexRules(const std::map<std::string, std::string> &patterns,
                                                 const std::map<std::string, std::string> &notes) {
	std::map<std::string, RegexRule> rules;
	for (const auto &entry : patterns) {
		rules[entry.first].pattern = entry.second;
	}
	for (const auto &entry : notes) {
		auto rule = rules.find(entry.first);
		if (rule == rules.end()) {
			throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_RULE_PATH,
			                         "Note for '" + entry.first + "' has no regex rule",
			                         OptionContext("regex_notes"));
		}
		rule->second.note = entry.second;
	}
	return rules;
}

std::unique_ptr<re2::RE2> CompileRegexRule(const std::string &field, const RegexRule &rule) {
	re2::RE2::Options re_options;
	re_options.set_log_errors(false);
	auto regex = std::make_unique<re2::RE2>(rule.pattern, re_options);
	if (!regex->ok()) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_REGEX,
		                         "Regex rule for '" + field + "' does not compile: " + regex->error(),
		                         OptionContext("regex_rules"));
	}
	return regex;
}

bool RegexRuleMatches(const re2::RE2 &rule, const std::string &text) {
	return re2::RE2::PartialMatch(text, rule);
}

void ProfileOptions::Validate() const {
	if (!std::isfinite(required_threshold) || required_threshold <= 0.0 || required_threshold > 1.0) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_THRESHOLD,
		                         "required_threshold must be in (0, 1], got " + std::to_string(required_threshold),
		                         OptionContext("required_threshold"));
	}
	if (!std::isfinite(rare_field_max_fraction) || rare_field_max_fraction < 0.0 || rare_field_max_fraction >= 1.0) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_RARE_FRACTION,
		                         "rare_field_max_fraction must be in [0, 1), got " +
		                             std::to_string(rare_field_max_fraction),
		                         OptionContext("rare_field_max_fraction"));
	}
	if (rare_field_max_fraction >= required_threshold) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_CONFLICTING_OPTIONS,
		                         "rare_field_max_fraction must be below required_threshold",
		                         OptionContext("rare_field_max_fraction"));
	}
	if (examples_per_issue < 1) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_EXAMPLES,
		                         "examples_per_issue must be at least 1, got " + std::to_string(examples_per_issue),
		                         OptionContext("examples_per_issue"));
	}
	if (sample_limit && *sample_limit < 1) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_SAMPLE_LIMIT,
		                         "sample_limit must be at least 1, got " + std::to_string(*sample_limit),
		                         OptionContext("sample_limit"));
	}
	if (examples_per_subcollection < 1) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_EXAMPLES,
		                         "examples_per_subcollection must be at least 1, got " +
		                             std::to_string(examples_per_subcollection),
		                         OptionContext("examples_per_subcollection"));
	}
	if (!include_schema && !include_issues && !include_example && !include_subcollections) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_CONFLICTING_OPTIONS,
		                         "Nothing requested to profile",
		                         OptionContext("include_schema"));
	}
	for (const auto &entry : regex_rules) {
		if (entry.first.empty()) {
			throw ProfileConfigError(ProfileErrorCode::CONFIG_INVALID_RULE_PATH, "Regex rule with empty field path",
			                         OptionContext("regex_rules"));
		}
		CompileRegexRule(entry.first, entry.second);
	}
	FP_LOG_DEBUG("Options valid: threshold=" + std::to_string(required_threshold) +
	             ", rare=" + std::to_string(rare_field_max_fraction) +
	             ", examples=" + std::to_string(examples_per_issue) +
	             ", rules=" + std::to_string(regex_rules.size()));
}

} // namespace duckdb
