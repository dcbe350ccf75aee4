#pragma once

#include "profile_issues.hpp"
#include "profile_options.hpp"
#include "profile_summary.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace duckdb {

// Run metadata rendered under "meta"
struct ReportMetadata {
	std::string collection;
	std::optional<int64_t> sample_limit;
	int64_t docs_scanned = 0;
	int64_t docs_total_seen = 0;
	double required_threshold = ProfileOptions::kDefaultRequiredThreshold;
	double rare_field_max_fraction = ProfileOptions::kDefaultRareFieldMaxFraction;
	int64_t examples_per_issue = ProfileOptions::kDefaultExamplesPerIssue;
	bool check_field_name_variants = true;
	int passes = 1;
	bool include_subcollections = false;
};

// Schema of one subcollection id, merged over every scanned parent document
struct SubcollectionProfile {
	std::string id;
	// "users/{doc}/orders"
	std::string collection;
	int64_t parent_documents = 0;
	int64_t docs_scanned = 0;
	DocumentSchema schema;
};

// Document kept for the "example" section
struct ExampleDocument {
	std::string document_id;
	json document; // sanitized
	// Subcollection id -> first documents of that subcollection, sanitized
	std::map<std::string, std::vector<json>> subcollections;
};

// Round a fraction to 4 decimal places for display
double RoundFraction(double value);

// Plain JSON rendering of a REST typed value: timestamps and references as
// strings, geopoints as {latitude, longitude}, integers as numbers
json SanitizeValue(const json &value);
json SanitizeFields(const json &fields);

json IssuesToJson(const IssueReport &issues);
json IssueSummaryToJson(const IssueReport &issues);

json SubcollectionsToJson(const std::vector<SubcollectionProfile> &subcollections);

// Join the requested sections into one report object. Sections whose
// pointer is null are omitted
json AssembleReport(const ReportMetadata &meta, const DocumentSchema *schema, const IssueReport *issues,
                    const ExampleDocument *example,
                    const std::vector<SubcollectionProfile> *subcollections = nullptr);

// One issue flattened to a table row
struct LintRow {
	std::string issue_type;
	std::string field;
	int64_t count;
	std::optional<double> fraction;
	json details;
};

std::vector<LintRow> FlattenIssues(const IssueReport &issues);

} // namespace duckdb
