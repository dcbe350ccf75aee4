#pragma once

#include "profile_issues.hpp"
#include "profile_options.hpp"
#include "profile_report.hpp"
#include "profile_source.hpp"
#include "profile_summary.hpp"
#include <optional>
#include <string>
#include <vector>

namespace duckdb {

struct ProfileResult {
	std::string collection;
	int64_t docs_scanned = 0;
	int passes = 0;
	ObjectAggregate aggregate;
	std::optional<DocumentSchema> schema;
	std::optional<IssueReport> issues;
	std::optional<ExampleDocument> example;
	std::vector<SubcollectionProfile> subcollections;
	json report;
};

// Profile one collection:
//   1. validate options
//   2. pass 1: fold up to sample_limit documents, gathering issue evidence
//   3. summarize the schema
//   4. pass 2 (issues only, and only when an expected field has a deficit):
//      collect ids of documents missing expected fields
//   5. run the checks and assemble the report
// With include_subcollections, every subcollection id found under the
// scanned documents is profiled as one merged schema after pass 1
// Configuration errors are thrown before the source is touched; source errors
// abort the run with no partial result
ProfileResult RunProfile(const std::string &collection, ProfileDocumentSource &source, const ProfileOptions &options);

} // namespace duckdb
