#pragma once

#include "profile_aggregate.hpp"
#include "profile_options.hpp"
#include "profile_sampler.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace duckdb {

class ProfileDocumentSource;

// ============================================================================
// Pass 1 evidence
// ============================================================================

struct RegexViolationExample {
	std::string doc;
	std::string value;
};

// Bounded example lists gathered for one field path while folding
struct FieldEvidence {
	std::map<Kind, std::vector<std::string>> kind_examples;
	std::vector<std::string> present_examples;
	std::vector<RegexViolationExample> regex_violations;
};

// Fold observer recording example document ids per field path. Every list is
// capped at examples_per_issue; the first documents seen win
class IssueEvidenceCollector : public ProfileFoldObserver {
public:
	explicit IssueEvidenceCollector(const ProfileOptions &options);

	// Must be called before folding each document
	void BeginDocument(const std::string &document_id);

	void OnFieldValue(const FieldPath &path, Kind kind, const json &value) override;

	const FieldEvidence *Find(const std::string &field) const;
	const std::map<std::string, FieldEvidence> &Evidence() const {
		return evidence_;
	}

private:
	struct CompiledRule {
		RegexRule rule;
		std::unique_ptr<re2::RE2> regex;
	};

	size_t limit_;
	std::string current_document_;
	std::map<std::string, CompiledRule> rules_;
	std::map<std::string, FieldEvidence> evidence_;
};

// ============================================================================
// Field flattening
// ============================================================================

// One addressable field: a property reached from the root through object
// values only. Arrays are leaves. A key containing '.' can share its display
// path with a nested property ("a.b" and a -> b); such fields are one
// FlatField listing every path, with merged owning the combined aggregate
struct FlatField {
	std::string field;
	std::vector<FieldPath> paths;
	const FieldAggregate *aggregate;
	std::shared_ptr<const FieldAggregate> merged;
};

// All addressable fields of root, sorted by display path, one per display path
std::vector<FlatField> FlattenFields(const ObjectAggregate &root);

// Fields whose presence fraction reaches the threshold
std::vector<FlatField> ExpectedFields(const std::vector<FlatField> &fields, int64_t total_docs, double threshold);

// Whether the document's fields contain path (null counts as present)
bool DocumentHasField(const json &fields, const FieldPath &path);
// Whether the document's fields contain any of field's paths
bool DocumentHasField(const json &fields, const FlatField &field);

// Lowercase with '.' and '_' removed
std::string NormalizeFieldName(const std::string &field);

// ============================================================================
// Pass 2
// ============================================================================

using MissingExamples = std::map<std::string, std::vector<std::string>>;

// Re-enumerate source and record up to limit ids of documents lacking each
// expected field that has a deficit. Stops as soon as every list is full
MissingExamples CollectMissingExamples(ProfileDocumentSource &source, const std::vector<FlatField> &expected,
                                       int64_t total_docs, int64_t limit, std::optional<int64_t> sample_limit);

// ============================================================================
// Issue records
// ============================================================================

struct MissingFieldIssue {
	std::string field;
	int64_t missing_count;
	double missing_fraction;
	std::vector<std::string> example_doc_ids;
};

struct TypeMismatchIssue {
	std::string field;
	std::map<Kind, int64_t> kinds;
	std::map<Kind, std::vector<std::string>> example_doc_ids_by_kind;
};

struct RegexViolationIssue {
	std::string field;
	std::string pattern;
	std::optional<std::string> note;
	std::vector<RegexViolationExample> examples;
};

struct RareFieldIssue {
	std::string field;
	int64_t present_count;
	double present_fraction;
	std::vector<std::string> example_doc_ids;
};

struct FieldNameVariant {
	std::string field;
	int64_t present_count;
};

struct FieldNameVariantIssue {
	std::string normalized;
	std::string canonical;
	int64_t canonical_count;
	std::vector<FieldNameVariant> variants;
};

struct IssueReport {
	std::vector<MissingFieldIssue> missing_fields;
	std::vector<TypeMismatchIssue> type_mismatches;
	std::vector<RegexViolationIssue> regex_violations;
	std::vector<RareFieldIssue> rare_fields;
	std::vector<FieldNameVariantIssue> field_name_variants;

	int64_t fields_total = 0;
	int64_t expected_fields_count = 0;

	// Distinct ids cited by missing-field, type-mismatch and regex issues
	std::set<std::string> DocumentsWithIssueExamples() const;
	bool Empty() const;
};

// Run the five checks over a finished pass-1 aggregate
IssueReport DetectIssues(const ObjectAggregate &root, const IssueEvidenceCollector &evidence,
                         const MissingExamples &missing, const ProfileOptions &options);

} // namespace duckdb
