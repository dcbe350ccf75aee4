#include "profile_issues.hpp"
#include "profile_logger.hpp"
#include "profile_source.hpp"
#include <algorithm>
#include <cctype>

namespace duckdb {

static void PushExample(std::vector<std::string> &examples, const std::string &id, size_t limit) {
	// A document reaches one display path twice when a dotted key shadows a nested one
	if (!examples.empty() && examples.back() == id) {
		return;
	}
	if (examples.size() < limit) {
		examples.push_back(id);
	}
}

// ============================================================================
// IssueEvidenceCollector
// ============================================================================

IssueEvidenceCollector::IssueEvidenceCollector(const ProfileOptions &options)
    : limit_(static_cast<size_t>(options.examples_per_issue)) {
	for (const auto &entry : options.regex_rules) {
		rules_.emplace(entry.first, CompiledRule {entry.second, CompileRegexRule(entry.first, entry.second)});
	}
}

void IssueEvidenceCollector::BeginDocument(const std::string &document_id) {
	current_document_ = document_id;
}

void IssueEvidenceCollector::OnFieldValue(const FieldPath &path, Kind kind, const json &value) {
	auto field = FieldPathToString(path);
	auto &evidence = evidence_[field];

	PushExample(evidence.kind_examples[kind], current_document_, limit_);
	PushExample(evidence.present_examples, current_document_, limit_);

	if (kind != Kind::STRING || evidence.regex_violations.size() >= limit_) {
		return;
	}
	auto rule_it = rules_.find(field);
	if (rule_it == rules_.end()) {
		return;
	}
	auto str = value.find("stringValue");
	if (str == value.end() || !str->is_string()) {
		return;
	}
	auto text = str->get<std::string>();
	if (!RegexRuleMatches(*rule_it->second.regex, text)) {
		evidence.regex_violations.push_back(RegexViolationExample {current_document_, text});
	}
}

const FieldEvidence *IssueEvidenceCollector::Find(const std::string &field) const {
	auto it = evidence_.find(field);
	return it == evidence_.end() ? nullptr : &it->second;
}

// ============================================================================
// Flattening
// ============================================================================

static void FlattenInto(const ObjectAggregate &object, FieldPath &path, std::vector<FlatField> &out) {
	for (const auto &entry : object.properties) {
		path.push_back(entry.first);
		out.push_back(FlatField {FieldPathToString(path), {path}, &entry.second, nullptr});
		auto object_variant = entry.second.FindVariant(Kind::OBJECT);
		if (object_variant) {
			FlattenInto(*object_variant->object, path, out);
		}
		path.pop_back();
	}
}

std::vector<FlatField> FlattenFields(const ObjectAggregate &root) {
	std::vector<FlatField> result;
	FieldPath path;
	FlattenInto(root, path, result);
	std::stable_sort(result.begin(), result.end(),
	                 [](const FlatField &a, const FlatField &b) { return a.field < b.field; });

	std::vector<FlatField> merged;
	size_t begin = 0;
	while (begin < result.size()) {
		size_t end = begin + 1;
		while (end < result.size() && result[end].field == result[begin].field) {
			end++;
		}
		FlatField field = std::move(result[begin]);
		if (end - begin > 1) {
			auto combined = std::make_shared<FieldAggregate>();
			MergeFieldAggregate(*combined, *field.aggregate);
			for (size_t i = begin + 1; i < end; i++) {
				MergeFieldAggregate(*combined, *result[i].aggregate);
				field.paths.push_back(result[i].paths.front());
			}
			field.aggregate = combined.get();
			field.merged = std::move(combined);
		}
		merged.push_back(std::move(field));
		begin = end;
	}
	return merged;
}

std::vector<FlatField> ExpectedFields(const std::vector<FlatField> &fields, int64_t total_docs, double threshold) {
	std::vector<FlatField> result;
	if (total_docs <= 0) {
		return result;
	}
	for (const auto &field : fields) {
		double fraction = static_cast<double>(field.aggregate->present_count) / static_cast<double>(total_docs);
		if (fraction >= threshold) {
			result.push_back(field);
		}
	}
	return result;
}

bool DocumentHasField(const json &fields, const FieldPath &path) {
	const json *current = fields.is_object() ? &fields : nullptr;
	for (size_t i = 0; i < path.size(); i++) {
		if (!current) {
			return false;
		}
		auto it = current->find(path[i]);
		if (it == current->end()) {
			return false;
		}
		if (i + 1 == path.size()) {
			return true;
		}
		current = GetMapFields(*it);
	}
	return false;
}

bool DocumentHasField(const json &fields, const FlatField &field) {
	for (const auto &path : field.paths) {
		if (DocumentHasField(fields, path)) {
			return true;
		}
	}
	return false;
}

std::string NormalizeFieldName(const std::string &field) {
	std::string result;
	result.reserve(field.size());
	for (char c : field) {
		if (c == '.' || c == '_') {
			continue;
		}
		result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return result;
}

// ============================================================================
// Pass 2
// ============================================================================

MissingExamples CollectMissingExamples(ProfileDocumentSource &source, const std::vector<FlatField> &expected,
                                       int64_t total_docs, int64_t limit, std::optional<int64_t> sample_limit) {
	MissingExamples result;
	std::vector<const FlatField *> pending;
	for (const auto &field : expected) {
		if (field.aggregate->present_count < total_docs) {
			pending.push_back(&field);
			result[field.field];
		}
	}
	if (pending.empty()) {
		return result;
	}

	size_t cap = static_cast<size_t>(limit);
	int64_t seen = 0;
	source.Scan([&](const ProfileDocument &doc) {
		seen++;
		for (auto field : pending) {
			auto &examples = result[field->field];
			if (examples.size() < cap && !DocumentHasField(doc.fields, *field)) {
				examples.push_back(doc.id);
			}
		}
		// Drop fields whose list is full; stop once nothing is left
		pending.erase(std::remove_if(pending.begin(), pending.end(),
		                             [&](const FlatField *f) { return result[f->field].size() >= cap; }),
		              pending.end());
		if (sample_limit && seen >= *sample_limit) {
			return false;
		}
		return !pending.empty();
	});

	FP_LOG_DEBUG("Pass 2 read " + std::to_string(seen) + " documents");
	return result;
}

// ============================================================================
// Checks
// ============================================================================

static double Fraction(int64_t count, int64_t total) {
	return total > 0 ? static_cast<double>(count) / static_cast<double>(total) : 0.0;
}

static void DetectMissingFields(const std::vector<FlatField> &expected, int64_t total_docs,
                                const MissingExamples &missing, IssueReport &report) {
	for (const auto &field : expected) {
		int64_t missing_count = total_docs - field.aggregate->present_count;
		if (missing_count <= 0) {
			continue;
		}
		MissingFieldIssue issue;
		issue.field = field.field;
		issue.missing_count = missing_count;
		issue.missing_fraction = Fraction(missing_count, total_docs);
		auto it = missing.find(field.field);
		if (it != missing.end()) {
			issue.example_doc_ids = it->second;
		}
		report.missing_fields.push_back(std::move(issue));
	}
	std::stable_sort(report.missing_fields.begin(), report.missing_fields.end(),
	                 [](const MissingFieldIssue &a, const MissingFieldIssue &b) {
		                 if (a.missing_count != b.missing_count) {
			                 return a.missing_count > b.missing_count;
		                 }
		                 return a.field < b.field;
	                 });
}

static void DetectTypeMismatches(const std::vector<FlatField> &fields, const IssueEvidenceCollector &evidence,
                                 IssueReport &report) {
	for (const auto &field : fields) {
		if (field.aggregate->NonNullKindCount() < 2) {
			continue;
		}
		TypeMismatchIssue issue;
		issue.field = field.field;
		for (const auto &entry : field.aggregate->variants) {
			issue.kinds[entry.first] = entry.second.count;
		}
		auto field_evidence = evidence.Find(field.field);
		if (field_evidence) {
			for (const auto &entry : field_evidence->kind_examples) {
				if (!entry.second.empty()) {
					issue.example_doc_ids_by_kind[entry.first] = entry.second;
				}
			}
		}
		report.type_mismatches.push_back(std::move(issue));
	}
	std::stable_sort(report.type_mismatches.begin(), report.type_mismatches.end(),
	                 [](const TypeMismatchIssue &a, const TypeMismatchIssue &b) {
		                 if (a.kinds.size() != b.kinds.size()) {
			                 return a.kinds.size() > b.kinds.size();
		                 }
		                 return a.field < b.field;
	                 });
}

static void DetectRegexViolations(const IssueEvidenceCollector &evidence, const ProfileOptions &options,
                                  IssueReport &report) {
	for (const auto &entry : options.regex_rules) {
		auto field_evidence = evidence.Find(entry.first);
		if (!field_evidence || field_evidence->regex_violations.empty()) {
			continue;
		}
		RegexViolationIssue issue;
		issue.field = entry.first;
		issue.pattern = entry.second.pattern;
		issue.note = entry.second.note;
		issue.examples = field_evidence->regex_violations;
		report.regex_violations.push_back(std::move(issue));
	}
}

static void DetectRareFields(const std::vector<FlatField> &fields, int64_t total_docs,
                             const IssueEvidenceCollector &evidence, double max_fraction, IssueReport &report) {
	if (total_docs <= 0) {
		return;
	}
	for (const auto &field : fields) {
		double fraction = Fraction(field.aggregate->present_count, total_docs);
		if (fraction > max_fraction) {
			continue;
		}
		RareFieldIssue issue;
		issue.field = field.field;
		issue.present_count = field.aggregate->present_count;
		issue.present_fraction = fraction;
		auto field_evidence = evidence.Find(field.field);
		if (field_evidence) {
			issue.example_doc_ids = field_evidence->present_examples;
		}
		report.rare_fields.push_back(std::move(issue));
	}
	std::stable_sort(report.rare_fields.begin(), report.rare_fields.end(),
	                 [](const RareFieldIssue &a, const RareFieldIssue &b) {
		                 if (a.present_count != b.present_count) {
			                 return a.present_count < b.present_count;
		                 }
		                 return a.field < b.field;
	                 });
}

static void DetectFieldNameVariants(const std::vector<FlatField> &fields, IssueReport &report) {
	// fields are sorted by path, so each group lists its members in path order
	std::map<std::string, std::vector<const FlatField *>> groups;
	for (const auto &field : fields) {
		groups[NormalizeFieldName(field.field)].push_back(&field);
	}
	for (const auto &entry : groups) {
		const auto &members = entry.second;
		if (members.size() < 2) {
			continue;
		}
		const FlatField *canonical = members[0];
		for (auto member : members) {
			if (member->aggregate->present_count > canonical->aggregate->present_count) {
				canonical = member;
			}
		}
		FieldNameVariantIssue issue;
		issue.normalized = entry.first;
		issue.canonical = canonical->field;
		issue.canonical_count = canonical->aggregate->present_count;
		for (auto member : members) {
			if (member != canonical) {
				issue.variants.push_back(FieldNameVariant {member->field, member->aggregate->present_count});
			}
		}
		std::stable_sort(issue.variants.begin(), issue.variants.end(),
		                 [](const FieldNameVariant &a, const FieldNameVariant &b) {
			                 if (a.present_count != b.present_count) {
				                 return a.present_count > b.present_count;
			                 }
			                 return a.field < b.field;
		                 });
		report.field_name_variants.push_back(std::move(issue));
	}
}

IssueReport DetectIssues(const ObjectAggregate &root, const IssueEvidenceCollector &evidence,
                         const MissingExamples &missing, const ProfileOptions &options) {
	IssueReport report;
	int64_t total_docs = root.total_seen;
	auto fields = FlattenFields(root);
	auto expected = ExpectedFields(fields, total_docs, options.required_threshold);

	report.fields_total = static_cast<int64_t>(fields.size());
	report.expected_fields_count = static_cast<int64_t>(expected.size());

	DetectMissingFields(expected, total_docs, missing, report);
	DetectTypeMismatches(fields, evidence, report);
	DetectRegexViolations(evidence, options, report);
	DetectRareFields(fields, total_docs, evidence, options.rare_field_max_fraction, report);
	if (options.check_field_name_variants) {
		DetectFieldNameVariants(fields, report);
	}

	FP_LOG_DEBUG("Issues: missing=" + std::to_string(report.missing_fields.size()) +
	             ", mismatches=" + std::to_string(report.type_mismatches.size()) +
	             ", regex=" + std::to_string(report.regex_violations.size()) +
	             ", rare=" + std::to_string(report.rare_fields.size()) +
	             ", variants=" + std::to_string(report.field_name_variants.size()));
	return report;
}

std::set<std::string> IssueReport::DocumentsWithIssueExamples() const {
	std::set<std::string> result;
	for (const auto &issue : missing_fields) {
		result.insert(issue.example_doc_ids.begin(), issue.example_doc_ids.end());
	}
	for (const auto &issue : type_mismatches) {
		for (const auto &entry : issue.example_doc_ids_by_kind) {
			result.insert(entry.second.begin(), entry.second.end());
		}
	}
	for (const auto &issue : regex_violations) {
		for (const auto &example : issue.examples) {
			result.insert(example.doc);
		}
	}
	return result;
}

bool IssueReport::Empty() const {
	return missing_fields.empty() && type_mismatches.empty() && regex_violations.empty() && rare_fields.empty() &&
	       field_name_variants.empty();
}

} // namespace duckdb
