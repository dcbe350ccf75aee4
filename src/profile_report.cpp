#include "profile_report.hpp"
#include <cmath>

namespace duckdb {

double RoundFraction(double value) {
	return std::round(value * 10000.0) / 10000.0;
}

// ============================================================================
// Example document sanitizing
// ============================================================================

static json SanitizeInteger(const json &raw) {
	if (raw.is_number()) {
		return raw;
	}
	if (raw.is_string()) {
		try {
			size_t consumed = 0;
			auto text = raw.get<std::string>();
			long long parsed = std::stoll(text, &consumed);
			if (consumed == text.size()) {
				return json(static_cast<int64_t>(parsed));
			}
		} catch (const std::exception &) {
			// Out of range or not a number: keep the original text
		}
	}
	return raw;
}

json SanitizeValue(const json &value) {
	switch (ClassifyValue(value)) {
	case Kind::NULL_KIND:
		return nullptr;
	case Kind::BOOLEAN:
		return value["booleanValue"];
	case Kind::STRING:
		return value["stringValue"];
	case Kind::TIMESTAMP:
		return value["timestampValue"];
	case Kind::REFERENCE:
		return value["referenceValue"];
	case Kind::BYTES:
		return value["bytesValue"];
	case Kind::NUMBER:
		if (value.contains("integerValue")) {
			return SanitizeInteger(value["integerValue"]);
		}
		return value["doubleValue"];
	case Kind::GEOPOINT: {
		const auto &point = value["geoPointValue"];
		if (!point.is_object()) {
			return value.dump();
		}
		// Firestore omits a zero coordinate
		auto latitude = point.find("latitude");
		auto longitude = point.find("longitude");
		bool latitude_ok = latitude == point.end() || latitude->is_number();
		bool longitude_ok = longitude == point.end() || longitude->is_number();
		if (!latitude_ok || !longitude_ok) {
			return value.dump();
		}
		json result = json::object();
		result["latitude"] = latitude == point.end() ? json(0.0) : *latitude;
		result["longitude"] = longitude == point.end() ? json(0.0) : *longitude;
		return result;
	}
	case Kind::ARRAY: {
		json result = json::array();
		const json *values = GetArrayValues(value);
		if (values) {
			for (const auto &element : *values) {
				result.push_back(SanitizeValue(element));
			}
		}
		return result;
	}
	case Kind::OBJECT: {
		const json *fields = GetMapFields(value);
		return fields ? SanitizeFields(*fields) : json::object();
	}
	default:
		return value.dump();
	}
}

json SanitizeFields(const json &fields) {
	json result = json::object();
	if (!fields.is_object()) {
		return result;
	}
	for (auto it = fields.begin(); it != fields.end(); ++it) {
		result[it.key()] = SanitizeValue(it.value());
	}
	return result;
}

// ============================================================================
// Issues
// ============================================================================

static json KindMapToJson(const std::map<Kind, int64_t> &kinds) {
	json result = json::object();
	for (const auto &entry : kinds) {
		result[KindToString(entry.first)] = entry.second;
	}
	return result;
}

static json KindExamplesToJson(const std::map<Kind, std::vector<std::string>> &examples) {
	json result = json::object();
	for (const auto &entry : examples) {
		result[KindToString(entry.first)] = entry.second;
	}
	return result;
}

static json RegexExamplesToJson(const std::vector<RegexViolationExample> &examples) {
	json result = json::array();
	for (const auto &example : examples) {
		result.push_back({{"doc", example.doc}, {"value", example.value}});
	}
	return result;
}

static json VariantsToJson(const std::vector<FieldNameVariant> &variants) {
	json result = json::array();
	for (const auto &variant : variants) {
		result.push_back({{"field", variant.field}, {"present_count", variant.present_count}});
	}
	return result;
}

json IssuesToJson(const IssueReport &issues) {
	json result = json::object();

	if (!issues.missing_fields.empty()) {
		json list = json::array();
		for (const auto &issue : issues.missing_fields) {
			json entry = {{"field", issue.field},
			              {"missing_count", issue.missing_count},
			              {"missing_fraction", RoundFraction(issue.missing_fraction)}};
			if (!issue.example_doc_ids.empty()) {
				entry["example_doc_ids"] = issue.example_doc_ids;
			}
			list.push_back(std::move(entry));
		}
		result["missing_fields"] = std::move(list);
	}

	if (!issues.type_mismatches.empty()) {
		json list = json::array();
		for (const auto &issue : issues.type_mismatches) {
			list.push_back({{"field", issue.field},
			                {"kinds", KindMapToJson(issue.kinds)},
			                {"example_doc_ids_by_kind", KindExamplesToJson(issue.example_doc_ids_by_kind)}});
		}
		result["type_mismatches"] = std::move(list);
	}

	if (!issues.regex_violations.empty()) {
		json list = json::array();
		for (const auto &issue : issues.regex_violations) {
			json entry = {{"field", issue.field}, {"pattern", issue.pattern}};
			if (issue.note) {
				entry["note"] = *issue.note;
			}
			entry["examples"] = RegexExamplesToJson(issue.examples);
			list.push_back(std::move(entry));
		}
		result["regex_violations"] = std::move(list);
	}

	if (!issues.rare_fields.empty()) {
		json list = json::array();
		for (const auto &issue : issues.rare_fields) {
			json entry = {{"field", issue.field},
			              {"present_count", issue.present_count},
			              {"present_fraction", RoundFraction(issue.present_fraction)}};
			if (!issue.example_doc_ids.empty()) {
				entry["example_doc_ids"] = issue.example_doc_ids;
			}
			list.push_back(std::move(entry));
		}
		result["rare_fields"] = std::move(list);
	}

	if (!issues.field_name_variants.empty()) {
		json list = json::array();
		for (const auto &issue : issues.field_name_variants) {
			list.push_back({{"normalized", issue.normalized},
			                {"canonical", issue.canonical},
			                {"canonical_count", issue.canonical_count},
			                {"variants", VariantsToJson(issue.variants)}});
		}
		result["field_name_variants"] = std::move(list);
	}

	return result;
}

json IssueSummaryToJson(const IssueReport &issues) {
	json result = json::object();
	result["fields_total"] = issues.fields_total;
	result["expected_fields_count"] = issues.expected_fields_count;
	result["missing_fields_issues"] = issues.missing_fields.size();
	result["type_mismatch_issues"] = issues.type_mismatches.size();
	result["regex_issues"] = issues.regex_violations.size();
	result["rare_fields_issues"] = issues.rare_fields.size();
	result["field_name_variant_issues"] = issues.field_name_variants.size();
	result["docs_with_issues_examples_count"] = issues.DocumentsWithIssueExamples().size();
	return result;
}

// ============================================================================
// Report
// ============================================================================

static json MetadataToJson(const ReportMetadata &meta) {
	json result = json::object();
	if (meta.sample_limit) {
		result["sample_limit"] = *meta.sample_limit;
	} else {
		result["sample_limit"] = nullptr;
	}
	result["docs_scanned"] = meta.docs_scanned;
	result["docs_total_seen"] = meta.docs_total_seen;
	result["required_threshold"] = meta.required_threshold;
	result["rare_field_max_fraction"] = meta.rare_field_max_fraction;
	result["examples_per_issue"] = meta.examples_per_issue;
	result["check_field_name_variants"] = meta.check_field_name_variants;
	result["passes"] = meta.passes;
	result["include_subcollections"] = meta.include_subcollections;
	return result;
}

json SubcollectionsToJson(const std::vector<SubcollectionProfile> &subcollections) {
	json result = json::object();
	for (const auto &profile : subcollections) {
		result[profile.id] = {{"collection", profile.collection},
		                      {"parent_documents", profile.parent_documents},
		                      {"docs_scanned", profile.docs_scanned},
		                      {"schema", profile.schema.ToJson()}};
	}
	return result;
}

json AssembleReport(const ReportMetadata &meta, const DocumentSchema *schema, const IssueReport *issues,
                    const ExampleDocument *example, const std::vector<SubcollectionProfile> *subcollections) {
	json report = json::object();
	report["collection"] = meta.collection;
	report["meta"] = MetadataToJson(meta);
	if (schema) {
		report["schema"] = schema->ToJson();
	}
	if (subcollections && !subcollections->empty()) {
		report["subcollections"] = SubcollectionsToJson(*subcollections);
	}
	if (example) {
		json block = {{"document_id", example->document_id}, {"document", example->document}};
		if (!example->subcollections.empty()) {
			block["subcollections"] = example->subcollections;
		}
		report["example"] = std::move(block);
	}
	if (issues) {
		report["summary"] = IssueSummaryToJson(*issues);
		report["issues"] = IssuesToJson(*issues);
	}
	return report;
}

// ============================================================================
// Lint rows
// ============================================================================

std::vector<LintRow> FlattenIssues(const IssueReport &issues) {
	std::vector<LintRow> rows;

	for (const auto &issue : issues.missing_fields) {
		json details = {{"example_doc_ids", issue.example_doc_ids}};
		rows.push_back(LintRow {"missing_field", issue.field, issue.missing_count,
		                        RoundFraction(issue.missing_fraction), std::move(details)});
	}
	for (const auto &issue : issues.type_mismatches) {
		json details = {{"kinds", KindMapToJson(issue.kinds)},
		                {"example_doc_ids_by_kind", KindExamplesToJson(issue.example_doc_ids_by_kind)}};
		rows.push_back(LintRow {"type_mismatch", issue.field, static_cast<int64_t>(issue.kinds.size()),
		                        std::nullopt, std::move(details)});
	}
	for (const auto &issue : issues.regex_violations) {
		json details = {{"pattern", issue.pattern}, {"examples", RegexExamplesToJson(issue.examples)}};
		if (issue.note) {
			details["note"] = *issue.note;
		}
		rows.push_back(LintRow {"regex_violation", issue.field, static_cast<int64_t>(issue.examples.size()),
		                        std::nullopt, std::move(details)});
	}
	for (const auto &issue : issues.rare_fields) {
		json details = {{"example_doc_ids", issue.example_doc_ids}};
		rows.push_back(LintRow {"rare_field", issue.field, issue.present_count,
		                        RoundFraction(issue.present_fraction), std::move(details)});
	}
	for (const auto &issue : issues.field_name_variants) {
		json details = {{"normalized", issue.normalized}, {"variants", VariantsToJson(issue.variants)}};
		rows.push_back(LintRow {"field_name_variant", issue.canonical, issue.canonical_count, std::nullopt,
		                        std::move(details)});
	}
	return rows;
}

} // namespace duckdb
