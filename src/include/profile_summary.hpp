#pragma once

#include "profile_aggregate.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace duckdb {

// Declarative description of one field, rebuilt from a finished aggregate.
//
// type is one of: string, boolean, integer, number, timestamp,
// documentReference, bytes(base64), geopoint{...}, array, object,
// map<string,K>, union, unknown, any
struct SchemaSummary {
	std::string type;
	bool required = false;
	bool nullable = false;
	// The "any" placeholder of an array that was always empty carries no flags
	bool has_presence = true;

	std::optional<std::string> format;                               // timestamp
	std::vector<std::string> union_types;                            // union, sorted
	std::unique_ptr<SchemaSummary> items;                            // array
	std::vector<std::pair<std::string, SchemaSummary>> fields;       // object, sorted by name
	std::vector<std::string> required_fields;                        // object

	json ToJson() const;
};

// Schema of the document root: like an object summary without type/flags
struct DocumentSchema {
	std::vector<std::pair<std::string, SchemaSummary>> fields;
	std::vector<std::string> required_fields;

	json ToJson() const;
};

// Summarize a field whose parent held parent_total values
SchemaSummary SummarizeField(const FieldAggregate &field, int64_t parent_total);

// Summarize the document root
DocumentSchema SummarizeDocument(const ObjectAggregate &root);

// Map-vs-record heuristic: returns the dictionary value kind when the object
// behaves like map<string,K>, nothing when it is a fixed-shape record
std::optional<Kind> DetectMapValueKind(const ObjectAggregate &object);

// Display name of a variant ("integer" for whole numbers, "documentReference", ...)
std::string FriendlyTypeName(const VariantAggregate &variant);

} // namespace duckdb
