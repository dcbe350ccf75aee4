#include "profile_summary.hpp"
#include <algorithm>

namespace duckdb {

static constexpr const char *GEOPOINT_TYPE = "geopoint{latitude:number, longitude:number}";

std::string FriendlyTypeName(const VariantAggregate &variant) {
	switch (variant.kind) {
	case Kind::NUMBER:
		return variant.integer_only ? "integer" : "number";
	case Kind::REFERENCE:
		return "documentReference";
	case Kind::BYTES:
		return "bytes(base64)";
	default:
		return KindToString(variant.kind);
	}
}

std::optional<Kind> DetectMapValueKind(const ObjectAggregate &object) {
	if (object.properties.empty()) {
		return std::nullopt;
	}
	// Any key present in every instance means a stable, fixed shape
	for (const auto &entry : object.properties) {
		if (entry.second.present_count == object.total_seen) {
			return std::nullopt;
		}
	}
	std::optional<Kind> value_kind;
	for (const auto &entry : object.properties) {
		const auto &variants = entry.second.variants;
		if (variants.size() != 1) {
			return std::nullopt;
		}
		Kind kind = variants.begin()->first;
		if (!IsMapValueKind(kind)) {
			return std::nullopt;
		}
		if (value_kind && *value_kind != kind) {
			return std::nullopt;
		}
		value_kind = kind;
	}
	return value_kind;
}

static void SummarizeProperties(const ObjectAggregate &object,
                                std::vector<std::pair<std::string, SchemaSummary>> &fields,
                                std::vector<std::string> &required_fields) {
	for (const auto &entry : object.properties) {
		fields.emplace_back(entry.first, SummarizeField(entry.second, object.total_seen));
		if (entry.second.present_count == object.total_seen) {
			required_fields.push_back(entry.first);
		}
	}
}

SchemaSummary SummarizeField(const FieldAggregate &field, int64_t parent_total) {
	SchemaSummary result;
	result.required = parent_total > 0 && field.present_count == parent_total;
	result.nullable = field.HasKind(Kind::NULL_KIND);

	std::vector<const VariantAggregate *> non_null;
	for (const auto &entry : field.variants) {
		if (entry.first != Kind::NULL_KIND) {
			non_null.push_back(&entry.second);
		}
	}

	if (non_null.empty()) {
		result.type = "unknown";
		result.nullable = true;
		return result;
	}

	if (non_null.size() > 1) {
		result.type = "union";
		for (auto variant : non_null) {
			result.union_types.push_back(FriendlyTypeName(*variant));
		}
		std::sort(result.union_types.begin(), result.union_types.end());
		return result;
	}

	const auto &variant = *non_null[0];
	// Alone, a geopoint spells out its shape; as a union member it is "geopoint"
	result.type = variant.kind == Kind::GEOPOINT ? GEOPOINT_TYPE : FriendlyTypeName(variant);

	switch (variant.kind) {
	case Kind::TIMESTAMP:
		result.format = "RFC3339";
		break;
	case Kind::ARRAY: {
		const auto &array = *variant.array;
		if (array.items) {
			result.items = std::make_unique<SchemaSummary>(SummarizeField(*array.items, array.items->present_count));
		} else {
			result.items = std::make_unique<SchemaSummary>();
			result.items->type = "any";
			result.items->has_presence = false;
		}
		break;
	}
	case Kind::OBJECT: {
		const auto &object = *variant.object;
		auto map_kind = DetectMapValueKind(object);
		if (map_kind) {
			result.type = std::string("map<string,") + KindToString(*map_kind) + ">";
			break;
		}
		SummarizeProperties(object, result.fields, result.required_fields);
		break;
	}
	default:
		break;
	}
	return result;
}

DocumentSchema SummarizeDocument(const ObjectAggregate &root) {
	DocumentSchema result;
	SummarizeProperties(root, result.fields, result.required_fields);
	return result;
}

// ============================================================================
// JSON rendering
// ============================================================================

static json FieldsToJson(const std::vector<std::pair<std::string, SchemaSummary>> &fields) {
	json result = json::object();
	for (const auto &entry : fields) {
		result[entry.first] = entry.second.ToJson();
	}
	return result;
}

json SchemaSummary::ToJson() const {
	json result = json::object();
	result["type"] = type;
	if (has_presence) {
		result["required"] = required;
		result["nullable"] = nullable;
	}
	if (format) {
		result["format"] = *format;
	}
	if (!union_types.empty()) {
		result["union"] = union_types;
	}
	if (items) {
		result["items"] = items->ToJson();
	}
	if (type == "object") {
		if (!required_fields.empty()) {
			result["requiredFields"] = required_fields;
		}
		result["fields"] = FieldsToJson(fields);
	}
	return result;
}

json DocumentSchema::ToJson() const {
	json result = json::object();
	if (!required_fields.empty()) {
		result["requiredFields"] = required_fields;
	}
	result["fields"] = FieldsToJson(fields);
	return result;
}

} // namespace duckdb
