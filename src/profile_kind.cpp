#include "profile_kind.hpp"
#include <cmath>

namespace duckdb {

bool IsFirestoreVector(const json &value) {
	if (!value.is_object() || !value.contains("mapValue"))
		return false;
	const auto &mv = value["mapValue"];
	if (!mv.is_object() || !mv.contains("fields"))
		return false;
	const auto &fields = mv["fields"];
	if (!fields.is_object() || !fields.contains("__type__") || !fields.contains("value"))
		return false;
	const auto &type_field = fields["__type__"];
	if (!type_field.is_object() || !type_field.contains("stringValue"))
		return false;
	const auto &tag = type_field["stringValue"];
	if (!tag.is_string() || tag.get<std::string>() != "__vector__")
		return false;
	const auto &value_field = fields["value"];
	return value_field.is_object() && value_field.contains("arrayValue");
}

Kind ClassifyValue(const json &value) {
	// Typed values are single-key objects; anything else is not a Firestore value
	if (!value.is_object()) {
		return Kind::UNKNOWN;
	}
	if (value.contains("nullValue"))
		return Kind::NULL_KIND;

	// Opaque structured kinds come before array/map so a geopoint or timestamp
	// is never taken for a generic object
	if (value.contains("timestampValue"))
		return Kind::TIMESTAMP;
	if (value.contains("geoPointValue"))
		return Kind::GEOPOINT;
	if (value.contains("referenceValue"))
		return Kind::REFERENCE;
	if (value.contains("bytesValue"))
		return Kind::BYTES;

	if (value.contains("arrayValue"))
		return Kind::ARRAY;

	if (value.contains("stringValue"))
		return Kind::STRING;
	if (value.contains("booleanValue"))
		return Kind::BOOLEAN;
	if (value.contains("integerValue") || value.contains("doubleValue"))
		return Kind::NUMBER;

	if (value.contains("mapValue"))
		return Kind::OBJECT;

	return Kind::UNKNOWN;
}

const char *KindToString(Kind kind) {
	switch (kind) {
	case Kind::ARRAY:
		return "array";
	case Kind::BOOLEAN:
		return "boolean";
	case Kind::BYTES:
		return "bytes";
	case Kind::GEOPOINT:
		return "geopoint";
	case Kind::NULL_KIND:
		return "null";
	case Kind::NUMBER:
		return "number";
	case Kind::OBJECT:
		return "object";
	case Kind::REFERENCE:
		return "reference";
	case Kind::STRING:
		return "string";
	case Kind::TIMESTAMP:
		return "timestamp";
	case Kind::UNKNOWN:
		return "unknown";
	}
	return "unknown";
}

Kind ParseKind(const std::string &name) {
	if (name == "array")
		return Kind::ARRAY;
	if (name == "boolean")
		return Kind::BOOLEAN;
	if (name == "bytes")
		return Kind::BYTES;
	if (name == "geopoint")
		return Kind::GEOPOINT;
	if (name == "null")
		return Kind::NULL_KIND;
	if (name == "number")
		return Kind::NUMBER;
	if (name == "object")
		return Kind::OBJECT;
	if (name == "reference")
		return Kind::REFERENCE;
	if (name == "string")
		return Kind::STRING;
	if (name == "timestamp")
		return Kind::TIMESTAMP;
	return Kind::UNKNOWN;
}

bool IsMapValueKind(Kind kind) {
	return kind == Kind::BOOLEAN || kind == Kind::STRING || kind == Kind::NUMBER;
}

bool IsIntegralNumber(const json &value) {
	if (value.contains("integerValue")) {
		return true;
	}
	if (!value.contains("doubleValue")) {
		return false;
	}
	const auto &dv = value["doubleValue"];
	// REST encodes NaN and the infinities as strings
	if (!dv.is_number()) {
		return false;
	}
	double d = dv.get<double>();
	return std::isfinite(d) && std::trunc(d) == d;
}

} // namespace duckdb
