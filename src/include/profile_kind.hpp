#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace duckdb {

using json = nlohmann::json;

// Discrete type tag of one observed Firestore value.
//
// Firestore REST value -> Kind
// nullValue            -> NULL_KIND
// timestampValue       -> TIMESTAMP
// geoPointValue        -> GEOPOINT
// referenceValue       -> REFERENCE
// bytesValue           -> BYTES
// arrayValue           -> ARRAY
// stringValue          -> STRING
// booleanValue         -> BOOLEAN
// integerValue         -> NUMBER
// doubleValue          -> NUMBER
// mapValue             -> OBJECT (vectors included)
// anything else        -> UNKNOWN
//
// The enumerator order is the alphabetical order of the kind names, so
// iterating a std::map<Kind, ...> yields kinds sorted by name.
enum class Kind : uint8_t {
	ARRAY = 0,
	BOOLEAN,
	BYTES,
	GEOPOINT,
	NULL_KIND,
	NUMBER,
	OBJECT,
	REFERENCE,
	STRING,
	TIMESTAMP,
	UNKNOWN
};

// Classify a Firestore typed value. Total: never throws
Kind ClassifyValue(const json &value);

// Lower-case kind name ("null", "geopoint", ...)
const char *KindToString(Kind kind);

// Inverse of KindToString; unrecognised names map to UNKNOWN
Kind ParseKind(const std::string &name);

// True for the scalar kinds the map heuristic accepts as dictionary values
bool IsMapValueKind(Kind kind);

// Whether a NUMBER value has no fractional part. integerValue is always
// integral; doubleValue is integral when finite and whole
bool IsIntegralNumber(const json &value);

// Check if a Firestore mapValue is a vector embedding
//   { "mapValue": { "fields": { "__type__": { "stringValue": "__vector__" }, "value": { "arrayValue": ... } } } }
bool IsFirestoreVector(const json &value);

} // namespace duckdb
