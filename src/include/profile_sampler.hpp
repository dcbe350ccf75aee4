#pragma once

#include "profile_aggregate.hpp"
#include <string>
#include <vector>

namespace duckdb {

// Property names from the document root down through nested maps
using FieldPath = std::vector<std::string>;

// "a.b.c" display form of a path
std::string FieldPathToString(const FieldPath &path);

// Receives every value the sampler visits outside arrays, with its path and
// the kind it was classified as. Pass-1 issue evidence is gathered this way
class ProfileFoldObserver {
public:
	virtual ~ProfileFoldObserver() = default;
	virtual void OnFieldValue(const FieldPath &path, Kind kind, const json &value) = 0;
};

// Record one more observation of value in aggregate
void FoldValue(FieldAggregate &aggregate, const json &value);

// Fold a whole document: fields is the REST "fields" object (name -> typed
// value). total_seen grows by one per call; there is no dedup, folding the
// same document twice counts it twice
void FoldObjectSample(ObjectAggregate &aggregate, const json &fields, ProfileFoldObserver *observer = nullptr);

// The "fields" object of a mapValue, or nullptr for an empty map
const json *GetMapFields(const json &value);

// The "values" array of an arrayValue, or nullptr for an empty array
const json *GetArrayValues(const json &value);

} // namespace duckdb
