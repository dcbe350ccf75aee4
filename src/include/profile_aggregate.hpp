#pragma once

#include "profile_kind.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace duckdb {

struct ObjectAggregate;
struct ArrayAggregate;

// Per-kind counter for one field. Object and array variants own the nested
// aggregate for their values
struct VariantAggregate {
	VariantAggregate();
	explicit VariantAggregate(Kind kind);
	~VariantAggregate();

	VariantAggregate(VariantAggregate &&other) noexcept;
	VariantAggregate &operator=(VariantAggregate &&other) noexcept;
	VariantAggregate(const VariantAggregate &) = delete;
	VariantAggregate &operator=(const VariantAggregate &) = delete;

	Kind kind;
	int64_t count;
	// NUMBER only: false once any non-integral value was seen
	bool integer_only;
	std::unique_ptr<ObjectAggregate> object; // OBJECT only
	std::unique_ptr<ArrayAggregate> array;   // ARRAY only
};

// Everything observed for one field at one nesting position.
// Invariant: present_count == sum of variants[*].count
struct FieldAggregate {
	int64_t present_count = 0;
	std::map<Kind, VariantAggregate> variants;

	VariantAggregate &GetOrCreateVariant(Kind kind);
	const VariantAggregate *FindVariant(Kind kind) const;
	bool HasKind(Kind kind) const {
		return variants.find(kind) != variants.end();
	}
	// Number of distinct kinds excluding null
	size_t NonNullKindCount() const;
};

// All object values seen at one position (or the document root).
// Invariant: properties[k].present_count <= total_seen
struct ObjectAggregate {
	int64_t total_seen = 0;
	std::map<std::string, FieldAggregate> properties;

	FieldAggregate &GetOrCreateProperty(const std::string &name);
};

// All array values seen at one position. Every element of every array lands
// in the one shared items aggregate
struct ArrayAggregate {
	int64_t total_seen = 0;
	int64_t empty_count = 0;
	std::unique_ptr<FieldAggregate> items;

	FieldAggregate &GetOrCreateItems();
};

// Merge source into target. Counts add, integer_only ANDs, missing children
// are created. Commutative and associative, so shards folded separately and
// merged equal one sequential fold
void MergeFieldAggregate(FieldAggregate &target, const FieldAggregate &source);
void MergeObjectAggregate(ObjectAggregate &target, const ObjectAggregate &source);
void MergeArrayAggregate(ArrayAggregate &target, const ArrayAggregate &source);

// Structural equality of two aggregate trees
bool operator==(const FieldAggregate &a, const FieldAggregate &b);
bool operator==(const ObjectAggregate &a, const ObjectAggregate &b);
bool operator==(const ArrayAggregate &a, const ArrayAggregate &b);
inline bool operator!=(const FieldAggregate &a, const FieldAggregate &b) {
	return !(a == b);
}
inline bool operator!=(const ObjectAggregate &a, const ObjectAggregate &b) {
	return !(a == b);
}

} // namespace duckdb
