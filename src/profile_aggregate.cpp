#include "profile_aggregate.hpp"

namespace duckdb {

// ============================================================================
// VariantAggregate
// ============================================================================

VariantAggregate::VariantAggregate() : VariantAggregate(Kind::UNKNOWN) {
}

VariantAggregate::VariantAggregate(Kind kind_p) : kind(kind_p), count(0), integer_only(true) {
	if (kind == Kind::OBJECT) {
		object = std::make_unique<ObjectAggregate>();
	} else if (kind == Kind::ARRAY) {
		array = std::make_unique<ArrayAggregate>();
	}
}

VariantAggregate::~VariantAggregate() = default;
VariantAggregate::VariantAggregate(VariantAggregate &&other) noexcept = default;
VariantAggregate &VariantAggregate::operator=(VariantAggregate &&other) noexcept = default;

// ============================================================================
// FieldAggregate / ObjectAggregate / ArrayAggregate
// ============================================================================

VariantAggregate &FieldAggregate::GetOrCreateVariant(Kind kind) {
	auto it = variants.find(kind);
	if (it == variants.end()) {
		it = variants.emplace(kind, VariantAggregate(kind)).first;
	}
	return it->second;
}

const VariantAggregate *FieldAggregate::FindVariant(Kind kind) const {
	auto it = variants.find(kind);
	return it == variants.end() ? nullptr : &it->second;
}

size_t FieldAggregate::NonNullKindCount() const {
	size_t result = variants.size();
	if (HasKind(Kind::NULL_KIND)) {
		result--;
	}
	return result;
}

FieldAggregate &ObjectAggregate::GetOrCreateProperty(const std::string &name) {
	return properties[name];
}

FieldAggregate &ArrayAggregate::GetOrCreateItems() {
	if (!items) {
		items = std::make_unique<FieldAggregate>();
	}
	return *items;
}

// ============================================================================
// Merge
// ============================================================================

void MergeFieldAggregate(FieldAggregate &target, const FieldAggregate &source) {
	target.present_count += source.present_count;
	for (const auto &entry : source.variants) {
		const auto &src = entry.second;
		auto &dst = target.GetOrCreateVariant(entry.first);
		dst.count += src.count;
		dst.integer_only = dst.integer_only && src.integer_only;
		if (src.object) {
			MergeObjectAggregate(*dst.object, *src.object);
		}
		if (src.array) {
			MergeArrayAggregate(*dst.array, *src.array);
		}
	}
}

void MergeObjectAggregate(ObjectAggregate &target, const ObjectAggregate &source) {
	target.total_seen += source.total_seen;
	for (const auto &entry : source.properties) {
		MergeFieldAggregate(target.GetOrCreateProperty(entry.first), entry.second);
	}
}

void MergeArrayAggregate(ArrayAggregate &target, const ArrayAggregate &source) {
	target.total_seen += source.total_seen;
	target.empty_count += source.empty_count;
	if (source.items) {
		MergeFieldAggregate(target.GetOrCreateItems(), *source.items);
	}
}

// ============================================================================
// Equality
// ============================================================================

static bool VariantsEqual(const VariantAggregate &a, const VariantAggregate &b) {
	if (a.kind != b.kind || a.count != b.count) {
		return false;
	}
	if (a.kind == Kind::NUMBER && a.integer_only != b.integer_only) {
		return false;
	}
	if (a.object && b.object && !(*a.object == *b.object)) {
		return false;
	}
	if (a.array && b.array && !(*a.array == *b.array)) {
		return false;
	}
	return true;
}

bool operator==(const FieldAggregate &a, const FieldAggregate &b) {
	if (a.present_count != b.present_count || a.variants.size() != b.variants.size()) {
		return false;
	}
	auto it_a = a.variants.begin();
	auto it_b = b.variants.begin();
	for (; it_a != a.variants.end(); ++it_a, ++it_b) {
		if (!VariantsEqual(it_a->second, it_b->second)) {
			return false;
		}
	}
	return true;
}

bool operator==(const ObjectAggregate &a, const ObjectAggregate &b) {
	return a.total_seen == b.total_seen && a.properties == b.properties;
}

bool operator==(const ArrayAggregate &a, const ArrayAggregate &b) {
	if (a.total_seen != b.total_seen || a.empty_count != b.empty_count) {
		return false;
	}
	if (!a.items || !b.items) {
		return !a.items && !b.items;
	}
	return *a.items == *b.items;
}

} // namespace duckdb
