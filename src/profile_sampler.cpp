#include "profile_sampler.hpp"

namespace duckdb {

std::string FieldPathToString(const FieldPath &path) {
	std::string result;
	for (const auto &segment : path) {
		if (!result.empty()) {
			result += ".";
		}
		result += segment;
	}
	return result;
}

const json *GetMapFields(const json &value) {
	auto mv = value.find("mapValue");
	if (mv == value.end() || !mv->is_object()) {
		return nullptr;
	}
	auto fields = mv->find("fields");
	if (fields == mv->end() || !fields->is_object()) {
		return nullptr;
	}
	return &*fields;
}

const json *GetArrayValues(const json &value) {
	auto av = value.find("arrayValue");
	if (av == value.end() || !av->is_object()) {
		return nullptr;
	}
	auto values = av->find("values");
	if (values == av->end() || !values->is_array()) {
		return nullptr;
	}
	return &*values;
}

static void FoldFields(ObjectAggregate &aggregate, const json *fields, ProfileFoldObserver *observer,
                       FieldPath &path);

// observer is only passed down while outside arrays
static void FoldValueInternal(FieldAggregate &aggregate, const json &value, ProfileFoldObserver *observer,
                              FieldPath &path) {
	aggregate.present_count++;

	Kind kind = ClassifyValue(value);
	auto &variant = aggregate.GetOrCreateVariant(kind);
	variant.count++;

	if (observer) {
		observer->OnFieldValue(path, kind, value);
	}

	switch (kind) {
	case Kind::OBJECT:
		FoldFields(*variant.object, GetMapFields(value), observer, path);
		break;
	case Kind::ARRAY: {
		auto &array = *variant.array;
		array.total_seen++;
		const json *values = GetArrayValues(value);
		if (!values || values->empty()) {
			array.empty_count++;
			break;
		}
		auto &items = array.GetOrCreateItems();
		for (const auto &element : *values) {
			FoldValueInternal(items, element, nullptr, path);
		}
		break;
	}
	case Kind::NUMBER:
		if (!IsIntegralNumber(value)) {
			variant.integer_only = false;
		}
		break;
	default:
		break;
	}
}

static void FoldFields(ObjectAggregate &aggregate, const json *fields, ProfileFoldObserver *observer,
                       FieldPath &path) {
	aggregate.total_seen++;
	if (!fields) {
		return;
	}
	for (auto it = fields->begin(); it != fields->end(); ++it) {
		auto &child = aggregate.GetOrCreateProperty(it.key());
		if (observer) {
			path.push_back(it.key());
			FoldValueInternal(child, it.value(), observer, path);
			path.pop_back();
		} else {
			FoldValueInternal(child, it.value(), nullptr, path);
		}
	}
}

void FoldValue(FieldAggregate &aggregate, const json &value) {
	FieldPath path;
	FoldValueInternal(aggregate, value, nullptr, path);
}

void FoldObjectSample(ObjectAggregate &aggregate, const json &fields, ProfileFoldObserver *observer) {
	FieldPath path;
	FoldFields(aggregate, fields.is_object() ? &fields : nullptr, observer, path);
}

} // namespace duckdb
