#include "profile_aggregate.hpp"
#include "profile_error.hpp"
#include "profile_issues.hpp"
#include "profile_kind.hpp"
#include "profile_logger.hpp"
#include "profile_options.hpp"
#include "profile_report.hpp"
#include "profile_runner.hpp"
#include "profile_sampler.hpp"
#include "profile_source.hpp"
#include "profile_summary.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace duckdb;

// Firestore REST value builders
static json Str(const std::string &s) {
  return json{{"stringValue", s}};
}

static json Int(int64_t v) {
  return json{{"integerValue", std::to_string(v)}};
}

static json Dbl(double v) {
  return json{{"doubleValue", v}};
}

static json Bool(bool b) {
  return json{{"booleanValue", b}};
}

static json Null() {
  return json{{"nullValue", nullptr}};
}

static json Map(const json& fields) {
  return json{{"mapValue", json{{"fields", fields}}}};
}

static json Arr(const json& values) {
  return json{{"arrayValue", json{{"values", values}}}};
}

static std::string DocId(int i) {
  return "d" + std::to_string(i);
}

// Wraps a source and counts documents handed to the callback
class CountingSource : public ProfileDocumentSource {
 public:
  explicit CountingSource(ProfileDocumentSource& inner) : inner_(inner) {}

  int64_t Scan(const DocumentCallback& callback) override {
    return inner_.Scan([&](const ProfileDocument& doc) {
      delivered++;
      return callback(doc);
    });
  }

  std::string Describe() const override { return "counting:" + inner_.Describe(); }

  int64_t delivered = 0;

 private:
  ProfileDocumentSource& inner_;
};

static ProfileOptions IssuesOnly() {
  ProfileOptions options;
  options.include_schema = false;
  return options;
}

// ----------------------------------------------------------------------------
// Classification
// ----------------------------------------------------------------------------

static void test_classify_value() {
  assert(ClassifyValue(Null()) == Kind::NULL_KIND);
  assert(ClassifyValue(json{{"timestampValue", "2024-01-02T03:04:05Z"}}) == Kind::TIMESTAMP);
  assert(ClassifyValue(json{{"geoPointValue", json{{"latitude", 1.5}, {"longitude", 2.5}}}}) == Kind::GEOPOINT);
  assert(ClassifyValue(json{{"referenceValue", "projects/p/databases/(default)/documents/a/b"}}) == Kind::REFERENCE);
  assert(ClassifyValue(json{{"bytesValue", "AAEC"}}) == Kind::BYTES);
  assert(ClassifyValue(Arr(json::array({Int(1)}))) == Kind::ARRAY);
  assert(ClassifyValue(Str("x")) == Kind::STRING);
  assert(ClassifyValue(Bool(true)) == Kind::BOOLEAN);
  assert(ClassifyValue(Int(7)) == Kind::NUMBER);
  assert(ClassifyValue(Dbl(7.5)) == Kind::NUMBER);
  assert(ClassifyValue(Map(json{{"a", Int(1)}})) == Kind::OBJECT);

  // Not Firestore values
  assert(ClassifyValue(json(5)) == Kind::UNKNOWN);
  assert(ClassifyValue(json("text")) == Kind::UNKNOWN);
  assert(ClassifyValue(json::object()) == Kind::UNKNOWN);
  assert(ClassifyValue(json{{"someOtherValue", 1}}) == Kind::UNKNOWN);

  // Vectors are maps
  json vec = Map(json{{"__type__", Str("__vector__")}, {"value", Arr(json::array({Dbl(0.5), Dbl(1.5)}))}});
  assert(IsFirestoreVector(vec));
  assert(ClassifyValue(vec) == Kind::OBJECT);
  assert(!IsFirestoreVector(Map(json{{"a", Int(1)}})));
}

static void test_kind_names() {
  std::vector<Kind> all = {Kind::ARRAY,  Kind::BOOLEAN, Kind::BYTES,     Kind::GEOPOINT, Kind::NULL_KIND, Kind::NUMBER,
                           Kind::OBJECT, Kind::REFERENCE, Kind::STRING, Kind::TIMESTAMP, Kind::UNKNOWN};
  for (auto kind : all) {
    assert(ParseKind(KindToString(kind)) == kind);
  }
  assert(std::string(KindToString(Kind::NULL_KIND)) == "null");
  assert(ParseKind("nope") == Kind::UNKNOWN);

  // Enumerator order follows the names
  for (size_t i = 1; i < all.size(); i++) {
    assert(std::string(KindToString(all[i - 1])) < std::string(KindToString(all[i])));
  }
}

// ----------------------------------------------------------------------------
// Folding
// ----------------------------------------------------------------------------

static void test_fold_counts() {
  FieldAggregate scalar;
  FoldValue(scalar, Int(1));
  FoldValue(scalar, Str("x"));
  FoldValue(scalar, Null());
  FoldValue(scalar, Int(2));
  assert(scalar.present_count == 4);
  assert(scalar.variants.size() == 3);
  assert(scalar.FindVariant(Kind::NUMBER)->count == 2);
  assert(scalar.NonNullKindCount() == 2);
  int64_t sum = 0;
  for (const auto& entry : scalar.variants) {
    sum += entry.second.count;
  }
  assert(sum == scalar.present_count);

  FieldAggregate object;
  FoldValue(object, Map(json{{"a", Int(1)}}));
  FoldValue(object, Map(json{{"b", Str("x")}, {"a", Int(2)}}));
  FoldValue(object, json{{"mapValue", json::object()}});
  const auto* variant = object.FindVariant(Kind::OBJECT);
  assert(variant && variant->object);
  assert(variant->object->total_seen == 3);
  assert(variant->object->properties.at("a").present_count == 2);
  assert(variant->object->properties.at("b").present_count == 1);

  FieldAggregate array;
  FoldValue(array, Arr(json::array({Int(1), Int(2), Str("z")})));
  FoldValue(array, Arr(json::array()));
  FoldValue(array, json{{"arrayValue", json::object()}});
  const auto* array_variant = array.FindVariant(Kind::ARRAY);
  assert(array_variant && array_variant->array);
  assert(array_variant->array->total_seen == 3);
  assert(array_variant->array->empty_count == 2);
  assert(array_variant->array->items->present_count == 3);
  assert(array_variant->array->items->FindVariant(Kind::STRING)->count == 1);
}

static void test_fold_document_twice_counts_twice() {
  ObjectAggregate root;
  json doc = {{"a", Int(1)}};
  FoldObjectSample(root, doc);
  FoldObjectSample(root, doc);
  assert(root.total_seen == 2);
  assert(root.properties.at("a").present_count == 2);

  // A document without fields still counts
  FoldObjectSample(root, json::object());
  assert(root.total_seen == 3);
}

static void test_integer_tracking() {
  FieldAggregate f;
  FoldValue(f, Int(3));
  FoldValue(f, Dbl(3.0));
  assert(f.FindVariant(Kind::NUMBER)->integer_only);

  FoldValue(f, Dbl(2.5));
  assert(!f.FindVariant(Kind::NUMBER)->integer_only);

  // Sticky
  FoldValue(f, Int(4));
  assert(!f.FindVariant(Kind::NUMBER)->integer_only);

  assert(!IsIntegralNumber(json{{"doubleValue", "NaN"}}));
  assert(!IsIntegralNumber(json{{"doubleValue", "Infinity"}}));
  assert(IsIntegralNumber(Int(9)));
}

static void test_merge_monoid() {
  std::vector<json> docs = {
      {{"a", Int(1)}, {"b", Map(json{{"x", Str("s")}})}},
      {{"a", Dbl(2.5)}, {"c", Arr(json::array({Int(1)}))}},
      {{"a", Str("three")}, {"b", Null()}},
      {{"c", Arr(json::array())}, {"b", Map(json{{"y", Bool(true)}})}},
      {{"a", Int(5)}},
  };

  ObjectAggregate whole;
  for (const auto& doc : docs) {
    FoldObjectSample(whole, doc);
  }

  ObjectAggregate left, right;
  for (size_t i = 0; i < docs.size(); i++) {
    FoldObjectSample(i < 2 ? left : right, docs[i]);
  }

  ObjectAggregate left_then_right;
  MergeObjectAggregate(left_then_right, left);
  MergeObjectAggregate(left_then_right, right);
  assert(left_then_right == whole);

  ObjectAggregate right_then_left;
  MergeObjectAggregate(right_then_left, right);
  MergeObjectAggregate(right_then_left, left);
  assert(right_then_left == whole);

  // integer_only ANDs: 2.5 lives only in the left half
  assert(!whole.properties.at("a").FindVariant(Kind::NUMBER)->integer_only);
  assert(right.properties.at("a").FindVariant(Kind::NUMBER)->integer_only);
  assert(!left_then_right.properties.at("a").FindVariant(Kind::NUMBER)->integer_only);

  // Merging an empty aggregate is the identity
  ObjectAggregate empty;
  MergeObjectAggregate(left_then_right, empty);
  assert(left_then_right == whole);

  ObjectAggregate different;
  FoldObjectSample(different, docs[0]);
  assert(different != whole);
}

// ----------------------------------------------------------------------------
// Summaries
// ----------------------------------------------------------------------------

static ObjectAggregate FoldFlagsDocuments(const std::vector<std::vector<std::string>>& keys_per_doc) {
  ObjectAggregate root;
  for (const auto& keys : keys_per_doc) {
    json flags = json::object();
    for (const auto& key : keys) {
      flags[key] = Bool(true);
    }
    FoldObjectSample(root, json{{"flags", Map(flags)}});
  }
  return root;
}

static void test_map_heuristic() {
  // a and b three times each over five objects: dictionary
  auto sparse = FoldFlagsDocuments({{"a", "b"}, {"a"}, {"b"}, {"a"}, {"b"}});
  auto sparse_schema = SummarizeDocument(sparse).ToJson();
  assert(sparse_schema["fields"]["flags"]["type"] == "map<string,boolean>");
  assert(!sparse_schema["fields"]["flags"].contains("fields"));

  // The same keys over three objects: both present every time, fixed record
  auto dense = FoldFlagsDocuments({{"a", "b"}, {"a", "b"}, {"a", "b"}});
  auto dense_schema = SummarizeDocument(dense).ToJson();
  const auto& flags = dense_schema["fields"]["flags"];
  assert(flags["type"] == "object");
  assert(flags["requiredFields"] == json::array({"a", "b"}));
  assert(flags["fields"]["a"]["required"] == true);
  assert(flags["fields"]["b"]["type"] == "boolean");

  // Mixed value kinds are never a map
  ObjectAggregate mixed;
  FoldObjectSample(mixed, json{{"m", Map(json{{"a", Str("x")}})}});
  FoldObjectSample(mixed, json{{"m", Map(json{{"b", Int(1)}})}});
  assert(!DetectMapValueKind(*mixed.properties.at("m").FindVariant(Kind::OBJECT)->object));
}

static void test_summary_types() {
  ObjectAggregate root;
  FoldObjectSample(root, json{{"name", Str("a")},
                              {"tag", Null()},
                              {"mixed", Int(1)},
                              {"onlyNull", Null()},
                              {"created", json{{"timestampValue", "2024-01-02T03:04:05Z"}}},
                              {"where", json{{"geoPointValue", json{{"latitude", 1.0}, {"longitude", 2.0}}}}},
                              {"ref", json{{"referenceValue", "projects/p/databases/(default)/documents/a/b"}}},
                              {"blob", json{{"bytesValue", "AAEC"}}},
                              {"scores", Arr(json::array({Int(1), Int(2)}))},
                              {"empty", Arr(json::array())},
                              {"ratio", Dbl(0.5)}});
  FoldObjectSample(root, json{{"name", Str("b")},
                              {"tag", Str("t")},
                              {"mixed", Str("one")},
                              {"onlyNull", Null()},
                              {"scores", Arr(json::array({Int(3)}))},
                              {"empty", Arr(json::array())},
                              {"ratio", Int(1)}});

  auto schema = SummarizeDocument(root).ToJson();
  const auto& fields = schema["fields"];

  assert(fields["name"]["type"] == "string");
  assert(fields["name"]["required"] == true);
  assert(fields["name"]["nullable"] == false);

  assert(fields["tag"]["type"] == "string");
  assert(fields["tag"]["required"] == true);
  assert(fields["tag"]["nullable"] == true);

  assert(fields["mixed"]["type"] == "union");
  assert(fields["mixed"]["union"] == json::array({"integer", "string"}));

  assert(fields["onlyNull"]["type"] == "unknown");
  assert(fields["onlyNull"]["nullable"] == true);

  assert(fields["created"]["type"] == "timestamp");
  assert(fields["created"]["format"] == "RFC3339");
  assert(fields["created"]["required"] == false);

  assert(fields["where"]["type"] == "geopoint{latitude:number, longitude:number}");
  assert(fields["ref"]["type"] == "documentReference");
  assert(fields["blob"]["type"] == "bytes(base64)");
  assert(fields["ratio"]["type"] == "number");

  assert(fields["scores"]["type"] == "array");
  assert(fields["scores"]["items"]["type"] == "integer");
  assert(fields["scores"]["items"]["required"] == true);

  assert(fields["empty"]["items"]["type"] == "any");
  assert(!fields["empty"]["items"].contains("required"));

  auto required = schema["requiredFields"];
  assert(required == json::array({"empty", "mixed", "name", "onlyNull", "ratio", "scores", "tag"}));
}

static void test_geopoint_union_member_name() {
  json point = {{"geoPointValue", {{"latitude", 1.0}, {"longitude", 2.0}}}};
  ObjectAggregate root;
  FoldObjectSample(root, json{{"spot", point}, {"where", point}});
  FoldObjectSample(root, json{{"spot", Str("near the river")}, {"where", point}});

  auto fields = SummarizeDocument(root).ToJson()["fields"];
  assert(fields["spot"]["type"] == "union");
  assert(fields["spot"]["union"] == json::array({"geopoint", "string"}));
  assert(fields["where"]["type"] == "geopoint{latitude:number, longitude:number}");
}

static void test_summary_deterministic() {
  ObjectAggregate first, second;
  FoldObjectSample(first, json{{"b", Int(1)}, {"a", Map(json{{"z", Str("x")}, {"y", Null()}})}});
  FoldObjectSample(first, json{{"a", Str("s")}});
  FoldObjectSample(second, json{{"a", Str("s")}});
  FoldObjectSample(second, json{{"a", Map(json{{"y", Null()}, {"z", Str("x")}})}, {"b", Int(1)}});

  auto once = SummarizeDocument(first).ToJson().dump();
  auto twice = SummarizeDocument(first).ToJson().dump();
  assert(once == twice);
  // Document order does not matter either
  assert(once == SummarizeDocument(second).ToJson().dump());
}

// ----------------------------------------------------------------------------
// Issues
// ----------------------------------------------------------------------------

static void test_type_mismatch_age() {
  InMemoryDocumentSource source;
  for (int i = 0; i < 10; i++) {
    source.Add(DocId(i), json{{"age", i == 9 ? Str("ten") : Int(20 + i)}});
  }

  auto result = RunProfile("people", source, IssuesOnly());
  const auto& issues = *result.issues;

  assert(issues.type_mismatches.size() == 1);
  const auto& mismatch = issues.type_mismatches[0];
  assert(mismatch.field == "age");
  assert(mismatch.kinds.size() == 2);
  assert(mismatch.kinds.at(Kind::NUMBER) == 9);
  assert(mismatch.kinds.at(Kind::STRING) == 1);
  assert(mismatch.example_doc_ids_by_kind.at(Kind::STRING) == std::vector<std::string>({"d9"}));
  assert(mismatch.example_doc_ids_by_kind.at(Kind::NUMBER).size() == 9);

  assert(issues.missing_fields.empty());
  assert(result.passes == 1);

  auto report_issues = result.report["issues"]["type_mismatches"][0];
  assert(report_issues["kinds"] == json({{"number", 9}, {"string", 1}}));
}

static void test_null_is_not_a_mismatch_but_unknown_is() {
  ObjectAggregate root;
  FoldObjectSample(root, json{{"a", Str("x")}, {"b", Str("x")}});
  FoldObjectSample(root, json{{"a", Null()}, {"b", json{{"mysteryValue", 1}}}});

  ProfileOptions options;
  IssueEvidenceCollector evidence(options);
  auto issues = DetectIssues(root, evidence, {}, options);
  assert(issues.type_mismatches.size() == 1);
  assert(issues.type_mismatches[0].field == "b");
  assert(issues.type_mismatches[0].kinds.count(Kind::UNKNOWN) == 1);
}

static void test_regex_violations() {
  InMemoryDocumentSource source;
  std::vector<std::string> codes = {"ABC", "XYZ", "ab1", "ABCD", "DEF"};
  for (size_t i = 0; i < codes.size(); i++) {
    source.Add(DocId(static_cast<int>(i)), json{{"status", Map(json{{"code", Str(codes[i])}})}});
  }
  // Non-string values are not checked
  source.Add("d5", json{{"status", Map(json{{"code", Int(42)}})}});

  auto options = IssuesOnly();
  options.regex_rules["status.code"] = RegexRule{"^[A-Z]{3}$", std::string("three capitals")};
  options.regex_rules["never.seen"] = RegexRule{"^x$", std::nullopt};

  auto result = RunProfile("orders", source, options);
  const auto& regex = result.issues->regex_violations;
  assert(regex.size() == 1);
  assert(regex[0].field == "status.code");
  assert(regex[0].pattern == "^[A-Z]{3}$");
  assert(regex[0].examples.size() == 2);
  assert(regex[0].examples[0].value == "ab1");
  assert(regex[0].examples[0].doc == "d2");
  assert(regex[0].examples[1].value == "ABCD");
  assert(regex[0].examples[1].doc == "d3");

  auto rendered = result.report["issues"]["regex_violations"][0];
  assert(rendered["note"] == "three capitals");
  assert(rendered["examples"][1]["value"] == "ABCD");
}

static void test_regex_search_semantics() {
  ObjectAggregate root;
  ProfileOptions options;
  options.regex_rules["email"] = RegexRule{"@", std::nullopt};
  IssueEvidenceCollector evidence(options);

  std::vector<std::string> values = {"a@b.c", "nope", "x@y"};
  for (size_t i = 0; i < values.size(); i++) {
    evidence.BeginDocument(DocId(static_cast<int>(i)));
    FoldObjectSample(root, json{{"email", Str(values[i])}}, &evidence);
  }
  const auto* field = evidence.Find("email");
  assert(field && field->regex_violations.size() == 1);
  assert(field->regex_violations[0].value == "nope");
}

static void test_regex_long_string_values() {
  ObjectAggregate root;
  ProfileOptions options;
  options.regex_rules["bio"] = RegexRule{"^[a-z]*$", std::nullopt};
  options.regex_rules["tag"] = RegexRule{"^(a|b)*$", std::nullopt};
  IssueEvidenceCollector evidence(options);

  std::string long_ok(200000, 'a');
  std::string long_bad = long_ok + "Z";
  evidence.BeginDocument("d0");
  FoldObjectSample(root, json{{"bio", Str(long_ok)}, {"tag", Str(long_ok)}}, &evidence);
  evidence.BeginDocument("d1");
  FoldObjectSample(root, json{{"bio", Str(long_bad)}, {"tag", Str(long_bad)}}, &evidence);

  const auto* bio = evidence.Find("bio");
  assert(bio && bio->regex_violations.size() == 1);
  assert(bio->regex_violations[0].doc == "d1");
  assert(bio->regex_violations[0].value.size() == 200001);
  const auto* tag = evidence.Find("tag");
  assert(tag && tag->regex_violations.size() == 1);
  assert(tag->regex_violations[0].doc == "d1");
}

static void test_field_name_variants() {
  InMemoryDocumentSource source;
  for (int i = 0; i < 42; i++) {
    source.Add(DocId(i), i < 40 ? json{{"firstName", Str("n")}} : json{{"first_name", Str("n")}});
  }

  auto result = RunProfile("people", source, IssuesOnly());
  const auto& issues = *result.issues;

  assert(issues.field_name_variants.size() == 1);
  const auto& group = issues.field_name_variants[0];
  assert(group.normalized == "firstname");
  assert(group.canonical == "firstName");
  assert(group.canonical_count == 40);
  assert(group.variants.size() == 1);
  assert(group.variants[0].field == "first_name");
  assert(group.variants[0].present_count == 2);

  // first_name is also rare, and firstName is expected but missing twice
  assert(issues.rare_fields.size() == 1);
  assert(issues.rare_fields[0].field == "first_name");
  assert(issues.rare_fields[0].example_doc_ids == std::vector<std::string>({"d40", "d41"}));
  assert(issues.missing_fields.size() == 1);
  assert(issues.missing_fields[0].field == "firstName");
  assert(issues.missing_fields[0].missing_count == 2);
  assert(issues.missing_fields[0].example_doc_ids == std::vector<std::string>({"d40", "d41"}));
  assert(result.passes == 2);

  assert(result.report["issues"]["rare_fields"][0]["present_fraction"] == RoundFraction(2.0 / 42.0));
  assert(result.report["summary"]["field_name_variant_issues"] == 1);
  assert(result.report["summary"]["docs_with_issues_examples_count"] == 2);

  auto disabled = IssuesOnly();
  disabled.check_field_name_variants = false;
  auto quiet = RunProfile("people", source, disabled);
  assert(quiet.issues->field_name_variants.empty());
  assert(!quiet.report["issues"].contains("field_name_variants"));
}

static void test_variant_canonical_tie_uses_path_order() {
  ObjectAggregate root;
  FoldObjectSample(root, json{{"user_id", Int(1)}});
  FoldObjectSample(root, json{{"userId", Int(1)}});
  ProfileOptions options;
  IssueEvidenceCollector evidence(options);
  auto issues = DetectIssues(root, evidence, {}, options);
  assert(issues.field_name_variants.size() == 1);
  // "userId" sorts before "user_id"
  assert(issues.field_name_variants[0].canonical == "userId");
}

static void test_missing_examples_bounded() {
  InMemoryDocumentSource source;
  for (int i = 0; i < 30; i++) {
    json fields = {{"id", Int(i)}};
    if (i >= 3) {
      fields["email"] = Str("x@y");
    }
    source.Add(DocId(i), fields);
  }

  auto options = IssuesOnly();
  options.examples_per_issue = 2;
  auto result = RunProfile("people", source, options);

  // 27 of 30 is exactly the 0.9 threshold
  const auto& missing = result.issues->missing_fields;
  assert(missing.size() == 1);
  assert(missing[0].field == "email");
  assert(missing[0].missing_count == 3);
  assert(missing[0].example_doc_ids == std::vector<std::string>({"d0", "d1"}));
  assert(result.report["issues"]["missing_fields"][0]["missing_fraction"] == 0.1);

  // Pass 2 stops once the two slots are filled
  auto expected = ExpectedFields(FlattenFields(result.aggregate), 30, 0.9);
  CountingSource counting(source);
  auto examples = CollectMissingExamples(counting, expected, 30, 2, std::nullopt);
  assert(examples.at("email").size() == 2);
  assert(counting.delivered == 2);
}

static void test_below_threshold_is_not_missing() {
  InMemoryDocumentSource source;
  for (int i = 0; i < 10; i++) {
    json fields = {{"id", Int(i)}};
    if (i >= 2) {
      fields["email"] = Str("x@y");
    }
    source.Add(DocId(i), fields);
  }
  auto result = RunProfile("people", source, IssuesOnly());
  assert(result.issues->missing_fields.empty());
  assert(result.issues->expected_fields_count == 1);
  // No deficit among expected fields: one pass only
  assert(result.passes == 1);
  assert(source.ScanCount() == 1);
}

static void test_nested_paths_and_arrays() {
  ObjectAggregate root;
  FoldObjectSample(root, json{{"address", Map(json{{"city", Str("x")}})},
                              {"tags", Arr(json::array({Map(json{{"label", Str("a")}})}))}});
  auto fields = FlattenFields(root);
  std::vector<std::string> names;
  for (const auto& field : fields) {
    names.push_back(field.field);
  }
  assert(names == std::vector<std::string>({"address", "address.city", "tags"}));

  json doc = {{"address", Map(json{{"city", Null()}})}};
  assert(DocumentHasField(doc, FieldPath{"address", "city"}));
  assert(!DocumentHasField(doc, FieldPath{"address", "zip"}));
  assert(!DocumentHasField(json{{"address", Str("flat")}}, FieldPath{"address", "city"}));
  assert(NormalizeFieldName("User_Profile.First_Name") == "userprofilefirstname");
}

static void test_dotted_key_shares_display_path() {
  InMemoryDocumentSource source;
  source.Add("d0", json{{"a.b", Str("x")}});
  source.Add("d1", json{{"a", Map(json{{"b", Int(1)}})}});
  source.Add("d2", json{{"a", Map(json{{"b", Str("y")}})}});
  source.Add("d3", json{{"other", Bool(true)}});

  ObjectAggregate root;
  source.Scan([&](const ProfileDocument& doc) {
    FoldObjectSample(root, doc.fields);
    return true;
  });
  auto fields = FlattenFields(root);
  assert(fields.size() == 3);
  assert(fields[1].field == "a.b");
  assert(fields[1].paths.size() == 2);
  assert(fields[1].aggregate->present_count == 3);

  auto options = IssuesOnly();
  options.required_threshold = 0.7;
  auto result = RunProfile("dotted", source, options);
  const auto& issues = *result.issues;

  assert(issues.field_name_variants.empty());
  assert(issues.fields_total == 3);
  assert(issues.type_mismatches.size() == 1);
  assert(issues.type_mismatches[0].field == "a.b");
  assert(issues.type_mismatches[0].kinds.at(Kind::STRING) == 2);
  assert(issues.type_mismatches[0].kinds.at(Kind::NUMBER) == 1);
  assert(issues.missing_fields.size() == 1);
  assert(issues.missing_fields[0].field == "a.b");
  assert(issues.missing_fields[0].missing_count == 1);
  // d0 holds the literal key, d1 the nested property
  assert(issues.missing_fields[0].example_doc_ids == std::vector<std::string>({"d3"}));
}

static void test_sample_limit() {
  InMemoryDocumentSource source;
  for (int i = 0; i < 10; i++) {
    source.Add(DocId(i), json{{"n", Int(i)}});
  }
  ProfileOptions options;
  options.sample_limit = 4;
  CountingSource counting(source);
  auto result = RunProfile("numbers", counting, options);
  assert(result.docs_scanned == 4);
  assert(result.aggregate.total_seen == 4);
  assert(counting.delivered == 4);
  assert(result.report["meta"]["sample_limit"] == 4);
  assert(result.report["meta"]["docs_total_seen"] == 4);

  ProfileOptions unlimited;
  auto full = RunProfile("numbers", source, unlimited);
  assert(full.report["meta"]["sample_limit"].is_null());
  assert(full.docs_scanned == 10);
}

static void test_sample_limit_bounds_second_pass() {
  // email is missing from d1, inside the first four documents, and from d6
  InMemoryDocumentSource source;
  for (int i = 0; i < 10; i++) {
    json fields = {{"n", Int(i)}};
    if (i != 1 && i != 6) {
      fields["email"] = Str("x@y");
    }
    source.Add(DocId(i), fields);
  }

  auto options = IssuesOnly();
  options.sample_limit = 4;
  options.required_threshold = 0.7;
  CountingSource counting(source);
  auto result = RunProfile("people", counting, options);

  assert(result.passes == 2);
  assert(source.ScanCount() == 2);
  // Four documents per pass, never more
  assert(counting.delivered == 8);
  const auto& missing = result.issues->missing_fields;
  assert(missing.size() == 1);
  assert(missing[0].field == "email");
  assert(missing[0].missing_count == 1);
  assert(missing[0].example_doc_ids == std::vector<std::string>({"d1"}));
}

static void test_subcollections() {
  InMemoryDocumentSource source;
  source.Add("u1", json{{"name", Str("a")}, {"age", Int(1)}});
  source.Add("u2", json{{"name", Str("b")}});
  source.Add("u3", json{{"name", Str("c")}});
  source.AddToSubcollection("u1", "orders", "o1", json{{"total", Int(5)}, {"note", Str("x")}});
  source.AddToSubcollection("u1", "orders", "o2", json{{"total", Dbl(2.5)}});
  source.AddToSubcollection("u2", "orders", "o3", json{{"total", Int(7)}});
  source.AddToSubcollection("u2", "tags", "t1", json{{"label", Str("vip")}});

  ProfileOptions options;
  options.include_issues = false;
  options.include_example = true;
  options.include_subcollections = true;
  auto result = RunProfile("users", source, options);

  assert(result.subcollections.size() == 2);
  const auto& orders = result.subcollections[0];
  assert(orders.id == "orders");
  assert(orders.collection == "users/{doc}/orders");
  assert(orders.parent_documents == 2);
  assert(orders.docs_scanned == 3);

  const auto& report = result.report;
  assert(report["meta"]["include_subcollections"] == true);
  const auto& order_schema = report["subcollections"]["orders"]["schema"];
  assert(order_schema["fields"]["total"]["type"] == "number");
  assert(order_schema["fields"]["total"]["required"] == true);
  assert(order_schema["fields"]["note"]["required"] == false);
  assert(report["subcollections"]["tags"]["parent_documents"] == 1);

  // u1 is the widest document; only its own subcollections appear, one document each
  const auto& example = report["example"];
  assert(example["document_id"] == "u1");
  assert(example["subcollections"].size() == 1);
  assert(example["subcollections"]["orders"] == json::array({json{{"note", "x"}, {"total", 5}}}));

  // The main collection is still read once
  assert(source.ScanCount() == 1);

  ProfileOptions plain;
  plain.include_issues = false;
  auto without = RunProfile("users", source, plain);
  assert(without.subcollections.empty());
  assert(!without.report.contains("subcollections"));
  assert(without.report["meta"]["include_subcollections"] == false);
}

static void test_subcollections_sample_limit() {
  InMemoryDocumentSource source;
  source.Add("p1", json{{"x", Int(1)}});
  source.Add("p2", json{{"x", Int(2)}});
  for (int i = 0; i < 5; i++) {
    source.AddToSubcollection("p1", "items", DocId(i), json{{"n", Int(i)}});
    source.AddToSubcollection("p2", "items", DocId(i), json{{"n", Int(i)}});
  }

  ProfileOptions options;
  options.include_issues = false;
  options.include_subcollections = true;
  options.sample_limit = 2;
  auto result = RunProfile("parents", source, options);
  // Two parents, each subcollection read up to the limit
  assert(result.subcollections.size() == 1);
  assert(result.subcollections[0].docs_scanned == 4);
}

// ----------------------------------------------------------------------------
// Report
// ----------------------------------------------------------------------------

static void test_report_layout() {
  InMemoryDocumentSource source;
  source.Add("small", json{{"name", Str("a")}});
  source.Add("wide", json{{"name", Str("b")},
                          {"age", Int(36)},
                          {"seen", json{{"timestampValue", "2024-01-02T03:04:05Z"}}},
                          {"where", json{{"geoPointValue", json{{"latitude", 1.5}, {"longitude", 2.5}}}}},
                          {"tags", Arr(json::array({Str("x"), Null()}))},
                          {"meta", Map(json{{"ok", Bool(true)}})}});

  ProfileOptions options;
  options.include_example = true;
  auto result = RunProfile("people", source, options);
  const auto& report = result.report;

  assert(report["collection"] == "people");
  assert(report["meta"]["docs_scanned"] == 2);
  assert(report["meta"]["required_threshold"] == 0.9);
  assert(report["meta"]["examples_per_issue"] == 20);
  assert(report["meta"]["check_field_name_variants"] == true);
  assert(report.contains("schema"));
  assert(report.contains("summary"));
  assert(report.contains("issues"));
  assert(report["summary"]["fields_total"] == 7);
  assert(report["summary"]["expected_fields_count"] == 1);

  const auto& example = report["example"];
  assert(example["document_id"] == "wide");
  assert(example["document"]["age"] == 36);
  assert(example["document"]["seen"] == "2024-01-02T03:04:05Z");
  assert(example["document"]["where"]["latitude"] == 1.5);
  assert(example["document"]["tags"] == json::array({"x", nullptr}));
  assert(example["document"]["meta"]["ok"] == true);

  ProfileOptions schema_only;
  schema_only.include_issues = false;
  auto schema_result = RunProfile("people", source, schema_only);
  assert(schema_result.report.contains("schema"));
  assert(!schema_result.report.contains("issues"));
  assert(!schema_result.report.contains("summary"));
  assert(!schema_result.issues);
  assert(schema_result.passes == 1);
}

static void test_example_with_malformed_values() {
  InMemoryDocumentSource source;
  source.Add("bad_point", json{{"where", json{{"geoPointValue", "oops"}}},
                               {"at", json{{"geoPointValue", json{{"latitude", "12.5"}, {"longitude", 3}}}}},
                               {"north", json{{"geoPointValue", json{{"latitude", 45}}}}},
                               {"name", Str("a")}});

  ProfileOptions options;
  options.include_example = true;
  auto result = RunProfile("places", source, options);
  const auto& document = result.report["example"]["document"];
  assert(document["where"] == json({{"geoPointValue", "oops"}}).dump());
  assert(document["at"].is_string());
  assert(document["north"]["latitude"] == 45);
  assert(document["north"]["longitude"] == 0.0);
  assert(document["name"] == "a");
}

static void test_lint_rows() {
  InMemoryDocumentSource source;
  for (int i = 0; i < 42; i++) {
    source.Add(DocId(i), i < 40 ? json{{"firstName", Str("n")}} : json{{"first_name", Str("n")}});
  }
  auto result = RunProfile("people", source, IssuesOnly());
  auto rows = FlattenIssues(*result.issues);

  assert(rows.size() == 3);
  assert(rows[0].issue_type == "missing_field");
  assert(rows[0].field == "firstName");
  assert(rows[0].count == 2);
  assert(rows[1].issue_type == "rare_field");
  assert(rows[1].fraction && *rows[1].fraction == RoundFraction(2.0 / 42.0));
  assert(rows[2].issue_type == "field_name_variant");
  assert(rows[2].field == "firstName");
  assert(rows[2].count == 40);
  assert(!rows[2].fraction);
  assert(rows[2].details["variants"][0]["field"] == "first_name");
}

static void test_round_fraction() {
  assert(RoundFraction(1.0 / 3.0) == 0.3333);
  assert(RoundFraction(0.0) == 0.0);
  assert(RoundFraction(1.0) == 1.0);
}

// ----------------------------------------------------------------------------
// Sources
// ----------------------------------------------------------------------------

static std::string DataPath(const std::string& name) {
  return std::string(FIRE_PROFILE_TEST_DATA_DIR) + "/" + name;
}

static void test_jsonl_source() {
  JsonLinesDocumentSource source(DataPath("users.jsonl"));
  std::vector<std::string> ids;
  auto delivered = source.Scan([&](const ProfileDocument& doc) {
    ids.push_back(doc.id);
    if (doc.id == "u3") {
      assert(doc.fields.is_object() && doc.fields.empty());
    }
    return true;
  });
  assert(delivered == 3);
  assert(ids == std::vector<std::string>({"u1", "u2", "u3"}));

  // Re-enumerable, and stops when asked
  ids.clear();
  delivered = source.Scan([&](const ProfileDocument& doc) {
    ids.push_back(doc.id);
    return false;
  });
  assert(delivered == 1);
  assert(ids == std::vector<std::string>({"u1"}));

  auto result = RunProfile("users", source, ProfileOptions());
  assert(result.docs_scanned == 3);
  assert(result.report["schema"]["fields"]["firstName"]["required"] == false);
}

static void test_jsonl_source_errors() {
  JsonLinesDocumentSource malformed(DataPath("malformed.jsonl"));
  try {
    malformed.Scan([](const ProfileDocument&) { return true; });
    assert(false && "expected ProfileSourceError");
  } catch (const ProfileSourceError& e) {
    assert(e.code() == ProfileErrorCode::SOURCE_PARSE_FAILED);
    assert(e.context().line && *e.context().line == 2);
    assert(e.context().source_path && *e.context().source_path == DataPath("malformed.jsonl"));
  }

  JsonLinesDocumentSource missing(DataPath("does_not_exist.jsonl"));
  try {
    RunProfile("users", missing, ProfileOptions());
    assert(false && "expected ProfileSourceError");
  } catch (const ProfileSourceError& e) {
    assert(e.code() == ProfileErrorCode::SOURCE_OPEN_FAILED);
    assert(IsSourceError(e.code()));
  }

  JsonLinesDocumentSource bad_fields(DataPath("bad_fields.jsonl"));
  try {
    bad_fields.Scan([](const ProfileDocument&) { return true; });
    assert(false && "expected ProfileSourceError");
  } catch (const ProfileSourceError& e) {
    assert(e.code() == ProfileErrorCode::SOURCE_DOCUMENT_INVALID);
    assert(e.context().line && *e.context().line == 2);
    assert(e.context().document_id && *e.context().document_id == "u9");
    assert(std::string(e.what()).find("document_id=u9") != std::string::npos);
  }

  try {
    ParseRestDocument(json{{"fields", json::object()}});
    assert(false && "expected ProfileSourceError");
  } catch (const ProfileSourceError& e) {
    assert(e.code() == ProfileErrorCode::SOURCE_DOCUMENT_INVALID);
  }

  auto doc = ParseRestDocument(json{{"name", "projects/p/databases/(default)/documents/users/abc"}});
  assert(doc.id == "abc");
  assert(ExtractDocumentId("plain") == "plain");
}

static void test_sources_without_subcollections() {
  JsonLinesDocumentSource jsonl(DataPath("users.jsonl"));
  ProfileDocument parent{"u1", json::object(), "users/u1"};
  assert(jsonl.ListSubcollections(parent).empty());
  try {
    jsonl.OpenSubcollection(parent, "orders");
    assert(false && "expected ProfileSourceError");
  } catch (const ProfileSourceError& e) {
    assert(e.code() == ProfileErrorCode::SOURCE_NO_SUBCOLLECTIONS);
  }

  auto doc = ParseRestDocument(json{{"name", "projects/p/databases/(default)/documents/users/u1/orders/o7"}});
  assert(doc.id == "o7");
  assert(doc.path == "users/u1/orders/o7");
  assert(ParseRestDocument(json{{"id", "plain"}}).path.empty());

  ProfileOptions bad;
  bad.examples_per_subcollection = 0;
  try {
    bad.Validate();
    assert(false && "expected ProfileConfigError");
  } catch (const ProfileConfigError& e) {
    assert(e.code() == ProfileErrorCode::CONFIG_INVALID_EXAMPLES);
    assert(*e.context().option == "examples_per_subcollection");
  }
}

// ----------------------------------------------------------------------------
// Options
// ----------------------------------------------------------------------------

static void expect_config_error(const ProfileOptions& options, ProfileErrorCode code, const std::string& option) {
  try {
    options.Validate();
    assert(false && "expected ProfileConfigError");
  } catch (const ProfileConfigError& e) {
    assert(e.code() == code);
    assert(IsConfigError(e.code()));
    assert(e.context().option && *e.context().option == option);
  }
}

static void test_options_validation() {
  ProfileOptions defaults;
  defaults.Validate();
  assert(defaults.required_threshold == 0.9);
  assert(defaults.rare_field_max_fraction == 0.05);
  assert(defaults.examples_per_issue == 20);
  assert(defaults.check_field_name_variants);
  assert(!defaults.sample_limit);

  ProfileOptions all_required;
  all_required.required_threshold = 1.0;
  all_required.Validate();

  ProfileOptions o;
  o.required_threshold = 0.0;
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_THRESHOLD, "required_threshold");
  o = ProfileOptions();
  o.required_threshold = 1.5;
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_THRESHOLD, "required_threshold");

  o = ProfileOptions();
  o.rare_field_max_fraction = 1.0;
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_RARE_FRACTION, "rare_field_max_fraction");

  o = ProfileOptions();
  o.required_threshold = 0.4;
  o.rare_field_max_fraction = 0.5;
  expect_config_error(o, ProfileErrorCode::CONFIG_CONFLICTING_OPTIONS, "rare_field_max_fraction");

  o = ProfileOptions();
  o.examples_per_issue = 0;
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_EXAMPLES, "examples_per_issue");

  o = ProfileOptions();
  o.sample_limit = 0;
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_SAMPLE_LIMIT, "sample_limit");

  o = ProfileOptions();
  o.regex_rules["name"] = RegexRule{"([", std::nullopt};
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_REGEX, "regex_rules");

  o = ProfileOptions();
  o.regex_rules[""] = RegexRule{"x", std::nullopt};
  expect_config_error(o, ProfileErrorCode::CONFIG_INVALID_RULE_PATH, "regex_rules");

  o = ProfileOptions();
  o.include_schema = false;
  o.include_issues = false;
  expect_config_error(o, ProfileErrorCode::CONFIG_CONFLICTING_OPTIONS, "include_schema");
}

static void test_regex_rules_with_notes() {
  auto rules = BuildRegexRules({{"email", "@"}, {"code", "^[A-Z]{3}$"}}, {{"code", "three capitals"}});
  assert(rules.size() == 2);
  assert(rules.at("email").pattern == "@");
  assert(!rules.at("email").note);
  assert(rules.at("code").note && *rules.at("code").note == "three capitals");

  try {
    BuildRegexRules({{"email", "@"}}, {{"phone", "digits only"}});
    assert(false && "expected ProfileConfigError");
  } catch (const ProfileConfigError& e) {
    assert(e.code() == ProfileErrorCode::CONFIG_INVALID_RULE_PATH);
    assert(e.context().option && *e.context().option == "regex_notes");
  }
}

static void test_config_errors_precede_reading() {
  InMemoryDocumentSource source;
  source.Add("a", json{{"x", Int(1)}});

  ProfileOptions bad;
  bad.examples_per_issue = 0;
  try {
    RunProfile("things", source, bad);
    assert(false && "expected ProfileConfigError");
  } catch (const ProfileConfigError& e) {
    assert(e.code() == ProfileErrorCode::CONFIG_INVALID_EXAMPLES);
  }

  try {
    RunProfile("", source, ProfileOptions());
    assert(false && "expected ProfileConfigError");
  } catch (const ProfileConfigError& e) {
    assert(e.code() == ProfileErrorCode::CONFIG_MISSING_COLLECTION);
  }
  assert(source.ScanCount() == 0);
}

// ----------------------------------------------------------------------------
// Ambient
// ----------------------------------------------------------------------------

static void test_error_formatting() {
  assert(FormatErrorCode(ProfileErrorCode::CONFIG_INVALID_THRESHOLD) == "FP_06030001");
  assert(GetErrorCategory(ProfileErrorCode::SOURCE_PARSE_FAILED) == 0x07);
  assert(IsNetworkError(ProfileErrorCode::NETWORK_REQUEST_FAILED));
  assert(!IsConfigError(ProfileErrorCode::SOURCE_OPEN_FAILED));

  ProfileConfigError e(ProfileErrorCode::CONFIG_INVALID_THRESHOLD, "bad threshold",
                       ProfileErrorContext().withOperation("validate").withOption("required_threshold"));
  assert(std::string(e.what()) ==
         "[FP_06030001] bad threshold {operation=validate, option=required_threshold}");
  assert(e.message() == "bad threshold");
  assert(e.has_context());

  ProfileError plain(ProfileErrorCode::INTERNAL_UNEXPECTED, "oops");
  assert(std::string(plain.what()) == "[FP_FF000001] oops");

  auto body = ProfileErrorContext().withResponseBody(std::string(2000, 'x'));
  assert(body.response_body->size() == 1024);
}

static void test_logger_callback_sink() {
  assert(ParseLogLevel("warn") == ProfileLogLevel::WARN);
  assert(ParseLogLevel("ERROR") == ProfileLogLevel::ERR);
  assert(ParseLogLevel("bogus") == ProfileLogLevel::NONE);

  auto& logger = ProfileLogger::Instance();
  std::vector<ProfileLogEntry> entries;
  logger.SetSink([&](const ProfileLogEntry& entry) { entries.push_back(entry); });
  logger.SetLogLevel(ProfileLogLevel::INFO);
  assert(logger.ShouldLog(ProfileLogLevel::WARN));
  assert(!logger.ShouldLog(ProfileLogLevel::DEBUG));

  InMemoryDocumentSource source;
  source.Add("a", json{{"x", Int(1)}});
  RunProfile("logged", source, ProfileOptions());

  bool saw_start = false;
  for (const auto& entry : entries) {
    assert(entry.level >= ProfileLogLevel::INFO);
    if (entry.message.find("Profiling logged") != std::string::npos) {
      saw_start = true;
      assert(std::string(entry.file) == "profile_runner.cpp");
    }
  }
  assert(saw_start);

  logger.ResetToDefault();
  assert(logger.GetLogLevel() == ProfileLogLevel::NONE);
  size_t before = entries.size();
  FP_LOG_ERROR("dropped");
  assert(entries.size() == before);
}

static void test_logger_level_from_environment() {
  auto& logger = ProfileLogger::Instance();
  logger.ResetToDefault();

  unsetenv("FIRE_PROFILE_TEST_LOG_LEVEL");
  logger.ConfigureFromEnvironment("FIRE_PROFILE_TEST_LOG_LEVEL");
  assert(logger.GetLogLevel() == ProfileLogLevel::NONE);

  std::vector<std::string> messages;
  logger.SetSink([&](const ProfileLogEntry& entry) { messages.push_back(entry.message); });
  setenv("FIRE_PROFILE_TEST_LOG_LEVEL", "Warning", 1);
  logger.ConfigureFromEnvironment("FIRE_PROFILE_TEST_LOG_LEVEL");
  assert(logger.GetLogLevel() == ProfileLogLevel::WARN);
  FP_LOG_INFO("below the level");
  FP_LOG_WARN("kept");
  assert(messages == std::vector<std::string>({"kept"}));

  unsetenv("FIRE_PROFILE_TEST_LOG_LEVEL");
  logger.ResetToDefault();
}

int main() {
  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("classify_value", test_classify_value);
    run("kind_names", test_kind_names);
    run("fold_counts", test_fold_counts);
    run("fold_document_twice_counts_twice", test_fold_document_twice_counts_twice);
    run("integer_tracking", test_integer_tracking);
    run("merge_monoid", test_merge_monoid);
    run("map_heuristic", test_map_heuristic);
    run("summary_types", test_summary_types);
    run("geopoint_union_member_name", test_geopoint_union_member_name);
    run("summary_deterministic", test_summary_deterministic);
    run("type_mismatch_age", test_type_mismatch_age);
    run("null_is_not_a_mismatch_but_unknown_is", test_null_is_not_a_mismatch_but_unknown_is);
    run("regex_violations", test_regex_violations);
    run("regex_search_semantics", test_regex_search_semantics);
    run("regex_long_string_values", test_regex_long_string_values);
    run("field_name_variants", test_field_name_variants);
    run("variant_canonical_tie_uses_path_order", test_variant_canonical_tie_uses_path_order);
    run("missing_examples_bounded", test_missing_examples_bounded);
    run("below_threshold_is_not_missing", test_below_threshold_is_not_missing);
    run("nested_paths_and_arrays", test_nested_paths_and_arrays);
    run("dotted_key_shares_display_path", test_dotted_key_shares_display_path);
    run("sample_limit", test_sample_limit);
    run("sample_limit_bounds_second_pass", test_sample_limit_bounds_second_pass);
    run("subcollections", test_subcollections);
    run("subcollections_sample_limit", test_subcollections_sample_limit);
    run("sources_without_subcollections", test_sources_without_subcollections);
    run("report_layout", test_report_layout);
    run("example_with_malformed_values", test_example_with_malformed_values);
    run("lint_rows", test_lint_rows);
    run("round_fraction", test_round_fraction);
    run("jsonl_source", test_jsonl_source);
    run("jsonl_source_errors", test_jsonl_source_errors);
    run("options_validation", test_options_validation);
    run("regex_rules_with_notes", test_regex_rules_with_notes);
    run("config_errors_precede_reading", test_config_errors_precede_reading);
    run("error_formatting", test_error_formatting);
    run("logger_callback_sink", test_logger_callback_sink);
    run("logger_level_from_environment", test_logger_level_from_environment);
  } catch (...) {
    return 1;
  }

  std::cout << "All tests passed.\n";
  return 0;
}
