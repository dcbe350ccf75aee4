#include "profile_functions.hpp"
#include "profile_settings.hpp"
#include "firestore_client.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

// Rethrow a run failure as the DuckDB exception users expect: bad options
// are input errors, everything that went wrong reading documents is I/O
[[noreturn]] static void RethrowAsDuckDB(const ProfileError &e) {
	if (IsConfigError(e.code())) {
		throw InvalidInputException(e.what());
	}
	throw IOException(e.what());
}

// MAP(VARCHAR, VARCHAR) named parameter as path -> text
static std::map<std::string, std::string> ParseStringMap(const std::string &name, const Value &value) {
	std::map<std::string, std::string> result;
	for (auto &entry : MapValue::GetChildren(value)) {
		auto &kv = StructValue::GetChildren(entry);
		if (kv[0].IsNull() || kv[1].IsNull()) {
			throw InvalidInputException("%s keys and values cannot be NULL", name);
		}
		result[kv[0].GetValue<string>()] = kv[1].GetValue<string>();
	}
	return result;
}

static unique_ptr<FunctionData> ProfileBindInternal(ClientContext &context, TableFunctionBindInput &input,
                                                   ProfileFunctionMode mode, vector<LogicalType> &return_types,
                                                   vector<string> &names) {
	auto result = make_uniq<ProfileBindData>();
	result->mode = mode;
	result->collection = input.inputs[0].GetValue<string>();
	result->batch_size = ProfileSettings::BatchSize(context);

	auto &options = result->options;
	options.include_schema = mode != ProfileFunctionMode::LINT;
	options.include_issues = mode != ProfileFunctionMode::INFER_SCHEMA;
	std::map<std::string, std::string> regex_patterns;
	std::map<std::string, std::string> regex_notes;

	for (auto &kv : input.named_parameters) {
		if (kv.second.IsNull()) {
			continue;
		}
		if (kv.first == "export_path") {
			result->export_path = kv.second.GetValue<string>();
		} else if (kv.first == "project_id") {
			result->project_id = kv.second.GetValue<string>();
		} else if (kv.first == "database") {
			result->database = kv.second.GetValue<string>();
		} else if (kv.first == "api_key") {
			result->api_key = kv.second.GetValue<string>();
		} else if (kv.first == "access_token") {
			result->access_token = kv.second.GetValue<string>();
		} else if (kv.first == "sample_limit") {
			options.sample_limit = kv.second.GetValue<int64_t>();
		} else if (kv.first == "required_threshold") {
			options.required_threshold = kv.second.GetValue<double>();
		} else if (kv.first == "rare_field_max_fraction") {
			options.rare_field_max_fraction = kv.second.GetValue<double>();
		} else if (kv.first == "examples_per_issue") {
			options.examples_per_issue = kv.second.GetValue<int64_t>();
		} else if (kv.first == "regex_rules") {
			regex_patterns = ParseStringMap(kv.first, kv.second);
		} else if (kv.first == "regex_notes") {
			regex_notes = ParseStringMap(kv.first, kv.second);
		} else if (kv.first == "check_field_name_variants") {
			options.check_field_name_variants = kv.second.GetValue<bool>();
		} else if (kv.first == "include_example") {
			options.include_example = kv.second.GetValue<bool>();
		} else if (kv.first == "include_subcollections") {
			options.include_subcollections = kv.second.GetValue<bool>();
		} else if (kv.first == "examples_per_subcollection") {
			options.examples_per_subcollection = kv.second.GetValue<int64_t>();
		}
	}

	// Lint rows carry no schema, so nested collections would be read for nothing
	if (mode == ProfileFunctionMode::LINT) {
		options.include_subcollections = false;
	}
	if (result->collection.empty()) {
		throw InvalidInputException("Collection path cannot be empty");
	}
	try {
		options.regex_rules = BuildRegexRules(regex_patterns, regex_notes);
		options.Validate();
	} catch (const ProfileError &e) {
		RethrowAsDuckDB(e);
	}

	if (mode == ProfileFunctionMode::LINT) {
		names = {"issue_type", "field", "count", "fraction", "details"};
		return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::BIGINT, LogicalType::DOUBLE,
		                LogicalType::VARCHAR};
	} else {
		names = {"collection", "docs_scanned", "report"};
		return_types = {LogicalType::VARCHAR, LogicalType::BIGINT, LogicalType::VARCHAR};
	}
	return std::move(result);
}

static unique_ptr<FunctionData> ProfileBind(ClientContext &context, TableFunctionBindInput &input,
                                           vector<LogicalType> &return_types, vector<string> &names) {
	return ProfileBindInternal(context, input, ProfileFunctionMode::PROFILE, return_types, names);
}

static unique_ptr<FunctionData> InferSchemaBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
	return ProfileBindInternal(context, input, ProfileFunctionMode::INFER_SCHEMA, return_types, names);
}

static unique_ptr<FunctionData> LintBind(ClientContext &context, TableFunctionBindInput &input,
                                        vector<LogicalType> &return_types, vector<string> &names) {
	return ProfileBindInternal(context, input, ProfileFunctionMode::LINT, return_types, names);
}

static std::unique_ptr<ProfileDocumentSource> MakeSource(const ProfileBindData &bind_data) {
	if (bind_data.export_path) {
		return std::make_unique<JsonLinesDocumentSource>(*bind_data.export_path);
	}
	auto credentials = ResolveFirestoreCredentials(bind_data.project_id, bind_data.database, bind_data.api_key,
	                                               bind_data.access_token);
	auto client = std::make_shared<FirestoreClient>(std::move(credentials));
	return std::make_unique<FirestoreCollectionSource>(std::move(client), bind_data.collection,
	                                                   bind_data.batch_size);
}

static unique_ptr<GlobalTableFunctionState> ProfileInitGlobal(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<ProfileBindData>();
	auto state = make_uniq<ProfileGlobalState>();

	try {
		auto source = MakeSource(bind_data);
		state->result = RunProfile(bind_data.collection, *source, bind_data.options);
	} catch (const ProfileError &e) {
		FP_LOG_ERROR(std::string("Profile of ") + bind_data.collection + " failed: " + e.what());
		RethrowAsDuckDB(e);
	}

	if (bind_data.mode == ProfileFunctionMode::LINT && state->result.issues) {
		state->lint_rows = FlattenIssues(*state->result.issues);
	}
	return std::move(state);
}

static void ProfileFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &bind_data = data.bind_data->Cast<ProfileBindData>();
	auto &state = data.global_state->Cast<ProfileGlobalState>();
	if (state.finished) {
		output.SetCardinality(0);
		return;
	}

	if (bind_data.mode != ProfileFunctionMode::LINT) {
		output.SetValue(0, 0, Value(state.result.collection));
		output.SetValue(1, 0, Value::BIGINT(state.result.docs_scanned));
		output.SetValue(2, 0, Value(state.result.report.dump()));
		output.SetCardinality(1);
		state.finished = true;
		return;
	}

	idx_t count = 0;
	while (state.current_index < state.lint_rows.size() && count < STANDARD_VECTOR_SIZE) {
		auto &row = state.lint_rows[state.current_index];
		output.SetValue(0, count, Value(row.issue_type));
		output.SetValue(1, count, Value(row.field));
		output.SetValue(2, count, Value::BIGINT(row.count));
		output.SetValue(3, count, row.fraction ? Value::DOUBLE(*row.fraction) : Value(LogicalType::DOUBLE));
		output.SetValue(4, count, Value(row.details.dump()));
		state.current_index++;
		count++;
	}
	output.SetCardinality(count);
	if (state.current_index >= state.lint_rows.size()) {
		state.finished = true;
	}
}

static void AddNamedParameters(TableFunction &func) {
	func.named_parameters["export_path"] = LogicalType::VARCHAR;
	func.named_parameters["project_id"] = LogicalType::VARCHAR;
	func.named_parameters["database"] = LogicalType::VARCHAR;
	func.named_parameters["api_key"] = LogicalType::VARCHAR;
	func.named_parameters["access_token"] = LogicalType::VARCHAR;
	func.named_parameters["sample_limit"] = LogicalType::BIGINT;
	func.named_parameters["required_threshold"] = LogicalType::DOUBLE;
	func.named_parameters["rare_field_max_fraction"] = LogicalType::DOUBLE;
	func.named_parameters["examples_per_issue"] = LogicalType::BIGINT;
	func.named_parameters["regex_rules"] = LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR);
	func.named_parameters["regex_notes"] = LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR);
	func.named_parameters["check_field_name_variants"] = LogicalType::BOOLEAN;
	func.named_parameters["include_example"] = LogicalType::BOOLEAN;
	func.named_parameters["include_subcollections"] = LogicalType::BOOLEAN;
	func.named_parameters["examples_per_subcollection"] = LogicalType::BIGINT;
}

void RegisterProfileFunctions(ExtensionLoader &loader) {
	// firestore_profile('users', export_path := 'users.jsonl')
	TableFunction profile_func("firestore_profile", {LogicalType::VARCHAR}, ProfileFunction, ProfileBind,
	                           ProfileInitGlobal);
	AddNamedParameters(profile_func);
	loader.RegisterFunction(profile_func);

	TableFunction schema_func("firestore_infer_schema", {LogicalType::VARCHAR}, ProfileFunction, InferSchemaBind,
	                          ProfileInitGlobal);
	AddNamedParameters(schema_func);
	loader.RegisterFunction(schema_func);

	TableFunction lint_func("firestore_lint", {LogicalType::VARCHAR}, ProfileFunction, LintBind, ProfileInitGlobal);
	AddNamedParameters(lint_func);
	loader.RegisterFunction(lint_func);
}

} // namespace duckdb
