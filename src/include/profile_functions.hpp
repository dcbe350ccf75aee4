#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "profile_runner.hpp"

namespace duckdb {

class ExtensionLoader;

// What a profiling table function produces
enum class ProfileFunctionMode { PROFILE, INFER_SCHEMA, LINT };

// Bind data - stores parameters from SQL call
struct ProfileBindData : public TableFunctionData {
	ProfileFunctionMode mode = ProfileFunctionMode::PROFILE;
	std::string collection;
	ProfileOptions options;

	// Exactly one source: an export file, or Firestore REST
	std::optional<std::string> export_path;
	std::optional<std::string> project_id;
	std::optional<std::string> database;
	std::optional<std::string> api_key;
	std::optional<std::string> access_token;
	int64_t batch_size = 500;
};

// The whole run happens in InitGlobal; Function emits the buffered rows
struct ProfileGlobalState : public GlobalTableFunctionState {
	ProfileResult result;
	std::vector<LintRow> lint_rows;
	idx_t current_index = 0;
	bool finished = false;

	idx_t MaxThreads() const override {
		return 1;
	}
};

// Register firestore_profile, firestore_infer_schema and firestore_lint
void RegisterProfileFunctions(ExtensionLoader &loader);

} // namespace duckdb
