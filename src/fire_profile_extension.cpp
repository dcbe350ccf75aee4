#define DUCKDB_EXTENSION_MAIN

#include "fire_profile_extension.hpp"
#include "profile_functions.hpp"
#include "profile_settings.hpp"
#include "profile_logger.hpp"
#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/function/table_function.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	ProfileLogger::Instance().ConfigureFromEnvironment("FIRE_PROFILE_LOG_LEVEL");

	auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
	config.AddExtensionOption(ProfileSettings::kBatchSizeOption, "Page size of Firestore REST listings (1 to 1000)",
	                          LogicalType::BIGINT, Value::BIGINT(ProfileSettings::kDefaultBatchSize),
	                          ProfileSettings::SetBatchSize);

	// firestore_profile, firestore_infer_schema, firestore_lint
	RegisterProfileFunctions(loader);

	FP_LOG_DEBUG("fire_profile extension loaded");
}

void FireProfileExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string FireProfileExtension::Name() {
	return "fire_profile";
}

std::string FireProfileExtension::Version() const {
#ifdef EXT_VERSION_FIRE_PROFILE
	return EXT_VERSION_FIRE_PROFILE;
#else
	return "v0.1.0";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(fire_profile, loader) {
	duckdb::LoadInternal(loader);
}
}
