#pragma once

#include "duckdb/common/types/value.hpp"
#include "duckdb/main/client_config.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

struct ProfileSettings {
	// Page size of REST listings (Firestore caps pageSize at 1000)
	static constexpr int64_t kDefaultBatchSize = 500;
	static constexpr int64_t kMaxBatchSize = 1000;
	static constexpr const char *kBatchSizeOption = "fire_profile_batch_size";

	static int64_t BatchSize(const ClientContext &context) {
		auto &client_config = ClientConfig::GetConfig(context);
		auto client_it = client_config.set_variables.find(kBatchSizeOption);
		if (client_it != client_config.set_variables.end()) {
			return ClampBatchSize(BigIntValue::Get(client_it->second));
		}
		auto &db_config = DBConfig::GetConfig(context);
		auto db_it = db_config.options.set_variables.find(kBatchSizeOption);
		if (db_it != db_config.options.set_variables.end()) {
			return ClampBatchSize(BigIntValue::Get(db_it->second));
		}
		return kDefaultBatchSize;
	}

	static void SetBatchSize(ClientContext &context, SetScope scope, Value &parameter) {
		parameter = Value::BIGINT(ClampBatchSize(BigIntValue::Get(parameter)));
	}

	static int64_t ClampBatchSize(int64_t size) {
		if (size < 1) {
			return 1;
		}
		return size > kMaxBatchSize ? kMaxBatchSize : size;
	}
};

} // namespace duckdb
