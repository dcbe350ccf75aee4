#pragma once

#include "profile_error.hpp"
#include "profile_logger.hpp"
#include "profile_source.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <optional>
#include <memory>

namespace duckdb {

using json = nlohmann::json;

// How a request authenticates: API key in the query string, or an OAuth2
// bearer token. The emulator accepts unauthenticated requests
enum class FirestoreAuthType { API_KEY, ACCESS_TOKEN, NONE };

struct FirestoreCredentials {
	FirestoreAuthType type = FirestoreAuthType::NONE;
	std::string project_id;
	std::string database_id = "(default)";
	std::string api_key;
	std::string access_token;

	std::string GetAuthHeader() const;
	std::string GetUrlSuffix() const;
};

// Resolve credentials from explicit values, falling back to
// GOOGLE_CLOUD_PROJECT, FIRESTORE_API_KEY and FIRESTORE_ACCESS_TOKEN.
// Without FIRESTORE_EMULATOR_HOST an API key or access token is required
std::shared_ptr<FirestoreCredentials> ResolveFirestoreCredentials(const std::optional<std::string> &project_id,
                                                                  const std::optional<std::string> &database,
                                                                  const std::optional<std::string> &api_key,
                                                                  const std::optional<std::string> &access_token);

// One page of a listing
struct FirestoreListResponse {
	std::vector<ProfileDocument> documents;
	std::string next_page_token;
};

class FirestoreClient {
public:
	explicit FirestoreClient(std::shared_ptr<FirestoreCredentials> credentials);

	// GET .../documents/{collection}?pageSize=&pageToken=&orderBy=__name__
	FirestoreListResponse ListDocuments(const std::string &collection, int64_t page_size,
	                                    const std::string &page_token = "");

	// Collection group page: all collections named collection_id, ordered by
	// __name__, starting after the document named start_after
	FirestoreListResponse CollectionGroupPage(const std::string &collection_id, int64_t page_size,
	                                          const std::string &start_after = "");

	// POST .../documents/{document_path}:listCollectionIds, every page, sorted
	std::vector<std::string> ListCollectionIds(const std::string &document_path, int64_t page_size);

	const std::string &GetProjectId() const {
		return credentials_->project_id;
	}

	// Documents endpoint root, emulator-aware
	std::string BuildBaseUrl() const;

	// Full URL for a path under the documents endpoint, with the auth suffix
	std::string BuildUrl(const std::string &path) const;

private:
	std::shared_ptr<FirestoreCredentials> credentials_;

	json MakeRequest(const std::string &method, const std::string &url, const json &body = {},
	                 const ProfileErrorContext &ctx = {});

	void HandleError(int status_code, const json &response, const ProfileErrorContext &ctx);
};

// Pages through a Firestore collection. A collection path starting with '~'
// is a collection group ("~orders" scans every "orders" subcollection)
class FirestoreCollectionSource : public ProfileDocumentSource {
public:
	FirestoreCollectionSource(std::shared_ptr<FirestoreClient> client, std::string collection, int64_t page_size);

	int64_t Scan(const DocumentCallback &callback) override;
	std::string Describe() const override;
	std::vector<std::string> ListSubcollections(const ProfileDocument &parent) override;
	std::unique_ptr<ProfileDocumentSource> OpenSubcollection(const ProfileDocument &parent,
	                                                         const std::string &subcollection_id) override;

private:
	// parent's path under the documents root
	std::string DocumentPath(const ProfileDocument &parent) const;

	std::shared_ptr<FirestoreClient> client_;
	std::string collection_;
	int64_t page_size_;
};

} // namespace duckdb
