#include "firestore_client.hpp"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"
#include <algorithm>
#include <cstdlib>
#include <chrono>

namespace duckdb {

// Firestore REST API base URL template (project_id, database_id)
static const char* FIRESTORE_BASE_URL = "https://firestore.googleapis.com/v1/projects/%s/databases/%s/documents";
static const char* FIRESTORE_EMULATOR_URL = "http://%s/v1/projects/%s/databases/%s/documents";

static std::string GetEnv(const char *name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
}

static std::string GetEmulatorHost() {
    return GetEnv("FIRESTORE_EMULATOR_HOST");
}

// Split a URL into scheme+host and path
static bool ParseUrl(const std::string &url, std::string &scheme_host, std::string &path) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        scheme_host = url;
        path = "/";
    } else {
        scheme_host = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return true;
}

// ============================================================================
// Credentials
// ============================================================================

std::string FirestoreCredentials::GetAuthHeader() const {
    if (type == FirestoreAuthType::ACCESS_TOKEN) {
        return "Bearer " + access_token;
    }
    return "";
}

std::string FirestoreCredentials::GetUrlSuffix() const {
    if (type == FirestoreAuthType::API_KEY) {
        return "?key=" + api_key;
    }
    return "";
}

std::shared_ptr<FirestoreCredentials> ResolveFirestoreCredentials(const std::optional<std::string> &project_id,
                                                                  const std::optional<std::string> &database,
                                                                  const std::optional<std::string> &api_key,
                                                                  const std::optional<std::string> &access_token) {
    auto creds = std::make_shared<FirestoreCredentials>();

    creds->project_id = project_id.value_or(GetEnv("GOOGLE_CLOUD_PROJECT"));
    if (creds->project_id.empty()) {
        throw ProfileConfigError(ProfileErrorCode::CONFIG_MISSING_PROJECT_ID,
                                 "project_id is required (or set GOOGLE_CLOUD_PROJECT)",
                                 ProfileErrorContext().withOperation("credentials").withOption("project_id"));
    }
    if (database && !database->empty()) {
        creds->database_id = *database;
    }

    std::string key = api_key.value_or(GetEnv("FIRESTORE_API_KEY"));
    std::string token = access_token.value_or(GetEnv("FIRESTORE_ACCESS_TOKEN"));
    if (!token.empty()) {
        creds->type = FirestoreAuthType::ACCESS_TOKEN;
        creds->access_token = token;
    } else if (!key.empty()) {
        creds->type = FirestoreAuthType::API_KEY;
        creds->api_key = key;
    } else if (GetEmulatorHost().empty()) {
        throw ProfileConfigError(ProfileErrorCode::CONFIG_MISSING_CREDENTIALS,
                                 "api_key or access_token is required outside the emulator",
                                 ProfileErrorContext().withOperation("credentials").withOption("api_key"));
    }

    FP_LOG_DEBUG("Resolved credentials for project " + creds->project_id + ", database " + creds->database_id);
    return creds;
}

// ============================================================================
// FirestoreClient
// ============================================================================

FirestoreClient::FirestoreClient(std::shared_ptr<FirestoreCredentials> credentials)
    : credentials_(std::move(credentials)) {
    if (!credentials_) {
        throw FirestoreAuthError(ProfileErrorCode::AUTH_CREDENTIALS_NULL,
                                 "Credentials cannot be null", ProfileErrorContext());
    }
    FP_LOG_DEBUG("FirestoreClient initialized for project: " + credentials_->project_id);
}

std::string FirestoreClient::BuildBaseUrl() const {
    char buffer[512];
    std::string emulator_host = GetEmulatorHost();

    if (!emulator_host.empty()) {
        snprintf(buffer, sizeof(buffer), FIRESTORE_EMULATOR_URL,
                 emulator_host.c_str(),
                 credentials_->project_id.c_str(),
                 credentials_->database_id.c_str());
    } else {
        snprintf(buffer, sizeof(buffer), FIRESTORE_BASE_URL,
                 credentials_->project_id.c_str(),
                 credentials_->database_id.c_str());
    }
    return std::string(buffer);
}

std::string FirestoreClient::BuildUrl(const std::string &path) const {
    std::string url = BuildBaseUrl();
    if (!path.empty()) {
        if (path[0] != '/') {
            url += "/";
        }
        url += path;
    }
    url += credentials_->GetUrlSuffix();
    return url;
}

json FirestoreClient::MakeRequest(const std::string &method, const std::string &url,
                                  const json &body, const ProfileErrorContext &ctx) {
    auto start_time = std::chrono::high_resolution_clock::now();

    FP_LOG_DEBUG("Making " + method + " request to: " + url);

    ProfileErrorContext error_ctx = ctx;
    error_ctx.withMethod(method).withUrl(url);

    std::string scheme_host, path;
    if (!ParseUrl(url, scheme_host, path)) {
        throw FirestoreNetworkError(ProfileErrorCode::NETWORK_INVALID_URL,
                                    "Failed to parse URL: " + url, error_ctx);
    }

    httplib::Client cli(scheme_host);
    cli.set_connection_timeout(30);
    cli.set_read_timeout(30);

    httplib::Headers headers = {
        {"Content-Type", "application/json"}
    };
    std::string auth_header = credentials_->GetAuthHeader();
    if (!auth_header.empty()) {
        headers.emplace("Authorization", auth_header);
    }

    httplib::Result res;
    if (method == "POST") {
        res = cli.Post(path, headers, body.dump(), "application/json");
    } else {
        res = cli.Get(path, headers);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    if (!res) {
        std::string error_msg = "HTTP request failed: " + httplib::to_string(res.error());
        FP_LOG_ERROR(error_msg + " " + error_ctx.ToString());
        throw FirestoreNetworkError(ProfileErrorCode::NETWORK_REQUEST_FAILED, error_msg, error_ctx);
    }

    int http_code = res->status;
    const std::string &response_data = res->body;

    FP_LOG_DEBUG("Request completed in " + std::to_string(duration_ms) + "ms, status: " + std::to_string(http_code));

    error_ctx.withStatus(http_code);

    json response;
    if (!response_data.empty()) {
        try {
            response = json::parse(response_data);
        } catch (const json::exception &e) {
            error_ctx.withResponseBody(response_data);
            std::string error_msg = "Failed to parse response: " + std::string(e.what());
            FP_LOG_ERROR(error_msg);
            throw ProfileError(ProfileErrorCode::REQUEST_RESPONSE_PARSE, error_msg, error_ctx);
        }
    }

    HandleError(http_code, response, error_ctx);
    return response;
}

void FirestoreClient::HandleError(int status_code, const json &response, const ProfileErrorContext &ctx) {
    if (status_code >= 200 && status_code < 300) {
        return;
    }

    // runQuery reports errors as a one-element array
    const json *error = nullptr;
    if (response.is_object() && response.contains("error")) {
        error = &response["error"];
    } else if (response.is_array() && !response.empty() && response[0].is_object() && response[0].contains("error")) {
        error = &response[0]["error"];
    }

    std::string message = "Unknown error";
    ProfileErrorContext error_ctx = ctx;
    if (error) {
        if (error->contains("message") && (*error)["message"].is_string()) {
            message = (*error)["message"].get<std::string>();
        }
        error_ctx.withResponseBody(error->dump());
    }

    FP_LOG_ERROR("Firestore API error (HTTP " + std::to_string(status_code) + "): " + message);

    switch (status_code) {
        case 400:
            if (credentials_->type == FirestoreAuthType::API_KEY &&
                message.find("API key") != std::string::npos) {
                throw FirestoreAuthError(ProfileErrorCode::AUTH_API_KEY_INVALID,
                                         "API key rejected: " + message, error_ctx);
            }
            break;
        case 401:
            throw FirestoreAuthError(ProfileErrorCode::AUTH_TOKEN_EXPIRED,
                                     "Authentication failed: " + message, error_ctx);
        case 403:
            throw FirestorePermissionError(ProfileErrorCode::PERMISSION_DENIED,
                                           "Permission denied: " + message, error_ctx);
        case 404:
            throw FirestoreNotFoundError(ProfileErrorCode::NOT_FOUND_COLLECTION,
                                         "Not found: " + message, error_ctx);
        case 429:
            throw ProfileError(ProfileErrorCode::REQUEST_RATE_LIMITED,
                               "Rate limited: " + message, error_ctx);
        default:
            break;
    }
    if (status_code >= 500) {
        throw ProfileError(ProfileErrorCode::REQUEST_SERVER_ERROR,
                           "Server error (HTTP " + std::to_string(status_code) + "): " + message, error_ctx);
    }
    throw ProfileError(ProfileErrorCode::INTERNAL_UNEXPECTED,
                       "HTTP " + std::to_string(status_code) + ": " + message, error_ctx);
}

FirestoreListResponse FirestoreClient::ListDocuments(const std::string &collection, int64_t page_size,
                                                     const std::string &page_token) {
    FP_LOG_DEBUG("Listing documents from collection: " + collection);

    std::string url = BuildUrl(collection);

    bool has_params = (credentials_->type == FirestoreAuthType::API_KEY);
    auto add_param = [&](const std::string &key, const std::string &value) {
        url += (has_params ? "&" : "?") + key + "=" + value;
        has_params = true;
    };

    add_param("pageSize", std::to_string(page_size));
    if (!page_token.empty()) {
        add_param("pageToken", httplib::detail::encode_query_param(page_token));
    }
    add_param("orderBy", "__name__");

    ProfileErrorContext ctx;
    ctx.withOperation("list").withCollection(collection);

    json response = MakeRequest("GET", url, {}, ctx);

    FirestoreListResponse result;
    if (response.contains("documents")) {
        for (auto &doc_json : response["documents"]) {
            result.documents.push_back(ParseRestDocument(doc_json));
        }
    }
    if (response.contains("nextPageToken")) {
        result.next_page_token = response["nextPageToken"].get<std::string>();
    }

    FP_LOG_DEBUG("Listed " + std::to_string(result.documents.size()) + " documents");
    return result;
}

FirestoreListResponse FirestoreClient::CollectionGroupPage(const std::string &collection_id, int64_t page_size,
                                                           const std::string &start_after) {
    FP_LOG_DEBUG("Executing collection group query for: " + collection_id);

    std::string url = BuildBaseUrl() + ":runQuery" + credentials_->GetUrlSuffix();

    json structured_query = {
        {"from", {{
            {"collectionId", collection_id},
            {"allDescendants", true}
        }}},
        {"orderBy", {{
            {"field", {{"fieldPath", "__name__"}}},
            {"direction", "ASCENDING"}
        }}},
        {"limit", page_size}
    };
    if (!start_after.empty()) {
        structured_query["startAt"] = {
            {"values", {{{"referenceValue", start_after}}}},
            {"before", false}
        };
    }

    ProfileErrorContext ctx;
    ctx.withOperation("collection_group_query").withCollection(collection_id);

    json body = {{"structuredQuery", structured_query}};
    json response = MakeRequest("POST", url, body, ctx);

    FirestoreListResponse result;
    std::string last_name;
    if (response.is_array()) {
        for (auto &item : response) {
            if (item.contains("document")) {
                auto &document = item["document"];
                if (document.contains("name")) {
                    last_name = document["name"].get<std::string>();
                }
                result.documents.push_back(ParseRestDocument(document));
            }
        }
    }
    // A full page may have a successor; the cursor is the last document name
    if (static_cast<int64_t>(result.documents.size()) == page_size) {
        result.next_page_token = last_name;
    }

    FP_LOG_DEBUG("Collection group query returned " + std::to_string(result.documents.size()) + " documents");
    return result;
}

std::vector<std::string> FirestoreClient::ListCollectionIds(const std::string &document_path, int64_t page_size) {
    FP_LOG_DEBUG("Listing subcollections of: " + document_path);

    std::string url = BuildBaseUrl() + "/" + document_path + ":listCollectionIds" + credentials_->GetUrlSuffix();

    ProfileErrorContext ctx;
    ctx.withOperation("list_collection_ids").withDocument(document_path);

    std::vector<std::string> ids;
    std::string token;
    do {
        json body = {{"pageSize", page_size}};
        if (!token.empty()) {
            body["pageToken"] = token;
        }
        json response = MakeRequest("POST", url, body, ctx);

        if (response.contains("collectionIds")) {
            for (auto &id : response["collectionIds"]) {
                if (id.is_string()) {
                    ids.push_back(id.get<std::string>());
                }
            }
        }
        token.clear();
        if (response.contains("nextPageToken") && response["nextPageToken"].is_string()) {
            token = response["nextPageToken"].get<std::string>();
        }
    } while (!token.empty());

    std::sort(ids.begin(), ids.end());
    FP_LOG_DEBUG(document_path + " has " + std::to_string(ids.size()) + " subcollections");
    return ids;
}

// ============================================================================
// FirestoreCollectionSource
// ============================================================================

FirestoreCollectionSource::FirestoreCollectionSource(std::shared_ptr<FirestoreClient> client, std::string collection,
                                                     int64_t page_size)
    : client_(std::move(client)), collection_(std::move(collection)), page_size_(page_size) {
}

int64_t FirestoreCollectionSource::Scan(const DocumentCallback &callback) {
    bool is_collection_group = !collection_.empty() && collection_[0] == '~';
    std::string collection_id = is_collection_group ? collection_.substr(1) : collection_;

    int64_t delivered = 0;
    std::string token;
    do {
        auto page = is_collection_group ? client_->CollectionGroupPage(collection_id, page_size_, token)
                                        : client_->ListDocuments(collection_id, page_size_, token);
        for (const auto &doc : page.documents) {
            delivered++;
            if (!callback(doc)) {
                return delivered;
            }
        }
        token = page.next_page_token;
    } while (!token.empty());

    return delivered;
}

std::string FirestoreCollectionSource::Describe() const {
    return "firestore:" + client_->GetProjectId() + "/" + collection_;
}

std::string FirestoreCollectionSource::DocumentPath(const ProfileDocument &parent) const {
    if (!parent.path.empty()) {
        return parent.path;
    }
    if (!collection_.empty() && collection_[0] == '~') {
        throw ProfileSourceError(ProfileErrorCode::SOURCE_DOCUMENT_INVALID,
                                 "Collection group document without a resource name",
                                 ProfileErrorContext().withCollection(collection_).withDocument(parent.id));
    }
    return collection_ + "/" + parent.id;
}

std::vector<std::string> FirestoreCollectionSource::ListSubcollections(const ProfileDocument &parent) {
    return client_->ListCollectionIds(DocumentPath(parent), page_size_);
}

std::unique_ptr<ProfileDocumentSource> FirestoreCollectionSource::OpenSubcollection(
    const ProfileDocument &parent, const std::string &subcollection_id) {
    return std::make_unique<FirestoreCollectionSource>(client_, DocumentPath(parent) + "/" + subcollection_id,
                                                       page_size_);
}

} // namespace duckdb
