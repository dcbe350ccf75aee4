#include "profile_error.hpp"
#include <sstream>
#include <iomanip>

namespace duckdb {

// ============================================================================
// Error Code to String Conversion
// ============================================================================

const char* ProfileErrorCodeToString(ProfileErrorCode code) {
    switch (code) {
        case ProfileErrorCode::SUCCESS: return "Success";

        case ProfileErrorCode::AUTH_BASE: return "Authentication error";
        case ProfileErrorCode::AUTH_CREDENTIALS_NULL: return "Credentials cannot be null";
        case ProfileErrorCode::AUTH_TOKEN_EXPIRED: return "Access token rejected";
        case ProfileErrorCode::AUTH_API_KEY_INVALID: return "API key rejected";

        case ProfileErrorCode::PERMISSION_BASE: return "Permission error";
        case ProfileErrorCode::PERMISSION_DENIED: return "Permission denied";

        case ProfileErrorCode::NOT_FOUND_BASE: return "Not found";
        case ProfileErrorCode::NOT_FOUND_COLLECTION: return "Collection not found";
        case ProfileErrorCode::NOT_FOUND_EXPORT_FILE: return "Export file not found";

        case ProfileErrorCode::NETWORK_BASE: return "Network error";
        case ProfileErrorCode::NETWORK_REQUEST_FAILED: return "HTTP request failed";
        case ProfileErrorCode::NETWORK_INVALID_URL: return "Invalid URL";

        case ProfileErrorCode::REQUEST_BASE: return "Request error";
        case ProfileErrorCode::REQUEST_RESPONSE_PARSE: return "Cannot parse response";
        case ProfileErrorCode::REQUEST_RATE_LIMITED: return "Rate limited";
        case ProfileErrorCode::REQUEST_SERVER_ERROR: return "Server error";

        case ProfileErrorCode::CONFIG_BASE: return "Configuration error";
        case ProfileErrorCode::CONFIG_MISSING_PROJECT_ID: return "Missing project_id";
        case ProfileErrorCode::CONFIG_MISSING_CREDENTIALS: return "Missing credentials";
        case ProfileErrorCode::CONFIG_MISSING_COLLECTION: return "Missing collection";
        case ProfileErrorCode::CONFIG_INVALID_THRESHOLD: return "Invalid required_threshold";
        case ProfileErrorCode::CONFIG_INVALID_RARE_FRACTION: return "Invalid rare_field_max_fraction";
        case ProfileErrorCode::CONFIG_INVALID_EXAMPLES: return "Invalid examples_per_issue";
        case ProfileErrorCode::CONFIG_INVALID_SAMPLE_LIMIT: return "Invalid sample_limit";
        case ProfileErrorCode::CONFIG_INVALID_BATCH_SIZE: return "Invalid batch size";
        case ProfileErrorCode::CONFIG_INVALID_REGEX: return "Invalid regex rule";
        case ProfileErrorCode::CONFIG_INVALID_RULE_PATH: return "Invalid regex rule path";
        case ProfileErrorCode::CONFIG_CONFLICTING_OPTIONS: return "Conflicting options";

        case ProfileErrorCode::SOURCE_BASE: return "Document source error";
        case ProfileErrorCode::SOURCE_OPEN_FAILED: return "Cannot open document source";
        case ProfileErrorCode::SOURCE_READ_FAILED: return "Cannot read document source";
        case ProfileErrorCode::SOURCE_PARSE_FAILED: return "Cannot parse document";
        case ProfileErrorCode::SOURCE_DOCUMENT_INVALID: return "Invalid document";
        case ProfileErrorCode::SOURCE_NO_SUBCOLLECTIONS: return "Subcollections not supported by source";

        case ProfileErrorCode::INTERNAL_BASE: return "Internal error";
        case ProfileErrorCode::INTERNAL_UNEXPECTED: return "Unexpected internal error";

        default: return "Unknown error";
    }
}

std::string FormatErrorCode(ProfileErrorCode code) {
    std::ostringstream ss;
    ss << "FP_" << std::hex << std::uppercase << std::setfill('0') << std::setw(8)
       << static_cast<uint32_t>(code);
    return ss.str();
}

// ============================================================================
// ProfileErrorContext Implementation
// ============================================================================

std::string ProfileErrorContext::ToString() const {
    std::ostringstream ss;
    bool first = true;

    auto append = [&](const std::string& key, const std::string& value) {
        if (!first) ss << ", ";
        ss << key << "=" << value;
        first = false;
    };

    ss << "{";
    if (operation) append("operation", *operation);
    if (option) append("option", *option);
    if (collection) append("collection", *collection);
    if (document_id) append("document_id", *document_id);
    if (source_path) append("source", *source_path);
    if (line) append("line", std::to_string(*line));
    if (http_method) append("method", *http_method);
    if (http_status_code) append("status", std::to_string(*http_status_code));
    if (url) {
        std::string truncated_url = url->length() > 100 ? url->substr(0, 100) + "..." : *url;
        append("url", truncated_url);
    }
    ss << "}";

    return ss.str();
}

// ============================================================================
// ProfileError Implementation
// ============================================================================

ProfileError::ProfileError(const std::string& message)
    : code_(ProfileErrorCode::INTERNAL_UNEXPECTED)
    , message_(message)
    , has_context_(false) {
    build_what_cache();
}

ProfileError::ProfileError(ProfileErrorCode code, const std::string& message)
    : code_(code)
    , message_(message)
    , has_context_(false) {
    build_what_cache();
}

ProfileError::ProfileError(ProfileErrorCode code, const std::string& message,
                           const ProfileErrorContext& context)
    : code_(code)
    , message_(message)
    , context_(context)
    , has_context_(true) {
    build_what_cache();
}

const char* ProfileError::what() const noexcept {
    return what_cache_.c_str();
}

std::string ProfileError::formatted_message() const {
    return "[" + FormatErrorCode(code_) + "] " + message_;
}

void ProfileError::build_what_cache() {
    what_cache_ = formatted_message();
    if (has_context_) {
        what_cache_ += " " + context_.ToString();
    }
}

} // namespace duckdb
