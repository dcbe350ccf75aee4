#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <exception>

namespace duckdb {

// ============================================================================
// Error Codes
// ============================================================================
// Error codes are 32-bit integers with structure:
// Bits 24-31: Category (0-255)
// Bits 16-23: Subcategory (0-255)
// Bits 0-15:  Specific error (0-65535)

enum class ProfileErrorCode : uint32_t {
    // ========== SUCCESS (Category 0x00) ==========
    SUCCESS = 0x00000000,

    // ========== AUTHENTICATION ERRORS (Category 0x01) ==========
    AUTH_BASE                   = 0x01000000,
    AUTH_CREDENTIALS_NULL       = 0x01010001,  // Credentials object is null
    AUTH_TOKEN_EXPIRED          = 0x01030004,  // Token rejected (401 response)
    AUTH_API_KEY_INVALID        = 0x01040001,  // API key rejected by Firestore

    // ========== PERMISSION ERRORS (Category 0x02) ==========
    PERMISSION_BASE             = 0x02000000,
    PERMISSION_DENIED           = 0x02010001,  // 403 Forbidden

    // ========== NOT FOUND ERRORS (Category 0x03) ==========
    NOT_FOUND_BASE              = 0x03000000,
    NOT_FOUND_COLLECTION        = 0x03010002,  // Collection does not exist
    NOT_FOUND_EXPORT_FILE       = 0x03020001,  // Export file does not exist

    // ========== NETWORK ERRORS (Category 0x04) ==========
    NETWORK_BASE                = 0x04000000,
    NETWORK_REQUEST_FAILED      = 0x04010002,  // HTTP request failed
    NETWORK_INVALID_URL         = 0x04010006,  // URL could not be parsed

    // ========== REQUEST/RESPONSE ERRORS (Category 0x05) ==========
    REQUEST_BASE                = 0x05000000,
    REQUEST_RESPONSE_PARSE      = 0x05020001,  // Cannot parse JSON response
    REQUEST_RATE_LIMITED        = 0x05030001,  // 429 Too Many Requests
    REQUEST_SERVER_ERROR        = 0x05040001,  // 5xx server error

    // ========== CONFIGURATION ERRORS (Category 0x06) ==========
    CONFIG_BASE                 = 0x06000000,
    CONFIG_MISSING_PROJECT_ID   = 0x06010001,  // project_id required for REST source
    CONFIG_MISSING_CREDENTIALS  = 0x06010002,  // no api_key/access_token and no emulator
    CONFIG_MISSING_COLLECTION   = 0x06010004,  // collection path is empty
    CONFIG_INVALID_THRESHOLD    = 0x06030001,  // required_threshold out of range
    CONFIG_INVALID_RARE_FRACTION = 0x06030002, // rare_field_max_fraction out of range
    CONFIG_INVALID_EXAMPLES     = 0x06030003,  // examples_per_issue < 1
    CONFIG_INVALID_SAMPLE_LIMIT = 0x06030004,  // sample_limit < 1
    CONFIG_INVALID_BATCH_SIZE   = 0x06030005,  // batch size out of range
    CONFIG_INVALID_REGEX        = 0x06040001,  // regex rule does not compile
    CONFIG_INVALID_RULE_PATH    = 0x06040002,  // regex rule with empty field path
    CONFIG_CONFLICTING_OPTIONS  = 0x06050001,  // options contradict each other

    // ========== SOURCE ERRORS (Category 0x07) ==========
    SOURCE_BASE                 = 0x07000000,
    SOURCE_OPEN_FAILED          = 0x07010001,  // Cannot open export file
    SOURCE_READ_FAILED          = 0x07010002,  // I/O error while reading
    SOURCE_PARSE_FAILED         = 0x07020001,  // Line is not valid JSON
    SOURCE_DOCUMENT_INVALID     = 0x07020002,  // Line is JSON but not a document
    SOURCE_NO_SUBCOLLECTIONS    = 0x07030001,  // Source cannot open nested collections

    // ========== INTERNAL ERRORS (Category 0xFF) ==========
    INTERNAL_BASE               = 0xFF000000,
    INTERNAL_UNEXPECTED         = 0xFF000001,  // Unexpected internal error
};

// Category extraction helpers
constexpr uint8_t GetErrorCategory(ProfileErrorCode code) {
    return static_cast<uint8_t>((static_cast<uint32_t>(code) >> 24) & 0xFF);
}

constexpr bool IsConfigError(ProfileErrorCode code) {
    return GetErrorCategory(code) == 0x06;
}

constexpr bool IsSourceError(ProfileErrorCode code) {
    return GetErrorCategory(code) == 0x07;
}

constexpr bool IsNetworkError(ProfileErrorCode code) {
    return GetErrorCategory(code) == 0x04;
}

// Convert error code to human-readable string
const char* ProfileErrorCodeToString(ProfileErrorCode code);

// Format error code as hex string (e.g., "FP_06030001")
std::string FormatErrorCode(ProfileErrorCode code);

// ============================================================================
// Error Context
// ============================================================================

struct ProfileErrorContext {
    // Run context
    std::optional<std::string> operation;   // "pass1", "pass2", "list", "validate", ...
    std::optional<std::string> collection;
    std::optional<std::string> document_id;
    std::optional<std::string> option;      // offending configuration option

    // File source context
    std::optional<std::string> source_path;
    std::optional<size_t> line;

    // Request context
    std::optional<std::string> http_method;
    std::optional<std::string> url;
    std::optional<int> http_status_code;
    std::optional<std::string> response_body;  // First 1KB of response

    ProfileErrorContext() = default;

    ProfileErrorContext& withOperation(const std::string& o) { operation = o; return *this; }
    ProfileErrorContext& withCollection(const std::string& c) { collection = c; return *this; }
    ProfileErrorContext& withDocument(const std::string& d) { document_id = d; return *this; }
    ProfileErrorContext& withOption(const std::string& o) { option = o; return *this; }
    ProfileErrorContext& withSourcePath(const std::string& p) { source_path = p; return *this; }
    ProfileErrorContext& withLine(size_t l) { line = l; return *this; }
    ProfileErrorContext& withMethod(const std::string& m) { http_method = m; return *this; }
    ProfileErrorContext& withUrl(const std::string& u) { url = u; return *this; }
    ProfileErrorContext& withStatus(int s) { http_status_code = s; return *this; }
    ProfileErrorContext& withResponseBody(const std::string& b) {
        response_body = b.substr(0, 1024);
        return *this;
    }

    // Serialize to string for logging
    std::string ToString() const;
};

// ============================================================================
// Exception Classes
// ============================================================================

class ProfileError : public std::exception {
public:
    explicit ProfileError(const std::string& message);
    ProfileError(ProfileErrorCode code, const std::string& message);
    ProfileError(ProfileErrorCode code, const std::string& message,
                 const ProfileErrorContext& context);

    virtual ~ProfileError() = default;

    const char* what() const noexcept override;

    ProfileErrorCode code() const noexcept { return code_; }
    uint32_t code_value() const noexcept { return static_cast<uint32_t>(code_); }

    const ProfileErrorContext& context() const noexcept { return context_; }
    bool has_context() const noexcept { return has_context_; }

    // Raw message (without code prefix)
    const std::string& message() const noexcept { return message_; }

    // Formatted message with code prefix
    std::string formatted_message() const;

protected:
    ProfileErrorCode code_;
    std::string message_;
    ProfileErrorContext context_;
    bool has_context_;

    std::string what_cache_;

    void build_what_cache();
};

// Invalid or contradictory run configuration; raised before any document is read
class ProfileConfigError : public ProfileError {
public:
    ProfileConfigError(ProfileErrorCode code, const std::string& message)
        : ProfileError(code, message) {}
    ProfileConfigError(ProfileErrorCode code, const std::string& message,
                       const ProfileErrorContext& ctx)
        : ProfileError(code, message, ctx) {}
};

// Failure reading a document source; aborts the run
class ProfileSourceError : public ProfileError {
public:
    ProfileSourceError(ProfileErrorCode code, const std::string& message)
        : ProfileError(code, message) {}
    ProfileSourceError(ProfileErrorCode code, const std::string& message,
                       const ProfileErrorContext& ctx)
        : ProfileError(code, message, ctx) {}
};

class FirestoreAuthError : public ProfileError {
public:
    FirestoreAuthError(ProfileErrorCode code, const std::string& message,
                       const ProfileErrorContext& ctx)
        : ProfileError(code, message, ctx) {}
};

class FirestorePermissionError : public ProfileError {
public:
    FirestorePermissionError(ProfileErrorCode code, const std::string& message,
                             const ProfileErrorContext& ctx)
        : ProfileError(code, message, ctx) {}
};

class FirestoreNotFoundError : public ProfileError {
public:
    FirestoreNotFoundError(ProfileErrorCode code, const std::string& message,
                           const ProfileErrorContext& ctx)
        : ProfileError(code, message, ctx) {}
};

class FirestoreNetworkError : public ProfileError {
public:
    FirestoreNetworkError(ProfileErrorCode code, const std::string& message,
                          const ProfileErrorContext& ctx)
        : ProfileError(code, message, ctx) {}
};

} // namespace duckdb
