#pragma once

#include "profile_error.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace duckdb {

using json = nlohmann::json;

// One document as delivered by a source: its id and the REST "fields" object.
// path is relative to the database's documents root ("users/u1/orders/o7"),
// empty when the source does not know it
struct ProfileDocument {
	std::string id;
	json fields;
	std::string path;
};

// Return false to stop the enumeration after the current document
using DocumentCallback = std::function<bool(const ProfileDocument &)>;

// Re-enumerable, finite sequence of documents. Scan delivers documents in
// the same order on every call
class ProfileDocumentSource {
public:
	virtual ~ProfileDocumentSource() = default;

	// Enumerate documents until exhausted or the callback returns false.
	// Returns the number of documents delivered
	virtual int64_t Scan(const DocumentCallback &callback) = 0;

	// Short description for logs ("jsonl:/tmp/users.jsonl", ...)
	virtual std::string Describe() const = 0;

	// Ids of parent's direct subcollections, sorted. Sources without nested
	// collections report none
	virtual std::vector<std::string> ListSubcollections(const ProfileDocument &parent) {
		return {};
	}

	// Source over one subcollection of parent. Throws
	// SOURCE_NO_SUBCOLLECTIONS unless ListSubcollections is overridden
	virtual std::unique_ptr<ProfileDocumentSource> OpenSubcollection(const ProfileDocument &parent,
	                                                                 const std::string &subcollection_id);
};

class InMemoryDocumentSource : public ProfileDocumentSource {
public:
	InMemoryDocumentSource() = default;
	explicit InMemoryDocumentSource(std::vector<ProfileDocument> documents);

	void Add(const std::string &id, const json &fields);
	// Add a document to parent_id's subcollection subcollection_id
	void AddToSubcollection(const std::string &parent_id, const std::string &subcollection_id,
	                        const std::string &id, const json &fields);

	int64_t Scan(const DocumentCallback &callback) override;
	std::string Describe() const override;
	std::vector<std::string> ListSubcollections(const ProfileDocument &parent) override;
	std::unique_ptr<ProfileDocumentSource> OpenSubcollection(const ProfileDocument &parent,
	                                                         const std::string &subcollection_id) override;

	// Number of completed Scan calls
	int64_t ScanCount() const {
		return scan_count_;
	}

private:
	std::vector<ProfileDocument> documents_;
	// parent id -> subcollection id -> documents
	std::map<std::string, std::map<std::string, std::vector<ProfileDocument>>> subcollections_;
	int64_t scan_count_ = 0;
};

// Newline-delimited export: one REST document ({"name", "fields"}) per line.
// Blank lines are skipped
class JsonLinesDocumentSource : public ProfileDocumentSource {
public:
	explicit JsonLinesDocumentSource(std::string path);

	int64_t Scan(const DocumentCallback &callback) override;
	std::string Describe() const override;

private:
	std::string path_;
};

// Extract the last segment of a resource path ("projects/p/.../users/u1" -> "u1")
std::string ExtractDocumentId(const std::string &name);

// Build a ProfileDocument from one REST document. The id comes from "name" or
// else "id"; path is the part of "name" after "/documents/". A missing
// "fields" object means an empty document.
// Throws ProfileSourceError(SOURCE_DOCUMENT_INVALID) for anything else
ProfileDocument ParseRestDocument(const json &document);

} // namespace duckdb
