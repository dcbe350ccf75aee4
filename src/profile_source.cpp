#include "profile_source.hpp"
#include "profile_logger.hpp"
#include <fstream>

namespace duckdb {

std::string ExtractDocumentId(const std::string &name) {
	size_t last_slash = name.rfind('/');
	if (last_slash == std::string::npos) {
		return name;
	}
	return name.substr(last_slash + 1);
}

ProfileDocument ParseRestDocument(const json &document) {
	if (!document.is_object()) {
		throw ProfileSourceError(ProfileErrorCode::SOURCE_DOCUMENT_INVALID, "Document is not a JSON object");
	}

	ProfileDocument doc;
	auto name = document.find("name");
	auto id = document.find("id");
	if (name != document.end() && name->is_string()) {
		auto full_name = name->get<std::string>();
		doc.id = ExtractDocumentId(full_name);
		auto root = full_name.find("/documents/");
		if (root != std::string::npos) {
			doc.path = full_name.substr(root + 11);
		}
	} else if (id != document.end() && id->is_string()) {
		doc.id = id->get<std::string>();
	} else {
		throw ProfileSourceError(ProfileErrorCode::SOURCE_DOCUMENT_INVALID, "Document has neither name nor id");
	}

	auto fields = document.find("fields");
	if (fields == document.end()) {
		doc.fields = json::object();
	} else if (fields->is_object()) {
		doc.fields = *fields;
	} else {
		throw ProfileSourceError(ProfileErrorCode::SOURCE_DOCUMENT_INVALID,
		                         "Document fields is not an object",
		                         ProfileErrorContext().withDocument(doc.id));
	}
	return doc;
}

std::unique_ptr<ProfileDocumentSource> ProfileDocumentSource::OpenSubcollection(const ProfileDocument &parent,
                                                                                const std::string &subcollection_id) {
	throw ProfileSourceError(ProfileErrorCode::SOURCE_NO_SUBCOLLECTIONS,
	                         Describe() + " has no subcollection " + subcollection_id,
	                         ProfileErrorContext().withOperation("subcollections").withDocument(parent.id));
}

// ============================================================================
// InMemoryDocumentSource
// ============================================================================

InMemoryDocumentSource::InMemoryDocumentSource(std::vector<ProfileDocument> documents)
    : documents_(std::move(documents)) {
}

void InMemoryDocumentSource::Add(const std::string &id, const json &fields) {
	documents_.push_back(ProfileDocument {id, fields});
}

int64_t InMemoryDocumentSource::Scan(const DocumentCallback &callback) {
	int64_t delivered = 0;
	for (const auto &doc : documents_) {
		delivered++;
		if (!callback(doc)) {
			break;
		}
	}
	scan_count_++;
	return delivered;
}

std::string InMemoryDocumentSource::Describe() const {
	return "memory:" + std::to_string(documents_.size()) + " documents";
}

void InMemoryDocumentSource::AddToSubcollection(const std::string &parent_id, const std::string &subcollection_id,
                                                const std::string &id, const json &fields) {
	subcollections_[parent_id][subcollection_id].push_back(ProfileDocument {id, fields});
}

std::vector<std::string> InMemoryDocumentSource::ListSubcollections(const ProfileDocument &parent) {
	std::vector<std::string> result;
	auto it = subcollections_.find(parent.id);
	if (it != subcollections_.end()) {
		for (const auto &entry : it->second) {
			result.push_back(entry.first);
		}
	}
	return result;
}

std::unique_ptr<ProfileDocumentSource> InMemoryDocumentSource::OpenSubcollection(const ProfileDocument &parent,
                                                                                 const std::string &subcollection_id) {
	auto it = subcollections_.find(parent.id);
	if (it == subcollections_.end() || it->second.find(subcollection_id) == it->second.end()) {
		return std::make_unique<InMemoryDocumentSource>();
	}
	return std::make_unique<InMemoryDocumentSource>(it->second.at(subcollection_id));
}

// ============================================================================
// JsonLinesDocumentSource
// ============================================================================

JsonLinesDocumentSource::JsonLinesDocumentSource(std::string path) : path_(std::move(path)) {
}

int64_t JsonLinesDocumentSource::Scan(const DocumentCallback &callback) {
	std::ifstream file(path_);
	if (!file.is_open()) {
		throw ProfileSourceError(ProfileErrorCode::SOURCE_OPEN_FAILED, "Failed to open export file: " + path_,
		                         ProfileErrorContext().withSourcePath(path_));
	}
	FP_LOG_DEBUG("Scanning export file: " + path_);

	int64_t delivered = 0;
	size_t line_number = 0;
	std::string line;
	while (std::getline(file, line)) {
		line_number++;
		if (line.find_first_not_of(" \t\r") == std::string::npos) {
			continue;
		}

		ProfileErrorContext ctx;
		ctx.withSourcePath(path_).withLine(line_number);

		json parsed;
		try {
			parsed = json::parse(line);
		} catch (const json::exception &e) {
			throw ProfileSourceError(ProfileErrorCode::SOURCE_PARSE_FAILED,
			                         "Invalid JSON in export file: " + std::string(e.what()), ctx);
		}

		ProfileDocument doc;
		try {
			doc = ParseRestDocument(parsed);
		} catch (const ProfileSourceError &e) {
			if (e.has_context() && e.context().document_id) {
				ctx.withDocument(*e.context().document_id);
			}
			throw ProfileSourceError(e.code(), e.message(), ctx);
		}

		delivered++;
		if (!callback(doc)) {
			return delivered;
		}
	}
	if (file.bad()) {
		throw ProfileSourceError(ProfileErrorCode::SOURCE_READ_FAILED, "Error reading export file: " + path_,
		                         ProfileErrorContext().withSourcePath(path_).withLine(line_number));
	}
	return delivered;
}

std::string JsonLinesDocumentSource::Describe() const {
	return "jsonl:" + path_;
}

} // namespace duckdb
