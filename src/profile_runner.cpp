#include "profile_runner.hpp"
#include "profile_logger.hpp"
#include <chrono>

namespace duckdb {

// Fold each subcollection id of every parent into one aggregate per id.
// sample_limit applies to each parent's subcollection separately
static std::vector<SubcollectionProfile> ProfileSubcollections(const std::string &collection,
                                                               ProfileDocumentSource &source,
                                                               const std::vector<ProfileDocument> &parents,
                                                               const ProfileOptions &options) {
	std::map<std::string, std::vector<const ProfileDocument *>> parents_by_id;
	for (const auto &parent : parents) {
		for (const auto &id : source.ListSubcollections(parent)) {
			parents_by_id[id].push_back(&parent);
		}
	}

	std::vector<SubcollectionProfile> result;
	for (const auto &entry : parents_by_id) {
		ObjectAggregate aggregate;
		for (auto parent : entry.second) {
			auto child = source.OpenSubcollection(*parent, entry.first);
			int64_t seen = 0;
			child->Scan([&](const ProfileDocument &doc) {
				seen++;
				FoldObjectSample(aggregate, doc.fields);
				return !options.sample_limit || seen < *options.sample_limit;
			});
		}
		if (aggregate.total_seen == 0) {
			continue;
		}
		SubcollectionProfile profile;
		profile.id = entry.first;
		profile.collection = collection + "/{doc}/" + entry.first;
		profile.parent_documents = static_cast<int64_t>(entry.second.size());
		profile.docs_scanned = aggregate.total_seen;
		profile.schema = SummarizeDocument(aggregate);
		result.push_back(std::move(profile));
	}
	FP_LOG_DEBUG("Profiled " + std::to_string(result.size()) + " subcollections of " + collection);
	return result;
}

// First documents of each direct subcollection of the example document
static std::map<std::string, std::vector<json>> ExampleSubcollections(ProfileDocumentSource &source,
                                                                      const ProfileDocument &example,
                                                                      int64_t per_subcollection) {
	std::map<std::string, std::vector<json>> result;
	for (const auto &id : source.ListSubcollections(example)) {
		std::vector<json> documents;
		source.OpenSubcollection(example, id)->Scan([&](const ProfileDocument &doc) {
			documents.push_back(SanitizeFields(doc.fields));
			return static_cast<int64_t>(documents.size()) < per_subcollection;
		});
		if (!documents.empty()) {
			result[id] = std::move(documents);
		}
	}
	return result;
}

ProfileResult RunProfile(const std::string &collection, ProfileDocumentSource &source, const ProfileOptions &options) {
	if (collection.empty()) {
		throw ProfileConfigError(ProfileErrorCode::CONFIG_MISSING_COLLECTION, "Collection path cannot be empty",
		                         ProfileErrorContext().withOperation("validate").withOption("collection"));
	}
	options.Validate();

	auto start_time = std::chrono::high_resolution_clock::now();
	FP_LOG_INFO("Profiling " + collection + " from " + source.Describe());

	ProfileResult result;
	result.collection = collection;

	// Pass 1
	IssueEvidenceCollector evidence(options);
	ProfileDocument example;
	size_t example_width = 0;
	bool have_example = false;
	int64_t seen = 0;
	// Subcollections are listed per parent, so parents keep only id and path
	std::vector<ProfileDocument> parents;

	source.Scan([&](const ProfileDocument &doc) {
		seen++;
		evidence.BeginDocument(doc.id);
		FoldObjectSample(result.aggregate, doc.fields, options.include_issues ? &evidence : nullptr);
		if (options.include_example) {
			size_t width = doc.fields.is_object() ? doc.fields.size() : 0;
			if (!have_example || width > example_width) {
				example = doc;
				example_width = width;
				have_example = true;
			}
		}
		if (options.include_subcollections) {
			parents.push_back(ProfileDocument {doc.id, json(), doc.path});
		}
		return !options.sample_limit || seen < *options.sample_limit;
	});
	result.docs_scanned = seen;
	result.passes = 1;
	FP_LOG_DEBUG("Pass 1 folded " + std::to_string(seen) + " documents");

	if (options.include_schema) {
		result.schema = SummarizeDocument(result.aggregate);
	}
	if (options.include_subcollections && !parents.empty()) {
		result.subcollections = ProfileSubcollections(collection, source, parents, options);
	}
	if (have_example) {
		result.example = ExampleDocument {example.id, SanitizeFields(example.fields), {}};
		if (options.include_subcollections) {
			result.example->subcollections =
			    ExampleSubcollections(source, example, options.examples_per_subcollection);
		}
	}

	if (options.include_issues) {
		int64_t total_docs = result.aggregate.total_seen;
		auto expected = ExpectedFields(FlattenFields(result.aggregate), total_docs, options.required_threshold);
		bool has_deficit = false;
		for (const auto &field : expected) {
			if (field.aggregate->present_count < total_docs) {
				has_deficit = true;
				break;
			}
		}

		MissingExamples missing;
		if (has_deficit) {
			ProfileErrorContext ctx;
			ctx.withOperation("pass2").withCollection(collection);
			FP_LOG_DEBUG("Pass 2: collecting missing-field examples " + ctx.ToString());
			missing = CollectMissingExamples(source, expected, total_docs, options.examples_per_issue,
			                                 options.sample_limit);
			result.passes = 2;
		}
		result.issues = DetectIssues(result.aggregate, evidence, missing, options);
	}

	ReportMetadata meta;
	meta.collection = collection;
	meta.sample_limit = options.sample_limit;
	meta.docs_scanned = result.docs_scanned;
	meta.docs_total_seen = result.aggregate.total_seen;
	meta.required_threshold = options.required_threshold;
	meta.rare_field_max_fraction = options.rare_field_max_fraction;
	meta.examples_per_issue = options.examples_per_issue;
	meta.check_field_name_variants = options.check_field_name_variants;
	meta.passes = result.passes;
	meta.include_subcollections = options.include_subcollections;

	result.report = AssembleReport(meta, result.schema ? &*result.schema : nullptr,
	                               result.issues ? &*result.issues : nullptr,
	                               result.example ? &*result.example : nullptr, &result.subcollections);

	auto end_time = std::chrono::high_resolution_clock::now();
	auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
	FP_LOG_INFO("Profiled " + std::to_string(result.docs_scanned) + " documents of " + collection + " in " +
	            std::to_string(duration_ms) + "ms (" + std::to_string(result.passes) + " passes)");
	return result;
}

} // namespace duckdb
