#include "tools/search/corpus_search.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace norma::tools::search {

namespace {

using core::json::Value;

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ReadStringField(const Value& doc, const char* key, bool required, std::string& out,
                     std::size_t index, std::string& error) {
  const Value* field = core::json::Find(doc, key);
  if (field == nullptr || field->IsNull()) {
    if (required) {
      error = "documents[" + std::to_string(index) + "]." + key + " is required";
      return false;
    }
    return true;
  }
  if (!field->IsString()) {
    error = "documents[" + std::to_string(index) + "]." + key + " must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool NameMatches(const std::string& document_name, const std::vector<std::string>& expected) {
  const std::string lowered = ToLower(document_name);
  for (const auto& name : expected) {
    const std::string wanted = ToLower(name);
    if (wanted.empty()) {
      continue;
    }
    if (lowered.find(wanted) != std::string::npos || wanted.find(lowered) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

bool ParseCorpusJson(std::string_view text, std::vector<CorpusDocument>& documents,
                     std::string& error) {
  Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "corpus is not valid JSON: " + error;
    return false;
  }

  const Value* list = &root;
  if (root.IsObject()) {
    list = core::json::Find(root, "documents");
    if (list == nullptr) {
      error = "corpus object must contain a 'documents' array";
      return false;
    }
  }
  if (!list->IsArray()) {
    error = "corpus documents must be an array";
    return false;
  }

  std::vector<CorpusDocument> parsed;
  for (std::size_t i = 0; i < list->array_value.size(); ++i) {
    const Value& item = list->array_value[i];
    if (!item.IsObject()) {
      error = "documents[" + std::to_string(i) + "] must be an object";
      return false;
    }
    CorpusDocument doc;
    if (!ReadStringField(item, "name", true, doc.name, i, error) ||
        !ReadStringField(item, "domain", false, doc.domain, i, error) ||
        !ReadStringField(item, "locator", false, doc.locator, i, error) ||
        !ReadStringField(item, "text", false, doc.text, i, error)) {
      return false;
    }
    if (const Value* facts = core::json::Find(item, "facts"); facts != nullptr && !facts->IsNull()) {
      if (!facts->IsObject()) {
        error = "documents[" + std::to_string(i) + "].facts must be an object";
        return false;
      }
      doc.facts = facts->object_value;
    }
    parsed.push_back(std::move(doc));
  }

  documents = std::move(parsed);
  return true;
}

bool LoadCorpusFile(const std::filesystem::path& path, std::vector<CorpusDocument>& documents,
                    std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseCorpusJson(text, documents, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

CorpusSearch::CorpusSearch(std::vector<CorpusDocument> documents)
    : documents_(std::move(documents)) {}

bool CorpusSearch::Search(const SearchRequest& request, std::vector<DocumentRef>& documents,
                          std::string& error) {
  documents.clear();
  bool restrict = false;
  if (!request.expected_documents.empty()) {
    for (const auto& doc : documents_) {
      if (NameMatches(doc.name, request.expected_documents)) {
        restrict = true;
        break;
      }
    }
  }

  std::vector<std::string> keywords;
  for (const auto& keyword : request.keywords) {
    if (!keyword.empty()) {
      keywords.push_back(ToLower(keyword));
    }
  }
  if (keywords.empty()) {
    error = "search request keywords are all empty";
    return false;
  }

  for (const auto& doc : documents_) {
    if (restrict && !NameMatches(doc.name, request.expected_documents)) {
      continue;
    }
    const std::string haystack = ToLower(doc.name + "\n" + doc.text);
    std::size_t hits = 0;
    for (const auto& keyword : keywords) {
      if (haystack.find(keyword) != std::string::npos) {
        ++hits;
      }
    }
    if (hits == 0U) {
      continue;
    }

    DocumentRef ref;
    ref.document_name = doc.name;
    ref.locator = doc.locator;
    ref.domain = doc.domain;
    ref.excerpt = doc.text;
    ref.facts = doc.facts;
    ref.score = static_cast<double>(hits) / static_cast<double>(keywords.size());
    documents.push_back(std::move(ref));
  }

  std::stable_sort(documents.begin(), documents.end(),
                   [](const DocumentRef& a, const DocumentRef& b) { return a.score > b.score; });
  if (request.max_results > 0U && documents.size() > request.max_results) {
    documents.resize(request.max_results);
  }
  return true;
}

} // namespace norma::tools::search
