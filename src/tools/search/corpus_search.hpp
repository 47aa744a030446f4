#pragma once

#include "tools/tool_interfaces.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace norma::tools::search {

// One passage of the local reference corpus.
struct CorpusDocument {
  std::string name;
  std::string domain;
  std::string locator;
  std::string text;
  core::json::Value::Object facts;
};

// Corpus file layout:
// {"documents": [{"name": "...", "domain": "...", "locator": "...",
//                 "text": "...", "facts": {...}}]}
// A bare top-level array of documents is accepted too.
bool ParseCorpusJson(std::string_view text, std::vector<CorpusDocument>& documents,
                     std::string& error);
bool LoadCorpusFile(const std::filesystem::path& path, std::vector<CorpusDocument>& documents,
                    std::string& error);

// In-memory keyword search over a loaded corpus.
//
// Ranking is the number of request keywords found (case-insensitive) in the
// document name and text; ties keep corpus order. When `expected_documents`
// names at least one document present in the corpus, only those documents
// are searched.
class CorpusSearch final : public ISearchTool {
public:
  explicit CorpusSearch(std::vector<CorpusDocument> documents);

  bool Search(const SearchRequest& request, std::vector<DocumentRef>& documents,
              std::string& error) override;

  std::size_t DocumentCount() const {
    return documents_.size();
  }

private:
  std::vector<CorpusDocument> documents_;
};

} // namespace norma::tools::search
