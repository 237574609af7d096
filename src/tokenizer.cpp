#include <engram/tokenizer.hpp>

#ifdef ENGRAM_ENABLE_SEMANTIC

#include <fstream>

namespace engram::internal {

namespace {

bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool IsAsciiPunct(char c) {
  return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
         (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

}  // namespace

std::unique_ptr<WordPieceTokenizer> WordPieceTokenizer::Create(
    const std::string& vocab_path, std::string* error_out) {
  std::ifstream file(vocab_path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open vocabulary file: " + vocab_path;
    return nullptr;
  }

  std::unique_ptr<WordPieceTokenizer> tok(new WordPieceTokenizer());
  std::string line;
  int64_t id = 0;
  while (std::getline(file, line)) {
    while (!line.empty() && IsSpace(line.back())) line.pop_back();
    tok->vocab_.emplace(line, id++);
  }
  if (tok->vocab_.empty()) {
    if (error_out) *error_out = "Vocabulary file is empty: " + vocab_path;
    return nullptr;
  }

  auto lookup = [&](const char* name, int64_t fallback) {
    auto it = tok->vocab_.find(name);
    return it == tok->vocab_.end() ? fallback : it->second;
  };
  tok->unk_id_ = lookup("[UNK]", 100);
  tok->cls_id_ = lookup("[CLS]", 101);
  tok->sep_id_ = lookup("[SEP]", 102);
  return tok;
}

int64_t WordPieceTokenizer::TokenToId(const std::string& token) const {
  auto it = vocab_.find(token);
  return it == vocab_.end() ? unk_id_ : it->second;
}

std::vector<std::string> WordPieceTokenizer::SplitWords(std::string_view text) {
  std::vector<std::string> words;
  std::string cur;
  auto flush = [&] {
    if (!cur.empty()) {
      words.push_back(std::move(cur));
      cur.clear();
    }
  };
  for (char c : text) {
    if (IsSpace(c)) {
      flush();
    } else if (IsAsciiPunct(c)) {
      flush();
      words.emplace_back(1, c);
    } else {
      cur += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
  }
  flush();
  return words;
}

void WordPieceTokenizer::AppendWordPieces(const std::string& word,
                                          std::vector<int64_t>* ids) const {
  if (word.size() > kMaxWordBytes) {
    ids->push_back(unk_id_);
    return;
  }

  std::vector<int64_t> pieces;
  size_t start = 0;
  while (start < word.size()) {
    size_t end = word.size();
    int64_t match = -1;
    for (; end > start; --end) {
      std::string piece = word.substr(start, end - start);
      if (start > 0) piece.insert(0, "##");
      auto it = vocab_.find(piece);
      if (it != vocab_.end()) {
        match = it->second;
        break;
      }
    }
    if (match < 0) {
      ids->push_back(unk_id_);
      return;
    }
    pieces.push_back(match);
    start = end;
  }
  ids->insert(ids->end(), pieces.begin(), pieces.end());
}

TokenizerResult WordPieceTokenizer::Tokenize(std::string_view text,
                                             size_t max_length) const {
  TokenizerResult result;
  std::vector<int64_t>& ids = result.input_ids;
  ids.push_back(cls_id_);
  for (const auto& word : SplitWords(text)) {
    AppendWordPieces(word, &ids);
    if (ids.size() >= max_length - 1) break;
  }
  if (ids.size() > max_length - 1) ids.resize(max_length - 1);
  ids.push_back(sep_id_);

  result.attention_mask.assign(ids.size(), 1);
  result.token_type_ids.assign(ids.size(), 0);
  return result;
}

}  // namespace engram::internal

#endif  // ENGRAM_ENABLE_SEMANTIC
