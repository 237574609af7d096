#pragma once

#ifdef ENGRAM_ENABLE_SEMANTIC

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace engram::internal {

/**
 * Model inputs for one sequence: [CLS] tokens... [SEP].
 */
struct TokenizerResult {
  std::vector<int64_t> input_ids;
  std::vector<int64_t> attention_mask;
  std::vector<int64_t> token_type_ids;
};

/**
 * Greedy longest-match WordPiece tokenizer (BERT, MiniLM, BGE vocabularies).
 * Vocabulary is a vocab.txt with one token per line; the line number is the
 * token id.
 */
class WordPieceTokenizer {
 public:
  static std::unique_ptr<WordPieceTokenizer> Create(const std::string& vocab_path,
                                                    std::string* error_out = nullptr);

  // Sequences longer than max_length are cut, keeping [SEP] last.
  TokenizerResult Tokenize(std::string_view text, size_t max_length = 512) const;

  size_t VocabSize() const { return vocab_.size(); }
  int64_t TokenToId(const std::string& token) const;

 private:
  WordPieceTokenizer() = default;

  // Lowercase, split on whitespace, punctuation is its own word.
  static std::vector<std::string> SplitWords(std::string_view text);

  void AppendWordPieces(const std::string& word, std::vector<int64_t>* ids) const;

  std::unordered_map<std::string, int64_t> vocab_;
  int64_t unk_id_ = 100;
  int64_t cls_id_ = 101;
  int64_t sep_id_ = 102;

  static constexpr size_t kMaxWordBytes = 200;
};

}  // namespace engram::internal

#endif  // ENGRAM_ENABLE_SEMANTIC
