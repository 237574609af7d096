#include <engram/embedder.hpp>

namespace engram {

bool ParseEmbedderModelType(std::string_view name, EmbedderModelType* out) {
  if (name == "minilm") {
    *out = EmbedderModelType::kMiniLM;
  } else if (name == "bge-small") {
    *out = EmbedderModelType::kBGESmall;
  } else if (name == "bge-large") {
    *out = EmbedderModelType::kBGELarge;
  } else {
    return false;
  }
  return true;
}

}  // namespace engram

#ifdef ENGRAM_ENABLE_SEMANTIC

#include <engram/internal.hpp>
#include <engram/tokenizer.hpp>

#include <onnxruntime_cxx_api.h>

#include <filesystem>

namespace engram {

namespace {

class OnnxEmbedder : public Embedder {
 public:
  OnnxEmbedder(EmbedderModelType type, size_t dimension)
      : model_type_(type),
        dimension_(dimension),
        env_(ORT_LOGGING_LEVEL_WARNING, "engram_embedder"),
        memory_info_(Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                OrtMemType::OrtMemTypeDefault)) {}

  bool Initialize(const std::string& model_path, const std::string& vocab_path,
                  int num_threads, std::string* error_out) {
    tokenizer_ = internal::WordPieceTokenizer::Create(vocab_path, error_out);
    if (!tokenizer_) return false;

    try {
      Ort::SessionOptions session_options;
      if (num_threads > 0) session_options.SetIntraOpNumThreads(num_threads);
      session_options.SetGraphOptimizationLevel(
          GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
      session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(),
                                                session_options);

      Ort::AllocatorWithDefaultOptions allocator;
      for (size_t i = 0; i < session_->GetInputCount(); ++i) {
        input_names_str_.push_back(session_->GetInputNameAllocated(i, allocator).get());
      }
      for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
        output_names_str_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
      }
    } catch (const Ort::Exception& e) {
      if (error_out) *error_out = e.what();
      return false;
    }

    for (const auto& s : input_names_str_) input_names_.push_back(s.c_str());
    for (const auto& s : output_names_str_) output_names_.push_back(s.c_str());
    return true;
  }

  EmbeddingResult Embed(std::string_view text) const override {
    EmbeddingResult result;

    // BGE models expect a retrieval instruction prefix
    std::string input;
    if (model_type_ == EmbedderModelType::kBGESmall ||
        model_type_ == EmbedderModelType::kBGELarge) {
      input = "Represent this sentence for searching relevant passages: ";
    }
    input.append(text.data(), text.size());

    internal::TokenizerResult tokens = tokenizer_->Tokenize(input, 512);
    std::vector<int64_t> shape = {1, static_cast<int64_t>(tokens.input_ids.size())};

    try {
      std::vector<Ort::Value> inputs;
      for (const auto& name : input_names_str_) {
        std::vector<int64_t>* data = nullptr;
        if (name == "input_ids") {
          data = &tokens.input_ids;
        } else if (name == "attention_mask") {
          data = &tokens.attention_mask;
        } else if (name == "token_type_ids") {
          data = &tokens.token_type_ids;
        } else {
          result.error_message = "Unknown model input: " + name;
          return result;
        }
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(
            memory_info_, data->data(), data->size(), shape.data(), shape.size()));
      }

      auto outputs = session_->Run(Ort::RunOptions{nullptr}, input_names_.data(),
                                   inputs.data(), inputs.size(),
                                   output_names_.data(), output_names_.size());
      if (outputs.empty()) {
        result.error_message = "No output tensors";
        return result;
      }

      auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
      const float* data = outputs[0].GetTensorData<float>();

      if (out_shape.size() == 3) {
        // [batch, seq_len, hidden]: mean-pool over unmasked tokens
        const int64_t seq_len = out_shape[1];
        const int64_t hidden = out_shape[2];
        result.embedding.assign(static_cast<size_t>(hidden), 0.0f);
        float count = 0.0f;
        for (int64_t i = 0; i < seq_len; ++i) {
          if (i >= static_cast<int64_t>(tokens.attention_mask.size()) ||
              tokens.attention_mask[static_cast<size_t>(i)] == 0) {
            continue;
          }
          for (int64_t j = 0; j < hidden; ++j) {
            result.embedding[static_cast<size_t>(j)] += data[i * hidden + j];
          }
          count += 1.0f;
        }
        if (count > 0.0f) {
          for (float& v : result.embedding) v /= count;
        }
      } else if (out_shape.size() == 2) {
        result.embedding.assign(data, data + out_shape[1]);
      } else {
        result.error_message = "Unexpected output tensor shape";
        return result;
      }
    } catch (const Ort::Exception& e) {
      result.embedding.clear();
      result.error_message = e.what();
      return result;
    }

    if (result.embedding.size() != dimension_ ||
        !internal::L2Normalize(&result.embedding)) {
      result.embedding.clear();
      result.error_message = "model produced an unusable embedding";
      return result;
    }
    result.success = true;
    return result;
  }

  size_t Dimension() const override { return dimension_; }

  std::string Name() const override {
    switch (model_type_) {
      case EmbedderModelType::kMiniLM:
        return "onnx-minilm";
      case EmbedderModelType::kBGESmall:
        return "onnx-bge-small";
      case EmbedderModelType::kBGELarge:
        return "onnx-bge-large";
    }
    return "onnx";
  }

 private:
  EmbedderModelType model_type_;
  size_t dimension_;

  std::unique_ptr<internal::WordPieceTokenizer> tokenizer_;

  Ort::Env env_;
  Ort::MemoryInfo memory_info_;
  std::unique_ptr<Ort::Session> session_;

  std::vector<std::string> input_names_str_;
  std::vector<std::string> output_names_str_;
  std::vector<const char*> input_names_;
  std::vector<const char*> output_names_;
};

}  // namespace

std::unique_ptr<Embedder> NewOnnxEmbedder(const std::string& model_path,
                                          const std::string& vocab_path,
                                          EmbedderModelType type,
                                          int num_threads,
                                          std::string* error_out) {
  namespace fs = std::filesystem;
  fs::path vocab = vocab_path.empty()
                       ? fs::path(model_path).parent_path() / "vocab.txt"
                       : fs::path(vocab_path);
  std::error_code ec;
  if (!fs::exists(vocab, ec)) {
    if (error_out) *error_out = "Could not find vocabulary " + vocab.string();
    return nullptr;
  }
  if (!fs::exists(model_path, ec)) {
    if (error_out) *error_out = "Could not find model " + model_path;
    return nullptr;
  }

  size_t dimension = type == EmbedderModelType::kBGELarge ? 1024 : 384;
  auto embedder = std::make_unique<OnnxEmbedder>(type, dimension);
  if (!embedder->Initialize(model_path, vocab.string(), num_threads, error_out)) {
    return nullptr;
  }
  return embedder;
}

}  // namespace engram

#else  // !ENGRAM_ENABLE_SEMANTIC

namespace engram {

std::unique_ptr<Embedder> NewOnnxEmbedder(const std::string& /*model_path*/,
                                          const std::string& /*vocab_path*/,
                                          EmbedderModelType /*type*/,
                                          int /*num_threads*/,
                                          std::string* error_out) {
  if (error_out) {
    *error_out = "ONNX embedder not built. Rebuild with ENGRAM_ENABLE_SEMANTIC=ON";
  }
  return nullptr;
}

}  // namespace engram

#endif  // ENGRAM_ENABLE_SEMANTIC
