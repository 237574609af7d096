#include <engram/config.hpp>

#include <engram/embedder.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>

namespace engram {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

int64_t ParseInt(const std::string& key, const std::string& value) {
  size_t pos = 0;
  long long v = 0;
  try {
    v = std::stoll(value, &pos);
  } catch (const std::exception&) {
    throw ConfigError("Invalid integer for " + key + ": " + value);
  }
  if (pos != value.size()) {
    throw ConfigError("Invalid integer for " + key + ": " + value);
  }
  return static_cast<int64_t>(v);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw ConfigError("Invalid boolean for " + key + ": " + value);
}

bool IsValidCollectionName(const std::string& name) {
  if (name.empty()) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '-';
  });
}

void RequireNonNegative(const char* key, int64_t v) {
  if (v < 0) {
    throw ConfigError(std::string(key) + " must not be negative: " +
                      std::to_string(v));
  }
}

void RequirePositive(const char* key, int64_t v) {
  if (v <= 0) {
    throw ConfigError(std::string(key) + " must be positive: " +
                      std::to_string(v));
  }
}

}  // namespace

std::string IndexConfig::CollectionFor(PrivacyClass privacy,
                                       MemoryType type) const {
  switch (privacy) {
    case PrivacyClass::kPrivate:
      return "";
    case PrivacyClass::kSensitive:
      return restricted_collection;
    case PrivacyClass::kPublic:
      break;
  }
  switch (type) {
    case MemoryType::kConversation:
      return conversation_collection;
    case MemoryType::kTechnical:
      return technical_collection;
    case MemoryType::kInsight:
      return insight_collection;
    case MemoryType::kPattern:
      return pattern_collection;
    case MemoryType::kFact:
      return fact_collection;
  }
  return conversation_collection;
}

std::vector<std::string> IndexConfig::AllCollections() const {
  std::vector<std::string> out = UnrestrictedCollections();
  out.push_back(restricted_collection);
  return out;
}

std::vector<std::string> IndexConfig::UnrestrictedCollections() const {
  return {conversation_collection, technical_collection, insight_collection,
          pattern_collection, fact_collection};
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;
  int line_no = 0;

  while (std::getline(file, line)) {
    ++line_no;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw ConfigError(path + ":" + std::to_string(line_no) +
                        ": expected 'key: value'");
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      if (current_section != "storage" && current_section != "cache" &&
          current_section != "index" && current_section != "crypto" &&
          current_section != "logging") {
        throw ConfigError("Unknown config section: " + current_section);
      }
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    const std::string qualified = current_section + "." + key;

    if (current_section == "storage") {
      if (key == "data_dir") {
        config.storage.data_dir = value;
      } else if (key == "retention_days") {
        config.storage.retention_days = ParseInt(qualified, value);
      } else if (key == "sync_writes") {
        config.storage.sync_writes = ParseBool(qualified, value);
      } else {
        throw ConfigError("Unknown config key: " + qualified);
      }
    } else if (current_section == "cache") {
      if (key == "embedding_ttl_seconds") {
        config.cache.embedding_ttl_seconds = ParseInt(qualified, value);
      } else if (key == "embedding_capacity") {
        config.cache.embedding_capacity = ParseInt(qualified, value);
      } else if (key == "query_ttl_seconds") {
        config.cache.query_ttl_seconds = ParseInt(qualified, value);
      } else if (key == "query_capacity") {
        config.cache.query_capacity = ParseInt(qualified, value);
      } else {
        throw ConfigError("Unknown config key: " + qualified);
      }
    } else if (current_section == "index") {
      if (key == "embedding_dimensions") {
        config.index.embedding_dimensions = ParseInt(qualified, value);
      } else if (key == "default_top_k") {
        config.index.default_top_k = ParseInt(qualified, value);
      } else if (key == "max_index_text_bytes") {
        config.index.max_index_text_bytes = ParseInt(qualified, value);
      } else if (key == "conversation_collection") {
        config.index.conversation_collection = value;
      } else if (key == "technical_collection") {
        config.index.technical_collection = value;
      } else if (key == "insight_collection") {
        config.index.insight_collection = value;
      } else if (key == "pattern_collection") {
        config.index.pattern_collection = value;
      } else if (key == "fact_collection") {
        config.index.fact_collection = value;
      } else if (key == "restricted_collection") {
        config.index.restricted_collection = value;
      } else if (key == "embedder") {
        config.index.embedder = value;
      } else if (key == "model_path") {
        config.index.model_path = value;
      } else if (key == "vocab_path") {
        config.index.vocab_path = value;
      } else if (key == "model_type") {
        config.index.model_type = value;
      } else if (key == "embedder_threads") {
        config.index.embedder_threads = ParseInt(qualified, value);
      } else if (key == "vector_search") {
        config.index.vector_search = value;
      } else if (key == "hnsw_m") {
        config.index.hnsw_m = ParseInt(qualified, value);
      } else if (key == "hnsw_ef_construction") {
        config.index.hnsw_ef_construction = ParseInt(qualified, value);
      } else if (key == "hnsw_ef_search") {
        config.index.hnsw_ef_search = ParseInt(qualified, value);
      } else {
        throw ConfigError("Unknown config key: " + qualified);
      }
    } else if (current_section == "crypto") {
      if (key == "key_file") {
        config.crypto.key_file = value;
      } else {
        throw ConfigError("Unknown config key: " + qualified);
      }
    } else if (current_section == "logging") {
      if (key == "level") {
        config.log_level = value;
      } else {
        throw ConfigError("Unknown config key: " + qualified);
      }
    } else {
      throw ConfigError("Config key outside of a section: " + key);
    }
  }

  return config;
}

void Config::Validate() const {
  if (storage.data_dir.empty()) {
    throw ConfigError("storage.data_dir is required");
  }
  RequireNonNegative("storage.retention_days", storage.retention_days);
  if (storage.retention_days > 3650) {
    throw ConfigError("storage.retention_days must be at most 3650: " +
                      std::to_string(storage.retention_days));
  }

  RequireNonNegative("cache.embedding_ttl_seconds", cache.embedding_ttl_seconds);
  RequireNonNegative("cache.query_ttl_seconds", cache.query_ttl_seconds);
  RequirePositive("cache.embedding_capacity", cache.embedding_capacity);
  RequirePositive("cache.query_capacity", cache.query_capacity);

  RequirePositive("index.embedding_dimensions", index.embedding_dimensions);
  RequirePositive("index.default_top_k", index.default_top_k);
  RequirePositive("index.max_index_text_bytes", index.max_index_text_bytes);
  RequirePositive("index.hnsw_m", index.hnsw_m);
  RequirePositive("index.hnsw_ef_construction", index.hnsw_ef_construction);
  RequirePositive("index.hnsw_ef_search", index.hnsw_ef_search);
  if (index.hnsw_m > std::numeric_limits<int>::max() ||
      index.hnsw_ef_construction > std::numeric_limits<int>::max() ||
      index.hnsw_ef_search > std::numeric_limits<int>::max() ||
      index.embedder_threads > std::numeric_limits<int>::max()) {
    throw ConfigError("index.hnsw_* and index.embedder_threads must fit in an int");
  }

  if (index.embedder != "hashing" && index.embedder != "onnx") {
    throw ConfigError("Invalid index.embedder: " + index.embedder +
                      " (must be hashing or onnx)");
  }
  EmbedderModelType model_type;
  if (!ParseEmbedderModelType(index.model_type, &model_type)) {
    throw ConfigError("Invalid index.model_type: " + index.model_type +
                      " (must be minilm, bge-small or bge-large)");
  }
  if (index.embedder == "onnx" && index.model_path.empty()) {
    throw ConfigError("index.model_path is required when index.embedder is onnx");
  }
  RequireNonNegative("index.embedder_threads", index.embedder_threads);
  if (index.vector_search != "flat" && index.vector_search != "hnsw") {
    throw ConfigError("Invalid index.vector_search: " + index.vector_search +
                      " (must be flat or hnsw)");
  }

  std::set<std::string> seen;
  for (const auto& name : index.AllCollections()) {
    if (!IsValidCollectionName(name)) {
      throw ConfigError("Invalid collection name '" + name +
                        "' (allowed: a-z, 0-9, '_', '-')");
    }
    if (!seen.insert(name).second) {
      throw ConfigError("Duplicate collection name: " + name);
    }
  }

  if (crypto.key_file.empty()) {
    throw ConfigError("crypto.key_file is required");
  }

  if (log_level != "trace" && log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error" && log_level != "off") {
    throw ConfigError("Invalid logging.level: " + log_level +
                      " (must be trace, debug, info, warn, error, or off)");
  }
}

std::string Config::KeyFilePath() const {
  std::filesystem::path p(crypto.key_file);
  if (p.is_absolute()) return p.string();
  return (std::filesystem::path(storage.data_dir) / p).string();
}

}  // namespace engram
