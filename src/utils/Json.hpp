#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yyjson.h>

namespace rf::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    if (payload.empty()) {
      return Document();
    }
    return Document(yyjson_read(payload.data(), payload.size(),
                                YYJSON_READ_ALLOW_TRAILING_COMMAS));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }

  // Creates an object root; returns nullptr when allocation failed.
  yyjson_mut_val *make_object_root() {
    if (!doc_) {
      return nullptr;
    }
    auto *root = yyjson_mut_obj(doc_);
    yyjson_mut_doc_set_root(doc_, root);
    return root;
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

// Field readers for parsed objects. A missing key or a value of another
// type reads as std::nullopt.
inline std::optional<std::string> string_field(yyjson_val *object,
                                               char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> int_field(yyjson_val *object,
                                             char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_int(value)) {
    return std::nullopt;
  }
  return yyjson_get_sint(value);
}

inline std::optional<double> number_field(yyjson_val *object,
                                          char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_num(value)) {
    return std::nullopt;
  }
  return yyjson_get_num(value);
}

inline std::optional<bool> bool_field(yyjson_val *object, char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

inline std::vector<std::string> string_array(yyjson_val *array) {
  std::vector<std::string> result;
  if (array == nullptr || !yyjson_is_arr(array)) {
    return result;
  }
  size_t idx, limit;
  yyjson_val *entry = nullptr;
  yyjson_arr_foreach(array, idx, limit, entry) {
    if (yyjson_is_str(entry)) {
      result.emplace_back(yyjson_get_str(entry), yyjson_get_len(entry));
    }
  }
  return result;
}

} // namespace rf::json
