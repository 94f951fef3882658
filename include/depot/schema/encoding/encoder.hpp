#pragma once
#include <depot/schema/primitives.hpp>
#include <optional>
#include <span>

namespace depot::schema::encoding {

// Encoding backend is a build time choice: callers hold an encoder<Library>
// and the storage, key and audit layers are templated on it.
template <typename Library>
struct encoder {
  template <typename T>
  depot::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, depot::schema::bytes_t& out);

  template <typename T>
  T decode(const depot::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const depot::schema::bytes_view_t& bytes);
};

}  // namespace depot::schema::encoding
