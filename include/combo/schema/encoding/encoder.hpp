#pragma once
#include <combo/schema/primitives.hpp>
#include <optional>
#include <span>

namespace combo::schema::encoding {

// The codec is a build-time choice selected by tag type; hot swapping is not
// a goal.
template <typename Library>
struct encoder {
  template <typename T>
  combo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, combo::schema::bytes_t& out);

  template <typename T>
  T decode(const combo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const combo::schema::bytes_view_t& bytes);
};

}  // namespace combo::schema::encoding
