#pragma once
#include <combo/common/critical.hpp>
#include <combo/schema/account.hpp>
#include <combo/schema/block_result.hpp>
#include <combo/schema/combo_event.hpp>
#include <combo/schema/combo_record.hpp>
#include <combo/schema/encoding/encoder.hpp>
#include <combo/schema/history_entry.hpp>
#include <combo/schema/transaction.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace combo::schema::encoding {

struct scale_encoder_tag {};

// Schema types are plain aggregates; SCALE encodes them field by field in
// declaration order.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  combo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, combo::schema::bytes_t& out);

  template <typename T>
  T decode(const combo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const combo::schema::bytes_view_t& bytes);
};

template <typename T>
combo::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    combo::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        combo::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const combo::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    combo::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const combo::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace combo::schema::encoding
