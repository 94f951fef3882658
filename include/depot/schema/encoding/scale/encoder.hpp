#pragma once
#include <depot/common/critical.hpp>
#include <depot/schema/approval_record.hpp>
#include <depot/schema/area_state.hpp>
#include <depot/schema/encoding/encoder.hpp>
#include <depot/schema/encoding/scale/decision.hpp>
#include <depot/schema/encoding/scale/requisition_status.hpp>
#include <depot/schema/encoding/scale/role_id.hpp>
#include <depot/schema/inventory_item_state.hpp>
#include <depot/schema/machine_state.hpp>
#include <depot/schema/requisition_item_state.hpp>
#include <depot/schema/requisition_state.hpp>
#include <depot/schema/user_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace depot::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  depot::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, depot::schema::bytes_t& out);

  template <typename T>
  T decode(const depot::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const depot::schema::bytes_view_t& bytes);
};

template <typename T>
depot::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    depot::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        depot::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const depot::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    depot::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const depot::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace depot::schema::encoding
