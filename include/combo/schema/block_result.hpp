#pragma once

#include <combo/schema/primitives.hpp>
#include <combo/schema/transaction_result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace combo::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
};

using block_result_t = block_result<1>;

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root;
};

using commit_result_t = commit_result<1>;

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"combo-ledger"};
  std::string version{"0.1.0"};
  int64_t last_block_height{};
  hash32_t last_block_state_root;
};

using app_info_t = app_info<1>;

}  // namespace combo::schema
