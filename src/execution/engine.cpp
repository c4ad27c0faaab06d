#include <spdlog/spdlog.h>
#include <algorithm>
#include <combo/blake3/hash.hpp>
#include <combo/execution/engine.hpp>
#include <combo/schema/key/engine_keys.hpp>
#include <combo/store/address.hpp>
#include <combo/store/guards.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace combo::schema;

namespace {

using encoder_t =
    combo::schema::encoding::encoder<combo::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckCodespace = std::string_view{"combo.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"combo.finalize"};
constexpr auto kQueryCodespace = std::string_view{"combo.query"};

combo::schema::hash32_t fold_state_root(const combo::schema::hash32_t& seed,
                                        const combo::schema::bytes_t& tx,
                                        uint64_t height,
                                        uint64_t index) {
  auto material = combo::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return combo::blake3::hash(
      combo::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<combo::schema::transaction_t> decode_transaction(
    encoder_t& encoder,
    const combo::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<combo::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

combo::schema::transaction_result_t make_error_result(
    const combo::schema::combo_error_code code,
    const std::string_view codespace,
    std::string info = {}) {
  auto result = combo::schema::transaction_result_t{};
  result.code = combo::schema::to_code(code);
  result.log = std::string{combo::schema::describe(code)};
  result.info =
      info.empty() ? std::string{combo::schema::to_string(code)} : info;
  result.codespace = std::string{codespace};
  return result;
}

combo::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    const bool index = false) {
  return combo::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

combo::schema::transaction_event_t make_transaction_event(
    const combo::schema::combo_event_t& event) {
  auto result = combo::schema::transaction_event_t{};
  std::visit(
      overloaded{
          [&](const combo::schema::combo_created_t& created) {
            result.type = "combo_created";
            result.attributes = {
                make_attribute("combo", to_hex(created.combo), true),
                make_attribute("owner", to_hex(created.owner), true),
                make_attribute("character_id",
                               std::to_string(created.character_id)),
                make_attribute("damage", std::to_string(created.damage)),
                make_attribute("timestamp", std::to_string(created.timestamp))};
          },
          [&](const combo::schema::combo_verified_t& verified) {
            result.type = "combo_verified";
            result.attributes = {
                make_attribute("combo", to_hex(verified.combo), true),
                make_attribute("moves_count",
                               std::to_string(verified.moves_count)),
                make_attribute("timestamp",
                               std::to_string(verified.timestamp))};
          }},
      event);
  return result;
}

std::optional<combo::schema::combo_error_code> check_payload(
    const combo::schema::transaction_payload_t& payload) {
  auto payload_version =
      std::visit([](const auto& value) { return value.version; }, payload);
  if (payload_version != 1) {
    return combo::schema::combo_error_code::unsupported_transaction_version;
  }
  return std::visit(
      overloaded{
          [](const combo::schema::create_combo_t& create)
              -> std::optional<combo::schema::combo_error_code> {
            if (auto error = combo::store::validate_name_encoding(create)) {
              return error;
            }
            return combo::store::validate_combo_data(create);
          },
          [](const combo::schema::verify_combo_t& verify) {
            return combo::store::verify_move_sequence(verify);
          },
          [](const combo::schema::close_combo_t&)
              -> std::optional<combo::schema::combo_error_code> {
            return std::nullopt;
          }},
      payload);
}

}  // namespace

namespace combo::execution {

combo::schema::hash32_t default_chain_id() {
  return combo::blake3::hash(std::string_view{"combo-devnet"});
}

engine::engine(
    combo::schema::encoding::encoder<
        combo::schema::encoding::scale_encoder_tag>& encoder,
    combo::storage::storage<combo::storage::rocksdb_storage_tag>& storage,
    engine_options options)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{options.chain_id},
      accounts_{encoder, storage},
      records_{accounts_, [this]() { return current_block_time_; },
               [this](const combo::schema::combo_event_t& event) {
                 emitted_.push_back(event);
               }} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine for chain {}",
               to_hex(chain_id_));
  load_persisted_state();
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

combo::schema::transaction_result_t engine::check_transaction(
    const combo::schema::bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(combo_error_code::invalid_transaction,
                             kCheckCodespace, decode_error);
  }
  return validate_transaction(*maybe_tx, kCheckCodespace);
}

combo::schema::transaction_result_t engine::validate_transaction(
    const combo::schema::transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(combo_error_code::unsupported_transaction_version,
                             codespace, "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(combo_error_code::invalid_chain_id, codespace);
  }
  if (auto error = check_payload(tx.payload)) {
    return make_error_result(*error, codespace);
  }
  return combo::schema::transaction_result_t{};
}

combo::schema::transaction_result_t engine::execute_operation(
    const combo::schema::transaction_t& tx) {
  auto result = combo::schema::transaction_result_t{};
  auto fail = [&](const combo_error_code code) {
    result = make_error_result(code, kFinalizeCodespace);
  };

  std::visit(
      overloaded{
          [&](const combo::schema::create_combo_t& create) {
            auto created = records_.create(tx.signer, create);
            if (auto error = std::get_if<combo_error_code>(&created)) {
              fail(*error);
              return;
            }
            auto address = combo::store::find_record_address(tx.signer).first;
            result.data = encoder_.encode(address);
            result.info = "combo created";
          },
          [&](const combo::schema::verify_combo_t& verify) {
            if (auto error = records_.verify(tx.signer, verify)) {
              fail(*error);
              return;
            }
            result.info = "combo verified";
          },
          [&](const combo::schema::close_combo_t& close) {
            if (auto error = records_.destroy(tx.signer, close)) {
              fail(*error);
              return;
            }
            result.info = "combo closed";
          }},
      tx.payload);
  return result;
}

void engine::flush_events(const uint64_t height,
                          const uint32_t tx_index,
                          combo::schema::transaction_result_t& result) {
  if (emitted_.empty()) {
    return;
  }
  auto sequence_key = combo::schema::key::make_event_sequence_key(encoder_);
  auto next_id =
      storage_.get<uint64_t>(encoder_, bytes_view_t{sequence_key}).value_or(1);
  for (auto& event : emitted_) {
    auto row = combo::schema::event_record_t{.event_id = next_id,
                                             .height = height,
                                             .tx_index = tx_index,
                                             .event = event};
    auto event_key = combo::schema::key::make_event_key(encoder_, next_id);
    storage_.put(encoder_, bytes_view_t{event_key}, row);
    result.events.push_back(make_transaction_event(event));
    ++next_id;
  }
  storage_.put(encoder_, bytes_view_t{sequence_key}, next_id);
  emitted_.clear();
}

combo::schema::block_result_t engine::finalize_block(
    const uint64_t height,
    const combo::schema::unix_timestamp_t block_time,
    const std::vector<combo::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  current_block_time_ = block_time;
  auto result = combo::schema::block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        encoder_, bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);

    auto tx_result = combo::schema::transaction_result_t{};
    if (!maybe_tx) {
      tx_result = make_error_result(combo_error_code::invalid_transaction,
                                    kFinalizeCodespace, decode_error);
    } else {
      tx_result = validate_transaction(*maybe_tx, kFinalizeCodespace);
      if (tx_result.code == 0) {
        tx_result = execute_operation(*maybe_tx);
      }
    }

    if (tx_result.code == 0) {
      flush_events(height, index, tx_result);
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      emitted_.clear();
      spdlog::warn("Rejected tx {} at height {}: {}", i, height,
                   tx_result.log);
    }

    auto history_key =
        combo::schema::key::make_history_key(encoder_, height, index);
    storage_.put(encoder_, bytes_view_t{history_key},
                 combo::schema::history_entry_t{.height = height,
                                                .index = index,
                                                .code = tx_result.code,
                                                .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

combo::schema::commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }
  storage_.save_committed_state(
      combo::storage::committed_state{.height = last_committed_height_,
                                      .state_root = last_committed_state_root_});
  spdlog::info("Committed height {} state root {}", last_committed_height_,
               to_hex(last_committed_state_root_));

  auto result = combo::schema::commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

combo::schema::app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = combo::schema::app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

combo::schema::query_result_t engine::query(
    const std::string_view path,
    const combo::schema::bytes_view_t& data) {
  auto result = combo::schema::query_result_t{};
  result.key = make_bytes(data);
  result.codespace = std::string{kQueryCodespace};
  {
    auto lock = std::scoped_lock{mutex_};
    result.height = last_committed_height_;
  }

  auto fail = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    return result;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(info());
    return result;
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& prefix : combo::schema::key::kEngineKeyspaces) {
      keyspaces.emplace_back(prefix);
    }
    result.value = encoder_.encode(keyspaces);
    return result;
  }
  if (path == "/history/range" || path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "expected (from, to) range");
    }
    auto [from, to] = *range;
    if (path == "/history/range") {
      result.value = encoder_.encode(history(from, to));
    } else {
      result.value = encoder_.encode(events(from, to));
    }
    return result;
  }

  if (path != "/state/combo" && path != "/state/combo_address" &&
      path != "/state/account") {
    return fail(query_error_code::unsupported_path, "unsupported path");
  }
  auto id = encoder_.try_decode<hash32_t>(data);
  if (!id || data.size() != id->size()) {
    return fail(query_error_code::invalid_key, "expected 32-byte key");
  }

  auto lock = std::scoped_lock{mutex_};
  if (path == "/state/combo") {
    auto record = records_.find(*id);
    if (!record) {
      return fail(query_error_code::not_found, "combo not found");
    }
    result.value = encoder_.encode(*record);
  } else if (path == "/state/combo_address") {
    auto [address, bump] = combo::store::find_record_address(*id);
    result.value = encoder_.encode(std::tuple{address, bump});
  } else {
    auto account = accounts_.load(*id);
    if (!account) {
      return fail(query_error_code::not_found, "account not found");
    }
    result.value = encoder_.encode(*account);
  }
  return result;
}

std::vector<combo::schema::history_entry_t> engine::history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = make_bytes(combo::schema::key::kHistoryPrefix);
  auto rows = storage_.list_by_prefix(bytes_view_t{prefix});
  auto out = std::vector<combo::schema::history_entry_t>{};
  for (const auto& [key, value] : rows) {
    auto entry =
        encoder_.decode<combo::schema::history_entry_t>(bytes_view_t{value});
    if (entry.height >= from_height && entry.height <= to_height) {
      out.push_back(std::move(entry));
    }
  }
  std::sort(std::begin(out), std::end(out),
            [](const auto& lhs, const auto& rhs) {
              return std::tie(lhs.height, lhs.index) <
                     std::tie(rhs.height, rhs.index);
            });
  return out;
}

std::vector<combo::schema::event_record_t> engine::events(
    const uint64_t from_id,
    const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = make_bytes(combo::schema::key::kEventPrefix);
  auto rows = storage_.list_by_prefix(bytes_view_t{prefix});
  auto out = std::vector<combo::schema::event_record_t>{};
  for (const auto& [key, value] : rows) {
    auto row =
        encoder_.decode<combo::schema::event_record_t>(bytes_view_t{value});
    if (row.event_id >= from_id && row.event_id <= to_id) {
      out.push_back(std::move(row));
    }
  }
  std::sort(std::begin(out), std::end(out),
            [](const auto& lhs, const auto& rhs) {
              return lhs.event_id < rhs.event_id;
            });
  return out;
}

void engine::credit(const combo::schema::account_id_t& account,
                    const combo::schema::lamports_t lamports) {
  auto lock = std::scoped_lock{mutex_};
  accounts_.credit(account, lamports);
  spdlog::info("Credited {} lamports to {}", lamports, to_hex(account));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
    return;
  }
  last_committed_state_root_ = make_zero_hash();
  pending_state_root_ = last_committed_state_root_;
  storage_.save_committed_state(
      combo::storage::committed_state{.height = last_committed_height_,
                                      .state_root = last_committed_state_root_});
}

}  // namespace combo::execution
