#include <spdlog/spdlog.h>
#include <combo/fingerprint/fingerprint.hpp>
#include <combo/store/address.hpp>
#include <combo/store/guards.hpp>
#include <combo/store/record_store.hpp>

#include <limits>
#include <utility>

namespace combo::store {

record_store::record_store(allocator& accounts,
                           clock_source_t clock,
                           event_sink_t sink)
    : accounts_{accounts}, clock_{std::move(clock)}, sink_{std::move(sink)} {}

create_result_t record_store::create(
    const combo::schema::account_id_t& owner,
    const combo::schema::create_combo_t& request) {
  if (auto error = validate_name_encoding(request)) {
    return *error;
  }
  if (auto error = validate_combo_data(request)) {
    return *error;
  }

  auto [address, bump] = find_record_address(owner);
  if (auto error = accounts_.allocate(owner, address, kComboAccountSpace)) {
    return *error;
  }

  auto now = clock_();
  auto record = combo::schema::combo_record_t{};
  record.owner = owner;
  record.character_id = request.character_id;
  record.name = request.name;
  record.damage = request.damage;
  record.meter_gain = request.meter_gain;
  record.move_count = request.move_count;
  record.created_at = now;
  record.fingerprint = combo::fingerprint::compute_fingerprint(
      request.name, request.damage, request.meter_gain, request.move_count,
      request.character_id);
  record.verification_count = 0;
  record.bump = bump;
  accounts_.write(address, record);

  spdlog::debug("Created combo '{}' at {} for {}", record.name,
                combo::schema::to_hex(address), combo::schema::to_hex(owner));
  sink_(combo::schema::combo_created_t{.combo = address,
                                       .owner = owner,
                                       .character_id = record.character_id,
                                       .damage = record.damage,
                                       .timestamp = now});
  return record;
}

std::optional<combo::schema::combo_error_code> record_store::verify(
    const combo::schema::account_id_t& verifier,
    const combo::schema::verify_combo_t& request) {
  if (auto error = verify_move_sequence(request)) {
    return error;
  }

  auto record = find(request.record);
  if (!record) {
    return combo::schema::combo_error_code::record_missing;
  }
  if (record->verification_count ==
      std::numeric_limits<uint32_t>::max()) {
    return combo::schema::combo_error_code::verification_count_overflow;
  }

  auto now = clock_();
  record->verification_count += 1;
  record->last_verified_at = now;
  accounts_.write(request.record, *record);

  spdlog::debug("Verified combo {} by {} ({} verifications)",
                combo::schema::to_hex(request.record),
                combo::schema::to_hex(verifier), record->verification_count);
  sink_(combo::schema::combo_verified_t{
      .combo = request.record,
      .moves_count = static_cast<uint8_t>(request.moves.size()),
      .timestamp = now});
  return std::nullopt;
}

std::optional<combo::schema::combo_error_code> record_store::destroy(
    const combo::schema::account_id_t& caller,
    const combo::schema::close_combo_t& request) {
  auto record = find(request.record);
  if (!record) {
    return combo::schema::combo_error_code::record_missing;
  }
  if (auto error = only_owner(*record, caller)) {
    return error;
  }
  if (auto error = accounts_.reclaim(request.record, request.destination)) {
    return error;
  }
  spdlog::debug("Closed combo {} into {}", combo::schema::to_hex(request.record),
                combo::schema::to_hex(request.destination));
  return std::nullopt;
}

std::optional<combo::schema::combo_record_t> record_store::find(
    const combo::schema::address_t& address) const {
  return accounts_.read<combo::schema::combo_record_t>(address);
}

std::optional<combo::schema::combo_record_t> record_store::find_by_owner(
    const combo::schema::account_id_t& owner) const {
  return find(find_record_address(owner).first);
}

std::vector<combo::schema::address_t> record_store::addresses() const {
  return accounts_.allocated_addresses();
}

}  // namespace combo::store
