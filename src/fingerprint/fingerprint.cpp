#include <combo/crypto/sha256.hpp>
#include <combo/fingerprint/fingerprint.hpp>
#include <combo/schema/key/builder.hpp>

#include <utility>

namespace combo::fingerprint {

combo::schema::bytes_t canonical_bytes(const std::string_view name,
                                       const uint32_t damage,
                                       const uint32_t meter_gain,
                                       const uint8_t move_count,
                                       const uint8_t character_id) {
  auto preimage = combo::schema::key::builder{};
  preimage.data.reserve(name.size() + 10);
  preimage.write(name)
      .write(damage)
      .write(meter_gain)
      .write(move_count)
      .write(character_id);
  return std::move(preimage.data);
}

combo::schema::hash32_t compute_fingerprint(const std::string_view name,
                                            const uint32_t damage,
                                            const uint32_t meter_gain,
                                            const uint8_t move_count,
                                            const uint8_t character_id) {
  auto preimage =
      canonical_bytes(name, damage, meter_gain, move_count, character_id);
  return combo::crypto::sha256(
      combo::schema::bytes_view_t{preimage.data(), preimage.size()});
}

combo::schema::hash32_t compute_fingerprint(
    const combo::schema::combo_record_t& record) {
  return compute_fingerprint(record.name, record.damage, record.meter_gain,
                             record.move_count, record.character_id);
}

bool matches(const combo::schema::combo_record_t& record) {
  return compute_fingerprint(record) == record.fingerprint;
}

}  // namespace combo::fingerprint
