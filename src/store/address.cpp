#include <combo/blake3/hash.hpp>
#include <combo/schema/key/builder.hpp>
#include <combo/store/address.hpp>

namespace combo::store {

const combo::schema::hash32_t& program_id() {
  static const auto id = combo::blake3::hash(std::string_view{"combo-mint"});
  return id;
}

combo::schema::address_t derive_address(
    const std::string_view seed,
    const combo::schema::account_id_t& owner,
    const uint8_t bump,
    const combo::schema::hash32_t& program) {
  auto preimage = combo::schema::key::builder{};
  preimage.write(seed)
      .write(owner)
      .write(bump)
      .write(program)
      .write(kDerivationMarker);
  return combo::blake3::hash(preimage.view());
}

std::pair<combo::schema::address_t, uint8_t> find_record_address(
    const combo::schema::account_id_t& owner) {
  // Derived addresses are never checked against the signing curve, so the
  // search always settles on the canonical bump.
  return {derive_address(kComboSeed, owner, kCanonicalBump, program_id()),
          kCanonicalBump};
}

}  // namespace combo::store
