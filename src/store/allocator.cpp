#include <combo/store/allocator.hpp>

#include <limits>

namespace combo::store {

allocator::allocator(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<combo::schema::account_t> allocator::load(
    const combo::schema::address_t& address) const {
  auto key = combo::schema::key::make_account_key(encoder_, address);
  return storage_.get<combo::schema::account_t>(
      encoder_, combo::schema::bytes_view_t{key});
}

combo::schema::lamports_t allocator::balance(
    const combo::schema::address_t& address) const {
  auto account = load(address);
  if (!account) {
    return 0;
  }
  return account->lamports;
}

void allocator::credit(const combo::schema::address_t& address,
                       const combo::schema::lamports_t lamports) {
  auto account = load(address).value_or(combo::schema::account_t{});
  if (account.lamports >
      std::numeric_limits<combo::schema::lamports_t>::max() - lamports) {
    combo::common::critical("lamport balance overflow");
  }
  account.lamports += lamports;
  save(address, account);
}

std::optional<combo::schema::combo_error_code> allocator::allocate(
    const combo::schema::account_id_t& payer,
    const combo::schema::address_t& address,
    const uint32_t space) {
  auto existing = load(address);
  if (existing && existing->space > 0) {
    return combo::schema::combo_error_code::record_exists;
  }

  auto deposit = minimum_balance(space);
  auto funder = load(payer);
  if (!funder || funder->lamports < deposit) {
    spdlog::debug("Payer {} cannot fund deposit of {} lamports",
                  combo::schema::to_hex(payer), deposit);
    return combo::schema::combo_error_code::insufficient_funds;
  }
  funder->lamports -= deposit;
  save(payer, *funder);

  // Value already sent to the address stays with the allocation.
  auto account = load(address).value_or(combo::schema::account_t{});
  account.lamports += deposit;
  account.space = space;
  account.data.clear();
  save(address, account);
  return std::nullopt;
}

std::optional<combo::schema::combo_error_code> allocator::reclaim(
    const combo::schema::address_t& address,
    const combo::schema::account_id_t& destination) {
  auto account = load(address);
  if (!account || account->space == 0) {
    return combo::schema::combo_error_code::record_missing;
  }
  if (destination == address) {
    return combo::schema::combo_error_code::invalid_destination;
  }

  auto key = combo::schema::key::make_account_key(encoder_, address);
  storage_.erase(combo::schema::bytes_view_t{key});
  credit(destination, account->lamports);
  spdlog::debug("Reclaimed {} lamports from {} to {}", account->lamports,
                combo::schema::to_hex(address),
                combo::schema::to_hex(destination));
  return std::nullopt;
}

std::vector<combo::schema::address_t> allocator::allocated_addresses() const {
  auto prefix = combo::schema::make_bytes(combo::schema::key::kAccountKeyPrefix);
  auto rows = storage_.list_by_prefix(combo::schema::bytes_view_t{prefix});
  auto addresses = std::vector<combo::schema::address_t>{};
  for (const auto& [key, value] : rows) {
    auto address = combo::schema::key::parse_account_key(
        encoder_, combo::schema::bytes_view_t{key});
    if (!address) {
      combo::common::critical("malformed account key");
    }
    auto account = encoder_.decode<combo::schema::account_t>(
        combo::schema::bytes_view_t{value});
    if (account.space > 0) {
      addresses.push_back(*address);
    }
  }
  return addresses;
}

void allocator::save(const combo::schema::address_t& address,
                     const combo::schema::account_t& account) {
  auto key = combo::schema::key::make_account_key(encoder_, address);
  if (account.lamports == 0 && account.space == 0) {
    storage_.erase(combo::schema::bytes_view_t{key});
    return;
  }
  storage_.put(encoder_, combo::schema::bytes_view_t{key}, account);
}

}  // namespace combo::store
