#pragma once

#include <combo/schema/close_combo.hpp>
#include <combo/schema/combo_error_code.hpp>
#include <combo/schema/combo_event.hpp>
#include <combo/schema/combo_record.hpp>
#include <combo/schema/create_combo.hpp>
#include <combo/schema/verify_combo.hpp>
#include <combo/store/allocator.hpp>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace combo::store {

using clock_source_t = std::function<combo::schema::unix_timestamp_t()>;
using event_sink_t = std::function<void(const combo::schema::combo_event_t&)>;

using create_result_t =
    std::variant<combo::schema::combo_record_t, combo::schema::combo_error_code>;

/// Keyed collection of combo records, one per owning identity.
///
/// Every operation validates before touching storage; a returned error code
/// means no state changed. Events are emitted only after a successful
/// mutation.
class record_store final {
 public:
  record_store(allocator& accounts, clock_source_t clock, event_sink_t sink);

  /// Create the record of `owner` at its derived address.
  create_result_t create(const combo::schema::account_id_t& owner,
                         const combo::schema::create_combo_t& request);

  /// Count a verification of the record at `request.record`. Not owner-gated.
  std::optional<combo::schema::combo_error_code> verify(
      const combo::schema::account_id_t& verifier,
      const combo::schema::verify_combo_t& request);

  /// Owner-only removal; the allocation value goes to `request.destination`.
  std::optional<combo::schema::combo_error_code> destroy(
      const combo::schema::account_id_t& caller,
      const combo::schema::close_combo_t& request);

  std::optional<combo::schema::combo_record_t> find(
      const combo::schema::address_t& address) const;

  std::optional<combo::schema::combo_record_t> find_by_owner(
      const combo::schema::account_id_t& owner) const;

  std::vector<combo::schema::address_t> addresses() const;

 private:
  allocator& accounts_;
  clock_source_t clock_;
  event_sink_t sink_;
};

}  // namespace combo::store
