#pragma once
#include <popchain/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace popchain::storage {

using key_value_entry_t =
    std::pair<popchain::schema::bytes_t, popchain::schema::bytes_t>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  popchain::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const popchain::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const popchain::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint (sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (sequence + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const popchain::schema::bytes_view_t& prefix) const;

  /// Atomically write all entries together with the new checkpoint.
  ///
  /// Either every entry and the checkpoint become visible, or none do.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace popchain::storage
