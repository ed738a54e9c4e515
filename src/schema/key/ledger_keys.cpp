#include <bequest/schema/key/builder.hpp>
#include <bequest/schema/key/ledger_keys.hpp>

namespace bequest::schema::key {

namespace {

bequest::schema::bytes_t make_id_key(const std::string_view prefix,
                                     const uint64_t id) {
  auto b = builder{};
  b.write(prefix).write_id(id);
  return b.data;
}

bequest::schema::bytes_t make_index_prefix(const std::string_view prefix,
                                           const account_id_t& account) {
  auto b = builder{};
  b.write(prefix).write(account);
  return b.data;
}

bequest::schema::bytes_t make_index_key(const std::string_view prefix,
                                        const account_id_t& account,
                                        const vault_id_t vault_id) {
  auto b = builder{};
  b.write(prefix).write(account).write_id(vault_id);
  return b.data;
}

}  // namespace

bequest::schema::bytes_t make_vault_key(const vault_id_t vault_id) {
  return make_id_key(kVaultKeyPrefix, vault_id);
}

bequest::schema::bytes_t make_token_key(const token_id_t token_id) {
  return make_id_key(kTokenKeyPrefix, token_id);
}

bequest::schema::bytes_t make_shares_key(const vault_id_t vault_id) {
  return make_id_key(kSharesKeyPrefix, vault_id);
}

bequest::schema::bytes_t make_event_key(const event_id_t event_id) {
  return make_id_key(kEventPrefix, event_id);
}

bequest::schema::bytes_t make_owner_index_prefix(const account_id_t& owner) {
  return make_index_prefix(kOwnerIndexPrefix, owner);
}

bequest::schema::bytes_t make_owner_index_key(const account_id_t& owner,
                                              const vault_id_t vault_id) {
  return make_index_key(kOwnerIndexPrefix, owner, vault_id);
}

bequest::schema::bytes_t make_beneficiary_index_prefix(
    const account_id_t& beneficiary) {
  return make_index_prefix(kBeneficiaryIndexPrefix, beneficiary);
}

bequest::schema::bytes_t make_beneficiary_index_key(
    const account_id_t& beneficiary,
    const vault_id_t vault_id) {
  return make_index_key(kBeneficiaryIndexPrefix, beneficiary, vault_id);
}

std::optional<uint64_t> parse_trailing_id(
    const bequest::schema::bytes_view_t& key) {
  if (key.size() < sizeof(big_endian_id_t)) {
    return std::nullopt;
  }
  return read_id(key, key.size() - sizeof(big_endian_id_t));
}

}  // namespace bequest::schema::key
