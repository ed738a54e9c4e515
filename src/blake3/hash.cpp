#include <blake3.h>
#include <bequest/blake3/hash.hpp>

namespace bequest::blake3 {

bequest::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = bequest::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

bequest::schema::hash32_t hash(const bequest::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = bequest::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

bequest::schema::account_id_t make_account_id(const std::string_view& name) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init_derive_key(&hasher, "bequest account id v1");
  blake3_hasher_update(&hasher, name.data(), name.size());
  auto output = bequest::schema::account_id_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace bequest::blake3
