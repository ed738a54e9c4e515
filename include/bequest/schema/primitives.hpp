#pragma once
#include <array>
#include <boost/endian/buffers.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bequest::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using vault_id_t = uint64_t;
using token_id_t = uint64_t;
using event_id_t = uint64_t;
using big_endian_id_t = boost::endian::big_uint64_buf_t;

/// Reserved beneficiary of a vault whose balance is split across shares.
/// Equal to the null identity, so it can never be a valid single recipient.
inline constexpr auto kNoSingleBeneficiary = account_id_t{};

inline constexpr auto kMillisecondsPerDay = duration_milliseconds_t{86'400'000};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// True for the all-zero identity, which never names a real account.
bool is_null_account(const account_id_t& account);

}  // namespace bequest::schema
