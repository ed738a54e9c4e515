#pragma once
#include <bequest/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bequest::schema::encoding {

// The wire and storage codec is chosen at build time by tag. Ledger code is
// written against this interface only and never names the library.
template <typename Library>
struct encoder {
  template <typename T>
  bequest::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bequest::schema::bytes_t& out);

  template <typename T>
  T decode(const bequest::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bequest::schema::bytes_view_t& bytes);
};

}  // namespace bequest::schema::encoding
