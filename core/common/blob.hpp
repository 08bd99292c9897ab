/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <ostream>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>
#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "common/hexutil.hpp"

#define ATTESTA_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)         \
  namespace space_name {                                                       \
    struct class_name : public ::attesta::common::Blob<blob_size> {            \
      using Base = ::attesta::common::Blob<blob_size>;                         \
                                                                               \
      class_name() = default;                                                  \
      class_name(const class_name &) = default;                                \
      class_name(class_name &&) = default;                                     \
      class_name &operator=(const class_name &) = default;                     \
      class_name &operator=(class_name &&) = default;                          \
                                                                               \
      explicit class_name(const Base &blob) : Base{blob} {}                    \
      explicit class_name(Base &&blob) : Base{std::move(blob)} {}              \
                                                                               \
      ~class_name() = default;                                                 \
                                                                               \
      friend inline ::scale::ScaleEncoderStream &operator<<(                   \
          ::scale::ScaleEncoderStream &s,                                      \
          const space_name::class_name &data) {                                \
        return s << static_cast<const Base &>(data);                           \
      }                                                                        \
                                                                               \
      friend inline ::scale::ScaleDecoderStream &operator>>(                   \
          ::scale::ScaleDecoderStream &s, space_name::class_name &data) {      \
        return s >> static_cast<Base &>(data);                                 \
      }                                                                        \
    };                                                                         \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct std::hash<space_name::class_name> {                                   \
    auto operator()(const space_name::class_name &key) const {                 \
      /* NOLINTNEXTLINE */                                                     \
      return boost::hash_range(key.cbegin(), key.cend());                      \
    }                                                                          \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct fmt::formatter<space_name::class_name>                                \
      : fmt::formatter<space_name::class_name::Base> {                         \
    template <typename FormatCtx>                                              \
    auto format(const space_name::class_name &blob, FormatCtx &ctx) const      \
        -> decltype(ctx.out()) {                                               \
      return fmt::formatter<space_name::class_name::Base>::format(blob, ctx);  \
    }                                                                          \
  };

namespace attesta::common {

  using byte_t = uint8_t;

  /// Fixed-size byte array, the base of hashes, keys and signatures.
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
    using Array = std::array<byte_t, size_>;

   public:
    // encoded without length prefix
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->data(), size_});
    }
  };

  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace attesta::common

namespace attesta {
  using common::Hash256;
}  // namespace attesta

template <size_t N>
struct std::hash<attesta::common::Blob<N>> {
  auto operator()(const attesta::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

template <size_t N>
struct fmt::formatter<attesta::common::Blob<N>> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = N > 4 ? 's' : 'l';

  // Parses format specifications of the form ['s' | 'l'].
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }

    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }

    return it;
  }

  template <typename FormatContext>
  auto format(const attesta::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            blob[0],
                            blob[1],
                            blob[N - 2],
                            blob[N - 1]);
    }

    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};
