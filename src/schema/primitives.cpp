#include <multitest/common/critical.hpp>
#include <multitest/schema/primitives.hpp>

#include <iterator>
#include <string_view>

namespace multitest::schema {

namespace {

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> base64_sextet(const char c) {
  auto position = kBase64Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  auto accumulator = uint32_t{0};
  auto bits = 0u;
  for (const auto byte : bytes) {
    accumulator = (accumulator << 8u) | byte;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kBase64Alphabet[(accumulator >> bits) & 0x3Fu]);
    }
  }
  if (bits > 0) {
    out.push_back(kBase64Alphabet[(accumulator << (6 - bits)) & 0x3Fu]);
  }
  while ((out.size() % 4) != 0) {
    out.push_back('=');
  }
  return out;
}

std::optional<bytes_t> try_from_base64(std::string_view encoded) {
  if ((encoded.size() % 4) != 0) {
    return std::nullopt;
  }
  auto padding = std::size_t{0};
  while (padding < 2 && !encoded.empty() && encoded.back() == '=') {
    encoded.remove_suffix(1);
    ++padding;
  }

  auto out = bytes_t{};
  out.reserve((encoded.size() * 3) / 4);
  auto accumulator = uint32_t{0};
  auto bits = 0u;
  for (const auto c : encoded) {
    auto sextet = base64_sextet(c);
    if (!sextet) {
      return std::nullopt;
    }
    accumulator = (accumulator << 6u) | *sextet;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFFu));
    }
  }
  // Leftover bits must be the zero fill of the final quantum.
  if ((accumulator & ((1u << bits) - 1u)) != 0) {
    return std::nullopt;
  }
  return out;
}

bytes_t from_base64(std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    multitest::common::critical("invalid base64 input");
  }
  return *decoded;
}

}  // namespace multitest::schema
