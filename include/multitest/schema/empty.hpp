#pragma once

// Schema type: empty.
// Baseline extension type. Stands for "no chain-specific extension" in both
// the custom query (Q) and custom message (C) positions, and is the message
// type of entry points that take no payload.
namespace multitest::schema {

struct empty_t final {
  bool operator==(const empty_t&) const = default;
};

}  // namespace multitest::schema
