#pragma once
#include <multitest/schema/empty.hpp>
#include <multitest/schema/query_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace multitest::schema {

// Fieldless records occupy no bytes on the wire.
inline void encode(const empty_t&, ::scale::Encoder&) {}
inline void decode(empty_t&, ::scale::Decoder&) {}

inline void encode(const staking_bonded_denom_query_t&, ::scale::Encoder&) {}
inline void decode(staking_bonded_denom_query_t&, ::scale::Decoder&) {}

inline void encode(const staking_all_validators_query_t&, ::scale::Encoder&) {}
inline void decode(staking_all_validators_query_t&, ::scale::Decoder&) {}

}  // namespace multitest::schema
