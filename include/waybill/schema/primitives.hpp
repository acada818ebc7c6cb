#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace waybill::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Caller identities are opaque to the ledger; collaborators hand them in
// already verified.
using identity_t = std::string;
using delivery_id_t = uint64_t;
using sequence_t = uint64_t;
using logical_time_t = uint64_t;
using altitude_t = uint64_t;
using payload_fingerprint_t = hash32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Exactly 32 raw bytes, or std::nullopt.
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);

}  // namespace waybill::schema
