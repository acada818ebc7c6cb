#pragma once

#include <cstddef>
#include <cstdint>

namespace waybill::schema {

inline constexpr uint64_t kMaxEventsPerDelivery = 100;
inline constexpr std::size_t kMaxRolesPerAssignment = 5;
inline constexpr std::size_t kMaxOracles = 10;

// Upper bounds on caller-supplied text, in bytes.
inline constexpr std::size_t kMaxIdentityLength = 128;
inline constexpr std::size_t kMaxCoordinateLength = 32;
inline constexpr std::size_t kMaxStatusLength = 20;
inline constexpr std::size_t kMaxNoteLength = 256;
inline constexpr std::size_t kMaxFailureReasonLength = 256;

}  // namespace waybill::schema
