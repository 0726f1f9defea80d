#ifndef DICE_AGGREGATE_HPP
#define DICE_AGGREGATE_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "dice/error.hpp"

namespace dice {

enum class Aggregate
{
   NONE,
   SUM,
   AVG,
   MAX,
   MIN
};

// Case-insensitive "sum", "avg", "max" or "min". Throws ParseError(UNKNOWN_AGGREGATE).
Aggregate ParseAggregate(std::string_view name);

std::string_view ToString(Aggregate aggregate) noexcept;

// SUM, AVG, MAX and MIN throw EmptySequenceError for an empty roll set.
uint64_t Sum(std::span<const uint32_t> rolls);
double Average(std::span<const uint32_t> rolls);
uint32_t Max(std::span<const uint32_t> rolls);
uint32_t Min(std::span<const uint32_t> rolls);

// Renders the reduced value, or for NONE the space separated rolls in order.
std::string ApplyAggregate(Aggregate aggregate, std::span<const uint32_t> rolls);

} // namespace dice

#endif // DICE_AGGREGATE_HPP
