#include "dice/aggregate.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include "utils/format.hpp"

namespace {

struct NamedAggregate
{
   std::string_view name;
   dice::Aggregate value;
};

constexpr std::array<NamedAggregate, 4> NAMED_AGGREGATES = {{
   {"sum", dice::Aggregate::SUM},
   {"avg", dice::Aggregate::AVG},
   {"max", dice::Aggregate::MAX},
   {"min", dice::Aggregate::MIN},
}};

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
   auto ToLower = [](char c) {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
   };
   return lhs.size() == rhs.size() &&
          std::equal(lhs.cbegin(), lhs.cend(), rhs.cbegin(), [&](char l, char r) {
             return ToLower(l) == ToLower(r);
          });
}

void ThrowIfEmpty(std::span<const uint32_t> rolls, std::string_view what)
{
   if (rolls.empty())
      throw dice::EmptySequenceError(fmt::ToString("called aggregate {} on an empty roll set", what));
}

std::string JoinRolls(std::span<const uint32_t> rolls)
{
   std::string result;
   result.reserve(rolls.size() * 4);
   std::array<char, 16> buffer;
   for (size_t i = 0; i < rolls.size(); ++i) {
      if (i > 0)
         result.push_back(' ');
      const auto tail = fmt::Format(buffer, "{}", rolls[i]);
      result.append(buffer.data(), buffer.size() - tail.size());
   }
   return result;
}

} // namespace

namespace dice {

Aggregate ParseAggregate(std::string_view name)
{
   for (const auto & entry : NAMED_AGGREGATES) {
      if (EqualsIgnoreCase(name, entry.name))
         return entry.value;
   }
   throw ParseError(ParseError::Kind::UNKNOWN_AGGREGATE,
                    std::string(name),
                    "expected one of 'sum', 'avg', 'max', 'min'");
}

std::string_view ToString(Aggregate aggregate) noexcept
{
   for (const auto & entry : NAMED_AGGREGATES) {
      if (entry.value == aggregate)
         return entry.name;
   }
   return "none";
}

uint64_t Sum(std::span<const uint32_t> rolls)
{
   ThrowIfEmpty(rolls, "sum");
   return std::accumulate(rolls.begin(), rolls.end(), uint64_t{0});
}

double Average(std::span<const uint32_t> rolls)
{
   ThrowIfEmpty(rolls, "avg");
   return static_cast<double>(Sum(rolls)) / static_cast<double>(rolls.size());
}

uint32_t Max(std::span<const uint32_t> rolls)
{
   ThrowIfEmpty(rolls, "max");
   return *std::max_element(rolls.begin(), rolls.end());
}

uint32_t Min(std::span<const uint32_t> rolls)
{
   ThrowIfEmpty(rolls, "min");
   return *std::min_element(rolls.begin(), rolls.end());
}

std::string ApplyAggregate(Aggregate aggregate, std::span<const uint32_t> rolls)
{
   switch (aggregate) {
      case Aggregate::SUM:
         return fmt::ToString<32>("{}", Sum(rolls));
      case Aggregate::AVG:
         return fmt::ToString<32>("{}", Average(rolls));
      case Aggregate::MAX:
         return fmt::ToString<32>("{}", Max(rolls));
      case Aggregate::MIN:
         return fmt::ToString<32>("{}", Min(rolls));
      case Aggregate::NONE:
         break;
   }
   return JoinRolls(rolls);
}

} // namespace dice
