#include "dice/notation.hpp"

#include <algorithm>
#include <charconv>
#include <optional>

namespace {

constexpr char SEPARATOR = 'd';

bool IsDigitRun(std::string_view field)
{
   return std::all_of(field.cbegin(), field.cend(), [](char c) {
      return c >= '0' && c <= '9';
   });
}

std::optional<uint32_t> ParseNumber(std::string_view digits)
{
   uint32_t value = 0;
   const auto [last, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
   if (ec != std::errc() || last != digits.data() + digits.size())
      return std::nullopt;
   return value;
}

} // namespace

namespace dice {

Descriptor ParseDescriptor(std::string_view token)
{
   auto Malformed = [token](std::string reason) {
      return ParseError(ParseError::Kind::MALFORMED_TOKEN, std::string(token), std::move(reason));
   };

   const size_t separatorPos = token.find(SEPARATOR);
   if (separatorPos == std::string_view::npos)
      throw Malformed("expected <count>d<sides>");

   const std::string_view countField = token.substr(0, separatorPos);
   const std::string_view sidesField = token.substr(separatorPos + 1);

   const bool countIsDigits = IsDigitRun(countField);
   const bool endsWithSides = !sidesField.empty() && IsDigitRun(sidesField);
   if (!countIsDigits && !endsWithSides)
      throw Malformed("expected <count>d<sides>");
   if (!countIsDigits)
      throw Malformed("count must be a non-negative integer");
   if (sidesField.empty())
      throw Malformed("missing number of sides");
   if (!endsWithSides)
      throw Malformed("number of sides must be a positive integer");

   uint32_t count = 1U;
   if (!countField.empty()) {
      const auto parsed = ParseNumber(countField);
      if (!parsed)
         throw Malformed("count is too large");
      count = *parsed;
   }
   const auto sides = ParseNumber(sidesField);
   if (!sides)
      throw Malformed("number of sides is too large");

   try {
      return Descriptor(count, *sides);
   }
   catch (const std::invalid_argument & e) {
      throw ParseError(ParseError::Kind::INVALID_DESCRIPTOR, std::string(token), e.what());
   }
}

} // namespace dice
