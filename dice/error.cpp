#include "dice/error.hpp"

#include "utils/format.hpp"

namespace {

std::string Describe(dice::ParseError::Kind kind, const std::string & input, const std::string & reason)
{
   if (kind == dice::ParseError::Kind::UNKNOWN_AGGREGATE)
      return fmt::ToString("invalid aggregate function '{}': {}", input, reason);
   return fmt::ToString("invalid die '{}': {}", input, reason);
}

} // namespace

namespace dice {

ParseError::ParseError(Kind kind, std::string input, std::string reason)
   : std::invalid_argument(Describe(kind, input, reason))
   , m_kind(kind)
   , m_input(std::move(input))
   , m_reason(std::move(reason))
{}

} // namespace dice
