#ifndef DICE_ERROR_HPP
#define DICE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dice {

class ParseError : public std::invalid_argument
{
public:
   enum class Kind
   {
      MALFORMED_TOKEN,
      INVALID_DESCRIPTOR,
      UNKNOWN_AGGREGATE
   };

   ParseError(Kind kind, std::string input, std::string reason);

   Kind GetKind() const noexcept { return m_kind; }
   const std::string & GetInput() const noexcept { return m_input; }
   const std::string & GetReason() const noexcept { return m_reason; }

private:
   Kind m_kind;
   std::string m_input;
   std::string m_reason;
};

// Reduction of an empty roll set. Unreachable through Descriptor.
class EmptySequenceError : public std::logic_error
{
public:
   using std::logic_error::logic_error;
};

} // namespace dice

#endif // DICE_ERROR_HPP
