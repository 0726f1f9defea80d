#ifndef CORE_OPTIONS_HPP
#define CORE_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "dice/aggregate.hpp"

namespace core {

struct Options
{
   std::vector<std::string> dice;
   dice::Aggregate aggregate = dice::Aggregate::NONE;
   std::optional<uint32_t> seed;
   bool verbose = false;
   bool help = false;
};

class UsageError : public std::invalid_argument
{
public:
   using std::invalid_argument::invalid_argument;
};

// Throws UsageError for a malformed command line and dice::ParseError for an
// unknown aggregate name. Dice tokens are returned unparsed.
Options ParseOptions(int argc, const char * const argv[]);

std::string GetUsage(const std::string & programName);

} // namespace core

#endif // CORE_OPTIONS_HPP
