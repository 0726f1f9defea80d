#ifndef CORE_SESSION_HPP
#define CORE_SESSION_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "dice/aggregate.hpp"
#include "dice/cast.hpp"

class ILogger;

namespace dice {
class IEngine;
} // namespace dice

namespace core {

enum ExitCode : int
{
   OK = 0,
   INVALID_INPUT = 1,
   NOTHING_TO_DO = 2,
   INTERNAL_ERROR = 3
};

// Rolls one batch of dice tokens: every token is parsed before anything is
// rolled, then one "<count>d<sides> <result>" line per die goes to out.
class Session
{
public:
   Session(std::unique_ptr<dice::IEngine> engine, ILogger & logger);
   ~Session();

   ExitCode Run(const std::vector<std::string> & tokens, dice::Aggregate aggregate, std::ostream & out);

private:
   std::optional<std::vector<dice::Descriptor>> ParseAll(const std::vector<std::string> & tokens);

   std::unique_ptr<dice::IEngine> m_engine;
   ILogger & m_logger;
};

} // namespace core

#endif // CORE_SESSION_HPP
