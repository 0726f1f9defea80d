#ifndef CORE_APPLICATION_HPP
#define CORE_APPLICATION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include "core/logging.hpp"
#include "core/session.hpp"

namespace dice {
class IEngine;
} // namespace dice

namespace core {

struct Environment
{
   std::ostream & out;
   std::ostream & err;
   std::function<std::unique_ptr<ILogger>(LogPriority minPriority)> loggerBuilder;
   std::function<std::unique_ptr<dice::IEngine>(std::optional<uint32_t> seed)> engineBuilder;
};

// Whole command-line run: options, logger level, engine, session. Every
// failure is mapped to an ExitCode; nothing escapes.
ExitCode RunApplication(int argc, const char * const argv[], const Environment & env);

} // namespace core

#endif // CORE_APPLICATION_HPP
