#ifndef CORE_LOGGING_HPP
#define CORE_LOGGING_HPP

#include <string>
#include <string_view>
#include "utils/format.hpp"

enum class LogPriority
{
   DEFAULT = 1,
   VERBOSE,
   DEBUG,
   INFO,
   WARN,
   ERROR,
   FATAL
};

class ILogger
{
public:
   virtual ~ILogger() = default;

   virtual void Write(LogPriority prio, std::string msg) = 0;

   template <LogPriority prio, fmt::Formattable... TArgs>
   void Write(std::string_view format, TArgs &&... args)
   {
      Write(prio, fmt::ToString(format, std::forward<TArgs>(args)...));
   }
};

#endif // CORE_LOGGING_HPP
