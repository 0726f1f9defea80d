#include "utils/logger.hpp"

namespace {

char PriorityLetter(LogPriority prio)
{
   switch (prio) {
      case LogPriority::VERBOSE:
         return 'V';
      case LogPriority::DEBUG:
         return 'D';
      case LogPriority::INFO:
         return 'I';
      case LogPriority::WARN:
         return 'W';
      case LogPriority::ERROR:
         return 'E';
      case LogPriority::FATAL:
         return 'F';
      default:
         return '?';
   }
}

class Logger : public ILogger
{
public:
   Logger(std::string tag, LogPriority minPriority, FILE * sink)
      : m_tag(std::move(tag))
      , m_minPriority(minPriority)
      , m_sink(sink)
   {}
   void Write(LogPriority prio, std::string msg) override
   {
      if (prio < m_minPriority)
         return;
      fprintf(m_sink, "%c/%s: %s\n", PriorityLetter(prio), m_tag.c_str(), msg.c_str());
      fflush(m_sink);
   }

private:
   const std::string m_tag;
   const LogPriority m_minPriority;
   FILE * const m_sink;
};

} // namespace

std::unique_ptr<ILogger> CreateLogger(std::string tag, LogPriority minPriority, FILE * sink)
{
   return std::make_unique<Logger>(std::move(tag), minPriority, sink);
}
