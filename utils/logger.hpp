#ifndef UTILS_LOGGER_HPP
#define UTILS_LOGGER_HPP

#include <cstdio>
#include <memory>
#include <string>
#include "core/logging.hpp"

// Writes "<P>/<tag>: <msg>" lines to sink, dropping entries below minPriority.
std::unique_ptr<ILogger> CreateLogger(std::string tag,
                                      LogPriority minPriority = LogPriority::INFO,
                                      FILE * sink = stderr);

#endif // UTILS_LOGGER_HPP
