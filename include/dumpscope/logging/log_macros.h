#pragma once

#include "dumpscope/logging/logger_registry.h"

// Component must be defined before using DUMPSCOPE_LOG
#ifndef DUMPSCOPE_LOG_COMPONENT
#define DUMPSCOPE_LOG_COMPONENT "default"
#endif

#ifdef DUMPSCOPE_LOG_DISABLE
#define DUMPSCOPE_LOG(level, ...) ((void)0)
#else
#define DUMPSCOPE_LOG(level, ...)                                         \
  do {                                                                    \
    if (::dumpscope::logging::LoggerRegistry::instance().shouldLog(       \
            DUMPSCOPE_LOG_COMPONENT,                                      \
            ::dumpscope::logging::LogLevel::level)) {                     \
      ::dumpscope::logging::LoggerRegistry::instance()                    \
          .getOrCreateLogger(DUMPSCOPE_LOG_COMPONENT)                     \
          ->log(::dumpscope::logging::LogLevel::level, __FILE__, __LINE__, \
                __FUNCTION__, __VA_ARGS__);                               \
    }                                                                     \
  } while (0)
#endif

// Component logging
#define COMPONENT_LOG(component, level, ...)                      \
  ::dumpscope::logging::ComponentLogger(                          \
      ::dumpscope::logging::Component::component, #component)     \
      .log(::dumpscope::logging::LogLevel::level, __VA_ARGS__)
