#pragma once

#include "toolwire/logging/logger_registry.h"

// Each translation unit names its logger before including this header:
//   #define TOOLWIRE_LOG_COMPONENT "server"
#ifndef TOOLWIRE_LOG_COMPONENT
#define TOOLWIRE_LOG_COMPONENT "default"
#endif

#ifdef TOOLWIRE_LOG_DISABLE
#define TOOLWIRE_LOG(level, ...) ((void)0)
#else
#define TOOLWIRE_LOG(level, ...)                                           \
  do {                                                                     \
    auto toolwire_logger_ =                                                \
        ::toolwire::logging::LoggerRegistry::instance().getOrCreateLogger( \
            TOOLWIRE_LOG_COMPONENT);                                       \
    if (toolwire_logger_->shouldLog(                                       \
            ::toolwire::logging::LogLevel::level)) {                       \
      toolwire_logger_->log(::toolwire::logging::LogLevel::level,          \
                            __FILE__, __LINE__, __FUNCTION__,              \
                            __VA_ARGS__);                                  \
    }                                                                      \
  } while (0)
#endif

// Context-aware logging (request id, method, tool)
#define TOOLWIRE_LOG_WITH_CONTEXT(level, context, ...)                     \
  do {                                                                     \
    auto toolwire_logger_ =                                                \
        ::toolwire::logging::LoggerRegistry::instance().getOrCreateLogger( \
            TOOLWIRE_LOG_COMPONENT);                                       \
    if (toolwire_logger_->shouldLog(                                       \
            ::toolwire::logging::LogLevel::level)) {                       \
      toolwire_logger_->logWithContext(                                    \
          ::toolwire::logging::LogLevel::level, context, __VA_ARGS__);     \
    }                                                                      \
  } while (0)

#define TOOLWIRE_LOG_DEBUG(...) TOOLWIRE_LOG(Debug, __VA_ARGS__)
#define TOOLWIRE_LOG_INFO(...) TOOLWIRE_LOG(Info, __VA_ARGS__)
#define TOOLWIRE_LOG_WARNING(...) TOOLWIRE_LOG(Warning, __VA_ARGS__)
#define TOOLWIRE_LOG_ERROR(...) TOOLWIRE_LOG(Error, __VA_ARGS__)
