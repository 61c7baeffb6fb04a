/**
 * @file qbm/route/logger.h
 * @brief Logging macros for the qbm-route module.
 *
 * Routes every diagnostic of the module through qb-io's logger when `QB_LOGGER`
 * is defined, through `qb::io::cout()`/`qb::io::cerr()` when `QB_STDOUT_LOG` is
 * defined, and compiles them away otherwise.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Route
 */
#ifndef QB_MODULE_ROUTE_LOGGER_H_
#define QB_MODULE_ROUTE_LOGGER_H_

#include <qb/io.h> // qb::io::cout/cerr, and nanolog under QB_LOGGER

#define QBM_ROUTE_LOG_PREFIX "[qbm-route] "

// The module logs registrations (DEBUG), mounts (INFO) and setup errors right
// before they are thrown (ERROR).
#if defined(QB_LOGGER)

#define LOG_ROUTE_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_ROUTE_LOG_PREFIX << X)
#define LOG_ROUTE_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << QBM_ROUTE_LOG_PREFIX << X)
#define LOG_ROUTE_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_ROUTE_LOG_PREFIX << "setup error: " << X)

#elif defined(QB_STDOUT_LOG)

#define LOG_ROUTE_DEBUG(X) qb::io::cout() << QBM_ROUTE_LOG_PREFIX << "debug: " << X << std::endl
#define LOG_ROUTE_INFO(X)  qb::io::cout() << QBM_ROUTE_LOG_PREFIX << X << std::endl
#define LOG_ROUTE_ERROR(X) qb::io::cerr() << QBM_ROUTE_LOG_PREFIX << "setup error: " << X << std::endl

#else

#define LOG_ROUTE_DEBUG(X) do {} while (false)
#define LOG_ROUTE_INFO(X)  do {} while (false)
#define LOG_ROUTE_ERROR(X) do {} while (false)

#endif

#endif // QB_MODULE_ROUTE_LOGGER_H_
