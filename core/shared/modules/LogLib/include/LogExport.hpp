#ifndef LOG_EXPORT_HPP
#define LOG_EXPORT_HPP

/**
 * @file LogExport.hpp
 * @brief Shared-object visibility macros for LogLib
 */

#if defined(NEMOBRIDGE_STATIC) && !defined(LOGLIB_STATIC)
#define LOGLIB_STATIC
#endif

#if defined(LOGLIB_STATIC)
#define LOGLIB_API
#elif __GNUC__ >= 4
#define LOGLIB_API __attribute__((visibility("default")))
#else
#define LOGLIB_API
#endif

#endif // LOG_EXPORT_HPP
