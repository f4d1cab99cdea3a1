// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi

/***************************************************************************
 *   Copyright (C) 2008 by H-Store Project                                 *
 *   Brown University                                                      *
 *   Massachusetts Institute of Technology                                 *
 *   Yale University                                                       *
 *                                                                         *
 *   This software may be modified and distributed under the terms         *
 *   of the MIT license.  See the LICENSE file for details.                *
 *                                                                         *
 ***************************************************************************/

/**
 * @file log.h
 * @brief Logging macros that can be optimized out
 *
 * Derived from eRPC's src/util/logger.h, renamed into the jpatch
 * namespace with the levels jpatch uses.
 */

#ifndef JPATCH_LOG_H_
#define JPATCH_LOG_H_

#include <chrono>
#include <cstdio>

// Log levels: higher means more verbose
#define JPATCH_LOG_LEVEL_OFF 0
#define JPATCH_LOG_LEVEL_ERROR 1
#define JPATCH_LOG_LEVEL_WARN 2
#define JPATCH_LOG_LEVEL_INFO 3 // one line per failed patch
#define JPATCH_LOG_LEVEL_TRACE 4 // one line per applied operation

#define JPATCH_LOG_STREAM stderr

#ifndef JPATCH_LOG_LEVEL
#define JPATCH_LOG_LEVEL JPATCH_LOG_LEVEL_WARN
#endif

#if JPATCH_LOG_LEVEL >= JPATCH_LOG_LEVEL_ERROR
#define JPATCH_ERROR(...) \
    do { \
        jpatch::OutputLogHeader(JPATCH_LOG_STREAM, JPATCH_LOG_LEVEL_ERROR); \
        fprintf(JPATCH_LOG_STREAM, __VA_ARGS__); \
        fflush(JPATCH_LOG_STREAM); \
    } while (0)
#else
#define JPATCH_ERROR(...) ((void)0)
#endif

#if JPATCH_LOG_LEVEL >= JPATCH_LOG_LEVEL_WARN
#define JPATCH_WARN(...) \
    do { \
        jpatch::OutputLogHeader(JPATCH_LOG_STREAM, JPATCH_LOG_LEVEL_WARN); \
        fprintf(JPATCH_LOG_STREAM, __VA_ARGS__); \
        fflush(JPATCH_LOG_STREAM); \
    } while (0)
#else
#define JPATCH_WARN(...) ((void)0)
#endif

#if JPATCH_LOG_LEVEL >= JPATCH_LOG_LEVEL_INFO
#define JPATCH_INFO(...) \
    do { \
        jpatch::OutputLogHeader(JPATCH_LOG_STREAM, JPATCH_LOG_LEVEL_INFO); \
        fprintf(JPATCH_LOG_STREAM, __VA_ARGS__); \
        fflush(JPATCH_LOG_STREAM); \
    } while (0)
#else
#define JPATCH_INFO(...) ((void)0)
#endif

#if JPATCH_LOG_LEVEL >= JPATCH_LOG_LEVEL_TRACE
#define JPATCH_TRACE(...) \
    do { \
        jpatch::OutputLogHeader(JPATCH_LOG_STREAM, JPATCH_LOG_LEVEL_TRACE); \
        fprintf(JPATCH_LOG_STREAM, __VA_ARGS__); \
        fflush(JPATCH_LOG_STREAM); \
    } while (0)
#else
#define JPATCH_TRACE(...) ((void)0)
#endif

namespace jpatch {

// Writes "seconds:micros LEVEL: " with seconds rolling over every 100.
inline void
OutputLogHeader(FILE* stream, int level)
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    long long usec =
      std::chrono::duration_cast<std::chrono::microseconds>(now).count();
    const char* type;
    switch (level) {
        case JPATCH_LOG_LEVEL_ERROR:
            type = "ERROR";
            break;
        case JPATCH_LOG_LEVEL_WARN:
            type = "WARNG";
            break;
        case JPATCH_LOG_LEVEL_INFO:
            type = "INFOR";
            break;
        case JPATCH_LOG_LEVEL_TRACE:
            type = "TRACE";
            break;
        default:
            type = "UNKWN";
    }
    fprintf(stream,
            "%lld:%06lld %s: ",
            (usec / 1000000) % 100,
            usec % 1000000,
            type);
}

} // namespace jpatch

#endif /* JPATCH_LOG_H_ */
