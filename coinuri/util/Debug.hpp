/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_UTIL_DEBUG_HPP
#define COINURI_UTIL_DEBUG_HPP

#include "Status.hpp"

namespace coinuri {

/**
 * Opens a log file in addition to the console output.
 * The previous log is kept next to it with a ".prev" suffix.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

/**
 * Writes a timestamped printf-style line to the log.
 * Does nothing unless built with DEBUG.
 */
void CU_DebugLog(const char *format, ...);

} // namespace coinuri

#endif
