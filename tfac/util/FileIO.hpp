/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef TFAC_UTIL_FILE_IO_HPP
#define TFAC_UTIL_FILE_IO_HPP

#include <string>

namespace tfac {

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

} // namespace tfac

#endif
