/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <unistd.h>

namespace tfac {

bool
fileExists(const std::string &path)
{
    return 0 == access(path.c_str(), F_OK);
}

} // namespace tfac
