/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2022 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>

#include <jau/debug.hpp>

#include "BTAdapterProbe.hpp"

extern "C" {
    #include <errno.h>
    #include <dirent.h>
}

using namespace bt_discovery;

jau::darray<std::string> bt_discovery::getBluetoothAdapterNames(const std::string& sysfs_dir) noexcept {
    jau::darray<std::string> res;
    DIR *dir = ::opendir(sysfs_dir.c_str());
    if( nullptr == dir ) {
        DBG_PRINT("getBluetoothAdapterNames: Could not open %s: errno %d %s", sysfs_dir.c_str(), errno, strerror(errno));
        return res;
    }
    struct dirent *ent;
    while( nullptr != ( ent = ::readdir(dir) ) ) {
        if( 0 == ::strncmp(ent->d_name, "hci", 3) ) {
            res.push_back(std::string(ent->d_name));
        }
    }
    ::closedir(dir);
    DBG_PRINT("getBluetoothAdapterNames: %s: %zu adapter", sysfs_dir.c_str(), (size_t)res.size());
    return res;
}

bool bt_discovery::hasBluetoothAdapter(const std::string& sysfs_dir) noexcept {
    return getBluetoothAdapterNames(sysfs_dir).size() > 0;
}
