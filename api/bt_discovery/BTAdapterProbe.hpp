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

#ifndef BTD_ADAPTER_PROBE_HPP_
#define BTD_ADAPTER_PROBE_HPP_

#include <string>

#include <jau/darray.hpp>

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /** Linux sysfs directory listing one `hciN` entry per Bluetooth adapter. */
    inline constexpr const char* SYSFS_BLUETOOTH_DIR = "/sys/class/bluetooth";

    /**
     * Returns the names of all `hci*` entries of the given directory, e.g. `hci0`.
     *
     * An unreadable or missing directory results in an empty list.
     */
    jau::darray<std::string> getBluetoothAdapterNames(const std::string& sysfs_dir = SYSFS_BLUETOOTH_DIR) noexcept;

    /**
     * Returns true if at least one Bluetooth adapter is present.
     */
    bool hasBluetoothAdapter(const std::string& sysfs_dir = SYSFS_BLUETOOTH_DIR) noexcept;

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_ADAPTER_PROBE_HPP_ */
