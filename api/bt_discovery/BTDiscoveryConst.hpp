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

#ifndef BTD_CONST_HPP_
#define BTD_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace bt_discovery {

    /**
     * Domain of the discovery integration itself,
     * used for its own bootstrap discovery flow.
     */
    inline constexpr const char* DOMAIN = "bluetooth";

    /**
     * Maximum number of remembered matched (address, has-manufacturer-data) keys.
     *
     * Some devices use a random address, hence the matched set is bounded.
     */
    inline constexpr const jau::nsize_t MAX_REMEMBER_ADDRESSES = 2048;

    /**
     * Period in seconds of the unavailable device check.
     */
    inline constexpr const jau::nsize_t UNAVAILABLE_TRACK_SECONDS = 60 * 5;

    /**
     * Default period of the unavailable device check, i.e. UNAVAILABLE_TRACK_SECONDS.
     */
    inline constexpr const jau::fraction_i64 UNAVAILABLE_TRACK_PERIOD(UNAVAILABLE_TRACK_SECONDS, 1);

    /**
     * Maximum time to wait for a timer thread shutdown.
     */
    inline constexpr const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT(8000, 1000);

    /** BTServiceInfo::source of advertisements received by the locally owned scanner. */
    inline constexpr const char* SOURCE_LOCAL = "local";

    /** DiscoveryFlowContext::source for flows triggered by a matched advertisement. */
    inline constexpr const char* SOURCE_BLUETOOTH = "bluetooth";

    /** DiscoveryFlowContext::source for the explicitly configured integration bootstrap. */
    inline constexpr const char* SOURCE_IMPORT = "import";

    /** DiscoveryFlowContext::source for the adapter-present integration bootstrap. */
    inline constexpr const char* SOURCE_INTEGRATION_DISCOVERY = "integration_discovery";

} // namespace bt_discovery

#endif /* BTD_CONST_HPP_ */
