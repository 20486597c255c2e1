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

#ifndef BTD_MATCHER_HPP_
#define BTD_MATCHER_HPP_

#include <string>
#include <optional>
#include <cstdint>

#include <jau/darray.hpp>

#include "BTDiscoveryTypes.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Declarative filter over a (BLEDevice, AdvertisementData) pair.
     *
     * All set fields must match, unset fields are wildcards.
     */
    struct BTMatcher {
        /** Exact address match. */
        std::optional<std::string> address;
        /** Glob pattern, see fnmatch(3) with FNM_NOESCAPE, matched against the effective name. */
        std::optional<std::string> local_name;
        /** Must be a member of the advertised service UUIDs. */
        std::optional<std::string> service_uuid;
        /** Must be a key of the manufacturer data. */
        std::optional<uint16_t> manufacturer_id;
        /** Byte prefix of at least one manufacturer data payload. */
        std::optional<octets_t> manufacturer_data_start;

        /** Returns a matcher only testing the given address. */
        static BTMatcher forAddress(const std::string& address_) noexcept {
            BTMatcher m;
            m.address = address_;
            return m;
        }

        bool operator==(const BTMatcher& rhs) const noexcept {
            return address == rhs.address &&
                   local_name == rhs.local_name &&
                   service_uuid == rhs.service_uuid &&
                   manufacturer_id == rhs.manufacturer_id &&
                   manufacturer_data_start == rhs.manufacturer_data_start;
        }
        bool operator!=(const BTMatcher& rhs) const noexcept { return !(*this == rhs); }

        std::string toString() const noexcept;
    };

    /**
     * A BTMatcher declared by an integration, identified by its domain.
     */
    struct BTIntegrationMatcher {
        std::string domain;
        BTMatcher matcher;

        std::string toString() const noexcept {
            return "IntegrationMatcher["+domain+", "+matcher.toString()+"]";
        }
    };

    /**
     * Returns true if the given device and its advertisement satisfy every set field of the matcher.
     *
     * The name used for BTMatcher::local_name is
     * AdvertisementData::local_name, BLEDevice::name or BLEDevice::address, first non-empty.
     *
     * Pure function without side effects.
     */
    bool matches(const BTMatcher& matcher, const BLEDevice& device, const AdvertisementData& adv) noexcept;

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_MATCHER_HPP_ */
