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
#include <algorithm>

extern "C" {
    #include <fnmatch.h>
}

#include "BTMatcher.hpp"

using namespace bt_discovery;

std::string BTMatcher::toString() const noexcept {
    std::string out("Matcher[");
    bool comma = false;
    auto append = [&](const std::string& s) {
        if( comma ) {
            out.append(", ");
        }
        out.append(s);
        comma = true;
    };
    if( address.has_value() ) {
        append("address "+address.value());
    }
    if( local_name.has_value() ) {
        append("local_name '"+local_name.value()+"'");
    }
    if( service_uuid.has_value() ) {
        append("service_uuid "+service_uuid.value());
    }
    if( manufacturer_id.has_value() ) {
        append("manufacturer_id "+std::to_string(manufacturer_id.value()));
    }
    if( manufacturer_data_start.has_value() ) {
        append("manufacturer_data_start "+bt_discovery::to_string(manufacturer_data_start.value()));
    }
    out.append("]");
    return out;
}

static bool startsWith(const octets_t& data, const octets_t& prefix) noexcept {
    if( prefix.size() > data.size() ) {
        return false;
    }
    return std::equal(prefix.cbegin(), prefix.cend(), data.cbegin());
}

bool bt_discovery::matches(const BTMatcher& matcher, const BLEDevice& device, const AdvertisementData& adv) noexcept {
    if( matcher.address.has_value() && matcher.address.value() != device.address ) {
        return false;
    }

    if( matcher.local_name.has_value() ) {
        const std::string& name = adv.local_name.size() > 0 ? adv.local_name :
                                  ( device.name.size() > 0 ? device.name : device.address );
        if( 0 != ::fnmatch(matcher.local_name.value().c_str(), name.c_str(), FNM_NOESCAPE) ) {
            return false;
        }
    }

    if( matcher.service_uuid.has_value() ) {
        const std::string& uuid = matcher.service_uuid.value();
        if( adv.service_uuids.cend() == std::find(adv.service_uuids.cbegin(), adv.service_uuids.cend(), uuid) ) {
            return false;
        }
    }

    if( matcher.manufacturer_id.has_value() &&
        adv.manufacturer_data.cend() == adv.manufacturer_data.find(matcher.manufacturer_id.value()) )
    {
        return false;
    }

    if( matcher.manufacturer_data_start.has_value() ) {
        const octets_t& prefix = matcher.manufacturer_data_start.value();
        for(const auto& it : adv.manufacturer_data) {
            if( startsWith(it.second, prefix) ) {
                return true;
            }
        }
        return false;
    }

    return true;
}
