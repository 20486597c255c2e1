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
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "BTDiscoveryTypes.hpp"

using namespace bt_discovery;

#define SCANNINGMODE_ENUM(X) \
    X(PASSIVE) \
    X(ACTIVE)

#define SCANNINGMODE_CASE_TO_STRING(V) case ScanningMode::V: return #V;

std::string bt_discovery::to_string(const ScanningMode v) noexcept {
    switch(v) {
        SCANNINGMODE_ENUM(SCANNINGMODE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ScanningMode "+jau::to_hexstring(number(v));
}

ScanningMode bt_discovery::to_ScanningMode(const std::string & value) noexcept {
    if( "PASSIVE" == value || "passive" == value ) {
        return ScanningMode::PASSIVE;
    }
    return ScanningMode::ACTIVE;
}

std::string bt_discovery::to_string(const BTChange v) noexcept {
    switch(v) {
        case BTChange::ADVERTISEMENT: return "ADVERTISEMENT";
        default: ; // fall through intended
    }
    return "Unknown BTChange "+std::to_string(static_cast<int>(v));
}

std::string bt_discovery::to_string(const octets_t& v) noexcept {
    return jau::bytesHexString(v.data(), 0, v.size(), true /* lsbFirst */);
}

std::string BLEDevice::toString() const noexcept {
    return "BLEDevice[address "+address+", name '"+name+"', rssi "+std::to_string(rssi)+"]";
}

std::string AdvertisementData::toString() const noexcept {
    std::string out("AD[");
    if( local_name.size() > 0 ) {
        out.append("name '"+local_name+"', ");
    }
    out.append("rssi "+std::to_string(rssi));
    if( manufacturer_data.size() > 0 ) {
        out.append(", msd[");
        bool comma = false;
        for(const auto& it : manufacturer_data) {
            if( comma ) {
                out.append(", ");
            }
            out.append(std::to_string(it.first)+": "+bt_discovery::to_string(it.second));
            comma = true;
        }
        out.append("]");
    }
    if( service_data.size() > 0 ) {
        out.append(", sd[");
        bool comma = false;
        for(const auto& it : service_data) {
            if( comma ) {
                out.append(", ");
            }
            out.append(it.first+": "+bt_discovery::to_string(it.second));
            comma = true;
        }
        out.append("]");
    }
    if( service_uuids.size() > 0 ) {
        out.append(", services[");
        for(jau::nsize_t i=0; i<service_uuids.size(); ++i) {
            if( 0 < i ) {
                out.append(", ");
            }
            out.append(service_uuids[i]);
        }
        out.append("]");
    }
    out.append("]");
    return out;
}

BTServiceInfoRef BTServiceInfo::from_advertisement(const BLEDeviceRef& device,
                                                   const AdvertisementDataRef& advertisement,
                                                   const std::string& source)
{
    std::shared_ptr<BTServiceInfo> info = std::make_shared<BTServiceInfo>();
    if( advertisement->local_name.size() > 0 ) {
        info->name = advertisement->local_name;
    } else if( device->name.size() > 0 ) {
        info->name = device->name;
    } else {
        info->name = device->address;
    }
    info->address = device->address;
    info->rssi = device->rssi;
    info->manufacturer_data = advertisement->manufacturer_data;
    info->service_data = advertisement->service_data;
    info->service_uuids = advertisement->service_uuids;
    info->source = source;
    info->device = device;
    info->advertisement = advertisement;
    return info;
}

std::string BTServiceInfo::toString() const noexcept {
    return "ServiceInfo[name '"+name+"', address "+address+", rssi "+std::to_string(rssi)+
           ", source "+source+", "+( nullptr != advertisement ? advertisement->toString() : "AD[nil]" )+"]";
}
