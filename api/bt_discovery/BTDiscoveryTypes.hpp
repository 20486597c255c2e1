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

#ifndef BTD_TYPES_HPP_
#define BTD_TYPES_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <map>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/functional.hpp>

namespace bt_discovery {

    /** @defgroup BTDUserAPI BT-Discovery General User Level API
     *  General user level discovery API types and functionality.
     *
     *  @{
     */

    class BTDiscoveryException : public jau::RuntimeException {
        protected:
            BTDiscoveryException(std::string const type, std::string const m, const char* file, int line) noexcept
            : RuntimeException(type, m, file, line) {}

        public:
            BTDiscoveryException(std::string const m, const char* file, int line) noexcept
            : RuntimeException("BTDiscoveryException", m, file, line) {}

            BTDiscoveryException(const char *m, const char* file, int line) noexcept
            : RuntimeException("BTDiscoveryException", m, file, line) {}
    };

    /**
     * Thrown by BTScanner implementations, i.e. the transport driver,
     * if a required OS resource is missing or the backend failed.
     */
    class BTScannerException : public BTDiscoveryException {
        public:
            BTScannerException(std::string const m, const char* file, int line) noexcept
            : BTDiscoveryException("BTScannerException", m, file, line) {}
    };

    /**
     * Non-retryable failure while initializing the scanner.
     */
    class BTInitializationException : public BTDiscoveryException {
        public:
            BTInitializationException(std::string const m, const char* file, int line) noexcept
            : BTDiscoveryException("BTInitializationException", m, file, line) {}
    };

    /**
     * Retryable failure while starting to listen,
     * the caller is expected to retry the setup later.
     */
    class BTNotReadyException : public BTDiscoveryException {
        public:
            BTNotReadyException(std::string const m, const char* file, int line) noexcept
            : BTDiscoveryException("BTNotReadyException", m, file, line) {}
    };

    /**
     * The mode of scanning for advertising devices.
     */
    enum class ScanningMode : uint8_t {
        /** Only receive advertising PDUs, no scan requests are sent. */
        PASSIVE = 0,
        /** Send scan requests, also receiving scan responses. */
        ACTIVE  = 1
    };
    constexpr uint8_t number(const ScanningMode rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ScanningMode v) noexcept;

    /**
     * Maps the specified name to a constant of ScanningMode.
     * @param name the string name to be mapped to a constant of this enum type.
     * @return the corresponding constant of this enum type, using ScanningMode::ACTIVE if not supported.
     */
    ScanningMode to_ScanningMode(const std::string & name) noexcept;

    /**
     * Change marker passed to each BTCallback.
     */
    enum class BTChange : uint8_t {
        /** A new advertisement has been received. */
        ADVERTISEMENT = 0
    };
    std::string to_string(const BTChange v) noexcept;

    typedef jau::darray<uint8_t> octets_t;

    std::string to_string(const octets_t& v) noexcept;

    /**
     * Platform level handle of a remote device as reported by the transport driver.
     */
    struct BLEDevice {
        /** Opaque address, might be randomized by the device over time. */
        std::string address;
        /** Reported name, might be empty. */
        std::string name;
        int16_t rssi;

        BLEDevice(std::string address_, std::string name_, const int16_t rssi_) noexcept
        : address(std::move(address_)), name(std::move(name_)), rssi(rssi_) {}

        std::string toString() const noexcept;
    };
    typedef std::shared_ptr<const BLEDevice> BLEDeviceRef;

    /**
     * Immutable snapshot of one received advertisement.
     */
    struct AdvertisementData {
        /** Advertised local name, empty if not advertised. */
        std::string local_name;
        int16_t rssi = 0;
        std::map<uint16_t, octets_t> manufacturer_data;
        std::map<std::string, octets_t> service_data;
        jau::darray<std::string> service_uuids;

        bool hasManufacturerData() const noexcept { return !manufacturer_data.empty(); }

        std::string toString() const noexcept;
    };
    typedef std::shared_ptr<const AdvertisementData> AdvertisementDataRef;

    /**
     * Outward facing projection of a (BLEDevice, AdvertisementData) pair,
     * tagged with its source.
     */
    struct BTServiceInfo {
        /** AdvertisementData::local_name, BLEDevice::name or BLEDevice::address, first non-empty. */
        std::string name;
        std::string address;
        int16_t rssi = 0;
        std::map<uint16_t, octets_t> manufacturer_data;
        std::map<std::string, octets_t> service_data;
        jau::darray<std::string> service_uuids;
        /** Provenance of this info, e.g. ::SOURCE_LOCAL */
        std::string source;
        BLEDeviceRef device;
        AdvertisementDataRef advertisement;

        static std::shared_ptr<const BTServiceInfo> from_advertisement(const BLEDeviceRef& device,
                                                                      const AdvertisementDataRef& advertisement,
                                                                      const std::string& source);

        std::string toString() const noexcept;
    };
    typedef std::shared_ptr<const BTServiceInfo> BTServiceInfoRef;

    /**
     * Subscription callback receiving each matching advertisement.
     */
    typedef jau::function<void(const BTServiceInfoRef&, BTChange)> BTCallback;

    /**
     * Callback notified with the address of a device no more seen.
     */
    typedef jau::function<void(const std::string&)> BTUnavailableCallback;

    /**
     * Cancels a previous registration, returned by registration methods.
     */
    typedef jau::function<void()> BTCancelFunc;

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_TYPES_HPP_ */
