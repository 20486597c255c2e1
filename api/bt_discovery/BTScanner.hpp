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

#ifndef BTD_SCANNER_HPP_
#define BTD_SCANNER_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <cstdint>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>

#include "BTDiscoveryTypes.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Latest observation of one device.
     */
    struct BTObservation {
        BLEDeviceRef device;
        AdvertisementDataRef advertisement;

        bool isValid() const noexcept { return nullptr != device && nullptr != advertisement; }
    };

    /**
     * Thread safe map of address to the latest BTObservation.
     *
     * An entry is added or replaced by each received advertisement
     * and removed once the device is deemed unavailable.
     *
     * Each update stamps its entry with a new update sequence number,
     * allowing removeIfUnchanged() to skip entries updated after a snapshot().
     */
    class BTDeviceHistory {
        public:
            /** Address to update sequence number. */
            typedef std::unordered_map<std::string, uint64_t> Snapshot;

        private:
            struct Entry {
                BTObservation observation;
                uint64_t update_seq;
            };
            mutable std::mutex mtx_history;
            std::unordered_map<std::string, Entry> history;
            uint64_t update_count;

        public:
            BTDeviceHistory() noexcept
            : update_count(0) {}

            BTDeviceHistory(const BTDeviceHistory&) = delete;
            void operator=(const BTDeviceHistory&) = delete;

            /** Add or replace the observation for the device's address. */
            void update(const BLEDeviceRef& device, const AdvertisementDataRef& advertisement) noexcept;

            /** Returns the update sequence number of all entries. */
            Snapshot snapshot() const noexcept;

            /**
             * Removes the entry of the given address only if it has not been updated
             * since its update sequence number `update_seq` has been taken via snapshot().
             * @return true if removed, otherwise false
             */
            bool removeIfUnchanged(const std::string& address, const uint64_t update_seq) noexcept;

            /** Returns the latest observation of the given address, BTObservation::isValid() is false if none. */
            BTObservation find(const std::string& address) const noexcept;

            bool contains(const std::string& address) const noexcept;

            /** Returns a copy of all observations. */
            jau::darray<BTObservation> getObservations() const noexcept;

            jau::nsize_t size() const noexcept;

            void clear() noexcept;
    };

    /**
     * Transport driver abstraction, i.e. the single owned low-level scanner.
     *
     * Implementations receive advertisements from their backend
     * and pass them to deliverAdvertisement(), which records the BTDeviceHistory
     * and notifies all detection callbacks.
     *
     * Failures of setup(), start() and stop() are reported via BTScannerException.
     */
    class BTScanner {
        public:
            typedef jau::function<void(const BLEDeviceRef&, const AdvertisementDataRef&)> DetectionCallback;
            typedef jau::cow_darray<DetectionCallback> DetectionCallbackList;

        private:
            BTDeviceHistory history;
            DetectionCallbackList detectionCallbackList;

        protected:
            BTScanner() noexcept {}

            /**
             * Records the observation in the history and notifies all detection callbacks.
             *
             * Exceptions thrown by a callback are caught and logged.
             */
            void deliverAdvertisement(const BLEDeviceRef& device, const AdvertisementDataRef& advertisement) noexcept;

        public:
            BTScanner(const BTScanner&) = delete;
            void operator=(const BTScanner&) = delete;

            virtual ~BTScanner() noexcept {}

            /**
             * Prepare the backend using the given ScanningMode.
             * @throws BTScannerException if a required OS resource is unavailable
             */
            virtual void setup(const ScanningMode mode) = 0;

            /**
             * Start receiving advertisements.
             * @throws BTScannerException if starting the backend failed
             */
            virtual void start() = 0;

            /**
             * Stop receiving advertisements.
             * @throws BTScannerException if stopping the backend failed
             */
            virtual void stop() = 0;

            virtual bool isScanning() const noexcept = 0;

            /**
             * Returns the devices currently seen by the backend.
             */
            virtual jau::darray<BLEDeviceRef> getDiscoveredDevices() const = 0;

            virtual std::string toString() const noexcept = 0;

            /**
             * Adds the given callback, if not yet added.
             * @return true if newly added, otherwise false
             */
            bool addDetectionCallback(const DetectionCallback& cb);

            /**
             * Removes the given callback.
             * @return true if removed, otherwise false
             */
            bool removeDetectionCallback(const DetectionCallback& cb);

            jau::nsize_t getDetectionCallbackCount() const noexcept { return detectionCallbackList.size(); }

            BTDeviceHistory& getHistory() noexcept { return history; }
            const BTDeviceHistory& getHistory() const noexcept { return history; }
    };
    typedef std::shared_ptr<BTScanner> BTScannerRef;

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_SCANNER_HPP_ */
