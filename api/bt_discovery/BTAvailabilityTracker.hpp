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

#ifndef BTD_AVAILABILITY_TRACKER_HPP_
#define BTD_AVAILABILITY_TRACKER_HPP_

#include <string>
#include <mutex>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>

#include "BTDiscoveryTypes.hpp"
#include "BTScanner.hpp"
#include "BTEventLoop.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Periodically detects devices no more seen by the BTScanner
     * and notifies the BTUnavailableCallback registered for their address.
     *
     * A device is unavailable if it has an entry in the BTDeviceHistory,
     * but is no more listed by BTScanner::getDiscoveredDevices().
     * Its history entry is removed before its callbacks are invoked.
     */
    class BTAvailabilityTracker {
        public:
            typedef jau::darray<BTUnavailableCallback> CallbackList;

        private:
            mutable std::mutex mtx_callbacks;
            std::unordered_map<std::string, CallbackList> callbacks;

            std::mutex mtx_tracking;
            BTCancelFunc cancel_tracking;
            bool tracking;

        public:
            BTAvailabilityTracker() noexcept
            : tracking(false) {}

            BTAvailabilityTracker(const BTAvailabilityTracker&) = delete;
            void operator=(const BTAvailabilityTracker&) = delete;

            ~BTAvailabilityTracker() noexcept { stop(); }

            /**
             * Appends the callback for the given address.
             * @return BTCancelFunc removing this registration, idempotent.
             *         Must not be called after this tracker has been destructed.
             */
            BTCancelFunc add(const std::string& address, const BTUnavailableCallback& cb);

            /**
             * Removes the first equal callback for the given address.
             * @return true if removed, otherwise false
             */
            bool remove(const std::string& address, const BTUnavailableCallback& cb) noexcept;

            jau::nsize_t getCallbackCount(const std::string& address) const noexcept;

            /**
             * Performs one sweep: for each history address not within BTScanner::getDiscoveredDevices(),
             * removes the history entry and notifies its callbacks in registration order.
             *
             * The history is snapshot before the devices are listed.
             * A device recorded or updated in the history during the sweep is kept.
             *
             * Exceptions thrown by a callback are caught and logged.
             * If the scanner fails to list its devices, the sweep is skipped.
             *
             * @return the addresses deemed unavailable
             */
            jau::darray<std::string> checkUnavailable(BTScanner& scanner) noexcept;

            /**
             * Starts invoking `tick` every `period` on the given BTEventLoop.
             *
             * Does nothing if already tracking.
             */
            void start(BTEventLoop& loop, const jau::fraction_i64& period, const BTEventLoop::EventFunc& tick);

            /** Cancels the periodic sweep, idempotent. */
            void stop() noexcept;

            bool isTracking() noexcept;
    };

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_AVAILABILITY_TRACKER_HPP_ */
