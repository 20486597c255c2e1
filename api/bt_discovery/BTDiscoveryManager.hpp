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

#ifndef BTD_DISCOVERY_MANAGER_HPP_
#define BTD_DISCOVERY_MANAGER_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <optional>

#include <jau/environment.hpp>
#include <jau/darray.hpp>
#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>

#include "BTDiscoveryConst.hpp"
#include "BTDiscoveryTypes.hpp"
#include "BTMatcher.hpp"
#include "BTMatchCache.hpp"
#include "BTScanner.hpp"
#include "BTCallbackRegistry.hpp"
#include "BTAvailabilityTracker.hpp"
#include "BTEventLoop.hpp"
#include "BTDiscoveryFlow.hpp"
#include "BTAdapterProbe.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Read-only environment of the BTDiscoveryManager.
     */
    class BTDiscoveryEnv : public jau::root_environment {
        private:
            BTDiscoveryEnv() noexcept;

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Period of the unavailable device check, defaults to 300s.
             * <p>
             * Environment variable is 'bt_discovery.unavailable.track.period'.
             * </p>
             */
            const jau::fraction_i64 UNAVAILABLE_TRACK_PERIOD;

            /**
             * Maximum number of remembered matched keys, defaults to 2048.
             * <p>
             * Environment variable is 'bt_discovery.match.cache.capacity'.
             * </p>
             */
            const int32_t MATCH_CACHE_CAPACITY;

            /**
             * Debug each received advertisement and its matching result.
             * <p>
             * Environment variable is 'bt_discovery.debug.manager.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static BTDiscoveryEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static BTDiscoveryEnv e;
                return e;
            }
    };

    /**
     * Lifecycle state of the BTDiscoveryManager.
     */
    enum class BTManagerState : uint8_t {
        /** Scanner not yet created. */
        NONE    = 0,
        /** Scanner created, not listening. */
        SETUP   = 1,
        /** Listening, unavailable tracking armed. */
        STARTED = 2,
        /** Listener and tracking cancelled, scanner stopped. May be started again. */
        STOPPED = 3
    };
    constexpr uint8_t number(const BTManagerState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BTManagerState v) noexcept;

    class BTDiscoveryManager; // forward

    /**
     * Capability limited handle of the BTScanner owned by the BTDiscoveryManager,
     * allowing independent consumers to share the single scanner.
     *
     * All calls are forwarded to the BTDiscoveryManager,
     * which must outlive this handle.
     */
    class BTScannerHandle {
        friend class BTDiscoveryManager;

        private:
            BTDiscoveryManager * manager;

            explicit BTScannerHandle(BTDiscoveryManager & manager_) noexcept
            : manager(&manager_) {}

        public:
            /**
             * Returns the devices currently seen by the shared scanner.
             * @throws jau::IllegalStateException if the manager has not been set up
             */
            jau::darray<BLEDeviceRef> getDiscoveredDevices() const;

            /**
             * Registers a raw detection callback on the shared scanner.
             *
             * Registrations are dropped when the manager stops.
             * @throws jau::IllegalStateException if the manager has not been set up
             */
            BTCancelFunc registerDetectionCallback(const BTScanner::DetectionCallback& cb);

            std::string toString() const noexcept;
    };

    /**
     * Owns the single BTScanner, matches each received advertisement against
     * the integration matchers and fans out notifications:
     *
     * - one-shot discovery flows via DiscoveryFlowListener::createFlow() per matched domain
     * - subscription callbacks, see registerCallback()
     * - unavailable notifications, see trackUnavailable()
     *
     * Advertisement intake and the unavailable check are serialized.
     *
     * Controlling Environment variables, see {@link BTDiscoveryEnv}.
     */
    class BTDiscoveryManager {
        friend class BTScannerHandle;

        public:
            typedef jau::function<BTScannerRef()> ScannerFactory;
            typedef jau::darray<BTIntegrationMatcher> IntegrationMatcherList;

        private:
            const BTDiscoveryEnv & env;
            const IntegrationMatcherList integration_matchers;
            const ScannerFactory scanner_factory;
            BTEventLoop & event_loop;
            DiscoveryFlowListener & flow_listener;

            mutable std::recursive_mutex mtx_manager;
            BTManagerState state;
            BTScannerRef scanner;
            bool shutdown_hook_registered;
            BTCancelFunc cancel_shutdown_hook;

            BTMatchCache match_cache;
            BTCallbackRegistry callback_registry;
            BTAvailabilityTracker availability_tracker;
            jau::darray<BTScanner::DetectionCallback> handle_callbacks;

            BTScanner::DetectionCallback detectionCallback() noexcept;

            BTCancelFunc registerDetectionCallback(const BTScanner::DetectionCallback& cb);
            void removeDetectionCallback(const BTScanner::DetectionCallback& cb) noexcept;

            void unavailableTick() noexcept;
            void stopOnShutdown() noexcept;

        public:
            /**
             * @param scanner_factory creates the owned BTScanner in setup()
             * @param integration_matchers immutable list of integration matchers
             * @param event_loop used for the periodic unavailable check and the shutdown hook
             * @param flow_listener receiving the discovery flows
             */
            BTDiscoveryManager(const ScannerFactory& scanner_factory,
                               const IntegrationMatcherList& integration_matchers,
                               BTEventLoop& event_loop,
                               DiscoveryFlowListener& flow_listener) noexcept;

            BTDiscoveryManager(const BTDiscoveryManager&) = delete;
            void operator=(const BTDiscoveryManager&) = delete;

            /**
             * Stops this manager if started and drops its shutdown hook.
             */
            ~BTDiscoveryManager() noexcept;

            BTManagerState getState() const noexcept;

            /**
             * Creates the owned scanner via the ScannerFactory.
             *
             * Does nothing if already set up.
             * @throws BTInitializationException if the scanner could not be created
             */
            void setup();

            /**
             * Sets up and starts the scanner, listens to its advertisements,
             * arms the unavailable tracking and registers stop() at event loop shutdown.
             *
             * @param mode the ScanningMode
             * @return true if started, false if already started
             * @throws jau::IllegalStateException if not set up
             * @throws BTInitializationException if the scanner setup failed, not retryable
             * @throws BTNotReadyException if the scanner failed to start, retryable
             */
            bool start(const ScanningMode mode);

            /**
             * Cancels the advertisement listener, the unavailable tracking and
             * all detection callbacks registered via BTScannerHandle, then stops the scanner.
             *
             * A scanner stop failure is logged only. Method is idempotent.
             */
            void stop() noexcept;

            /**
             * Handles one received advertisement, the detection callback of the owned scanner.
             *
             * Evaluates the integration matchers unless the match cache holds the key,
             * dispatches the subscription callbacks, then triggers one discovery flow per matched domain.
             */
            void onAdvertisement(const BLEDeviceRef& device, const AdvertisementDataRef& adv) noexcept;

            /**
             * Performs one unavailable check, see BTAvailabilityTracker::checkUnavailable().
             * @return the addresses deemed unavailable
             */
            jau::darray<std::string> checkUnavailable() noexcept;

            /**
             * Returns a handle to the owned scanner.
             * @throws jau::IllegalStateException if not set up
             */
            BTScannerHandle getScanner();

            /**
             * Returns a BTServiceInfo for each device in the history.
             * @throws jau::IllegalStateException if not set up
             */
            jau::darray<BTServiceInfoRef> getDiscoveredServiceInfo() const;

            /**
             * Returns the last seen BLEDevice of the given address or nullptr.
             */
            BLEDeviceRef findDevice(const std::string& address) const noexcept;

            /**
             * Returns true if the given address is within the history.
             */
            bool isAddressPresent(const std::string& address) const noexcept;

            /**
             * Registers a subscription callback with an optional BTMatcher.
             *
             * If the matcher carries an address which is within the history,
             * the callback is invoked once right away with its last advertisement.
             *
             * @return BTCancelFunc removing this subscription, must not be called after this manager has been destructed
             */
            BTCancelFunc registerCallback(const BTCallback& cb, const std::optional<BTMatcher>& matcher = std::nullopt);

            /**
             * Registers a callback notified once the device of the given address is no more seen.
             * @return BTCancelFunc removing this registration, must not be called after this manager has been destructed
             */
            BTCancelFunc trackUnavailable(const BTUnavailableCallback& cb, const std::string& address);

            /**
             * Bootstraps the integration of this manager's own domain ::DOMAIN.
             *
             * - has_config_entries: nothing to do
             * - configured: creates a flow with ::SOURCE_IMPORT
             * - a Bluetooth adapter is present: creates a flow with ::SOURCE_INTEGRATION_DISCOVERY
             *
             * @param has_config_entries true if the integration already has config entries
             * @param configured true if the integration is explicitly configured
             * @param sysfs_dir directory for hasBluetoothAdapter()
             * @return the used flow source or an empty string if no flow has been created
             */
            std::string setupIntegration(const bool has_config_entries, const bool configured,
                                         const std::string& sysfs_dir = SYSFS_BLUETOOTH_DIR);

            jau::nsize_t getCallbackCount() const noexcept { return callback_registry.size(); }

            jau::nsize_t getUnavailableCallbackCount(const std::string& address) const noexcept {
                return availability_tracker.getCallbackCount(address);
            }

            jau::nsize_t getMatchCacheSize() const noexcept;

            bool isTrackingUnavailable() noexcept { return availability_tracker.isTracking(); }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_DISCOVERY_MANAGER_HPP_ */
