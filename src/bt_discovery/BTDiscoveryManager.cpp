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
#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <algorithm>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "BTDiscoveryManager.hpp"

using namespace bt_discovery;
using namespace jau::fractions_i64_literals;

BTDiscoveryEnv::BTDiscoveryEnv() noexcept
: exploding( jau::environment::getExplodingProperties("bt_discovery") ),
  UNAVAILABLE_TRACK_PERIOD( jau::environment::getFractionProperty("bt_discovery.unavailable.track.period", bt_discovery::UNAVAILABLE_TRACK_PERIOD, 1_s /* min */, 365_d /* max */) ),
  MATCH_CACHE_CAPACITY( jau::environment::getInt32Property("bt_discovery.match.cache.capacity", static_cast<int32_t>(MAX_REMEMBER_ADDRESSES), 1 /* min */, INT32_MAX /* max */) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("bt_discovery.debug.manager.event", false) )
{
}

#define MANAGERSTATE_ENUM(X) \
    X(NONE) \
    X(SETUP) \
    X(STARTED) \
    X(STOPPED)

#define MANAGERSTATE_CASE_TO_STRING(V) case BTManagerState::V: return #V;

std::string bt_discovery::to_string(const BTManagerState v) noexcept {
    switch(v) {
        MANAGERSTATE_ENUM(MANAGERSTATE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown BTManagerState "+jau::to_hexstring(number(v));
}

jau::darray<BLEDeviceRef> BTScannerHandle::getDiscoveredDevices() const {
    const std::lock_guard<std::recursive_mutex> lock(manager->mtx_manager); // RAII-style acquire and relinquish via destructor
    if( nullptr == manager->scanner ) {
        throw jau::IllegalStateException("BTScannerHandle: Not set up: "+manager->toString(), E_FILE_LINE);
    }
    return manager->scanner->getDiscoveredDevices();
}

BTCancelFunc BTScannerHandle::registerDetectionCallback(const BTScanner::DetectionCallback& cb) {
    return manager->registerDetectionCallback(cb);
}

std::string BTScannerHandle::toString() const noexcept {
    return "ScannerHandle["+manager->toString()+"]";
}

BTDiscoveryManager::BTDiscoveryManager(const ScannerFactory& scanner_factory_,
                                       const IntegrationMatcherList& integration_matchers_,
                                       BTEventLoop& event_loop_,
                                       DiscoveryFlowListener& flow_listener_) noexcept
: env(BTDiscoveryEnv::get()),
  integration_matchers(integration_matchers_),
  scanner_factory(scanner_factory_),
  event_loop(event_loop_),
  flow_listener(flow_listener_),
  state(BTManagerState::NONE),
  scanner(nullptr),
  shutdown_hook_registered(false),
  match_cache(static_cast<jau::nsize_t>(env.MATCH_CACHE_CAPACITY))
{
    DBG_PRINT("BTDiscoveryManager::ctor: %zu integration matcher", (size_t)integration_matchers.size());
}

BTDiscoveryManager::~BTDiscoveryManager() noexcept {
    DBG_PRINT("BTDiscoveryManager::dtor: %s", toString().c_str());
    stop();
    BTCancelFunc cancel;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
        cancel = cancel_shutdown_hook;
        shutdown_hook_registered = false;
    }
    try {
        cancel();
    } catch (std::exception &e) {
        ERR_PRINT("BTDiscoveryManager::dtor: Caught exception %s", e.what());
    }
}

BTManagerState BTDiscoveryManager::getState() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    return state;
}

BTScanner::DetectionCallback BTDiscoveryManager::detectionCallback() noexcept {
    return jau::bind_member(this, &BTDiscoveryManager::onAdvertisement);
}

void BTDiscoveryManager::setup() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( nullptr != scanner ) {
        DBG_PRINT("BTDiscoveryManager::setup: Already set up: %s", toString().c_str());
        return;
    }
    BTScannerRef s;
    try {
        s = scanner_factory();
    } catch (BTScannerException &e) {
        throw BTInitializationException("Failed to create Bluetooth scanner: "+std::string(e.what()), E_FILE_LINE);
    }
    if( nullptr == s ) {
        throw BTInitializationException("Failed to create Bluetooth scanner: nullptr", E_FILE_LINE);
    }
    scanner = s;
    state = BTManagerState::SETUP;
    DBG_PRINT("BTDiscoveryManager::setup: %s", toString().c_str());
}

bool BTDiscoveryManager::start(const ScanningMode mode) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( BTManagerState::STARTED == state ) {
        WORDY_PRINT("BTDiscoveryManager::start: Already started: %s", toString().c_str());
        return false;
    }
    if( nullptr == scanner ) {
        throw jau::IllegalStateException("BTDiscoveryManager::start: Not set up: "+toString(), E_FILE_LINE);
    }
    try {
        scanner->setup(mode);
    } catch (BTScannerException &e) {
        ERR_PRINT("BTDiscoveryManager::start: Setup %s failed: %s", to_string(mode).c_str(), e.what());
        throw BTInitializationException("Failed to initialize Bluetooth: "+std::string(e.what()), E_FILE_LINE);
    }
    DBG_PRINT("BTDiscoveryManager::start: Starting scanner %s, mode %s", scanner->toString().c_str(), to_string(mode).c_str());
    const BTScanner::DetectionCallback cb = detectionCallback();
    scanner->addDetectionCallback(cb);
    try {
        scanner->start();
    } catch (BTScannerException &e) {
        scanner->removeDetectionCallback(cb);
        ERR_PRINT("BTDiscoveryManager::start: Start failed: %s", e.what());
        throw BTNotReadyException("Failed to start Bluetooth: "+std::string(e.what()), E_FILE_LINE);
    }
    state = BTManagerState::STARTED;
    availability_tracker.start(event_loop, env.UNAVAILABLE_TRACK_PERIOD, jau::bind_member(this, &BTDiscoveryManager::unavailableTick));
    if( !shutdown_hook_registered ) {
        shutdown_hook_registered = true;
        cancel_shutdown_hook = event_loop.listenOnceShutdown(jau::bind_member(this, &BTDiscoveryManager::stopOnShutdown));
    }
    DBG_PRINT("BTDiscoveryManager::start: Done: %s", toString().c_str());
    return true;
}

void BTDiscoveryManager::stopOnShutdown() noexcept {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
        shutdown_hook_registered = false;
        cancel_shutdown_hook = BTCancelFunc();
    }
    DBG_PRINT("BTDiscoveryManager::stopOnShutdown");
    stop();
}

void BTDiscoveryManager::stop() noexcept {
    BTScannerRef s;
    jau::darray<BTScanner::DetectionCallback> handle_cbs;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
        if( BTManagerState::STARTED != state ) {
            DBG_PRINT("BTDiscoveryManager::stop: Not started: %s", toString().c_str());
            return;
        }
        state = BTManagerState::STOPPED;
        s = scanner;
        s->removeDetectionCallback(detectionCallback());
        handle_cbs = std::move(handle_callbacks);
        handle_callbacks.clear();
    }
    // outside of the lock, the tracker and scanner threads may wait for it
    availability_tracker.stop();
    for(const BTScanner::DetectionCallback& cb : handle_cbs) {
        s->removeDetectionCallback(cb);
    }
    try {
        s->stop();
    } catch (std::exception &e) {
        ERR_PRINT("BTDiscoveryManager::stop: Stopping scanner %s: Caught exception %s", s->toString().c_str(), e.what());
    }
    DBG_PRINT("BTDiscoveryManager::stop: Done: %s", toString().c_str());
}

static std::string domainsToString(const jau::darray<std::string>& domains) noexcept {
    std::string out("[");
    for(jau::nsize_t i=0; i<domains.size(); ++i) {
        if( 0 < i ) {
            out.append(", ");
        }
        out.append(domains[i]);
    }
    out.append("]");
    return out;
}

void BTDiscoveryManager::onAdvertisement(const BLEDeviceRef& device, const AdvertisementDataRef& adv) noexcept {
    if( nullptr == device || nullptr == adv ) {
        ERR_PRINT("BTDiscoveryManager::onAdvertisement: Null device %d or advertisement %d", nullptr == device, nullptr == adv);
        return;
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor

    const BTMatchKey match_key(device->address, adv->hasManufacturerData());
    jau::darray<std::string> matched_domains;

    // A match recorded without manufacturer data does not suppress
    // the evaluation of an advertisement carrying manufacturer data.
    if( !match_cache.contains( BTMatchKey(device->address, true) ) &&
        !match_cache.contains( match_key ) )
    {
        for(const BTIntegrationMatcher& m : integration_matchers) {
            if( matches(m.matcher, *device, *adv) &&
                matched_domains.cend() == std::find(matched_domains.cbegin(), matched_domains.cend(), m.domain) )
            {
                matched_domains.push_back(m.domain);
            }
        }
        if( matched_domains.size() > 0 ) {
            match_cache.insert(match_key);
        }
    }
    COND_PRINT(env.DEBUG_EVENT, "BTDiscoveryManager::onAdvertisement: %s, %s, matched domains %s",
            device->toString().c_str(), adv->toString().c_str(), domainsToString(matched_domains).c_str());

    if( matched_domains.empty() && 0 == callback_registry.size() ) {
        return;
    }

    BTServiceInfoRef service_info;
    callback_registry.dispatch(device, adv, SOURCE_LOCAL, service_info);

    if( matched_domains.empty() ) {
        return;
    }
    if( nullptr == service_info ) {
        service_info = BTServiceInfo::from_advertisement(device, adv, SOURCE_LOCAL);
    }
    const DiscoveryFlowContext context { SOURCE_BLUETOOTH };
    for(const std::string& domain : matched_domains) {
        try {
            flow_listener.createFlow(domain, context, service_info);
        } catch (std::exception &e) {
            ERR_PRINT("BTDiscoveryManager::onAdvertisement: createFlow %s for %s: Caught exception %s",
                    domain.c_str(), service_info->toString().c_str(), e.what());
        }
    }
}

jau::darray<std::string> BTDiscoveryManager::checkUnavailable() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( nullptr == scanner ) {
        return jau::darray<std::string>();
    }
    return availability_tracker.checkUnavailable(*scanner);
}

void BTDiscoveryManager::unavailableTick() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( BTManagerState::STARTED != state ) {
        // tick of a cancelled interval still in flight
        return;
    }
    const jau::darray<std::string> gone = checkUnavailable();
    DBG_PRINT("BTDiscoveryManager::unavailableTick: %zu unavailable", (size_t)gone.size());
}

BTScannerHandle BTDiscoveryManager::getScanner() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( nullptr == scanner ) {
        throw jau::IllegalStateException("BTDiscoveryManager::getScanner: Not set up", E_FILE_LINE);
    }
    return BTScannerHandle(*this);
}

BTCancelFunc BTDiscoveryManager::registerDetectionCallback(const BTScanner::DetectionCallback& cb) {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
        if( nullptr == scanner ) {
            throw jau::IllegalStateException("BTDiscoveryManager::registerDetectionCallback: Not set up", E_FILE_LINE);
        }
        scanner->addDetectionCallback(cb);
        handle_callbacks.push_back(cb);
    }
    return BTCancelFunc( [this, cb]() -> void { removeDetectionCallback(cb); } );
}

void BTDiscoveryManager::removeDetectionCallback(const BTScanner::DetectionCallback& cb) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    for(auto it = handle_callbacks.begin(); it != handle_callbacks.end(); ++it) {
        if( *it == cb ) {
            handle_callbacks.erase(it);
            if( nullptr != scanner ) {
                scanner->removeDetectionCallback(cb);
            }
            return;
        }
    }
}

jau::darray<BTServiceInfoRef> BTDiscoveryManager::getDiscoveredServiceInfo() const {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( nullptr == scanner ) {
        throw jau::IllegalStateException("BTDiscoveryManager::getDiscoveredServiceInfo: Not set up", E_FILE_LINE);
    }
    const jau::darray<BTObservation> observations = scanner->getHistory().getObservations();
    jau::darray<BTServiceInfoRef> res(observations.size());
    for(const BTObservation& o : observations) {
        res.push_back( BTServiceInfo::from_advertisement(o.device, o.advertisement, SOURCE_LOCAL) );
    }
    return res;
}

BLEDeviceRef BTDiscoveryManager::findDevice(const std::string& address) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    if( nullptr == scanner ) {
        return nullptr;
    }
    return scanner->getHistory().find(address).device;
}

bool BTDiscoveryManager::isAddressPresent(const std::string& address) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    return nullptr != scanner && scanner->getHistory().contains(address);
}

BTCancelFunc BTDiscoveryManager::registerCallback(const BTCallback& cb, const std::optional<BTMatcher>& matcher) {
    const BTCallbackRegistry::Entry entry { cb, matcher };
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
        callback_registry.add(entry);
        if( nullptr != scanner ) {
            const bool replayed = callback_registry.replay(entry, scanner->getHistory(), SOURCE_LOCAL);
            DBG_PRINT("BTDiscoveryManager::registerCallback: %s, replayed %d", entry.toString().c_str(), replayed);
        }
    }
    return BTCancelFunc( [this, entry]() -> void { callback_registry.remove(entry); } );
}

BTCancelFunc BTDiscoveryManager::trackUnavailable(const BTUnavailableCallback& cb, const std::string& address) {
    return availability_tracker.add(address, cb);
}

std::string BTDiscoveryManager::setupIntegration(const bool has_config_entries, const bool configured,
                                                 const std::string& sysfs_dir)
{
    if( has_config_entries ) {
        DBG_PRINT("BTDiscoveryManager::setupIntegration: Has config entries");
        return std::string();
    }
    std::string source;
    if( configured ) {
        source = SOURCE_IMPORT;
    } else if( hasBluetoothAdapter(sysfs_dir) ) {
        source = SOURCE_INTEGRATION_DISCOVERY;
    } else {
        WORDY_PRINT("BTDiscoveryManager::setupIntegration: Not configured and no adapter in %s", sysfs_dir.c_str());
        return std::string();
    }
    DBG_PRINT("BTDiscoveryManager::setupIntegration: Creating flow %s, source %s", DOMAIN, source.c_str());
    flow_listener.createFlow(DOMAIN, DiscoveryFlowContext{ source }, nullptr);
    return source;
}

jau::nsize_t BTDiscoveryManager::getMatchCacheSize() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    return match_cache.size();
}

std::string BTDiscoveryManager::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_manager); // RAII-style acquire and relinquish via destructor
    return "DiscoveryManager[state "+to_string(state)+
           ", matcher "+std::to_string(integration_matchers.size())+
           ", callbacks "+std::to_string(callback_registry.size())+
           ", "+match_cache.toString()+
           ", scanner "+( nullptr != scanner ? scanner->toString() : "nil" )+"]";
}
