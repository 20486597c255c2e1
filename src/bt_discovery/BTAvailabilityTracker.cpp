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

#include <string>
#include <mutex>
#include <unordered_set>

#include <jau/debug.hpp>

#include "BTAvailabilityTracker.hpp"

using namespace bt_discovery;

BTCancelFunc BTAvailabilityTracker::add(const std::string& address, const BTUnavailableCallback& cb) {
    {
        const std::lock_guard<std::mutex> lock(mtx_callbacks); // RAII-style acquire and relinquish via destructor
        callbacks[address].push_back(cb);
    }
    return BTCancelFunc( [this, address, cb]() -> void { remove(address, cb); } );
}

bool BTAvailabilityTracker::remove(const std::string& address, const BTUnavailableCallback& cb) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_callbacks); // RAII-style acquire and relinquish via destructor
    auto it = callbacks.find(address);
    if( callbacks.end() == it ) {
        return false;
    }
    CallbackList& list = it->second;
    for(auto cit = list.begin(); cit != list.end(); ++cit) {
        if( *cit == cb ) {
            list.erase(cit);
            if( list.empty() ) {
                callbacks.erase(it);
            }
            return true;
        }
    }
    return false;
}

jau::nsize_t BTAvailabilityTracker::getCallbackCount(const std::string& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_callbacks); // RAII-style acquire and relinquish via destructor
    auto it = callbacks.find(address);
    return callbacks.cend() == it ? 0 : it->second.size();
}

jau::darray<std::string> BTAvailabilityTracker::checkUnavailable(BTScanner& scanner) noexcept {
    jau::darray<std::string> disappeared;
    BTDeviceHistory& history = scanner.getHistory();
    // history first, a device recorded afterwards is not within the snapshot
    const BTDeviceHistory::Snapshot snapshot = history.snapshot();
    std::unordered_set<std::string> present;
    try {
        const jau::darray<BLEDeviceRef> devices = scanner.getDiscoveredDevices();
        for(const BLEDeviceRef& d : devices) {
            present.insert(d->address);
        }
    } catch (std::exception &e) {
        ERR_PRINT("BTAvailabilityTracker::checkUnavailable: %s: Caught exception %s", scanner.toString().c_str(), e.what());
        return disappeared;
    }
    for(const auto& entry : snapshot) {
        const std::string& address = entry.first;
        if( present.end() != present.find(address) ) {
            continue;
        }
        if( !history.removeIfUnchanged(address, entry.second) ) {
            DBG_PRINT("BTAvailabilityTracker::checkUnavailable: %s seen during check", address.c_str());
            continue;
        }
        disappeared.push_back(address);

        CallbackList cbs;
        {
            const std::lock_guard<std::mutex> lock(mtx_callbacks); // RAII-style acquire and relinquish via destructor
            auto it = callbacks.find(address);
            if( callbacks.end() == it ) {
                DBG_PRINT("BTAvailabilityTracker::checkUnavailable: %s gone, no callback", address.c_str());
                continue;
            }
            cbs = it->second; // stable copy
        }
        DBG_PRINT("BTAvailabilityTracker::checkUnavailable: %s gone, %zu callback", address.c_str(), (size_t)cbs.size());
        int i=0;
        for(BTUnavailableCallback& cb : cbs) {
            try {
                cb(address);
            } catch (std::exception &e) {
                ERR_PRINT("BTAvailabilityTracker::checkUnavailable %d/%zd: %s: Caught exception %s",
                        i+1, cbs.size(), address.c_str(), e.what());
            }
            i++;
        }
    }
    return disappeared;
}

void BTAvailabilityTracker::start(BTEventLoop& loop, const jau::fraction_i64& period, const BTEventLoop::EventFunc& tick) {
    const std::lock_guard<std::mutex> lock(mtx_tracking); // RAII-style acquire and relinquish via destructor
    if( tracking ) {
        return;
    }
    cancel_tracking = loop.trackInterval(period, tick);
    tracking = true;
    DBG_PRINT("BTAvailabilityTracker::start: period %s", period.to_string().c_str());
}

void BTAvailabilityTracker::stop() noexcept {
    BTCancelFunc cancel;
    {
        const std::lock_guard<std::mutex> lock(mtx_tracking); // RAII-style acquire and relinquish via destructor
        if( !tracking ) {
            return;
        }
        tracking = false;
        cancel = cancel_tracking;
        cancel_tracking = BTCancelFunc();
    }
    try {
        cancel();
    } catch (std::exception &e) {
        ERR_PRINT("BTAvailabilityTracker::stop: Caught exception %s", e.what());
    }
    DBG_PRINT("BTAvailabilityTracker::stop");
}

bool BTAvailabilityTracker::isTracking() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_tracking); // RAII-style acquire and relinquish via destructor
    return tracking;
}
