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
#include <memory>
#include <mutex>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "BTScanner.hpp"

using namespace bt_discovery;

void BTDeviceHistory::update(const BLEDeviceRef& device, const AdvertisementDataRef& advertisement) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    history[device->address] = Entry{ BTObservation{ device, advertisement }, ++update_count };
}

BTDeviceHistory::Snapshot BTDeviceHistory::snapshot() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    Snapshot res;
    for(const auto& it : history) {
        res[it.first] = it.second.update_seq;
    }
    return res;
}

bool BTDeviceHistory::removeIfUnchanged(const std::string& address, const uint64_t update_seq) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    auto it = history.find(address);
    if( history.end() == it || it->second.update_seq != update_seq ) {
        return false;
    }
    history.erase(it);
    return true;
}

BTObservation BTDeviceHistory::find(const std::string& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    auto it = history.find(address);
    if( history.cend() == it ) {
        return BTObservation{ nullptr, nullptr };
    }
    return it->second.observation;
}

bool BTDeviceHistory::contains(const std::string& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    return history.cend() != history.find(address);
}

jau::darray<BTObservation> BTDeviceHistory::getObservations() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    jau::darray<BTObservation> res(history.size());
    for(const auto& it : history) {
        res.push_back(it.second.observation);
    }
    return res;
}

jau::nsize_t BTDeviceHistory::size() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    return static_cast<jau::nsize_t>(history.size());
}

void BTDeviceHistory::clear() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_history); // RAII-style acquire and relinquish via destructor
    history.clear();
}

static BTScanner::DetectionCallbackList::equal_comparator _detectionCallbackEqComp =
        [](const BTScanner::DetectionCallback& a, const BTScanner::DetectionCallback& b) -> bool { return a == b; };

bool BTScanner::addDetectionCallback(const DetectionCallback& cb) {
    return detectionCallbackList.push_back_unique(cb, _detectionCallbackEqComp);
}

bool BTScanner::removeDetectionCallback(const DetectionCallback& cb) {
    return 0 < detectionCallbackList.erase_matching(cb, false /* all_matching */, _detectionCallbackEqComp);
}

void BTScanner::deliverAdvertisement(const BLEDeviceRef& device, const AdvertisementDataRef& advertisement) noexcept {
    history.update(device, advertisement);
    int i=0;
    jau::for_each_fidelity(detectionCallbackList, [&](DetectionCallback& cb) {
        try {
            cb(device, advertisement);
        } catch (std::exception &e) {
            ERR_PRINT("BTScanner::deliverAdvertisement %d/%zd: %s of %s: Caught exception %s",
                    i+1, detectionCallbackList.size(),
                    device->toString().c_str(), toString().c_str(), e.what());
        }
        i++;
    });
}
