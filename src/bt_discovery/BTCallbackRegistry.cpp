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

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "BTCallbackRegistry.hpp"

using namespace bt_discovery;

static BTCallbackRegistry::EntryList::equal_comparator _entryEqComp =
        [](const BTCallbackRegistry::Entry& a, const BTCallbackRegistry::Entry& b) -> bool { return a == b; };

void BTCallbackRegistry::add(const Entry& e) {
    entries.push_back(e);
}

bool BTCallbackRegistry::remove(const Entry& e) {
    return 0 < entries.erase_matching(e, false /* all_matching */, _entryEqComp);
}

void BTCallbackRegistry::invoke(const Entry& e, const BTServiceInfoRef& info, const char* cause) noexcept {
    try {
        e.callback(info, BTChange::ADVERTISEMENT);
    } catch (std::exception &except) {
        ERR_PRINT("BTCallbackRegistry::%s: %s of %s: Caught exception %s",
                cause, e.toString().c_str(), info->toString().c_str(), except.what());
    }
}

bool BTCallbackRegistry::replay(const Entry& e, const BTDeviceHistory& history, const std::string& source) noexcept {
    if( !e.matcher.has_value() || !e.matcher.value().address.has_value() ) {
        return false;
    }
    const BTObservation obs = history.find(e.matcher.value().address.value());
    if( !obs.isValid() ) {
        return false;
    }
    invoke(e, BTServiceInfo::from_advertisement(obs.device, obs.advertisement, source), "replay");
    return true;
}

jau::nsize_t BTCallbackRegistry::dispatch(const BLEDeviceRef& device, const AdvertisementDataRef& adv,
                                          const std::string& source, BTServiceInfoRef& service_info) noexcept
{
    jau::nsize_t count = 0;
    jau::for_each_fidelity(entries, [&](Entry& e) {
        if( e.match(*device, *adv) ) {
            if( nullptr == service_info ) {
                service_info = BTServiceInfo::from_advertisement(device, adv, source);
            }
            invoke(e, service_info, "dispatch");
            ++count;
        }
    });
    return count;
}
