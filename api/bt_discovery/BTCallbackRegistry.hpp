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

#ifndef BTD_CALLBACK_REGISTRY_HPP_
#define BTD_CALLBACK_REGISTRY_HPP_

#include <string>
#include <optional>

#include <jau/cow_darray.hpp>

#include "BTDiscoveryTypes.hpp"
#include "BTMatcher.hpp"
#include "BTScanner.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Ordered list of subscription callbacks, each with an optional BTMatcher.
     *
     * Iteration works on a copy-on-write snapshot,
     * hence callbacks may add or remove subscriptions while being dispatched.
     */
    class BTCallbackRegistry {
        public:
            /**
             * One subscription, identified by the pair of callback and matcher.
             */
            struct Entry {
                BTCallback callback;
                /** An absent matcher matches all advertisements. */
                std::optional<BTMatcher> matcher;

                bool match(const BLEDevice& device, const AdvertisementData& adv) const noexcept {
                    return !matcher.has_value() || matches(matcher.value(), device, adv);
                }

                bool operator==(const Entry& rhs) const noexcept {
                    return callback == rhs.callback && matcher == rhs.matcher;
                }

                std::string toString() const noexcept {
                    return "Callback["+( matcher.has_value() ? matcher.value().toString() : std::string("any") )+"]";
                }
            };
            typedef jau::cow_darray<Entry> EntryList;

        private:
            EntryList entries;

            static void invoke(const Entry& e, const BTServiceInfoRef& info, const char* cause) noexcept;

        public:
            BTCallbackRegistry() noexcept {}

            BTCallbackRegistry(const BTCallbackRegistry&) = delete;
            void operator=(const BTCallbackRegistry&) = delete;

            /** Appends the given entry. */
            void add(const Entry& e);

            /**
             * Removes the first entry equal to the given one.
             * @return true if removed, otherwise false
             */
            bool remove(const Entry& e);

            jau::nsize_t size() const noexcept { return entries.size(); }

            void clear() noexcept { entries.clear(); }

            /**
             * Invokes the entry once if its matcher carries an address which has an observation in the given history.
             *
             * Exceptions thrown by the callback are caught and logged.
             * @return true if invoked, otherwise false
             */
            bool replay(const Entry& e, const BTDeviceHistory& history, const std::string& source) noexcept;

            /**
             * Invokes all matching entries in registration order.
             *
             * The BTServiceInfo is created on demand on first match and stored in `service_info`,
             * if not already set by the caller.
             * Exceptions thrown by a callback are caught and logged.
             *
             * @return number of invoked entries
             */
            jau::nsize_t dispatch(const BLEDeviceRef& device, const AdvertisementDataRef& adv,
                                  const std::string& source, BTServiceInfoRef& service_info) noexcept;

            std::string toString() const noexcept {
                return "CallbackRegistry[size "+std::to_string(entries.size())+"]";
            }
    };

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_CALLBACK_REGISTRY_HPP_ */
