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

#ifndef BTD_MATCH_CACHE_HPP_
#define BTD_MATCH_CACHE_HPP_

#include <string>
#include <list>
#include <unordered_map>
#include <functional>

#include <jau/int_types.hpp>

#include "BTDiscoveryConst.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Key of the BTMatchCache, the device address and whether manufacturer data was present.
     */
    struct BTMatchKey {
        std::string address;
        bool has_manufacturer_data;

        BTMatchKey(std::string address_, const bool has_manufacturer_data_) noexcept
        : address(std::move(address_)), has_manufacturer_data(has_manufacturer_data_) {}

        /**
         * Implementation uses a lock-free and fast hash algorithm, combining the address hash
         * with the manufacturer data flag.
         */
        std::size_t hash_code() const noexcept {
            // 31 * x == (x << 5) - x
            const std::size_t h = std::hash<std::string>{}(address);
            return ( ( h << 5 ) - h ) + ( has_manufacturer_data ? 1 : 0 );
        }

        std::string toString() const noexcept {
            return "["+address+", msd "+std::to_string(has_manufacturer_data)+"]";
        }
    };

    inline bool operator==(const BTMatchKey& lhs, const BTMatchKey& rhs) noexcept {
        if( &lhs == &rhs ) {
            return true;
        }
        return lhs.has_manufacturer_data == rhs.has_manufacturer_data &&
               lhs.address == rhs.address;
    }

    inline bool operator!=(const BTMatchKey& lhs, const BTMatchKey& rhs) noexcept
    { return !(lhs == rhs); }

    /**@}*/

} // namespace bt_discovery

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    template<> struct hash<bt_discovery::BTMatchKey> {
        std::size_t operator()(bt_discovery::BTMatchKey const& a) const noexcept {
            return a.hash_code();
        }
    };

    /**@}*/
}

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Count bounded set of BTMatchKey, evicting the least recently used key, i.e. inserted or re-inserted.
     *
     * Remembers which (address, has manufacturer data) pairs already matched
     * an integration matcher, so repeated advertisements skip matcher evaluation.
     *
     * Implementation is not thread safe, the BTDiscoveryManager serializes access.
     */
    class BTMatchCache {
        private:
            typedef std::list<BTMatchKey> order_t;

            jau::nsize_t capacity_;
            /** Most recently used at front. */
            order_t order;
            std::unordered_map<BTMatchKey, order_t::iterator> index;

        public:
            explicit BTMatchCache(const jau::nsize_t capacity = MAX_REMEMBER_ADDRESSES) noexcept
            : capacity_( 0 < capacity ? capacity : 1 ) {}

            BTMatchCache(const BTMatchCache&) = delete;
            void operator=(const BTMatchCache&) = delete;

            /**
             * Returns true if the key is contained.
             *
             * Lookup does not refresh the recency of the key.
             */
            bool contains(const BTMatchKey& key) const noexcept;

            /**
             * Inserts the given key, or refreshes its recency if already contained.
             *
             * Evicts the least recently used keys while the capacity is exceeded.
             * @return true if the key was newly added, otherwise false
             */
            bool insert(const BTMatchKey& key);

            jau::nsize_t size() const noexcept { return static_cast<jau::nsize_t>(index.size()); }

            jau::nsize_t capacity() const noexcept { return capacity_; }

            void clear() noexcept;

            std::string toString() const noexcept {
                return "MatchCache[size "+std::to_string(size())+" / "+std::to_string(capacity_)+"]";
            }
    };

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_MATCH_CACHE_HPP_ */
