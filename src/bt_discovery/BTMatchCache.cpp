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

#include "BTMatchCache.hpp"

using namespace bt_discovery;

bool BTMatchCache::contains(const BTMatchKey& key) const noexcept {
    return index.cend() != index.find(key);
}

bool BTMatchCache::insert(const BTMatchKey& key) {
    auto it = index.find(key);
    if( index.end() != it ) {
        order.splice(order.begin(), order, it->second); // refresh, iterators stay valid
        return false;
    }
    order.push_front(key);
    index.emplace(key, order.begin());
    while( index.size() > capacity_ ) {
        const BTMatchKey& lru = order.back();
        DBG_PRINT("BTMatchCache::insert: evict %s, %s", lru.toString().c_str(), toString().c_str());
        index.erase(lru);
        order.pop_back();
    }
    return true;
}

void BTMatchCache::clear() noexcept {
    index.clear();
    order.clear();
}
