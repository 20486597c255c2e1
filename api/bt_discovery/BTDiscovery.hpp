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

#ifndef BTD_DISCOVERY_HPP_
#define BTD_DISCOVERY_HPP_

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
#include "BTDiscoveryManager.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * BTDiscovery.hpp Module for BT discovery:
 *
 * - BTDiscoveryManager owning the single BTScanner
 * - BTMatcher based integration discovery and subscription callbacks
 * - BTAvailabilityTracker for unavailable devices
 *
 */
namespace bt_discovery {

} // namespace bt_discovery

#endif /* BTD_DISCOVERY_HPP_ */
