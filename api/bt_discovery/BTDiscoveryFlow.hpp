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

#ifndef BTD_DISCOVERY_FLOW_HPP_
#define BTD_DISCOVERY_FLOW_HPP_

#include <string>

#include "BTDiscoveryTypes.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Context of a triggered discovery flow.
     */
    struct DiscoveryFlowContext {
        /** Origin of the flow, e.g. ::SOURCE_BLUETOOTH */
        std::string source;

        std::string toString() const noexcept { return "FlowContext[source "+source+"]"; }
    };

    /**
     * Receiver of one-shot discovery events, triggering the setup flow of an integration domain.
     */
    class DiscoveryFlowListener {
        public:
            virtual ~DiscoveryFlowListener() noexcept {}

            /**
             * Create a discovery flow for the given domain.
             *
             * @param domain the integration domain whose matcher matched
             * @param context the flow context
             * @param info the matching service info, may be nullptr for bootstrap flows
             */
            virtual void createFlow(const std::string& domain, const DiscoveryFlowContext& context, const BTServiceInfoRef& info) = 0;

            virtual std::string toString() const noexcept { return "DiscoveryFlowListener["+jau::to_hexstring(this)+"]"; }
    };

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_DISCOVERY_FLOW_HPP_ */
