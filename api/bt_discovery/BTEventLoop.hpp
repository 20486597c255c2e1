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

#ifndef BTD_EVENT_LOOP_HPP_
#define BTD_EVENT_LOOP_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>
#include <jau/simple_timer.hpp>

#include "BTDiscoveryTypes.hpp"

namespace bt_discovery {

    /** \addtogroup BTDUserAPI
     *
     *  @{
     */

    /**
     * Scheduling primitives used by the BTDiscoveryManager,
     * a periodic trigger and a one-shot shutdown hook.
     */
    class BTEventLoop {
        public:
            typedef jau::function<void()> EventFunc;

            virtual ~BTEventLoop() noexcept {}

            /**
             * Invoke the given function every period until the returned BTCancelFunc is called.
             * <p>
             * The returned BTCancelFunc must not be called after this BTEventLoop has been destructed.
             * </p>
             */
            virtual BTCancelFunc trackInterval(const jau::fraction_i64& period, const EventFunc& func) = 0;

            /**
             * Invoke the given function once at shutdown, unless the returned BTCancelFunc has been called before.
             */
            virtual BTCancelFunc listenOnceShutdown(const EventFunc& func) = 0;
    };

    /**
     * Default BTEventLoop using one jau::simple_timer thread per interval.
     *
     * Shutdown listeners are invoked by shutdown() or the destructor, whichever comes first.
     *
     * Cancelling an interval never waits for its timer thread,
     * hence it may be cancelled from within its own function or while holding a lock its function acquires.
     * The cancelled interval is reaped once its timer thread has ended, latest by the destructor.
     */
    class BTTimerEventLoop : public BTEventLoop {
        private:
            class Interval {
                private:
                    jau::simple_timer timer;
                    const jau::fraction_i64 period;
                    const EventFunc func;
                    std::atomic<bool> cancelled;
                    std::atomic<bool> done;

                    jau::fraction_i64 timeoutfunc(jau::simple_timer& t);

                public:
                    Interval(const std::string& name, const jau::fraction_i64& period_, const EventFunc& func_) noexcept;

                    bool start() noexcept;

                    /** Marks this interval cancelled without waiting, its function will not be invoked again. */
                    void cancel() noexcept { cancelled = true; }

                    /** Returns true if the timer function has returned for the last time. */
                    bool isDone() const noexcept { return done; }

                    /** Stops the timer and waits for its thread. Must not be called on the timer thread. */
                    void stop() noexcept;
            };

            std::mutex mtx_intervals;
            std::unordered_map<jau::nsize_t, std::unique_ptr<Interval>> intervals;
            jau::darray<std::unique_ptr<Interval>> cancelled_intervals;
            jau::nsize_t next_interval_id;

            std::mutex mtx_shutdown;
            std::unordered_map<jau::nsize_t, EventFunc> shutdownListener;
            jau::nsize_t next_listener_id;
            std::atomic<bool> is_shutdown;

            void cancelInterval(const jau::nsize_t id) noexcept;
            /** Destroys all done cancelled intervals, caller holds mtx_intervals. */
            void reapDoneIntervals() noexcept;
            void cancelShutdownListener(const jau::nsize_t id) noexcept;

        public:
            BTTimerEventLoop() noexcept;

            BTTimerEventLoop(const BTTimerEventLoop&) = delete;
            void operator=(const BTTimerEventLoop&) = delete;

            ~BTTimerEventLoop() noexcept override;

            BTCancelFunc trackInterval(const jau::fraction_i64& period, const EventFunc& func) override;

            /**
             * {@inheritDoc}
             * <p>
             * If already shut down, the function is invoked right away.
             * </p>
             */
            BTCancelFunc listenOnceShutdown(const EventFunc& func) override;

            /**
             * Invokes and drops all shutdown listener in no particular order, then cancels all intervals.
             *
             * Method is idempotent.
             */
            void shutdown() noexcept;

            bool isShutdown() const noexcept { return is_shutdown; }

            /** Returns the number of active, i.e. not cancelled, intervals. */
            jau::nsize_t getIntervalCount() noexcept;
    };

    /**@}*/

} // namespace bt_discovery

#endif /* BTD_EVENT_LOOP_HPP_ */
