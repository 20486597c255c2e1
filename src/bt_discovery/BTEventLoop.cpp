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

#include "BTDiscoveryConst.hpp"
#include "BTEventLoop.hpp"

using namespace bt_discovery;
using namespace jau::fractions_i64_literals;

BTTimerEventLoop::Interval::Interval(const std::string& name, const jau::fraction_i64& period_, const EventFunc& func_) noexcept
: timer(name, THREAD_SHUTDOWN_TIMEOUT),
  period(period_), func(func_), cancelled(false), done(false)
{ }

jau::fraction_i64 BTTimerEventLoop::Interval::timeoutfunc(jau::simple_timer& t) {
    if( t.shall_stop() || cancelled ) {
        done = true;
        return 0_s;
    }
    try {
        func();
    } catch (std::exception &e) {
        ERR_PRINT("BTTimerEventLoop::Interval: Caught exception %s", e.what());
    }
    if( t.shall_stop() || cancelled ) {
        done = true;
        return 0_s;
    }
    return period;
}

bool BTTimerEventLoop::Interval::start() noexcept {
    return timer.start(period, jau::bind_member(this, &Interval::timeoutfunc));
}

void BTTimerEventLoop::Interval::stop() noexcept {
    cancelled = true;
    timer.stop();
}

BTTimerEventLoop::BTTimerEventLoop() noexcept
: next_interval_id(0), next_listener_id(0), is_shutdown(false)
{ }

BTTimerEventLoop::~BTTimerEventLoop() noexcept {
    shutdown();
    jau::darray<std::unique_ptr<Interval>> stopping;
    {
        const std::lock_guard<std::mutex> lock(mtx_intervals); // RAII-style acquire and relinquish via destructor
        stopping.swap(cancelled_intervals);
    }
    for(std::unique_ptr<Interval>& interval : stopping) {
        interval->stop();
    }
}

BTCancelFunc BTTimerEventLoop::trackInterval(const jau::fraction_i64& period, const EventFunc& func) {
    if( is_shutdown ) {
        throw jau::IllegalStateException("BTTimerEventLoop is shut down", E_FILE_LINE);
    }
    if( period <= 0_s ) {
        throw jau::IllegalArgumentException("Interval period must be positive: "+period.to_string(), E_FILE_LINE);
    }
    jau::nsize_t id;
    {
        const std::lock_guard<std::mutex> lock(mtx_intervals); // RAII-style acquire and relinquish via destructor
        reapDoneIntervals();
        id = next_interval_id++;
        std::unique_ptr<Interval> interval = std::make_unique<Interval>("BTTimerEventLoop-"+std::to_string(id), period, func);
        const bool r = interval->start();
        DBG_PRINT("BTTimerEventLoop::trackInterval: id %zu, period %s, started %d", (size_t)id, period.to_string().c_str(), r);
        intervals[id] = std::move(interval);
    }
    return BTCancelFunc( [this, id]() -> void { cancelInterval(id); } );
}

void BTTimerEventLoop::cancelInterval(const jau::nsize_t id) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_intervals); // RAII-style acquire and relinquish via destructor
    auto it = intervals.find(id);
    if( intervals.end() == it ) {
        return;
    }
    // may run on the interval's own timer thread, reaped later
    it->second->cancel();
    cancelled_intervals.push_back( std::move(it->second) );
    intervals.erase(it);
    DBG_PRINT("BTTimerEventLoop::cancelInterval: id %zu", (size_t)id);
}

void BTTimerEventLoop::reapDoneIntervals() noexcept {
    for(auto it = cancelled_intervals.begin(); it != cancelled_intervals.end(); ) {
        if( (*it)->isDone() ) {
            (*it)->stop();
            it = cancelled_intervals.erase(it);
        } else {
            ++it;
        }
    }
}

jau::nsize_t BTTimerEventLoop::getIntervalCount() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_intervals); // RAII-style acquire and relinquish via destructor
    return static_cast<jau::nsize_t>(intervals.size());
}

BTCancelFunc BTTimerEventLoop::listenOnceShutdown(const EventFunc& func) {
    {
        const std::lock_guard<std::mutex> lock(mtx_shutdown); // RAII-style acquire and relinquish via destructor
        if( !is_shutdown ) {
            const jau::nsize_t id = next_listener_id++;
            shutdownListener[id] = func;
            return BTCancelFunc( [this, id]() -> void { cancelShutdownListener(id); } );
        }
    }
    func();
    return BTCancelFunc();
}

void BTTimerEventLoop::cancelShutdownListener(const jau::nsize_t id) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_shutdown); // RAII-style acquire and relinquish via destructor
    shutdownListener.erase(id);
}

void BTTimerEventLoop::shutdown() noexcept {
    std::unordered_map<jau::nsize_t, EventFunc> listener;
    {
        const std::lock_guard<std::mutex> lock(mtx_shutdown); // RAII-style acquire and relinquish via destructor
        if( is_shutdown ) {
            return;
        }
        is_shutdown = true;
        listener.swap(shutdownListener);
    }
    DBG_PRINT("BTTimerEventLoop::shutdown: %zu listener", (size_t)listener.size());
    for(auto& it : listener) {
        try {
            it.second();
        } catch (std::exception &e) {
            ERR_PRINT("BTTimerEventLoop::shutdown: Caught exception %s", e.what());
        }
    }
    const std::lock_guard<std::mutex> lock(mtx_intervals); // RAII-style acquire and relinquish via destructor
    reapDoneIntervals();
    for(auto& it : intervals) {
        it.second->cancel();
        cancelled_intervals.push_back( std::move(it.second) );
    }
    intervals.clear();
}
