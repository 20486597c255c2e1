/**
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

#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>
#include <fstream>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "btd_test_support.hpp"

extern "C" {
    #include <unistd.h>
    #include <sys/stat.h>
}

using namespace bt_discovery;
using namespace jau::fractions_i64_literals;

typedef BTDiscoveryManager::IntegrationMatcherList MatcherList;

static BTDiscoveryManager::ScannerFactory factoryOf(const TestScannerRef& scanner) {
    return BTDiscoveryManager::ScannerFactory( [scanner]() -> BTScannerRef { return scanner; } );
}

static std::string makeTempDir() {
    char templ[] = "/tmp/btd_lifecycle_XXXXXX";
    const char* res = ::mkdtemp(templ);
    REQUIRE( nullptr != res );
    return std::string(res);
}

TEST_CASE( "BTDiscoveryEnv Test 01", "[env]" ) {
    const BTDiscoveryEnv& env = BTDiscoveryEnv::get();
    REQUIRE( static_cast<int32_t>(MAX_REMEMBER_ADDRESSES) == env.MATCH_CACHE_CAPACITY );
    REQUIRE( UNAVAILABLE_TRACK_PERIOD == env.UNAVAILABLE_TRACK_PERIOD );
    REQUIRE( 300_s == env.UNAVAILABLE_TRACK_PERIOD );
    REQUIRE( "STARTED" == to_string(BTManagerState::STARTED) );
    REQUIRE( "ACTIVE" == to_string(ScanningMode::ACTIVE) );
    REQUIRE( ScanningMode::PASSIVE == to_ScanningMode("PASSIVE") );
}

TEST_CASE( "BTDiscoveryManager Setup Failure Test 02", "[lifecycle][setup]" ) {
    ManualEventLoop loop;
    RecordingFlowListener flows;
    {
        BTDiscoveryManager manager( BTDiscoveryManager::ScannerFactory( []() -> BTScannerRef {
            throw BTScannerException("No adapter", E_FILE_LINE);
        } ), MatcherList(), loop, flows );
        REQUIRE_THROWS_AS( manager.setup(), BTInitializationException );
        REQUIRE( BTManagerState::NONE == manager.getState() );
        REQUIRE_THROWS_AS( manager.getScanner(), jau::IllegalStateException );
        REQUIRE_THROWS_AS( manager.getDiscoveredServiceInfo(), jau::IllegalStateException );
        REQUIRE_THROWS_AS( manager.start(ScanningMode::PASSIVE), jau::IllegalStateException );
        REQUIRE( nullptr == manager.findDevice("44:33:22:11:00:01") );
        REQUIRE( false == manager.isAddressPresent("44:33:22:11:00:01") );
        REQUIRE( 0 == manager.checkUnavailable().size() );
    }
    {
        BTDiscoveryManager manager( BTDiscoveryManager::ScannerFactory( []() -> BTScannerRef {
            return nullptr;
        } ), MatcherList(), loop, flows );
        REQUIRE_THROWS_AS( manager.setup(), BTInitializationException );
    }
    {
        TestScannerRef scanner = std::make_shared<TestScanner>();
        scanner->fail_setup = true;
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        manager.setup();
        REQUIRE( BTManagerState::SETUP == manager.getState() );
        REQUIRE_THROWS_AS( manager.start(ScanningMode::ACTIVE), BTInitializationException );
        REQUIRE( 0 == scanner->start_count );
        REQUIRE( 0 == scanner->getDetectionCallbackCount() );
        REQUIRE( 0 == loop.getIntervalCount() );
    }
}

TEST_CASE( "BTDiscoveryManager Start Failure Test 03", "[lifecycle][start]" ) {
    ManualEventLoop loop;
    RecordingFlowListener flows;
    TestScannerRef scanner = std::make_shared<TestScanner>();
    scanner->fail_start = true;
    BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
    manager.setup();
    manager.setup(); // no-op

    REQUIRE_THROWS_AS( manager.start(ScanningMode::PASSIVE), BTNotReadyException );
    REQUIRE( 1 == scanner->setup_count );
    REQUIRE( 1 == scanner->start_count );
    REQUIRE( 0 == scanner->getDetectionCallbackCount() );
    REQUIRE( BTManagerState::SETUP == manager.getState() );
    REQUIRE( false == manager.isTrackingUnavailable() );
    REQUIRE( 0 == loop.getShutdownListenerCount() );

    // retry
    scanner->fail_start = false;
    REQUIRE( true == manager.start(ScanningMode::PASSIVE) );
    REQUIRE( ScanningMode::PASSIVE == scanner->mode );
    REQUIRE( true == scanner->isScanning() );
    REQUIRE( 1 == scanner->getDetectionCallbackCount() );
    REQUIRE( BTManagerState::STARTED == manager.getState() );
    REQUIRE( true == manager.isTrackingUnavailable() );
    REQUIRE( 1 == loop.getShutdownListenerCount() );

    // already started
    REQUIRE( false == manager.start(ScanningMode::PASSIVE) );
    REQUIRE( 1 == scanner->getDetectionCallbackCount() );
    REQUIRE( 1 == loop.getIntervalCount() );
}

TEST_CASE( "BTDiscoveryManager Stop Test 04", "[lifecycle][stop]" ) {
    ManualEventLoop loop;
    RecordingFlowListener flows;
    TestScannerRef scanner = std::make_shared<TestScanner>();
    {
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        manager.stop(); // not started, no-op
        REQUIRE( 0 == scanner->stop_count );

        manager.setup();
        REQUIRE( true == manager.start(ScanningMode::ACTIVE) );
        manager.stop();
        REQUIRE( 1 == scanner->stop_count );
        REQUIRE( false == scanner->isScanning() );
        REQUIRE( BTManagerState::STOPPED == manager.getState() );
        REQUIRE( 0 == scanner->getDetectionCallbackCount() );
        REQUIRE( 0 == loop.getIntervalCount() );

        manager.stop();
        REQUIRE( 1 == scanner->stop_count );

        // restart, shutdown hook registered once
        REQUIRE( true == manager.start(ScanningMode::ACTIVE) );
        REQUIRE( 1 == scanner->getDetectionCallbackCount() );
        REQUIRE( 1 == loop.getIntervalCount() );
        REQUIRE( 1 == loop.getShutdownListenerCount() );

        // failing scanner stop is logged only
        scanner->fail_stop = true;
        manager.stop();
        REQUIRE( 2 == scanner->stop_count );
        REQUIRE( BTManagerState::STOPPED == manager.getState() );
        REQUIRE( 0 == scanner->getDetectionCallbackCount() );
    }
    // destructor drops the shutdown hook
    REQUIRE( 0 == loop.getShutdownListenerCount() );
    REQUIRE( 2 == scanner->stop_count );
}

TEST_CASE( "BTDiscoveryManager Shutdown Test 05", "[lifecycle][shutdown]" ) {
    ManualEventLoop loop;
    RecordingFlowListener flows;
    TestScannerRef scanner = std::make_shared<TestScanner>();
    BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
    manager.setup();
    REQUIRE( true == manager.start(ScanningMode::ACTIVE) );
    REQUIRE( 1 == loop.getShutdownListenerCount() );

    loop.shutdown();
    REQUIRE( BTManagerState::STOPPED == manager.getState() );
    REQUIRE( 1 == scanner->stop_count );
    REQUIRE( 0 == loop.getIntervalCount() );
    REQUIRE( 0 == loop.getShutdownListenerCount() );

    // started again, the hook is registered anew
    REQUIRE( true == manager.start(ScanningMode::ACTIVE) );
    REQUIRE( 1 == loop.getShutdownListenerCount() );
    manager.stop();
    REQUIRE( 2 == scanner->stop_count );
}

TEST_CASE( "BTTimerEventLoop Test 06", "[eventloop]" ) {
    std::atomic<int> ticks(0);
    std::atomic<int> shutdowns(0);
    {
        BTTimerEventLoop loop;
        REQUIRE_THROWS_AS( loop.trackInterval(0_s, BTEventLoop::EventFunc( [&]() -> void { ++ticks; } )), jau::IllegalArgumentException );

        BTCancelFunc cancel = loop.trackInterval(10_ms, BTEventLoop::EventFunc( [&]() -> void { ++ticks; } ));
        REQUIRE( 1 == loop.getIntervalCount() );

        for(int i=0; i<500 && ticks < 2; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE( 2 <= ticks );

        cancel();
        REQUIRE( 0 == loop.getIntervalCount() );
        // a tick in flight may still complete
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        const int ticks_cancelled = ticks;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        REQUIRE( ticks_cancelled == ticks );

        loop.listenOnceShutdown(BTEventLoop::EventFunc( [&]() -> void { ++shutdowns; } ));
        BTCancelFunc cancel_hook = loop.listenOnceShutdown(BTEventLoop::EventFunc( [&]() -> void { shutdowns += 10; } ));
        cancel_hook();

        loop.trackInterval(1_s, BTEventLoop::EventFunc( [&]() -> void { ++ticks; } ));
        REQUIRE( 1 == loop.getIntervalCount() );

        loop.shutdown();
        REQUIRE( true == loop.isShutdown() );
        REQUIRE( 1 == shutdowns );
        REQUIRE( 0 == loop.getIntervalCount() );
        loop.shutdown();
        REQUIRE( 1 == shutdowns );

        REQUIRE_THROWS_AS( loop.trackInterval(1_s, BTEventLoop::EventFunc( [&]() -> void { ++ticks; } )), jau::IllegalStateException );

        // invoked right away after shutdown
        loop.listenOnceShutdown(BTEventLoop::EventFunc( [&]() -> void { ++shutdowns; } ));
        REQUIRE( 2 == shutdowns );
    }
    REQUIRE( 2 == shutdowns );
}

TEST_CASE( "BTDiscoveryManager Timer Event Loop Test 07", "[lifecycle][eventloop]" ) {
    RecordingFlowListener flows;
    TestScannerRef scanner = std::make_shared<TestScanner>();
    BTTimerEventLoop loop;
    {
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        manager.setup();
        REQUIRE( true == manager.start(ScanningMode::PASSIVE) );
        REQUIRE( 1 == loop.getIntervalCount() );

        loop.shutdown();
        REQUIRE( BTManagerState::STOPPED == manager.getState() );
        REQUIRE( 1 == scanner->stop_count );
        REQUIRE( 0 == loop.getIntervalCount() );
    }
    REQUIRE( 1 == scanner->stop_count );
}

/**
 * BTTimerEventLoop using a short fixed period for all intervals.
 */
class FastTimerEventLoop : public BTEventLoop {
    public:
        BTTimerEventLoop loop;

        BTCancelFunc trackInterval(const jau::fraction_i64&, const EventFunc& func) override {
            return loop.trackInterval(10_ms, func);
        }

        BTCancelFunc listenOnceShutdown(const EventFunc& func) override {
            return loop.listenOnceShutdown(func);
        }
};

TEST_CASE( "BTTimerEventLoop Self Cancel Test 08", "[eventloop]" ) {
    std::atomic<int> ticks(0);
    BTTimerEventLoop loop;
    BTCancelFunc cancel;
    std::mutex mtx_cancel;
    {
        const std::lock_guard<std::mutex> lock(mtx_cancel);
        cancel = loop.trackInterval(10_ms, BTEventLoop::EventFunc( [&]() -> void {
            BTCancelFunc c;
            {
                const std::lock_guard<std::mutex> lock2(mtx_cancel);
                c = cancel;
            }
            ++ticks;
            c(); // on its own timer thread
        } ));
    }
    for(int i=0; i<500 && ticks < 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE( 1 == ticks );
    REQUIRE( 0 == loop.getIntervalCount() );

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE( 1 == ticks );

    // reaps the done interval
    BTCancelFunc cancel2 = loop.trackInterval(1_s, BTEventLoop::EventFunc( [&]() -> void { ++ticks; } ));
    REQUIRE( 1 == loop.getIntervalCount() );
    cancel2();
    REQUIRE( 0 == loop.getIntervalCount() );
}

TEST_CASE( "BTDiscoveryManager Stop Within Unavailable Callback Test 09", "[lifecycle][eventloop][unavailable]" ) {
    RecordingFlowListener flows;
    TestScannerRef scanner = std::make_shared<TestScanner>();
    FastTimerEventLoop loop;
    std::atomic<int> unavailable(0);
    {
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        manager.setup();
        scanner->advertise(makeDevice("44:33:22:11:00:01", ""), makeAdv(""));
        scanner->disappear("44:33:22:11:00:01");
        manager.trackUnavailable( BTUnavailableCallback( [&](const std::string&) -> void {
            manager.stop(); // on the timer thread
            ++unavailable;
        } ), "44:33:22:11:00:01" );

        REQUIRE( true == manager.start(ScanningMode::PASSIVE) );
        for(int i=0; i<500 && unavailable < 1; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE( 1 == unavailable );
        REQUIRE( BTManagerState::STOPPED == manager.getState() );
        REQUIRE( 1 == scanner->stop_count );
        REQUIRE( 0 == loop.loop.getIntervalCount() );
        REQUIRE( false == manager.isAddressPresent("44:33:22:11:00:01") );
    }
    REQUIRE( 1 == unavailable );
}

TEST_CASE( "BTDiscoveryManager Setup Integration Test 10", "[lifecycle][integration]" ) {
    ManualEventLoop loop;
    TestScannerRef scanner = std::make_shared<TestScanner>();
    const std::string empty_dir = makeTempDir();
    const std::string adapter_dir = makeTempDir();
    REQUIRE( 0 == ::mkdir( (adapter_dir+"/hci0").c_str(), 0700 ) );

    {
        RecordingFlowListener flows;
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        REQUIRE( "" == manager.setupIntegration(true, true, adapter_dir) );
        REQUIRE( 0 == flows.flows.size() );
    }
    {
        RecordingFlowListener flows;
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        REQUIRE( SOURCE_IMPORT == manager.setupIntegration(false, true, empty_dir) );
        REQUIRE( 1 == flows.flows.size() );
        REQUIRE( DOMAIN == flows.flows[0].domain );
        REQUIRE( SOURCE_IMPORT == flows.flows[0].source );
        REQUIRE( nullptr == flows.flows[0].info );
    }
    {
        RecordingFlowListener flows;
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        REQUIRE( SOURCE_INTEGRATION_DISCOVERY == manager.setupIntegration(false, false, adapter_dir) );
        REQUIRE( 1 == flows.flows.size() );
        REQUIRE( SOURCE_INTEGRATION_DISCOVERY == flows.flows[0].source );
    }
    {
        RecordingFlowListener flows;
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        REQUIRE( "" == manager.setupIntegration(false, false, empty_dir) );
        REQUIRE( 0 == flows.flows.size() );
    }
    {
        RecordingFlowListener flows;
        flows.failing_domain = DOMAIN;
        BTDiscoveryManager manager( factoryOf(scanner), MatcherList(), loop, flows );
        REQUIRE_THROWS_AS( manager.setupIntegration(false, true, empty_dir), std::runtime_error );
    }
    ::rmdir( (adapter_dir+"/hci0").c_str() );
    ::rmdir( adapter_dir.c_str() );
    ::rmdir( empty_dir.c_str() );
}
