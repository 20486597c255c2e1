#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <stdexcept>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "btd_test_support.hpp"

using namespace bt_discovery;

TEST_CASE( "BTCallbackRegistry Dispatch Test 01", "[callback][dispatch]" ) {
    BTCallbackRegistry registry;
    jau::darray<std::string> order;
    jau::darray<BTServiceInfoRef> infos;
    jau::darray<BTChange> changes;

    BTMatcher m_switch;
    m_switch.local_name = "Switch*";
    BTMatcher m_other = BTMatcher::forAddress("44:33:22:11:00:99");

    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef& info, BTChange change) -> void {
        changes.push_back(change);
        order.push_back("any");
        infos.push_back(info);
    } ), std::nullopt } );
    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef& info, BTChange) -> void {
        order.push_back("switch");
        infos.push_back(info);
    } ), m_switch } );
    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef& info, BTChange) -> void {
        order.push_back("other");
        infos.push_back(info);
    } ), m_other } );
    REQUIRE( 3 == registry.size() );
    INFO_STR(registry.toString());

    const BLEDeviceRef dev = makeDevice("44:33:22:11:00:01", "");
    BTServiceInfoRef service_info;
    const jau::nsize_t count = registry.dispatch(dev, makeAdv("SwitchBot"), SOURCE_LOCAL, service_info);
    REQUIRE( 2 == count );
    REQUIRE( 2 == order.size() );
    REQUIRE( "any" == order[0] );
    REQUIRE( "switch" == order[1] );
    REQUIRE( 1 == changes.size() );
    REQUIRE( BTChange::ADVERTISEMENT == changes[0] );

    // one shared BTServiceInfo, built once
    REQUIRE( nullptr != service_info );
    REQUIRE( service_info == infos[0] );
    REQUIRE( service_info == infos[1] );
    REQUIRE( SOURCE_LOCAL == service_info->source );
    REQUIRE( "SwitchBot" == service_info->name );
    REQUIRE( "44:33:22:11:00:01" == service_info->address );
}

TEST_CASE( "BTCallbackRegistry No Match Test 02", "[callback][dispatch]" ) {
    BTCallbackRegistry registry;
    int called = 0;
    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef&, BTChange) -> void {
        ++called;
    } ), BTMatcher::forAddress("44:33:22:11:00:99") } );

    BTServiceInfoRef service_info;
    REQUIRE( 0 == registry.dispatch(makeDevice("44:33:22:11:00:01", ""), makeAdv(""), SOURCE_LOCAL, service_info) );
    REQUIRE( 0 == called );
    // not built if nobody matched
    REQUIRE( nullptr == service_info );
}

TEST_CASE( "BTCallbackRegistry Failing Callback Test 03", "[callback][exception]" ) {
    BTCallbackRegistry registry;
    int called_a = 0, called_b = 0;
    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef&, BTChange) -> void {
        ++called_a;
        throw std::runtime_error("callback failure");
    } ), std::nullopt } );
    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef&, BTChange) -> void {
        ++called_b;
    } ), std::nullopt } );

    BTServiceInfoRef service_info;
    REQUIRE( 2 == registry.dispatch(makeDevice("44:33:22:11:00:01", ""), makeAdv(""), SOURCE_LOCAL, service_info) );
    REQUIRE( 1 == called_a );
    REQUIRE( 1 == called_b );
}

TEST_CASE( "BTCallbackRegistry Remove Test 04", "[callback][remove]" ) {
    BTCallbackRegistry registry;
    int called = 0;
    const BTCallbackRegistry::Entry e { BTCallback( [&](const BTServiceInfoRef&, BTChange) -> void { ++called; } ), std::nullopt };
    registry.add(e);
    registry.add(e);
    REQUIRE( 2 == registry.size() );

    // first equal entry only
    REQUIRE( true == registry.remove(e) );
    REQUIRE( 1 == registry.size() );
    REQUIRE( true == registry.remove(e) );
    REQUIRE( 0 == registry.size() );
    REQUIRE( false == registry.remove(e) );

    registry.add(e);
    registry.clear();
    REQUIRE( 0 == registry.size() );
}

TEST_CASE( "BTCallbackRegistry Self Remove Test 05", "[callback][remove]" ) {
    BTCallbackRegistry registry;
    int called_self = 0, called_other = 0;
    BTCallbackRegistry::Entry self;
    self.callback = BTCallback( [&](const BTServiceInfoRef&, BTChange) -> void {
        ++called_self;
        registry.remove(self);
    } );
    registry.add(self);
    registry.add( BTCallbackRegistry::Entry{ BTCallback( [&](const BTServiceInfoRef&, BTChange) -> void {
        ++called_other;
    } ), std::nullopt } );

    const BLEDeviceRef dev = makeDevice("44:33:22:11:00:01", "");
    {
        BTServiceInfoRef service_info;
        REQUIRE( 2 == registry.dispatch(dev, makeAdv(""), SOURCE_LOCAL, service_info) );
    }
    REQUIRE( 1 == called_self );
    REQUIRE( 1 == called_other );
    REQUIRE( 1 == registry.size() );
    {
        BTServiceInfoRef service_info;
        REQUIRE( 1 == registry.dispatch(dev, makeAdv(""), SOURCE_LOCAL, service_info) );
    }
    REQUIRE( 1 == called_self );
    REQUIRE( 2 == called_other );
}

TEST_CASE( "BTCallbackRegistry Replay Test 06", "[callback][replay]" ) {
    BTCallbackRegistry registry;
    BTDeviceHistory history;
    const BLEDeviceRef dev = makeDevice("44:33:22:11:00:01", "WoHand");
    history.update(dev, makeAdv("SwitchBot"));

    jau::darray<BTServiceInfoRef> infos;
    const BTCallback cb( [&](const BTServiceInfoRef& info, BTChange) -> void { infos.push_back(info); } );

    // no matcher, no address
    REQUIRE( false == registry.replay( BTCallbackRegistry::Entry{ cb, std::nullopt }, history, SOURCE_LOCAL ) );
    {
        BTMatcher m;
        m.local_name = "Switch*";
        REQUIRE( false == registry.replay( BTCallbackRegistry::Entry{ cb, m }, history, SOURCE_LOCAL ) );
    }
    // address not within history
    REQUIRE( false == registry.replay( BTCallbackRegistry::Entry{ cb, BTMatcher::forAddress("44:33:22:11:00:02") }, history, SOURCE_LOCAL ) );
    REQUIRE( 0 == infos.size() );

    REQUIRE( true == registry.replay( BTCallbackRegistry::Entry{ cb, BTMatcher::forAddress("44:33:22:11:00:01") }, history, SOURCE_LOCAL ) );
    REQUIRE( 1 == infos.size() );
    REQUIRE( "SwitchBot" == infos[0]->name );
    REQUIRE( SOURCE_LOCAL == infos[0]->source );
    REQUIRE( dev == infos[0]->device );
}
