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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <map>

#include <cinttypes>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include <bt_discovery/BTDiscovery.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace bt_discovery;

/** \file
 * This _btd_replay00_ C++ example replays a textual advertisement script
 * through a scripted BTScanner into the BTDiscoveryManager,
 * printing discovery flows, subscription callbacks and unavailable events.
 *
 * ### btd_replay00 Invocation Examples:
 *
 * * Replay `adv.txt` matching SwitchBot devices for domain `switchbot`
 *   ~~~
 *   btd_replay00 -script adv.txt -matcher switchbot local_name=WoHand*
 *   ~~~
 *
 * * Replay from stdin, subscribe to all advertisements and track device 44:33:22:11:00:01
 *   ~~~
 *   btd_replay00 -subscribe -track 44:33:22:11:00:01 < adv.txt
 *   ~~~
 *
 * ### Script Format
 * One command per line, '#' starts a comment line.
 * - `adv <address> <name|-> <local_name|-> [msd=<id>:<hex>]* [uuid=<uuid>]* [rssi=<int>]`
 * - `gone <address>`, the device is no more seen by the scanner
 * - `tick`, performs one unavailable check
 */

/**
 * BTScanner fed by the script.
 */
class ReplayScanner : public BTScanner {
    private:
        bool scanning = false;
        std::map<std::string, BLEDeviceRef> active;

    public:
        void setup(const ScanningMode mode) override {
            jau::fprintf_td(stderr, "ReplayScanner: setup %s\n", to_string(mode).c_str());
        }

        void start() override { scanning = true; }

        void stop() override { scanning = false; }

        bool isScanning() const noexcept override { return scanning; }

        jau::darray<BLEDeviceRef> getDiscoveredDevices() const override {
            jau::darray<BLEDeviceRef> res;
            for(const auto& it : active) {
                res.push_back(it.second);
            }
            return res;
        }

        std::string toString() const noexcept override {
            return "ReplayScanner[scanning "+std::to_string(scanning)+", active "+std::to_string(active.size())+"]";
        }

        void advertise(const BLEDeviceRef& device, const AdvertisementDataRef& adv) {
            if( scanning ) {
                active[device->address] = device;
                deliverAdvertisement(device, adv);
            }
        }

        void disappear(const std::string& address) {
            active.erase(address);
        }
};

class PrintingFlowListener : public DiscoveryFlowListener {
    public:
        void createFlow(const std::string& domain, const DiscoveryFlowContext& context, const BTServiceInfoRef& info) override {
            jau::fprintf_td(stderr, "****** FLOW %s, %s: %s\n", domain.c_str(), context.toString().c_str(),
                    nullptr != info ? info->toString().c_str() : "nil");
        }
};

static bool parseOctets(const std::string& hex, octets_t& out) {
    if( 0 != hex.size() % 2 ) {
        return false;
    }
    for(std::string::size_type i=0; i<hex.size(); i+=2) {
        char* end = nullptr;
        const std::string b = hex.substr(i, 2);
        const unsigned long v = ::strtoul(b.c_str(), &end, 16);
        if( nullptr == end || '\0' != *end ) {
            return false;
        }
        out.push_back( static_cast<uint8_t>(v) );
    }
    return true;
}

static bool parseMatcher(const std::string& arg, BTMatcher& m) {
    const std::string::size_type sep = arg.find('=');
    if( std::string::npos == sep ) {
        return false;
    }
    const std::string key = arg.substr(0, sep);
    const std::string value = arg.substr(sep+1);
    if( "address" == key ) {
        m.address = value;
    } else if( "local_name" == key ) {
        m.local_name = value;
    } else if( "service_uuid" == key ) {
        m.service_uuid = value;
    } else if( "manufacturer_id" == key ) {
        m.manufacturer_id = static_cast<uint16_t>( atoi(value.c_str()) );
    } else if( "manufacturer_data_start" == key ) {
        octets_t start;
        if( !parseOctets(value, start) ) {
            return false;
        }
        m.manufacturer_data_start = start;
    } else {
        return false;
    }
    return true;
}

static void replayLine(const std::string& line, const int lineno, ReplayScanner& scanner, BTDiscoveryManager& manager) {
    std::istringstream in(line);
    std::string cmd;
    if( !(in >> cmd) || '#' == cmd[0] ) {
        return;
    }
    if( "tick" == cmd ) {
        const jau::darray<std::string> gone = manager.checkUnavailable();
        jau::fprintf_td(stderr, "tick: %zu unavailable\n", (size_t)gone.size());
        return;
    }
    if( "gone" == cmd ) {
        std::string address;
        if( in >> address ) {
            scanner.disappear(address);
        } else {
            jau::fprintf_td(stderr, "line %d: missing address\n", lineno);
        }
        return;
    }
    if( "adv" != cmd ) {
        jau::fprintf_td(stderr, "line %d: unknown command '%s'\n", lineno, cmd.c_str());
        return;
    }
    std::string address, name, local_name;
    if( !(in >> address >> name >> local_name) ) {
        jau::fprintf_td(stderr, "line %d: adv requires address, name and local_name\n", lineno);
        return;
    }
    int16_t rssi = -60;
    std::shared_ptr<AdvertisementData> adv = std::make_shared<AdvertisementData>();
    adv->local_name = "-" == local_name ? "" : local_name;
    std::string token;
    while( in >> token ) {
        if( 0 == token.compare(0, 4, "msd=") ) {
            const std::string::size_type sep = token.find(':', 4);
            octets_t data;
            if( std::string::npos == sep || !parseOctets(token.substr(sep+1), data) ) {
                jau::fprintf_td(stderr, "line %d: bad manufacturer data '%s'\n", lineno, token.c_str());
                return;
            }
            adv->manufacturer_data[ static_cast<uint16_t>( atoi(token.substr(4, sep-4).c_str()) ) ] = data;
        } else if( 0 == token.compare(0, 5, "uuid=") ) {
            adv->service_uuids.push_back(token.substr(5));
        } else if( 0 == token.compare(0, 5, "rssi=") ) {
            rssi = static_cast<int16_t>( atoi(token.substr(5).c_str()) );
        } else {
            jau::fprintf_td(stderr, "line %d: unknown token '%s'\n", lineno, token.c_str());
            return;
        }
    }
    adv->rssi = rssi;
    scanner.advertise(std::make_shared<BLEDevice>(address, "-" == name ? "" : name, rssi), adv);
}

int main(int argc, char *argv[])
{
    std::string script;
    BTDiscoveryManager::IntegrationMatcherList matchers;
    jau::darray<std::string> trackAddresses;
    bool subscribe = false;
    ScanningMode mode = ScanningMode::ACTIVE;

    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-btd_debug", argv[i]) && argc > (i+1) ) {
            setenv("bt_discovery.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-btd_verbose", argv[i]) && argc > (i+1) ) {
            setenv("bt_discovery.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-script", argv[i]) && argc > (i+1) ) {
            script = std::string(argv[++i]);
        } else if( !strcmp("-matcher", argv[i]) && argc > (i+2) ) {
            const std::string domain(argv[++i]);
            BTMatcher m;
            if( !parseMatcher(std::string(argv[++i]), m) ) {
                jau::fprintf_td(stderr, "Invalid matcher '%s'\n", argv[i]);
                return 1;
            }
            matchers.push_back( BTIntegrationMatcher{ domain, m } );
        } else if( !strcmp("-track", argv[i]) && argc > (i+1) ) {
            trackAddresses.push_back( std::string(argv[++i]) );
        } else if( !strcmp("-subscribe", argv[i]) ) {
            subscribe = true;
        } else if( !strcmp("-scanPassive", argv[i]) ) {
            mode = ScanningMode::PASSIVE;
        }
    }
    jau::fprintf_td(stderr, "pid %d\n", getpid());

    jau::fprintf_td(stderr, "Run with '[-script <file>] "
                    "(-matcher <domain> <address|local_name|service_uuid|manufacturer_id|manufacturer_data_start>=<value>)* "
                    "(-track <address>)* "
                    "[-subscribe] "
                    "[-scanPassive] "
                    "[-btd_verbose true|false] "
                    "[-btd_debug true|false|manager.event] "
                    "\n");

    jau::fprintf_td(stderr, "script %s\n", script.size() > 0 ? script.c_str() : "stdin");
    jau::fprintf_td(stderr, "matcher %zu\n", (size_t)matchers.size());
    for(const BTIntegrationMatcher& m : matchers) {
        jau::fprintf_td(stderr, "- %s\n", m.toString().c_str());
    }
    jau::fprintf_td(stderr, "scanMode %s\n", to_string(mode).c_str());

    std::shared_ptr<ReplayScanner> scanner = std::make_shared<ReplayScanner>();
    BTTimerEventLoop loop;
    PrintingFlowListener flowListener;
    BTDiscoveryManager manager( BTDiscoveryManager::ScannerFactory( [scanner]() -> BTScannerRef { return scanner; } ),
                                matchers, loop, flowListener );
    try {
        manager.setup();
        manager.start(mode);
    } catch (BTDiscoveryException &e) {
        jau::fprintf_td(stderr, "****** Start failed: %s\n", e.what());
        return 1;
    }

    jau::darray<BTCancelFunc> cancels;
    if( subscribe ) {
        cancels.push_back( manager.registerCallback( BTCallback( [](const BTServiceInfoRef& info, BTChange change) -> void {
            jau::fprintf_td(stderr, "****** CALLBACK %s: %s\n", to_string(change).c_str(), info->toString().c_str());
        } ) ) );
    }
    for(const std::string& address : trackAddresses) {
        cancels.push_back( manager.trackUnavailable( BTUnavailableCallback( [](const std::string& a) -> void {
            jau::fprintf_td(stderr, "****** UNAVAILABLE %s\n", a.c_str());
        } ), address ) );
    }

    jau::fprintf_td(stderr, "****** REPLAY start\n");
    int lineno = 0;
    std::string line;
    if( script.size() > 0 ) {
        std::ifstream in(script);
        if( !in.is_open() ) {
            jau::fprintf_td(stderr, "Could not open script %s\n", script.c_str());
            return 1;
        }
        while( std::getline(in, line) ) {
            replayLine(line, ++lineno, *scanner, manager);
        }
    } else {
        while( std::getline(std::cin, line) ) {
            replayLine(line, ++lineno, *scanner, manager);
        }
    }
    jau::fprintf_td(stderr, "****** REPLAY end: %d lines, %s\n", lineno, manager.toString().c_str());

    for(BTCancelFunc& cancel : cancels) {
        cancel();
    }
    loop.shutdown();
    jau::fprintf_td(stderr, "****** Shutdown: %s\n", manager.toString().c_str());
    return 0;
}
