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

#ifndef BTD_TEST_SUPPORT_HPP_
#define BTD_TEST_SUPPORT_HPP_

#include <string>
#include <memory>
#include <map>
#include <stdexcept>
#include <initializer_list>

#include <jau/darray.hpp>
#include <jau/basic_types.hpp>

#include <bt_discovery/BTDiscovery.hpp>

using namespace bt_discovery;

/**
 * In-memory BTScanner, devices are injected via advertise() and removed via disappear().
 */
class TestScanner : public BTScanner {
    public:
        bool fail_setup = false;
        bool fail_start = false;
        bool fail_stop = false;
        bool fail_list = false;
        int setup_count = 0;
        int start_count = 0;
        int stop_count = 0;
        ScanningMode mode = ScanningMode::PASSIVE;
        /** Advertised once by the next getDiscoveredDevices(), after the devices have been listed. */
        BLEDeviceRef advertise_while_listing;

    private:
        bool scanning = false;
        std::map<std::string, BLEDeviceRef> active;

    public:
        void setup(const ScanningMode mode_) override {
            ++setup_count;
            if( fail_setup ) {
                throw BTScannerException("No adapter", E_FILE_LINE);
            }
            mode = mode_;
        }

        void start() override {
            ++start_count;
            if( fail_start ) {
                throw BTScannerException("Adapter busy", E_FILE_LINE);
            }
            scanning = true;
        }

        void stop() override {
            ++stop_count;
            scanning = false;
            if( fail_stop ) {
                throw BTScannerException("Adapter gone", E_FILE_LINE);
            }
        }

        bool isScanning() const noexcept override { return scanning; }

        jau::darray<BLEDeviceRef> getDiscoveredDevices() const override {
            if( fail_list ) {
                throw BTScannerException("Listing failed", E_FILE_LINE);
            }
            jau::darray<BLEDeviceRef> res;
            for(const auto& it : active) {
                res.push_back(it.second);
            }
            if( nullptr != advertise_while_listing ) {
                TestScanner* self = const_cast<TestScanner*>(this);
                const BLEDeviceRef device = advertise_while_listing;
                self->advertise_while_listing = nullptr;
                self->advertise(device, std::make_shared<AdvertisementData>());
            }
            return res;
        }

        std::string toString() const noexcept override {
            return "TestScanner[scanning "+std::to_string(scanning)+", active "+std::to_string(active.size())+"]";
        }

        /** Marks the device as currently seen and delivers its advertisement. */
        void advertise(const BLEDeviceRef& device, const AdvertisementDataRef& adv) {
            active[device->address] = device;
            deliverAdvertisement(device, adv);
        }

        /** Device is no more seen, its history stays until the next unavailable check. */
        void disappear(const std::string& address) {
            active.erase(address);
        }
};
typedef std::shared_ptr<TestScanner> TestScannerRef;

/**
 * BTEventLoop firing its intervals on demand only.
 */
class ManualEventLoop : public BTEventLoop {
    private:
        struct Interval {
            jau::nsize_t id;
            jau::fraction_i64 period;
            EventFunc func;
        };
        jau::darray<Interval> intervals;
        std::map<jau::nsize_t, EventFunc> shutdownListener;
        jau::nsize_t next_id = 0;

        void cancelInterval(const jau::nsize_t id) {
            for(auto it = intervals.begin(); it != intervals.end(); ++it) {
                if( it->id == id ) {
                    intervals.erase(it);
                    return;
                }
            }
        }

    public:
        BTCancelFunc trackInterval(const jau::fraction_i64& period, const EventFunc& func) override {
            const jau::nsize_t id = next_id++;
            intervals.push_back( Interval{ id, period, func } );
            return BTCancelFunc( [this, id]() -> void { cancelInterval(id); } );
        }

        BTCancelFunc listenOnceShutdown(const EventFunc& func) override {
            const jau::nsize_t id = next_id++;
            shutdownListener[id] = func;
            return BTCancelFunc( [this, id]() -> void { shutdownListener.erase(id); } );
        }

        /** Invokes each interval function once. */
        void fire() {
            jau::darray<Interval> snapshot = intervals;
            for(Interval& i : snapshot) {
                i.func();
            }
        }

        void shutdown() {
            std::map<jau::nsize_t, EventFunc> l;
            l.swap(shutdownListener);
            for(auto& it : l) {
                it.second();
            }
        }

        jau::nsize_t getIntervalCount() const noexcept { return intervals.size(); }

        jau::nsize_t getShutdownListenerCount() const noexcept { return shutdownListener.size(); }

        jau::fraction_i64 getPeriod(const jau::nsize_t idx) const { return intervals.at(idx).period; }
};

/**
 * DiscoveryFlowListener recording all created flows.
 */
class RecordingFlowListener : public DiscoveryFlowListener {
    public:
        struct Flow {
            std::string domain;
            std::string source;
            BTServiceInfoRef info;
        };
        jau::darray<Flow> flows;
        /** Domain whose createFlow() throws. */
        std::string failing_domain;

        void createFlow(const std::string& domain, const DiscoveryFlowContext& context, const BTServiceInfoRef& info) override {
            flows.push_back( Flow{ domain, context.source, info } );
            if( domain == failing_domain ) {
                throw std::runtime_error("Flow of "+domain+" failed");
            }
        }

        jau::nsize_t count(const std::string& domain) const noexcept {
            jau::nsize_t c = 0;
            for(const Flow& f : flows) {
                if( f.domain == domain ) {
                    ++c;
                }
            }
            return c;
        }
};

inline BLEDeviceRef makeDevice(const std::string& address, const std::string& name, const int16_t rssi=-60) {
    return std::make_shared<BLEDevice>(address, name, rssi);
}

inline AdvertisementDataRef makeAdv(const std::string& local_name,
                                    const std::map<uint16_t, octets_t>& msd = {},
                                    const jau::darray<std::string>& service_uuids = {},
                                    const int16_t rssi=-60)
{
    std::shared_ptr<AdvertisementData> adv = std::make_shared<AdvertisementData>();
    adv->local_name = local_name;
    adv->rssi = rssi;
    adv->manufacturer_data = msd;
    adv->service_uuids = service_uuids;
    return adv;
}

inline octets_t makeOctets(std::initializer_list<uint8_t> bytes) {
    octets_t res;
    for(uint8_t b : bytes) {
        res.push_back(b);
    }
    return res;
}

#endif /* BTD_TEST_SUPPORT_HPP_ */
