#ifndef BEAMFORMER_DEVICE_HPP
#define BEAMFORMER_DEVICE_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <utility>
#include <cmath>
#include <Common.hpp>

namespace ChirpISAC {
namespace Device {

    enum class RFMode { TX, RX };

    inline std::string to_string(RFMode m) { return m == RFMode::TX ? "TX" : "RX"; }

    enum class RetCode { OK, ERROR, TIMEOUT, NOT_FOUND, INVALID_PARAM, BUSY };

    inline std::string to_string(RetCode c) {
        switch (c) {
        case RetCode::OK: return "OK";
        case RetCode::ERROR: return "ERROR";
        case RetCode::TIMEOUT: return "TIMEOUT";
        case RetCode::NOT_FOUND: return "NOT_FOUND";
        case RetCode::INVALID_PARAM: return "INVALID_PARAM";
        case RetCode::BUSY: return "BUSY";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Return code and message of one vendor call.
     */
    struct Status {
        RetCode code = RetCode::OK;
        std::string message;

        bool ok() const { return code == RetCode::OK; }
    };

    template <typename T>
    struct Reply : Status {
        T data{};
    };

    struct DeviceInfo {
        std::string sn;
        std::string address;
        bool dfu_mode = false;   // Firmware-update mode; such devices are not usable
    };

    /**
     * @brief Capability set of a vendor beamformer control library.
     *
     * Mirrors the operations the vendor service exposes. Every call returns a
     * Status or Reply; implementations never throw for device-side failures.
     * Frequencies are in GHz, angles in degrees, power in dBm.
     */
    class BeamformerDevice {
    public:
        virtual ~BeamformerDevice() = default;

        virtual Status start_service() = 0;
        virtual Reply<std::string> query_core_version() = 0;
        virtual Reply<std::vector<DeviceInfo>> scan_devices() = 0;
        virtual Status init_device(const std::string& sn) = 0;
        virtual Reply<std::string> get_device_type_name(const std::string& sn) = 0;
        virtual Status set_rf_mode(const std::string& sn, RFMode mode) = 0;
        virtual Reply<std::vector<double>> get_frequency_list(const std::string& sn) = 0;
        virtual Status set_operating_freq(const std::string& sn, double freq_ghz) = 0;
        virtual Reply<double> get_operating_freq(const std::string& sn) = 0;
        virtual Reply<std::string> query_cali_table_version(const std::string& sn) = 0;
        virtual Reply<std::pair<double, double>> get_gain_range(const std::string& sn, RFMode mode) = 0;
        virtual Reply<std::vector<std::string>> get_aakit_list(const std::string& sn) = 0;
        virtual Status select_aakit(const std::string& sn, const std::string& aakit) = 0;
        virtual Reply<std::string> query_mac(const std::string& sn) = 0;
        virtual Status set_beam_angle(const std::string& sn, double gain_db, double theta, double phi) = 0;
        virtual Reply<double> get_power_value(const std::string& sn, int freq_ghz) = 0;
        virtual Status deinit_device(const std::string& sn) = 0;
    };

    /**
     * @brief Deterministic stand-in for a BBox beamformer plus power detector.
     *
     * The detector reading peaks at `peak_theta` and falls off quadratically
     * with steering error. Supports per-call latency, injected failures and
     * concurrency accounting for tests.
     */
    class SimulatedBeamformer : public BeamformerDevice {
    public:
        struct Params {
            std::string bbox_sn = "D2230E013-28";
            std::string pd_sn = "PD2234E001";
            std::string ris_sn = "";                 // Empty: no RIS attached
            bool add_dfu_device = false;             // Also report a device stuck in DFU mode
            std::vector<double> frequencies = {26.5, 27.0, 27.5, 28.0, 28.5, 29.0, 29.5};
            std::pair<double, double> tx_gain_range = {1.5, 15.0};
            std::pair<double, double> rx_gain_range = {-3.5, 12.0};
            std::vector<std::string> aakits = {"TMYTEK_28ROC_2x2_A01", "TMYTEK_28ROC_4x4_A01"};
            double peak_power_dbm = -18.0;
            double peak_theta = 0.0;
            double rolloff_db_per_deg2 = 0.02;
            double phi_180_loss_db = 3.0;
            std::chrono::microseconds latency{0};
        };

        SimulatedBeamformer() : SimulatedBeamformer(Params()) {}
        explicit SimulatedBeamformer(const Params& params) : _params(params) {}

        /**
         * @brief Make the next `count` calls to `op` fail with `code`.
         */
        void fail_next(const std::string& op, RetCode code = RetCode::ERROR, int count = 1) {
            std::lock_guard<std::mutex> lock(_state_mutex);
            _failures[op] = {code, count};
        }

        size_t call_count(const std::string& op) const {
            std::lock_guard<std::mutex> lock(_state_mutex);
            auto it = _calls.find(op);
            return it == _calls.end() ? 0 : it->second;
        }

        int active_calls() const { return _active.load(); }
        int max_concurrent_calls() const { return _max_active.load(); }

        double current_theta() const { std::lock_guard<std::mutex> lock(_state_mutex); return _theta; }
        double current_phi() const { std::lock_guard<std::mutex> lock(_state_mutex); return _phi; }
        RFMode current_mode() const { std::lock_guard<std::mutex> lock(_state_mutex); return _mode; }

        // Power the detector would read for a given steering direction
        double model_power(double theta, double phi) const {
            const double err = theta - _params.peak_theta;
            double p = _params.peak_power_dbm - _params.rolloff_db_per_deg2 * err * err;
            if (std::abs(phi - 180.0) < 1e-9) p -= _params.phi_180_loss_db;
            return p;
        }

        Status start_service() override {
            CallScope scope(*this, "start_service");
            if (scope.failed) return scope.status;
            std::lock_guard<std::mutex> lock(_state_mutex);
            _service_running = true;
            return Status{};
        }

        Reply<std::string> query_core_version() override {
            CallScope scope(*this, "query_core_version");
            Reply<std::string> r = _reply<std::string>(scope);
            if (r.ok()) r.data = "1.2.1-sim";
            return r;
        }

        Reply<std::vector<DeviceInfo>> scan_devices() override {
            CallScope scope(*this, "scan_devices");
            Reply<std::vector<DeviceInfo>> r = _reply<std::vector<DeviceInfo>>(scope);
            if (!r.ok()) return r;
            {
                std::lock_guard<std::mutex> lock(_state_mutex);
                if (!_service_running) return _error<std::vector<DeviceInfo>>(RetCode::ERROR, "Service not started");
            }
            r.data.push_back(DeviceInfo{_params.bbox_sn, "192.168.100.111", false});
            r.data.push_back(DeviceInfo{_params.pd_sn, "usb:0", false});
            if (!_params.ris_sn.empty()) r.data.push_back(DeviceInfo{_params.ris_sn, "192.168.100.120", false});
            if (_params.add_dfu_device) r.data.push_back(DeviceInfo{"DFU0001", "usb:1", true});
            return r;
        }

        Status init_device(const std::string& sn) override {
            CallScope scope(*this, "init_device");
            if (scope.failed) return scope.status;
            if (!_known(sn)) return Status{RetCode::NOT_FOUND, "Unknown device " + sn};
            return Status{};
        }

        Reply<std::string> get_device_type_name(const std::string& sn) override {
            CallScope scope(*this, "get_device_type_name");
            Reply<std::string> r = _reply<std::string>(scope);
            if (!r.ok()) return r;
            if (sn == _params.bbox_sn) r.data = "BBoxOne 5G";
            else if (sn == _params.pd_sn) r.data = "PD";
            else if (!_params.ris_sn.empty() && sn == _params.ris_sn) r.data = "RIS";
            else return _error<std::string>(RetCode::NOT_FOUND, "Unknown device " + sn);
            return r;
        }

        Status set_rf_mode(const std::string& sn, RFMode mode) override {
            CallScope scope(*this, "set_rf_mode");
            if (scope.failed) return scope.status;
            if (sn != _params.bbox_sn) return Status{RetCode::NOT_FOUND, "Not a beamformer: " + sn};
            std::lock_guard<std::mutex> lock(_state_mutex);
            _mode = mode;
            return Status{};
        }

        Reply<std::vector<double>> get_frequency_list(const std::string& sn) override {
            CallScope scope(*this, "get_frequency_list");
            Reply<std::vector<double>> r = _reply<std::vector<double>>(scope);
            if (r.ok() && sn == _params.bbox_sn) r.data = _params.frequencies;
            return r;
        }

        Status set_operating_freq(const std::string& sn, double freq_ghz) override {
            CallScope scope(*this, "set_operating_freq");
            if (scope.failed) return scope.status;
            if (sn != _params.bbox_sn) return Status{RetCode::NOT_FOUND, "Not a beamformer: " + sn};
            bool supported = false;
            for (double f : _params.frequencies) supported |= std::abs(f - freq_ghz) < 1e-9;
            if (!supported) return Status{RetCode::INVALID_PARAM, "Unsupported frequency"};
            std::lock_guard<std::mutex> lock(_state_mutex);
            _freq_ghz = freq_ghz;
            return Status{};
        }

        Reply<double> get_operating_freq(const std::string& sn) override {
            CallScope scope(*this, "get_operating_freq");
            Reply<double> r = _reply<double>(scope);
            if (!r.ok()) return r;
            if (sn != _params.bbox_sn) return _error<double>(RetCode::NOT_FOUND, "Not a beamformer: " + sn);
            std::lock_guard<std::mutex> lock(_state_mutex);
            r.data = _freq_ghz;
            return r;
        }

        Reply<std::string> query_cali_table_version(const std::string& sn) override {
            CallScope scope(*this, "query_cali_table_version");
            Reply<std::string> r = _reply<std::string>(scope);
            if (r.ok()) {
                if (sn != _params.bbox_sn) return _error<std::string>(RetCode::NOT_FOUND, "Not a beamformer: " + sn);
                r.data = "2.1.6";
            }
            return r;
        }

        Reply<std::pair<double, double>> get_gain_range(const std::string& sn, RFMode mode) override {
            CallScope scope(*this, "get_gain_range");
            Reply<std::pair<double, double>> r = _reply<std::pair<double, double>>(scope);
            if (!r.ok()) return r;
            if (sn != _params.bbox_sn) return _error<std::pair<double, double>>(RetCode::NOT_FOUND, "Not a beamformer: " + sn);
            r.data = mode == RFMode::TX ? _params.tx_gain_range : _params.rx_gain_range;
            return r;
        }

        Reply<std::vector<std::string>> get_aakit_list(const std::string& sn) override {
            CallScope scope(*this, "get_aakit_list");
            Reply<std::vector<std::string>> r = _reply<std::vector<std::string>>(scope);
            if (r.ok() && sn == _params.bbox_sn) r.data = _params.aakits;
            return r;
        }

        Status select_aakit(const std::string& sn, const std::string& aakit) override {
            CallScope scope(*this, "select_aakit");
            if (scope.failed) return scope.status;
            if (sn != _params.bbox_sn) return Status{RetCode::NOT_FOUND, "Not a beamformer: " + sn};
            for (const auto& kit : _params.aakits) {
                if (kit == aakit) return Status{};
            }
            return Status{RetCode::INVALID_PARAM, "Unknown antenna kit " + aakit};
        }

        Reply<std::string> query_mac(const std::string& sn) override {
            CallScope scope(*this, "query_mac");
            Reply<std::string> r = _reply<std::string>(scope);
            if (r.ok()) {
                if (!_known(sn)) return _error<std::string>(RetCode::NOT_FOUND, "Unknown device " + sn);
                r.data = "00:1A:2B:3C:4D:5E";
            }
            return r;
        }

        Status set_beam_angle(const std::string& sn, double gain_db, double theta, double phi) override {
            CallScope scope(*this, "set_beam_angle");
            if (scope.failed) return scope.status;
            if (sn != _params.bbox_sn) return Status{RetCode::NOT_FOUND, "Not a beamformer: " + sn};
            std::lock_guard<std::mutex> lock(_state_mutex);
            _gain = gain_db;
            _theta = theta;
            _phi = phi;
            return Status{};
        }

        Reply<double> get_power_value(const std::string& sn, int freq_ghz) override {
            CallScope scope(*this, "get_power_value");
            Reply<double> r = _reply<double>(scope);
            if (!r.ok()) return r;
            if (sn != _params.pd_sn) return _error<double>(RetCode::NOT_FOUND, "Not a power detector: " + sn);
            (void)freq_ghz;
            std::lock_guard<std::mutex> lock(_state_mutex);
            r.data = model_power(_theta, _phi);
            return r;
        }

        Status deinit_device(const std::string& sn) override {
            CallScope scope(*this, "deinit_device");
            if (scope.failed) return scope.status;
            if (!_known(sn)) return Status{RetCode::NOT_FOUND, "Unknown device " + sn};
            return Status{};
        }

    private:
        /**
         * @brief Per-call bookkeeping: counts, concurrency, latency and failure injection.
         */
        struct CallScope {
            SimulatedBeamformer& dev;
            bool failed = false;
            Status status;

            CallScope(SimulatedBeamformer& d, const std::string& op) : dev(d) {
                const int now = dev._active.fetch_add(1) + 1;
                int prev = dev._max_active.load();
                while (now > prev && !dev._max_active.compare_exchange_weak(prev, now)) {}
                {
                    std::lock_guard<std::mutex> lock(dev._state_mutex);
                    dev._calls[op]++;
                    auto it = dev._failures.find(op);
                    if (it != dev._failures.end() && it->second.second > 0) {
                        failed = true;
                        status = Status{it->second.first, "Injected failure in " + op};
                        if (--it->second.second == 0) dev._failures.erase(it);
                    }
                }
                if (dev._params.latency.count() > 0) {
                    std::this_thread::sleep_for(dev._params.latency);
                }
            }

            ~CallScope() { dev._active.fetch_sub(1); }
        };

        template <typename T>
        Reply<T> _reply(const CallScope& scope) const {
            Reply<T> r;
            if (scope.failed) {
                r.code = scope.status.code;
                r.message = scope.status.message;
            }
            return r;
        }

        template <typename T>
        static Reply<T> _error(RetCode code, const std::string& msg) {
            Reply<T> r;
            r.code = code;
            r.message = msg;
            return r;
        }

        bool _known(const std::string& sn) const {
            return sn == _params.bbox_sn || sn == _params.pd_sn ||
                   (!_params.ris_sn.empty() && sn == _params.ris_sn);
        }

        Params _params;
        mutable std::mutex _state_mutex;
        std::map<std::string, size_t> _calls;
        std::map<std::string, std::pair<RetCode, int>> _failures;
        std::atomic<int> _active{0};
        std::atomic<int> _max_active{0};
        bool _service_running = false;
        RFMode _mode = RFMode::TX;
        double _freq_ghz = 0.0;
        double _gain = 0.0;
        double _theta = 0.0;
        double _phi = 0.0;
    };

} // namespace Device
} // namespace ChirpISAC

#endif // BEAMFORMER_DEVICE_HPP
