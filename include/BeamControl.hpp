#ifndef BEAM_CONTROL_HPP
#define BEAM_CONTROL_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <optional>
#include <functional>
#include <condition_variable>
#include <type_traits>
#include <uhd/utils/log.hpp>
#include <Common.hpp>
#include <BeamformerDevice.hpp>

namespace ChirpISAC {
namespace Device {

    /**
     * @brief Single point of entry to a beamformer handle.
     *
     * Every vendor call runs with one timed mutex held for the duration of the
     * call. With a zero timeout callers wait indefinitely; otherwise a call that
     * cannot get the lock in time is skipped and reported as std::nullopt.
     */
    class SerializedDevice {
    public:
        SerializedDevice(BeamformerDevice& device, std::chrono::milliseconds lock_timeout)
            : _device(device), _lock_timeout(lock_timeout) {}

        template <typename F>
        auto call(const char* op, F&& fn) -> std::optional<std::invoke_result_t<F, BeamformerDevice&>> {
            std::unique_lock<std::timed_mutex> lock(_mutex, std::defer_lock);
            if (_lock_timeout.count() > 0) {
                if (!lock.try_lock_for(_lock_timeout)) {
                    UHD_LOG_WARNING("BEAM", "Device busy, " << op << " skipped after waiting "
                                    << _lock_timeout.count() << " ms");
                    return std::nullopt;
                }
            } else {
                lock.lock();
            }
            return fn(_device);
        }

    private:
        BeamformerDevice& _device;
        std::chrono::milliseconds _lock_timeout;
        std::timed_mutex _mutex;
    };

    enum class DeviceRole { BBox, PowerDetector, RIS, Unknown };

    inline std::string to_string(DeviceRole r) {
        switch (r) {
        case DeviceRole::BBox: return "BBox";
        case DeviceRole::PowerDetector: return "PD";
        case DeviceRole::RIS: return "RIS";
        case DeviceRole::Unknown: return "Unknown";
        }
        return "Unknown";
    }

    struct DeviceRecord {
        DeviceInfo info;
        std::string type_name;
        DeviceRole role = DeviceRole::Unknown;
        std::string mode;          // RF mode for beamformers, empty otherwise
        bool configured = false;
    };

    struct BBoxSetup {
        double operating_freq_ghz = 0.0;
        std::string cali_version;
        double gain_min = 0.0;
        double gain_max = 0.0;
        std::string aakit;
    };

    /**
     * @brief Device discovery and bring-up.
     *
     * Scans attached devices, assigns roles by type name and configures the
     * first BBox beamformer and the power detector.
     */
    class BeamDeviceManager {
    public:
        BeamDeviceManager(SerializedDevice& device, const Config& cfg)
            : _device(device), _target_freq_ghz(cfg.beam_target_freq_ghz), _default_gain(cfg.beam_default_gain) {}

        bool init_service() {
            UHD_LOG_INFO("BEAM", "Starting beamformer control service");
            auto started = _device.call("start_service", [](BeamformerDevice& d) { return d.start_service(); });
            if (!started || !started->ok()) {
                UHD_LOG_ERROR("BEAM", "Control service failed to start: " << (started ? started->message : "device busy"));
                return false;
            }
            auto version = _device.call("query_core_version", [](BeamformerDevice& d) { return d.query_core_version(); });
            if (version && version->ok()) {
                _core_version = version->data;
                UHD_LOG_INFO("BEAM", "Control service v" << _core_version << " ready");
            }
            _service_ready = true;
            return true;
        }

        /**
         * @brief Enumerate and initialize devices, skipping any in DFU mode.
         *
         * @return Number of usable devices found
         */
        size_t scan_devices() {
            _devices.clear();
            _bbox_sn.clear();
            _pd_sn.clear();
            _ris_sn.clear();
            if (!_service_ready) {
                UHD_LOG_ERROR("BEAM", "Control service not started");
                return 0;
            }

            auto scan = _device.call("scan_devices", [](BeamformerDevice& d) { return d.scan_devices(); });
            if (!scan || !scan->ok()) {
                UHD_LOG_ERROR("BEAM", "Device scan failed: " << (scan ? scan->message : "device busy"));
                return 0;
            }

            for (const DeviceInfo& info : scan->data) {
                if (info.dfu_mode) {
                    UHD_LOG_WARNING("BEAM", "Device " << info.sn << " is in DFU mode, skipped");
                    continue;
                }
                auto init = _device.call("init_device", [&](BeamformerDevice& d) { return d.init_device(info.sn); });
                if (!init || !init->ok()) {
                    UHD_LOG_ERROR("BEAM", "Init of " << info.sn << " failed: " << (init ? init->message : "device busy"));
                    continue;
                }
                auto type = _device.call("get_device_type_name", [&](BeamformerDevice& d) { return d.get_device_type_name(info.sn); });

                DeviceRecord rec;
                rec.info = info;
                rec.type_name = (type && type->ok()) ? type->data : "";
                if (rec.type_name.find("PD") != std::string::npos) {
                    rec.role = DeviceRole::PowerDetector;
                    if (_pd_sn.empty()) _pd_sn = info.sn;
                } else if (rec.type_name.find("BBox") != std::string::npos) {
                    rec.role = DeviceRole::BBox;
                    if (_bbox_sn.empty()) _bbox_sn = info.sn;
                } else if (rec.type_name.find("RIS") != std::string::npos) {
                    rec.role = DeviceRole::RIS;
                    if (_ris_sn.empty()) _ris_sn = info.sn;
                }
                UHD_LOG_INFO("BEAM", "Found " << rec.type_name << " (" << info.sn << ") as " << to_string(rec.role));
                _devices[info.sn] = rec;
            }
            return _devices.size();
        }

        /**
         * @brief Configure the BBox: RF mode, operating frequency, calibration, gain range, antenna kit.
         *
         * An unsupported target frequency falls back to the first listed one.
         * @return Gain range and settings, or std::nullopt on failure
         */
        std::optional<BBoxSetup> setup_bbox_device(RFMode mode) {
            if (_bbox_sn.empty()) return std::nullopt;
            const std::string sn = _bbox_sn;
            UHD_LOG_INFO("BEAM", "Configuring BBox " << sn);

            auto rf = _device.call("set_rf_mode", [&](BeamformerDevice& d) { return d.set_rf_mode(sn, mode); });
            if (!rf || !rf->ok()) {
                UHD_LOG_ERROR("BEAM", "Set RF mode failed: " << (rf ? rf->message : "device busy"));
                return std::nullopt;
            }

            auto freqs = _device.call("get_frequency_list", [&](BeamformerDevice& d) { return d.get_frequency_list(sn); });
            if (!freqs || !freqs->ok() || freqs->data.empty()) {
                UHD_LOG_ERROR("BEAM", "No frequency list for " << sn);
                return std::nullopt;
            }

            BBoxSetup setup;
            setup.operating_freq_ghz = _target_freq_ghz;
            bool supported = false;
            for (double f : freqs->data) supported |= std::abs(f - _target_freq_ghz) < 1e-9;
            if (!supported) {
                UHD_LOG_WARNING("BEAM", "Target frequency " << _target_freq_ghz
                                << " GHz not supported, using " << freqs->data.front() << " GHz");
                setup.operating_freq_ghz = freqs->data.front();
            }
            auto set_freq = _device.call("set_operating_freq", [&](BeamformerDevice& d) {
                return d.set_operating_freq(sn, setup.operating_freq_ghz);
            });
            if (!set_freq || !set_freq->ok()) {
                UHD_LOG_ERROR("BEAM", "Set frequency failed: " << (set_freq ? set_freq->message : "device busy"));
                return std::nullopt;
            }
            UHD_LOG_INFO("BEAM", "Operating frequency " << setup.operating_freq_ghz << " GHz");

            auto cali = _device.call("query_cali_table_version", [&](BeamformerDevice& d) { return d.query_cali_table_version(sn); });
            if (cali && cali->ok()) {
                setup.cali_version = cali->data;
                UHD_LOG_INFO("BEAM", "Calibration table " << setup.cali_version);
            } else {
                UHD_LOG_WARNING("BEAM", "Calibration version unavailable");
            }

            auto range = _device.call("get_gain_range", [&](BeamformerDevice& d) { return d.get_gain_range(sn, mode); });
            if (!range || !range->ok()) {
                UHD_LOG_ERROR("BEAM", "Gain range query failed: " << (range ? range->message : "device busy"));
                return std::nullopt;
            }
            setup.gain_min = range->data.first;
            setup.gain_max = range->data.second;

            auto kits = _device.call("get_aakit_list", [&](BeamformerDevice& d) { return d.get_aakit_list(sn); });
            if (kits && kits->ok()) {
                for (const auto& kit : kits->data) {
                    if (kit.find("4x4") == std::string::npos) continue;
                    auto sel = _device.call("select_aakit", [&](BeamformerDevice& d) { return d.select_aakit(sn, kit); });
                    if (sel && sel->ok()) {
                        setup.aakit = kit;
                        UHD_LOG_INFO("BEAM", "Antenna kit " << kit);
                    }
                    break;
                }
            }

            DeviceRecord& rec = _devices[sn];
            rec.mode = to_string(mode);
            rec.configured = true;
            _bbox_setup = setup;
            UHD_LOG_INFO("BEAM", "BBox " << sn << " ready, max gain " << setup.gain_max << " dB");
            return setup;
        }

        bool setup_power_detector() {
            if (_pd_sn.empty()) return false;
            _devices[_pd_sn].configured = true;
            UHD_LOG_INFO("BEAM", "Power detector " << _pd_sn << " ready");
            return true;
        }

        const std::string& bbox_sn() const { return _bbox_sn; }
        const std::string& pd_sn() const { return _pd_sn; }
        const std::string& ris_sn() const { return _ris_sn; }
        const std::string& core_version() const { return _core_version; }
        const std::map<std::string, DeviceRecord>& devices() const { return _devices; }
        std::optional<BBoxSetup> bbox_setup() const { return _bbox_setup; }
        double default_gain() const { return _default_gain; }

        void set_bbox_mode_record(RFMode mode) {
            if (!_bbox_sn.empty()) _devices[_bbox_sn].mode = to_string(mode);
        }

    private:
        SerializedDevice& _device;
        double _target_freq_ghz;
        double _default_gain;
        bool _service_ready = false;
        std::string _core_version;
        std::string _bbox_sn;
        std::string _pd_sn;
        std::string _ris_sn;
        std::map<std::string, DeviceRecord> _devices;
        std::optional<BBoxSetup> _bbox_setup;
    };

    struct BeamStatus {
        bool initialized = false;
        std::string mode;
        double theta = 0.0;
        double phi = 0.0;
        bool bbox_available = false;
        bool pd_available = false;
        bool ris_available = false;
        double gain_max = 0.0;
        double target_freq_ghz = 0.0;
        bool scanning = false;
        std::map<std::string, DeviceRecord> devices;
    };

    /**
     * @brief ISAC beam-steering interface.
     *
     * Validates every steering request before it reaches the device. Failures
     * are logged and reported as false or std::nullopt; nothing is retried here.
     * The device handle is owned by the caller and must outlive the controller.
     */
    class BeamController {
    public:
        using ScanCallback = std::function<void(double theta, std::optional<double> power_dbm)>;

        BeamController(BeamformerDevice& device, const Config& cfg)
            : _serial(device, std::chrono::milliseconds(std::max(0, cfg.beam_lock_timeout_ms))),
              _manager(_serial, cfg),
              _scan_min(cfg.scan_min),
              _scan_max(cfg.scan_max),
              _target_freq_ghz(cfg.beam_target_freq_ghz),
              _gain_max(cfg.beam_default_gain)
        {}

        ~BeamController() {
            stop_scan();
        }

        BeamController(const BeamController&) = delete;
        BeamController& operator=(const BeamController&) = delete;

        /**
         * @brief Bring up the service, discover devices and verify the BBox configuration.
         */
        bool initialize() {
            UHD_LOG_INFO("BEAM", "Initializing beam control");
            if (!_manager.init_service()) return false;
            if (_manager.scan_devices() == 0) {
                UHD_LOG_ERROR("BEAM", "No devices found");
                return false;
            }
            if (!_manager.bbox_sn().empty()) {
                auto setup = _manager.setup_bbox_device(RFMode::TX);
                if (!setup) {
                    UHD_LOG_ERROR("BEAM", "BBox setup failed");
                    return false;
                }
                _gain_max = setup->gain_max;
                _mode = "TX";
            } else {
                UHD_LOG_WARNING("BEAM", "No BBox found, steering commands will be rejected");
                _gain_max = _manager.default_gain();
            }
            if (!_manager.pd_sn().empty()) {
                if (!_manager.setup_power_detector()) {
                    UHD_LOG_ERROR("BEAM", "Power detector setup failed");
                    return false;
                }
            } else {
                UHD_LOG_WARNING("BEAM", "No power detector found");
            }
            if (!_validate_configuration()) {
                UHD_LOG_ERROR("BEAM", "Configuration check failed");
                return false;
            }
            _initialized.store(true);
            UHD_LOG_INFO("BEAM", "Beam control initialized");
            return true;
        }

        bool is_initialized() const { return _initialized.load(); }

        // Case-insensitive "TX" or "RX"
        bool set_bbox_mode(const std::string& mode) {
            if (!_initialized.load() || _manager.bbox_sn().empty()) {
                UHD_LOG_ERROR("BEAM", "Beam control not initialized or no BBox available");
                return false;
            }
            const std::string upper = _upper(mode);
            RFMode rf;
            if (upper == "TX") rf = RFMode::TX;
            else if (upper == "RX") rf = RFMode::RX;
            else {
                UHD_LOG_ERROR("BEAM", "Unsupported BBox mode: " << mode);
                return false;
            }
            const std::string sn = _manager.bbox_sn();
            auto ret = _serial.call("set_rf_mode", [&](BeamformerDevice& d) { return d.set_rf_mode(sn, rf); });
            if (!ret || !ret->ok()) {
                UHD_LOG_ERROR("BEAM", "Set RF mode failed: " << (ret ? ret->message : "device busy"));
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(_state_mutex);
                _mode = upper;
                _manager.set_bbox_mode_record(rf);
            }
            UHD_LOG_INFO("BEAM", "BBox mode " << upper);
            return true;
        }

        /**
         * @brief Steer the beam.
         *
         * @param theta Elevation in degrees, within [scan_min, scan_max]
         * @param phi Azimuth plane, exactly 0 or 180
         */
        bool set_beam_angle(double theta, double phi) {
            if (!_initialized.load() || _manager.bbox_sn().empty()) {
                UHD_LOG_ERROR("BEAM", "Beam control not initialized or no BBox available");
                return false;
            }
            if (!angle_allowed(theta, phi)) {
                UHD_LOG_ERROR("BEAM", "Beam angle theta=" << theta << " phi=" << phi << " rejected, theta range ["
                              << _scan_min << ", " << _scan_max << "], phi 0 or 180");
                return false;
            }
            const std::string sn = _manager.bbox_sn();
            const double gain = _gain_max;
            auto ret = _serial.call("set_beam_angle", [&](BeamformerDevice& d) {
                return d.set_beam_angle(sn, gain, theta, phi);
            });
            if (!ret || !ret->ok()) {
                UHD_LOG_ERROR("BEAM", "Set beam angle failed: " << (ret ? ret->message : "device busy"));
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(_state_mutex);
                _theta = theta;
                _phi = phi;
            }
            UHD_LOG_DEBUG("BEAM", "Beam steered to theta=" << theta << " phi=" << phi);
            return true;
        }

        bool angle_allowed(double theta, double phi) const {
            return theta >= _scan_min && theta <= _scan_max && (phi == 0.0 || phi == 180.0);
        }

        /**
         * @brief Steer, let the beam settle, then read the power detector.
         */
        std::optional<double> measure_power(double theta, double phi) {
            if (!_initialized.load() || _manager.pd_sn().empty()) {
                UHD_LOG_ERROR("BEAM", "Beam control not initialized or no power detector available");
                return std::nullopt;
            }
            if (!set_beam_angle(theta, phi)) return std::nullopt;
            std::this_thread::sleep_for(SETTLE_TIME);

            const std::string sn = _manager.pd_sn();
            const int freq = static_cast<int>(_target_freq_ghz);
            auto ret = _serial.call("get_power_value", [&](BeamformerDevice& d) { return d.get_power_value(sn, freq); });
            if (!ret || !ret->ok()) {
                UHD_LOG_ERROR("BEAM", "Power measurement failed: " << (ret ? ret->message : "device busy"));
                return std::nullopt;
            }
            UHD_LOG_DEBUG("BEAM", "Power at theta=" << theta << " phi=" << phi << ": " << ret->data << " dBm");
            return ret->data;
        }

        BeamStatus get_status() const {
            std::lock_guard<std::mutex> lock(_state_mutex);
            BeamStatus s;
            s.initialized = _initialized.load();
            s.mode = _mode;
            s.theta = _theta;
            s.phi = _phi;
            s.bbox_available = !_manager.bbox_sn().empty();
            s.pd_available = !_manager.pd_sn().empty();
            s.ris_available = !_manager.ris_sn().empty();
            s.gain_max = _gain_max;
            s.target_freq_ghz = _target_freq_ghz;
            s.scanning = _scan_running.load();
            s.devices = _manager.devices();
            return s;
        }

        // Return the beam to boresight
        bool emergency_stop() {
            UHD_LOG_WARNING("BEAM", "Emergency stop, steering to boresight");
            return set_beam_angle(0.0, 0.0);
        }

        /**
         * @brief Stop scanning, park the beam and release the devices.
         */
        void cleanup() {
            stop_scan();
            if (_initialized.load()) {
                if (!emergency_stop()) {
                    UHD_LOG_WARNING("BEAM", "Could not park beam during cleanup");
                }
                for (const auto& kv : _manager.devices()) {
                    const std::string sn = kv.first;
                    auto ret = _serial.call("deinit_device", [&](BeamformerDevice& d) { return d.deinit_device(sn); });
                    if (!ret || !ret->ok()) {
                        UHD_LOG_WARNING("BEAM", "Release of " << sn << " failed");
                    }
                }
            }
            _initialized.store(false);
            UHD_LOG_INFO("BEAM", "Beam control cleaned up");
        }

        /**
         * @brief Sweep theta from scan_min to scan_max in the background, repeatedly.
         *
         * @param step_deg Angle increment
         * @param dwell Time spent at each position
         * @param callback Called at each position with the power reading, when a detector exists
         */
        bool start_scan(double step_deg, std::chrono::milliseconds dwell, ScanCallback callback = ScanCallback()) {
            if (!_initialized.load()) {
                UHD_LOG_ERROR("BEAM", "Cannot scan before initialization");
                return false;
            }
            if (step_deg <= 0.0) {
                UHD_LOG_ERROR("BEAM", "Scan step must be positive");
                return false;
            }
            if (_scan_running.exchange(true)) return false;
            if (_scan_thread.joinable()) _scan_thread.join();
            _scan_thread = std::thread(&BeamController::_scan_proc, this, step_deg, dwell, std::move(callback));
            UHD_LOG_INFO("BEAM", "Beam scan started, step " << step_deg << " deg, dwell " << dwell.count() << " ms");
            return true;
        }

        void stop_scan() {
            {
                std::lock_guard<std::mutex> lock(_scan_mutex);
                _scan_running.store(false);
            }
            _scan_cv.notify_all();
            if (_scan_thread.joinable()) {
                _scan_thread.join();
                UHD_LOG_INFO("BEAM", "Beam scan stopped");
            }
        }

        bool scanning() const { return _scan_running.load(); }

        size_t scan_positions_visited() const { return _scan_positions.load(); }

        const BeamDeviceManager& manager() const { return _manager; }

    private:
        static constexpr std::chrono::milliseconds SETTLE_TIME{10};

        SerializedDevice _serial;
        BeamDeviceManager _manager;
        double _scan_min;
        double _scan_max;
        double _target_freq_ghz;
        double _gain_max;

        std::atomic<bool> _initialized{false};
        mutable std::mutex _state_mutex;
        std::string _mode = "";
        double _theta = 0.0;
        double _phi = 0.0;

        std::atomic<bool> _scan_running{false};
        std::atomic<size_t> _scan_positions{0};
        std::thread _scan_thread;
        std::mutex _scan_mutex;
        std::condition_variable _scan_cv;

        static std::string _upper(std::string s) {
            for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return s;
        }

        bool _validate_configuration() {
            const std::string sn = _manager.bbox_sn();
            if (sn.empty()) return false;
            bool ok = true;

            auto freq = _serial.call("get_operating_freq", [&](BeamformerDevice& d) { return d.get_operating_freq(sn); });
            if (freq && freq->ok()) {
                UHD_LOG_INFO("BEAM", "Frequency check: target " << _target_freq_ghz << " GHz, actual " << freq->data << " GHz");
                ok &= std::abs(freq->data - _target_freq_ghz) < 0.1;
            }
            auto mac = _serial.call("query_mac", [&](BeamformerDevice& d) { return d.query_mac(sn); });
            ok &= mac && mac->ok();
            auto cali = _serial.call("query_cali_table_version", [&](BeamformerDevice& d) { return d.query_cali_table_version(sn); });
            ok &= cali && cali->ok();
            return ok;
        }

        void _scan_proc(double step_deg, std::chrono::milliseconds dwell, ScanCallback callback) {
            double theta = _scan_min;
            while (_scan_running.load()) {
                std::optional<double> power;
                if (!_manager.pd_sn().empty()) {
                    power = measure_power(theta, 0.0);
                } else if (!set_beam_angle(theta, 0.0)) {
                    UHD_LOG_WARNING("BEAM", "Scan position theta=" << theta << " not reached");
                }
                _scan_positions.fetch_add(1);
                if (callback) callback(theta, power);

                {
                    std::unique_lock<std::mutex> lock(_scan_mutex);
                    _scan_cv.wait_for(lock, dwell, [this] { return !_scan_running.load(); });
                }
                theta += step_deg;
                if (theta > _scan_max + 1e-9) theta = _scan_min;
            }
        }
    };

} // namespace Device
} // namespace ChirpISAC

#endif // BEAM_CONTROL_HPP
