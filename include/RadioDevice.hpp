#ifndef RADIO_DEVICE_HPP
#define RADIO_DEVICE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <random>
#include <sstream>
#include <optional>
#include <uhd/utils/log.hpp>
#include <Common.hpp>
#include <ChirpSignalProcessing.hpp>

namespace ChirpISAC {
namespace Device {

    struct RadioParams {
        std::string device_args;
        double sample_rate = 30e6;
        double center_freq = 2e9;
        double tx_gain = 20.0;
        double rx_gain = 20.0;
        double bandwidth = 20e6;
        std::string tx_antenna = "TX/RX";
        std::string rx_antenna = "RX2";
        std::string clock_source = "internal";
        std::string wire_format = "sc16";
        size_t num_recv_frames = 32;
        size_t num_send_frames = 32;

        static RadioParams from_config(const Config& cfg) {
            RadioParams p;
            p.device_args = cfg.device_args;
            if (!cfg.device_serial.empty()) {
                p.device_args += (p.device_args.empty() ? "" : ",") + std::string("serial=") + cfg.device_serial;
            }
            p.sample_rate = cfg.sample_rate;
            p.center_freq = cfg.center_freq_if;
            p.tx_gain = cfg.tx_gain;
            p.rx_gain = cfg.rx_gain;
            p.bandwidth = cfg.chirp_bandwidth;
            p.tx_antenna = cfg.tx_antenna;
            p.rx_antenna = cfg.rx_antenna;
            p.clock_source = cfg.clocksource;
            p.wire_format = cfg.wire_format;
            p.num_recv_frames = cfg.num_recv_frames;
            p.num_send_frames = cfg.num_send_frames;
            return p;
        }
    };

    /**
     * @brief Minimal SDR front end: tune, send a burst, capture samples.
     */
    class RadioDevice {
    public:
        virtual ~RadioDevice() = default;

        virtual void configure(const RadioParams& params) = 0;

        // Returns the number of samples accepted by the device
        virtual size_t transmit(const AlignedVector& burst) = 0;

        // Returns up to num_samples; fewer if the timeout expires first
        virtual AlignedVector receive(size_t num_samples, double timeout_s) = 0;

        virtual std::string describe() const = 0;
    };

    /**
     * @brief Loopback radio for running without hardware.
     *
     * receive() returns the last transmitted burst delayed by `delay_samples`,
     * scaled by `attenuation`, with white noise at `snr_db`.
     */
    class SimulatedRadioDevice : public RadioDevice {
    public:
        struct Params {
            size_t delay_samples = 0;
            float attenuation = 1.0f;
            double snr_db = 30.0;
            std::optional<uint64_t> seed;
        };

        SimulatedRadioDevice() : SimulatedRadioDevice(Params()) {}

        explicit SimulatedRadioDevice(const Params& params)
            : _sim(params), _rng(params.seed ? *params.seed : std::random_device{}()) {}

        void configure(const RadioParams& params) override {
            std::lock_guard<std::mutex> lock(_mutex);
            _radio = params;
            _configured = true;
            UHD_LOG_INFO("RADIO", "Simulated radio at " << params.sample_rate / 1e6 << " Msps, "
                         << params.center_freq / 1e9 << " GHz");
        }

        size_t transmit(const AlignedVector& burst) override {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_configured) {
                throw std::runtime_error("Simulated radio used before configure()");
            }
            _last_burst = burst;
            return burst.size();
        }

        AlignedVector receive(size_t num_samples, double timeout_s) override {
            (void)timeout_s;
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_configured) {
                throw std::runtime_error("Simulated radio used before configure()");
            }
            AlignedVector clean(num_samples, std::complex<float>(0.0f, 0.0f));
            for (size_t i = 0; i < _last_burst.size(); ++i) {
                const size_t j = i + _sim.delay_samples;
                if (j >= num_samples) break;
                clean[j] = _last_burst[i] * _sim.attenuation;
            }
            if (DSP::signal_power(clean) == 0.0) {
                return clean;
            }
            AlignedVector noisy;
            DSP::add_awgn(clean, _sim.snr_db, _rng, noisy);
            return noisy;
        }

        std::string describe() const override {
            std::ostringstream oss;
            oss << "Simulated loopback (delay " << _sim.delay_samples << " samples, SNR " << _sim.snr_db << " dB)";
            return oss.str();
        }

    private:
        Params _sim;
        RadioParams _radio;
        bool _configured = false;
        AlignedVector _last_burst;
        std::mt19937_64 _rng;
        std::mutex _mutex;
    };

} // namespace Device
} // namespace ChirpISAC

#endif // RADIO_DEVICE_HPP
