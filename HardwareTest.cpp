#include <uhd/utils/safe_main.hpp>
#include <uhd/exception.hpp>
#include <iostream>
#include <vector>
#include <complex>
#include <cmath>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>
#include <future>
#include <memory>
#include <boost/program_options.hpp>
#include <Common.hpp>
#include <ConfigIO.hpp>
#include <ChirpSignalProcessing.hpp>
#include <ChirpGeneratorCore.hpp>
#include <RadarProcessorCore.hpp>
#include <RadioDevice.hpp>
#include <UhdRadioDevice.hpp>

namespace po = boost::program_options;
using namespace ChirpISAC;

std::atomic<bool> stop_signal(false);
void signal_handler(int) { stop_signal.store(true); }

/**
 * @brief Open and configure the USRP, retrying on UHD errors.
 */
std::unique_ptr<Device::UhdRadioDevice> connect(const Device::RadioParams& params, int max_retries, double retry_delay) {
    const int attempts = std::max(1, max_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto radio = std::make_unique<Device::UhdRadioDevice>();
        try {
            radio->configure(params);
            return radio;
        } catch (const uhd::exception& e) {
            std::cerr << "Connection attempt " << attempt << "/" << attempts << " failed: " << e.what() << std::endl;
            if (attempt == attempts) throw;
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(retry_delay));
    }
    return nullptr;
}

// Captures while the burst is on the air
AlignedVector loopback(Device::RadioDevice& radio, const AlignedVector& burst, size_t capture) {
    auto rx = std::async(std::launch::async, [&radio, capture] { return radio.receive(capture, 2.0); });
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const size_t sent = radio.transmit(burst);
    std::cout << "Sent " << sent << "/" << burst.size() << " samples" << std::endl;
    return rx.get();
}

int UHD_SAFE_MAIN(int argc, char *argv[]) {
    std::signal(SIGINT, &signal_handler);

    Config cfg;
    std::string config_file;
    double tone_freq = 1e6;
    double tone_duration = 0.01;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "help message")
        ("config,c", po::value<std::string>(&config_file), "Optional YAML config file")
        ("args", po::value<std::string>(&cfg.device_args), "USRP device args (default: type=b200)")
        ("serial", po::value<std::string>(&cfg.device_serial), "USRP serial number")
        ("rate", po::value<double>(&cfg.sample_rate), "Sample rate (default: 30e6)")
        ("freq", po::value<double>(&cfg.center_freq_if), "IF center frequency (default: 2e9)")
        ("tx-gain", po::value<double>(&cfg.tx_gain), "TX gain (default: 20)")
        ("rx-gain", po::value<double>(&cfg.rx_gain), "RX gain (default: 20)")
        ("clocksource", po::value<std::string>(&cfg.clocksource), "Clock source: internal, external, gpsdo (default: internal)")
        ("tone-freq", po::value<double>(&tone_freq), "Test tone offset (default: 1e6)")
        ("retries", po::value<int>(&cfg.max_retries), "Connection attempts (default: 3)");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    if (!config_file.empty()) {
        if (!load_config_from_yaml(cfg, config_file)) return 1;
        vm.clear();
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }

    apply_log_level(cfg.log_level);
    ValidationResult check = cfg.validate();
    for (const auto& w : check.warnings) std::cout << "Warning: " << w << std::endl;
    if (!check.valid) {
        for (const auto& e : check.errors) std::cerr << "Error: " << e << std::endl;
        return 1;
    }

    DSP::FFTWManager::import_wisdom();

    std::cout << "=== Device Discovery ===" << std::endl;
    auto found = Device::UhdRadioDevice::find_devices(cfg.device_args);
    for (const auto& addr : found) std::cout << "  " << addr << std::endl;
    if (found.empty()) {
        std::cerr << "No USRP found for '" << cfg.device_args << "'" << std::endl;
        return 1;
    }

    std::cout << "\n=== Connection ===" << std::endl;
    auto radio = connect(Device::RadioParams::from_config(cfg), cfg.max_retries, cfg.retry_delay);
    std::cout << radio->describe() << std::endl;

    bool ok = true;

    std::cout << "\n=== Tone Loopback ===" << std::endl;
    const size_t tone_len = static_cast<size_t>(tone_duration * cfg.sample_rate);
    AlignedVector tone(tone_len);
    for (size_t i = 0; i < tone_len; ++i) {
        const double ph = 2.0 * M_PI * tone_freq * static_cast<double>(i) / cfg.sample_rate;
        tone[i] = std::complex<float>(0.5f * static_cast<float>(std::cos(ph)), 0.5f * static_cast<float>(std::sin(ph)));
    }
    AlignedVector rx_tone = loopback(*radio, tone, tone_len * 2);
    const double rx_power = DSP::signal_power(rx_tone);
    std::cout << "Received " << rx_tone.size() << " samples, power "
              << 10.0 * std::log10(rx_power + 1e-20) << " dBFS" << std::endl;
    ok &= rx_tone.size() == tone_len * 2 && rx_power > 0.0;

    if (!stop_signal.load()) {
        std::cout << "\n=== Chirp Radar Loopback ===" << std::endl;
        Core::ChirpGenerator gen(cfg);
        Core::RadarProcessor radar(cfg);
        Core::ChirpSignal chirp = gen.generate_linear_chirp();
        AlignedVector burst = chirp.samples;
        for (auto& s : burst) s *= 0.5f;
        AlignedVector rx = loopback(*radio, burst, chirp.samples.size() * 4);
        auto det = radar.process(rx);
        if (det) {
            std::cout << "Detected " << det->num_targets << " peak(s), first at index " << det->peak_indices.front()
                      << " (" << det->ranges.front() << " m)" << std::endl;
        } else {
            std::cout << "No radar detection" << std::endl;
        }
        ok &= det.has_value();
    }

    DSP::FFTWManager::export_wisdom();
    std::cout << "\nHardware test " << (ok ? "passed" : "failed") << std::endl;
    return ok ? 0 : 1;
}
