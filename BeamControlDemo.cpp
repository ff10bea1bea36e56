#include <uhd/utils/safe_main.hpp>
#include <iostream>
#include <iomanip>
#include <vector>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>
#include <optional>
#include <algorithm>
#include <numeric>
#include <filesystem>
#include <boost/program_options.hpp>
#include <Common.hpp>
#include <ConfigIO.hpp>
#include <BeamformerDevice.hpp>
#include <BeamControl.hpp>

namespace po = boost::program_options;
namespace fs = std::filesystem;
using namespace ChirpISAC;

std::atomic<bool> stop_signal(false);
void signal_handler(int) { stop_signal.store(true); }

// Retries a steering or measurement call; fn returns bool or std::optional
template <typename F>
auto with_retry(const Config& cfg, const std::string& what, F&& fn) -> decltype(fn()) {
    const int attempts = std::max(1, cfg.max_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = fn();
        if (result) return result;
        std::cerr << what << " failed (attempt " << attempt << "/" << attempts << ")" << std::endl;
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::duration<double>(cfg.retry_delay));
        }
    }
    return decltype(fn()){};
}

struct PowerSample {
    double theta;
    double power_dbm;
};

std::vector<PowerSample> sweep(Device::BeamController& beam, const Config& cfg,
                               double from, double to, double step) {
    std::vector<PowerSample> samples;
    for (double theta = from; theta <= to + 1e-9 && !stop_signal.load(); theta += step) {
        auto p = with_retry(cfg, "Power measurement", [&] { return beam.measure_power(theta, 0.0); });
        if (p) {
            samples.push_back({theta, *p});
            const std::ios::fmtflags flags = std::cout.flags();
            const std::streamsize precision = std::cout.precision();
            std::cout << "  theta " << std::setw(6) << theta << " deg: " << std::fixed << std::setprecision(2)
                      << *p << " dBm" << std::endl;
            std::cout.flags(flags);
            std::cout.precision(precision);
        }
    }
    return samples;
}

std::optional<PowerSample> best_of(const std::vector<PowerSample>& samples) {
    if (samples.empty()) return std::nullopt;
    return *std::max_element(samples.begin(), samples.end(),
                             [](const PowerSample& a, const PowerSample& b) { return a.power_dbm < b.power_dbm; });
}

bool basic_control(Device::BeamController& beam, const Config& cfg) {
    std::cout << "\n=== Basic Beam Control ===" << std::endl;
    const std::vector<std::pair<double, double>> angles = {
        {0.0, 0.0}, {15.0, 0.0}, {-15.0, 0.0}, {30.0, 0.0}, {-30.0, 0.0}, {0.0, 180.0}};
    bool ok = true;
    for (const auto& a : angles) {
        const bool steered = with_retry(cfg, "Beam steering", [&] { return beam.set_beam_angle(a.first, a.second); });
        std::cout << "  theta " << std::setw(4) << a.first << ", phi " << std::setw(3) << a.second << ": "
                  << (steered ? "OK" : "FAILED") << std::endl;
        ok &= steered;
    }
    // Outside the steering range, must be refused without touching the device
    ok &= !beam.set_beam_angle(cfg.scan_max + 10.0, 0.0);
    ok &= !beam.set_beam_angle(0.0, 90.0);
    return ok;
}

bool power_scan(Device::BeamController& beam, const Config& cfg, double step) {
    std::cout << "\n=== Power Scan ===" << std::endl;
    if (!beam.set_bbox_mode("RX")) return false;

    auto samples = sweep(beam, cfg, -30.0, 30.0, step);
    if (samples.empty()) return false;

    double sum = 0.0;
    for (const auto& s : samples) sum += s.power_dbm;
    auto minmax = std::minmax_element(samples.begin(), samples.end(),
                                      [](const PowerSample& a, const PowerSample& b) { return a.power_dbm < b.power_dbm; });
    std::cout << "Max " << minmax.second->power_dbm << " dBm at " << minmax.second->theta << " deg, min "
              << minmax.first->power_dbm << " dBm, mean " << sum / static_cast<double>(samples.size()) << " dBm" << std::endl;
    return true;
}

std::optional<double> adaptive_search(Device::BeamController& beam, const Config& cfg) {
    std::cout << "\n=== Adaptive Beam Search ===" << std::endl;
    std::cout << "Coarse sweep:" << std::endl;
    auto coarse = best_of(sweep(beam, cfg, cfg.scan_min, cfg.scan_max, 15.0));
    if (!coarse) return std::nullopt;

    std::cout << "Fine sweep around " << coarse->theta << " deg:" << std::endl;
    const double lo = std::max(cfg.scan_min, coarse->theta - 10.0);
    const double hi = std::min(cfg.scan_max, coarse->theta + 10.0);
    auto fine = best_of(sweep(beam, cfg, lo, hi, 5.0));
    const PowerSample best = (fine && fine->power_dbm >= coarse->power_dbm) ? *fine : *coarse;

    std::cout << "Best beam: " << best.theta << " deg, " << best.power_dbm << " dBm" << std::endl;
    if (!beam.set_beam_angle(best.theta, 0.0)) return std::nullopt;
    return best.theta;
}

bool background_scan(Device::BeamController& beam, double step, std::chrono::milliseconds dwell,
                     std::chrono::milliseconds duration) {
    std::cout << "\n=== Background Scan ===" << std::endl;
    std::atomic<size_t> readings{0};
    const bool started = beam.start_scan(step, dwell, [&readings](double theta, std::optional<double> power) {
        if (power) readings++;
        std::cout << "  scan theta " << theta << " deg" << (power ? "" : " (no reading)") << std::endl;
    });
    if (!started) return false;
    const auto end = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < end && !stop_signal.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    beam.stop_scan();
    std::cout << "Visited " << beam.scan_positions_visited() << " positions, " << readings.load() << " readings" << std::endl;
    return beam.scan_positions_visited() > 0;
}

void print_status(const Device::BeamController& beam) {
    Device::BeamStatus st = beam.get_status();
    std::cout << "\n=== Beam Status ===" << std::endl
              << "  Initialized: " << (st.initialized ? "yes" : "no") << std::endl
              << "  Mode:        " << st.mode << std::endl
              << "  Angle:       theta " << st.theta << ", phi " << st.phi << std::endl
              << "  Gain:        " << st.gain_max << " dB at " << st.target_freq_ghz << " GHz" << std::endl
              << "  BBox/PD/RIS: " << st.bbox_available << "/" << st.pd_available << "/" << st.ris_available << std::endl;
    for (const auto& d : st.devices) {
        std::cout << "  Device " << d.first << " (" << Device::to_string(d.second.role) << ")" << std::endl;
    }
}

int UHD_SAFE_MAIN(int argc, char *argv[]) {
    std::signal(SIGINT, &signal_handler);

    const std::string default_config_file = "ChirpISAC.yaml";
    Config cfg;
    Device::SimulatedBeamformer::Params sim;

    std::string config_file = default_config_file;
    double scan_step = 5.0;
    int dwell_ms = 50;
    int scan_time_ms = 1000;
    int latency_us = 500;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "help message")
        ("config,c", po::value<std::string>(&config_file)->default_value(default_config_file), "Config file path (default: ChirpISAC.yaml)")
        ("peak-theta", po::value<double>(&sim.peak_theta), "Simulated direction of the strongest return (default: 0)")
        ("latency-us", po::value<int>(&latency_us), "Simulated per-call device latency in microseconds (default: 500)")
        ("scan-step", po::value<double>(&scan_step), "Power scan step in degrees (default: 5)")
        ("dwell-ms", po::value<int>(&dwell_ms), "Background scan dwell time in ms (default: 50)")
        ("scan-time-ms", po::value<int>(&scan_time_ms), "Background scan duration in ms (default: 1000)")
        ("log-level", po::value<std::string>(&cfg.log_level), "trace, debug, info, warning, error (default: info)");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    if (fs::exists(config_file) && load_config_from_yaml(cfg, config_file)) {
        std::cout << "Loaded config from: " << config_file << std::endl;
    }
    vm.clear();
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    apply_log_level(cfg.log_level);
    sim.latency = std::chrono::microseconds(std::max(0, latency_us));

    Device::SimulatedBeamformer device(sim);
    Device::BeamController beam(device, cfg);
    if (!beam.initialize()) {
        std::cerr << "Beam control initialization failed" << std::endl;
        return 1;
    }

    bool ok = basic_control(beam, cfg);
    ok &= power_scan(beam, cfg, scan_step);
    auto best = adaptive_search(beam, cfg);
    if (best) {
        std::cout << "Simulated peak at " << sim.peak_theta << " deg, found " << *best << " deg" << std::endl;
    }
    ok &= best.has_value();
    if (!stop_signal.load()) {
        ok &= background_scan(beam, scan_step, std::chrono::milliseconds(dwell_ms), std::chrono::milliseconds(scan_time_ms));
    }

    std::cout << "\n=== Emergency Stop ===" << std::endl;
    ok &= beam.emergency_stop();
    print_status(beam);

    beam.cleanup();
    std::cout << "\nBeam control demo " << (ok ? "completed" : "finished with failures") << std::endl;
    return ok ? 0 : 1;
}
