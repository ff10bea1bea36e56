#include <uhd/utils/safe_main.hpp>
#include <uhd/utils/log.hpp>
#include <iostream>
#include <iomanip>
#include <cmath>
#include <vector>
#include <complex>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>
#include <functional>
#include <filesystem>
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>
#include <Common.hpp>
#include <ConfigIO.hpp>
#include <ChirpSignalProcessing.hpp>
#include <ChirpGeneratorCore.hpp>
#include <RadarProcessorCore.hpp>
#include <CommProcessorCore.hpp>
#include <ISACBlocks.hpp>
#include <FlowGraph.hpp>
#include <BeamformerDevice.hpp>
#include <BeamControl.hpp>
#include <RadioDevice.hpp>
#include <SignalIO.hpp>

namespace po = boost::program_options;
namespace fs = std::filesystem;
using namespace ChirpISAC;

std::atomic<bool> stop_signal(false);
void signal_handler(int) { stop_signal.store(true); }

/**
 * @brief No-hardware walkthrough of the ISAC testbed.
 *
 * Runs each subsystem in turn against simulated devices and reports a
 * pass/fail line per stage.
 */
class ISACDemo {
public:
    ISACDemo(const Config& cfg, std::chrono::milliseconds run_time)
        : _cfg(cfg), _run_time(run_time) {}

    bool run() {
        _stage("Configuration system", [this] { return _demo_config(); });
        _stage("Chirp generator", [this] { return _demo_chirp_generator(); });
        _stage("ISAC blocks", [this] { return _demo_blocks(); });
        _stage("Radio loopback", [this] { return _demo_radio_loopback(); });
        _stage("Beam control", [this] { return _demo_beam_control(); });
        _stage("System integration", [this] { return _demo_integration(); });
        return _summary();
    }

private:
    Config _cfg;
    std::chrono::milliseconds _run_time;
    std::vector<std::pair<std::string, bool>> _results;

    void _stage(const std::string& name, const std::function<bool()>& fn) {
        if (stop_signal.load()) return;
        std::cout << "\n=== " << name << " ===" << std::endl;
        bool ok = false;
        try {
            ok = fn();
        } catch (const std::exception& e) {
            std::cerr << name << " raised: " << e.what() << std::endl;
        }
        std::cout << name << ": " << (ok ? "PASS" : "FAIL") << std::endl;
        _results.emplace_back(name, ok);
    }

    bool _summary() const {
        size_t passed = 0;
        std::cout << "\n=== Demo Summary ===" << std::endl;
        for (const auto& r : _results) {
            std::cout << "  " << std::left << std::setw(24) << r.first << (r.second ? "PASS" : "FAIL") << std::endl;
            if (r.second) ++passed;
        }
        std::cout << passed << "/" << _results.size() << " stages passed" << std::endl;
        return !_results.empty() && passed == _results.size();
    }

    bool _demo_config() {
        print_config_summary(_cfg);
        if (!ensure_directories(_cfg)) return false;
        const std::string snapshot = (fs::path(_cfg.temp_dir) / "effective_config.yaml").string();
        if (!save_config_to_yaml(_cfg, snapshot)) return false;
        Config reloaded;
        if (!load_config_from_yaml(reloaded, snapshot)) return false;
        std::cout << "Configuration snapshot written to " << snapshot << std::endl;
        return _cfg.validate().valid && reloaded.sample_rate == _cfg.sample_rate;
    }

    bool _demo_chirp_generator() {
        Core::ChirpGenerator gen(_cfg);
        bool ok = true;

        Core::ChirpSignal up = gen.generate_linear_chirp(Direction::Up);
        Core::ChirpSignal down = gen.generate_linear_chirp(Direction::Down);
        std::cout << "Linear chirp: " << up.samples.size() << " samples, "
                  << up.params.start_freq / 1e6 << " -> " << up.params.stop_freq / 1e6 << " MHz, rate "
                  << up.params.chirp_rate / 1e12 << " MHz/us" << std::endl;
        ok &= up.samples.size() == _cfg.samples_per_chirp() && down.samples.size() == up.samples.size();

        Core::ChirpAnalysis a = gen.analyze_chirp(up);
        std::cout << "Analysis: power " << a.time_domain.power
                  << ", peak " << a.frequency_domain.peak_freq / 1e6 << " MHz"
                  << ", -3 dB span " << a.frequency_domain.bandwidth_3db / 1e6 << " MHz"
                  << ", centroid " << a.frequency_domain.spectral_centroid / 1e6 << " MHz"
                  << ", spectrogram " << a.spectrogram.power.size() << "x" << a.spectrogram.times.size() << std::endl;
        ok &= std::abs(a.time_domain.power - 1.0) < 1e-3;

        const BitVector bits = {1, 0, 1, 1, 0};
        for (Encoding e : {Encoding::Direction, Encoding::Frequency, Encoding::Phase, Encoding::Duration}) {
            Core::EncodedChirps enc = gen.encode_data_in_chirp(bits, e);
            std::cout << "Encoding " << std::setw(9) << to_string(e) << ": " << enc.num_bits
                      << " chirps at " << enc.bit_rate / 1e3 << " kbit/s" << std::endl;
            ok &= enc.chirps.size() == bits.size();
        }

        for (const char* type : {"quadratic", "logarithmic", "exponential"}) {
            Core::ChirpSignal nl = gen.generate_nonlinear_chirp(type, 2.0);
            std::cout << "Nonlinear " << std::setw(11) << type << ": f(0) = "
                      << nl.instantaneous_freq.front() / 1e6 << " MHz, f(T) = "
                      << nl.params.instantaneous_frequency(nl.params.duration) / 1e6 << " MHz" << std::endl;
        }

        Core::MultiChirp multi = gen.generate_multi_chirp(4, Spacing::Equal);
        std::cout << "Multi-chirp: " << multi.num_chirps << " x " << multi.bandwidth_per_chirp / 1e6
                  << " MHz, power " << DSP::signal_power(multi.samples) << std::endl;

        Core::NoisySignal noisy = Core::ChirpGenerator::add_noise(up.samples, 10.0);
        const double measured = 10.0 * std::log10(noisy.signal_power / DSP::signal_power(noisy.noise));
        std::cout << "Noise: target 10 dB, measured " << measured << " dB" << std::endl;
        ok &= std::abs(measured - 10.0) < 1.0;

        fs::path json_path = IO::save_signal(up, _cfg.data_dir, "demo_linear_chirp", "json");
        fs::path npy_path = IO::save_signal(up, _cfg.data_dir, "demo_linear_chirp", "npy");
        std::cout << "Saved " << json_path << " and " << npy_path << std::endl;
        Core::ChirpSignal reloaded = IO::load_signal_json(json_path);
        ok &= reloaded.samples == up.samples;
        return ok;
    }

    bool _demo_blocks() {
        Config cfg = _cfg;
        cfg.mode = "communication";
        Core::ChirpISACSource source(cfg);
        Core::ChirpISACProcessor processor(cfg);
        source.add_data_to_send({0, 1, 0, 1, 1, 0});

        // One chirp per iteration so every block is a whole chirp
        Core::FlowGraph::Params fg;
        fg.block_size = cfg.samples_per_chirp();
        fg.sink_path = (fs::path(cfg.temp_dir) / "processor_output.fc32").string();
        Core::FlowGraph graph(source, processor, fg);
        graph.run_iterations(6);

        auto comm = processor.get_latest_results(Core::ResultType::Communication);
        std::cout << "Decoded bits:";
        for (const auto& r : comm) std::cout << " " << static_cast<int>(r.comm->bits.front());
        std::cout << std::endl;
        source.print_stats();

        const BitVector expected = {0, 1, 0, 1, 1, 0};
        bool ok = comm.size() == expected.size();
        for (size_t i = 0; ok && i < expected.size(); ++i) {
            ok = comm[i].comm->bits.front() == expected[i];
        }

        source.set_mode("radar");
        graph.run_for(_run_time);
        std::cout << "Radar run: " << graph.samples_processed() << " samples, "
                  << processor.get_latest_results(Core::ResultType::Radar).size() << " radar results buffered" << std::endl;
        return ok && !processor.get_latest_results(Core::ResultType::Radar).empty();
    }

    bool _demo_radio_loopback() {
        Device::SimulatedRadioDevice::Params sim;
        sim.delay_samples = 0;
        sim.attenuation = 0.5f;
        sim.snr_db = 20.0;
        sim.seed = 7;
        Device::SimulatedRadioDevice radio(sim);
        radio.configure(Device::RadioParams::from_config(_cfg));
        std::cout << radio.describe() << std::endl;

        Core::ChirpGenerator gen(_cfg);
        Core::CommunicationProcessor comm;
        Core::RadarProcessor radar(_cfg);

        const BitVector bits = {1, 1, 0, 1, 0, 0, 1, 0};
        Core::EncodedChirps enc = gen.encode_data_in_chirp(bits, Encoding::Direction);
        size_t errors = 0;
        for (size_t i = 0; i < bits.size(); ++i) {
            radio.transmit(enc.chirps[i].samples);
            AlignedVector rx = radio.receive(enc.chirps[i].samples.size(), 1.0);
            auto decision = comm.process(rx);
            if (!decision || decision->bits.front() != bits[i]) ++errors;
        }
        std::cout << "Loopback: " << bits.size() << " bits, " << errors << " errors" << std::endl;

        radio.transmit(gen.generate_linear_chirp().samples);
        auto det = radar.process(radio.receive(_cfg.samples_per_chirp(), 1.0));
        if (det) {
            std::cout << "Radar: " << det->num_targets << " peak(s), first at index "
                      << det->peak_indices.front() << " -> " << det->ranges.front() << " m" << std::endl;
        }
        return errors == 0 && det.has_value();
    }

    bool _demo_beam_control() {
        Device::SimulatedBeamformer bf;
        Device::BeamController beam(bf, _cfg);
        if (!beam.initialize()) return false;

        bool ok = beam.set_bbox_mode("tx");
        ok &= beam.set_beam_angle(15.0, 0.0);
        ok &= !beam.set_beam_angle(60.0, 0.0);
        auto power = beam.measure_power(0.0, 0.0);
        if (power) std::cout << "Boresight power: " << *power << " dBm" << std::endl;
        ok &= power.has_value();
        ok &= beam.emergency_stop();

        Device::BeamStatus st = beam.get_status();
        std::cout << "Beam status: mode " << st.mode << ", theta " << st.theta << ", phi " << st.phi
                  << ", gain " << st.gain_max << " dB, " << st.devices.size() << " devices" << std::endl;
        beam.cleanup();
        return ok;
    }

    bool _demo_integration() {
        Config cfg = _cfg;
        cfg.mode = "hybrid";
        Device::SimulatedBeamformer bf;
        Device::BeamController beam(bf, cfg);
        if (!beam.initialize()) return false;

        Core::ChirpISACSource source(cfg);
        Core::ChirpISACProcessor processor(cfg);
        std::atomic<size_t> steer_failures{0};
        source.set_beam_steer_callback([&](double tx, double) {
            if (!beam.set_beam_angle(tx, 0.0)) steer_failures++;
        });
        source.add_data_to_send(BitVector(64, 1));

        Core::FlowGraph::Params fg;
        fg.block_size = cfg.samples_per_chirp();
        fg.throttle_rate = cfg.sample_rate;
        Core::FlowGraph graph(source, processor, fg);
        graph.run_for(_run_time);

        source.print_stats();
        Core::SourceStats stats = source.get_stats();
        auto radar = processor.get_latest_results(Core::ResultType::Radar);
        auto comm = processor.get_latest_results(Core::ResultType::Communication);
        std::cout << "Results: " << radar.size() << " radar, " << comm.size() << " communication; beam at "
                  << beam.get_status().theta << " deg, " << steer_failures.load() << " steering failures" << std::endl;
        beam.cleanup();
        return stats.chirps_generated > 0 && steer_failures.load() == 0 && !radar.empty();
    }
};

int UHD_SAFE_MAIN(int argc, char *argv[]) {
    std::signal(SIGINT, &signal_handler);

    const std::string default_config_file = "ChirpISAC.yaml";
    Config cfg;

    std::string config_file = default_config_file;
    std::string save_config = "";
    int run_time_ms = 300;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "help message")
        ("config,c", po::value<std::string>(&config_file)->default_value(default_config_file), "Config file path (default: ChirpISAC.yaml)")
        ("save-config,s", po::value<std::string>(&save_config)->implicit_value(""), "Save current config to file and exit (optionally specify filename)")
        ("mode", po::value<std::string>(&cfg.mode), "ISAC mode: radar, communication, hybrid (default: hybrid)")
        ("processing-mode", po::value<std::string>(&cfg.processing_mode), "Receive processing: radar, communication, both (default: both)")
        ("encoding", po::value<std::string>(&cfg.encoding), "Bit encoding: direction, frequency, phase, duration (default: direction)")
        ("sample-rate", po::value<double>(&cfg.sample_rate), "Sample rate (default: 30e6)")
        ("chirp-duration", po::value<double>(&cfg.chirp_duration), "Chirp duration in seconds (default: 100e-6)")
        ("chirp-bandwidth", po::value<double>(&cfg.chirp_bandwidth), "Chirp bandwidth (default: 20e6)")
        ("data-dir", po::value<std::string>(&cfg.data_dir), "Directory for saved signals (default: data)")
        ("log-level", po::value<std::string>(&cfg.log_level), "trace, debug, info, warning, error (default: info)")
        ("run-time-ms", po::value<int>(&run_time_ms), "Flow graph run time per stage in ms (default: 300)");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    // Load config from YAML file (if exists), then CLI args override
    if (fs::exists(config_file)) {
        if (load_config_from_yaml(cfg, config_file)) {
            std::cout << "Loaded config from: " << config_file << std::endl;
        }
    } else if (config_file == default_config_file) {
        if (save_config_to_yaml(cfg, config_file)) {
            std::cout << "Config file '" << config_file << "' not found. Created with default values." << std::endl;
        }
    }

    vm.clear();
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("save-config")) {
        std::string output_file = save_config.empty() ? config_file : save_config;
        if (save_config_to_yaml(cfg, output_file)) {
            std::cout << "Config saved to: " << output_file << std::endl;
        }
        return 0;
    }

    apply_log_level(cfg.log_level);
    DSP::FFTWManager::import_wisdom();

    ISACDemo demo(cfg, std::chrono::milliseconds(std::max(50, run_time_ms)));
    const bool passed = demo.run();

    DSP::FFTWManager::export_wisdom();
    if (stop_signal.load()) {
        std::cout << "\nInterrupted." << std::endl;
    }
    return passed ? 0 : 1;
}
