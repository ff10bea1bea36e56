#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <uhd/utils/log.hpp>
#include <Common.hpp>

namespace ChirpISAC {

namespace fs = std::filesystem;

/**
 * @brief Write the configuration to a YAML file.
 */
inline bool save_config_to_yaml(const Config& cfg, const std::string& filepath) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "device_args" << YAML::Value << cfg.device_args;
    out << YAML::Key << "device_serial" << YAML::Value << cfg.device_serial;
    out << YAML::Key << "sample_rate" << YAML::Value << cfg.sample_rate;
    out << YAML::Key << "center_freq_if" << YAML::Value << cfg.center_freq_if;
    out << YAML::Key << "center_freq_rf" << YAML::Value << cfg.center_freq_rf;
    out << YAML::Key << "tx_gain" << YAML::Value << cfg.tx_gain;
    out << YAML::Key << "rx_gain" << YAML::Value << cfg.rx_gain;
    out << YAML::Key << "tx_antenna" << YAML::Value << cfg.tx_antenna;
    out << YAML::Key << "rx_antenna" << YAML::Value << cfg.rx_antenna;
    out << YAML::Key << "clock_source" << YAML::Value << cfg.clocksource;
    out << YAML::Key << "wire_format" << YAML::Value << cfg.wire_format;
    out << YAML::Key << "max_sample_rate" << YAML::Value << cfg.max_sample_rate;
    out << YAML::Key << "verified_sample_rate" << YAML::Value << cfg.verified_sample_rate;
    out << YAML::Key << "max_bandwidth" << YAML::Value << cfg.max_bandwidth;
    out << YAML::Key << "min_freq" << YAML::Value << cfg.min_freq;
    out << YAML::Key << "max_freq" << YAML::Value << cfg.max_freq;
    out << YAML::Key << "tx_gain_range" << YAML::Value << YAML::Flow << std::vector<double>{cfg.tx_gain_min, cfg.tx_gain_max};
    out << YAML::Key << "rx_gain_range" << YAML::Value << YAML::Flow << std::vector<double>{cfg.rx_gain_min, cfg.rx_gain_max};
    out << YAML::Key << "chirp_duration" << YAML::Value << cfg.chirp_duration;
    out << YAML::Key << "chirp_bandwidth" << YAML::Value << cfg.chirp_bandwidth;
    out << YAML::Key << "start_freq" << YAML::Value << cfg.start_freq;
    out << YAML::Key << "mode" << YAML::Value << cfg.mode;
    out << YAML::Key << "processing_mode" << YAML::Value << cfg.processing_mode;
    out << YAML::Key << "radar_duty_cycle" << YAML::Value << cfg.radar_duty_cycle;
    out << YAML::Key << "comm_duty_cycle" << YAML::Value << cfg.comm_duty_cycle;
    out << YAML::Key << "hybrid_cycle_time" << YAML::Value << cfg.hybrid_cycle_time;
    out << YAML::Key << "scan_enabled" << YAML::Value << cfg.scan_enabled;
    out << YAML::Key << "scan_angles" << YAML::Value << YAML::Flow << cfg.scan_angles;
    out << YAML::Key << "beam_dwell_time" << YAML::Value << cfg.beam_dwell_time;
    out << YAML::Key << "scan_range" << YAML::Value << YAML::Flow << std::vector<double>{cfg.scan_min, cfg.scan_max};
    out << YAML::Key << "beam_target_freq_ghz" << YAML::Value << cfg.beam_target_freq_ghz;
    out << YAML::Key << "beam_default_gain" << YAML::Value << cfg.beam_default_gain;
    out << YAML::Key << "beam_lock_timeout_ms" << YAML::Value << cfg.beam_lock_timeout_ms;
    out << YAML::Key << "max_retries" << YAML::Value << cfg.max_retries;
    out << YAML::Key << "retry_delay" << YAML::Value << cfg.retry_delay;
    out << YAML::Key << "fft_size" << YAML::Value << cfg.fft_size;
    out << YAML::Key << "overlap_factor" << YAML::Value << cfg.overlap_factor;
    out << YAML::Key << "window_type" << YAML::Value << cfg.window_type;
    out << YAML::Key << "buffer_size" << YAML::Value << cfg.buffer_size;
    out << YAML::Key << "num_recv_frames" << YAML::Value << cfg.num_recv_frames;
    out << YAML::Key << "num_send_frames" << YAML::Value << cfg.num_send_frames;
    out << YAML::Key << "range_bins" << YAML::Value << cfg.range_bins;
    out << YAML::Key << "doppler_bins" << YAML::Value << cfg.doppler_bins;
    out << YAML::Key << "cfar_guard_cells" << YAML::Value << YAML::Flow << cfg.cfar_guard_cells;
    out << YAML::Key << "cfar_training_cells" << YAML::Value << YAML::Flow << cfg.cfar_training_cells;
    out << YAML::Key << "cfar_pfa" << YAML::Value << cfg.cfar_pfa;
    out << YAML::Key << "detection_threshold" << YAML::Value << cfg.detection_threshold;
    out << YAML::Key << "modulation" << YAML::Value << cfg.modulation;
    out << YAML::Key << "encoding" << YAML::Value << cfg.encoding;
    out << YAML::Key << "data_rate" << YAML::Value << cfg.data_rate;
    out << YAML::Key << "frame_size" << YAML::Value << cfg.frame_size;
    out << YAML::Key << "error_correction" << YAML::Value << cfg.error_correction;
    out << YAML::Key << "data_dir" << YAML::Value << cfg.data_dir;
    out << YAML::Key << "log_dir" << YAML::Value << cfg.log_dir;
    out << YAML::Key << "temp_dir" << YAML::Value << cfg.temp_dir;
    out << YAML::Key << "log_level" << YAML::Value << cfg.log_level;
    out << YAML::EndMap;

    std::ofstream fout(filepath);
    if (!fout) {
        std::cerr << "Error: Cannot write to config file: " << filepath << std::endl;
        return false;
    }
    fout << out.c_str() << std::endl;
    return static_cast<bool>(fout);
}

/**
 * @brief Overlay values present in a YAML file onto `cfg`.
 *
 * Keys missing from the file keep their current values.
 */
inline bool load_config_from_yaml(Config& cfg, const std::string& filepath) {
    if (!fs::exists(filepath)) {
        return false;
    }
    try {
        YAML::Node config = YAML::LoadFile(filepath);
        if (config["device_args"]) cfg.device_args = config["device_args"].as<std::string>();
        if (config["device_serial"]) cfg.device_serial = config["device_serial"].as<std::string>();
        if (config["sample_rate"]) cfg.sample_rate = config["sample_rate"].as<double>();
        if (config["center_freq_if"]) cfg.center_freq_if = config["center_freq_if"].as<double>();
        if (config["center_freq_rf"]) cfg.center_freq_rf = config["center_freq_rf"].as<double>();
        if (config["tx_gain"]) cfg.tx_gain = config["tx_gain"].as<double>();
        if (config["rx_gain"]) cfg.rx_gain = config["rx_gain"].as<double>();
        if (config["tx_antenna"]) cfg.tx_antenna = config["tx_antenna"].as<std::string>();
        if (config["rx_antenna"]) cfg.rx_antenna = config["rx_antenna"].as<std::string>();
        if (config["clock_source"]) cfg.clocksource = config["clock_source"].as<std::string>();
        if (config["wire_format"]) cfg.wire_format = config["wire_format"].as<std::string>();
        if (config["max_sample_rate"]) cfg.max_sample_rate = config["max_sample_rate"].as<double>();
        if (config["verified_sample_rate"]) cfg.verified_sample_rate = config["verified_sample_rate"].as<double>();
        if (config["max_bandwidth"]) cfg.max_bandwidth = config["max_bandwidth"].as<double>();
        if (config["min_freq"]) cfg.min_freq = config["min_freq"].as<double>();
        if (config["max_freq"]) cfg.max_freq = config["max_freq"].as<double>();
        if (config["tx_gain_range"]) {
            auto r = config["tx_gain_range"].as<std::vector<double>>();
            if (r.size() == 2) { cfg.tx_gain_min = r[0]; cfg.tx_gain_max = r[1]; }
        }
        if (config["rx_gain_range"]) {
            auto r = config["rx_gain_range"].as<std::vector<double>>();
            if (r.size() == 2) { cfg.rx_gain_min = r[0]; cfg.rx_gain_max = r[1]; }
        }
        if (config["chirp_duration"]) cfg.chirp_duration = config["chirp_duration"].as<double>();
        if (config["chirp_bandwidth"]) cfg.chirp_bandwidth = config["chirp_bandwidth"].as<double>();
        if (config["start_freq"]) cfg.start_freq = config["start_freq"].as<double>();
        if (config["mode"]) cfg.mode = config["mode"].as<std::string>();
        if (config["processing_mode"]) cfg.processing_mode = config["processing_mode"].as<std::string>();
        if (config["radar_duty_cycle"]) cfg.radar_duty_cycle = config["radar_duty_cycle"].as<double>();
        if (config["comm_duty_cycle"]) cfg.comm_duty_cycle = config["comm_duty_cycle"].as<double>();
        if (config["hybrid_cycle_time"]) cfg.hybrid_cycle_time = config["hybrid_cycle_time"].as<double>();
        if (config["scan_enabled"]) cfg.scan_enabled = config["scan_enabled"].as<bool>();
        if (config["scan_angles"]) cfg.scan_angles = config["scan_angles"].as<std::vector<double>>();
        if (config["beam_dwell_time"]) cfg.beam_dwell_time = config["beam_dwell_time"].as<double>();
        if (config["scan_range"]) {
            auto r = config["scan_range"].as<std::vector<double>>();
            if (r.size() == 2) { cfg.scan_min = r[0]; cfg.scan_max = r[1]; }
        }
        if (config["beam_target_freq_ghz"]) cfg.beam_target_freq_ghz = config["beam_target_freq_ghz"].as<double>();
        if (config["beam_default_gain"]) cfg.beam_default_gain = config["beam_default_gain"].as<double>();
        if (config["beam_lock_timeout_ms"]) cfg.beam_lock_timeout_ms = config["beam_lock_timeout_ms"].as<int>();
        if (config["max_retries"]) cfg.max_retries = config["max_retries"].as<int>();
        if (config["retry_delay"]) cfg.retry_delay = config["retry_delay"].as<double>();
        if (config["fft_size"]) cfg.fft_size = config["fft_size"].as<size_t>();
        if (config["overlap_factor"]) cfg.overlap_factor = config["overlap_factor"].as<double>();
        if (config["window_type"]) cfg.window_type = config["window_type"].as<std::string>();
        if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<size_t>();
        if (config["num_recv_frames"]) cfg.num_recv_frames = config["num_recv_frames"].as<size_t>();
        if (config["num_send_frames"]) cfg.num_send_frames = config["num_send_frames"].as<size_t>();
        if (config["range_bins"]) cfg.range_bins = config["range_bins"].as<size_t>();
        if (config["doppler_bins"]) cfg.doppler_bins = config["doppler_bins"].as<size_t>();
        if (config["cfar_guard_cells"]) cfg.cfar_guard_cells = config["cfar_guard_cells"].as<std::vector<int>>();
        if (config["cfar_training_cells"]) cfg.cfar_training_cells = config["cfar_training_cells"].as<std::vector<int>>();
        if (config["cfar_pfa"]) cfg.cfar_pfa = config["cfar_pfa"].as<double>();
        if (config["detection_threshold"]) cfg.detection_threshold = config["detection_threshold"].as<double>();
        if (config["modulation"]) cfg.modulation = config["modulation"].as<std::string>();
        if (config["encoding"]) cfg.encoding = config["encoding"].as<std::string>();
        if (config["data_rate"]) cfg.data_rate = config["data_rate"].as<double>();
        if (config["frame_size"]) cfg.frame_size = config["frame_size"].as<size_t>();
        if (config["error_correction"]) cfg.error_correction = config["error_correction"].as<bool>();
        if (config["data_dir"]) cfg.data_dir = config["data_dir"].as<std::string>();
        if (config["log_dir"]) cfg.log_dir = config["log_dir"].as<std::string>();
        if (config["temp_dir"]) cfg.temp_dir = config["temp_dir"].as<std::string>();
        if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "Error parsing YAML config: " << e.what() << std::endl;
        return false;
    }
}

/**
 * @brief Create the data, log and temp directories if missing.
 */
inline bool ensure_directories(const Config& cfg) {
    bool ok = true;
    for (const std::string& dir : {cfg.data_dir, cfg.log_dir, cfg.temp_dir}) {
        if (dir.empty()) continue;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "Error: Cannot create directory " << dir << ": " << ec.message() << std::endl;
            ok = false;
        }
    }
    return ok;
}

/**
 * @brief Map the configured log level onto UHD's console logger.
 */
inline void apply_log_level(const std::string& level) {
    using uhd::log::severity_level;
    severity_level sev = uhd::log::info;
    const std::string l = to_lower(level);
    if (l == "trace") sev = uhd::log::trace;
    else if (l == "debug") sev = uhd::log::debug;
    else if (l == "info") sev = uhd::log::info;
    else if (l == "warning") sev = uhd::log::warning;
    else if (l == "error") sev = uhd::log::error;
    else if (l == "fatal") sev = uhd::log::fatal;
    else if (l == "off") sev = uhd::log::off;
    else std::cerr << "Warning: unknown log level '" << level << "', using info" << std::endl;
    uhd::log::set_console_level(sev);
}

inline void print_config_summary(const Config& cfg) {
    std::cout << "=== ChirpISAC Configuration ===" << std::endl
              << "Radio:" << std::endl
              << "  Device args:     " << cfg.device_args << std::endl
              << "  Sample rate:     " << cfg.sample_rate / 1e6 << " MHz" << std::endl
              << "  IF frequency:    " << cfg.center_freq_if / 1e9 << " GHz" << std::endl
              << "  RF frequency:    " << cfg.center_freq_rf / 1e9 << " GHz" << std::endl
              << "  TX/RX gain:      " << cfg.tx_gain << " / " << cfg.rx_gain << " dB" << std::endl
              << "Chirp:" << std::endl
              << "  Duration:        " << cfg.chirp_duration * 1e6 << " us" << std::endl
              << "  Bandwidth:       " << cfg.chirp_bandwidth / 1e6 << " MHz" << std::endl
              << "  Samples/chirp:   " << cfg.samples_per_chirp() << std::endl
              << "ISAC:" << std::endl
              << "  Mode:            " << cfg.mode << " (radar " << cfg.radar_duty_cycle * 100
              << "%, comm " << cfg.comm_duty_cycle * 100 << "%)" << std::endl
              << "  Encoding:        " << cfg.encoding << std::endl
              << "  Range res.:      " << cfg.range_resolution() << " m" << std::endl
              << "  Max range:       " << cfg.max_range() << " m" << std::endl
              << "  BW efficiency:   " << cfg.bandwidth_efficiency() << " bit/s/Hz" << std::endl
              << "Beam:" << std::endl
              << "  Scan range:      [" << cfg.scan_min << ", " << cfg.scan_max << "] deg" << std::endl
              << "  Scan positions:  " << cfg.scan_angles.size() << " x " << cfg.beam_dwell_time * 1e3
              << " ms = " << cfg.total_scan_time() << " s" << std::endl
              << "  Target freq:     " << cfg.beam_target_freq_ghz << " GHz" << std::endl;

    ValidationResult v = cfg.validate();
    std::cout << "Validation: " << (v.valid ? "PASSED" : "FAILED") << std::endl;
    for (const auto& e : v.errors) std::cout << "  Error:   " << e << std::endl;
    for (const auto& w : v.warnings) std::cout << "  Warning: " << w << std::endl;
}

} // namespace ChirpISAC

#endif // CONFIG_IO_HPP
