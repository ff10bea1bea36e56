#ifndef COMMON_HPP
#define COMMON_HPP

#include <vector>
#include <complex>
#include <string>
#include <sstream>
#include <stdexcept>
#include <limits>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cctype>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace ChirpISAC {

/**
 * @brief STL-compliant Aligned Memory Allocator.
 *
 * Ensures that allocated memory is aligned to specific boundaries (default 64 bytes)
 * so sample buffers can be handed to FFTW and vectorized loops directly.
 */
template <typename T, size_t Alignment = 64>
class AlignedAllocator {
public:
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using size_type = size_t;

    AlignedAllocator() = default;
    template <class U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) {}

    template <class U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    bool operator==(const AlignedAllocator&) const { return true; }
    bool operator!=(const AlignedAllocator& other) const { return !(*this == other); }

    pointer allocate(size_type n) {
        if (n > (std::numeric_limits<size_type>::max() / sizeof(value_type))) {
            throw std::bad_alloc();
        }
        size_type bytes = n * sizeof(value_type);
        size_type aligned_bytes = (bytes + Alignment - 1) & ~(Alignment - 1);
        if (aligned_bytes == 0) aligned_bytes = Alignment;
        void* ptr = std::aligned_alloc(Alignment, aligned_bytes);
        if (!ptr) throw std::bad_alloc();
        return static_cast<pointer>(ptr);
    }

    void deallocate(pointer p, size_type) { std::free(p); }
};

// Sample containers (64-byte alignment)
using AlignedVector = std::vector<std::complex<float>, AlignedAllocator<std::complex<float>, 64>>;
using AlignedFloatVector = std::vector<float, AlignedAllocator<float, 64>>;
using BitVector = std::vector<uint8_t>;

constexpr double SPEED_OF_LIGHT = 3e8;   // Propagation model used for range estimation

/**
 * @brief Raised when a caller passes an unsupported mode, type or value.
 */
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

enum class IsacMode { Radar, Communication, Hybrid };
enum class ProcessingMode { Radar, Communication, Both };
enum class Encoding { Direction, Frequency, Phase, Duration };
enum class ChirpShape { Linear, Quadratic, Logarithmic, Exponential };
enum class Direction { Up, Down };
enum class Spacing { Equal, Random };
enum class SaveFormat { Npy, Json, Bin };

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline IsacMode parse_isac_mode(const std::string& s) {
    if (s == "radar") return IsacMode::Radar;
    if (s == "communication") return IsacMode::Communication;
    if (s == "hybrid") return IsacMode::Hybrid;
    throw InvalidParameter("Unsupported ISAC mode: " + s);
}

inline std::string to_string(IsacMode m) {
    switch (m) {
    case IsacMode::Radar: return "radar";
    case IsacMode::Communication: return "communication";
    case IsacMode::Hybrid: return "hybrid";
    }
    return "unknown";
}

inline ProcessingMode parse_processing_mode(const std::string& s) {
    if (s == "radar") return ProcessingMode::Radar;
    if (s == "communication") return ProcessingMode::Communication;
    if (s == "both") return ProcessingMode::Both;
    throw InvalidParameter("Unsupported processing mode: " + s);
}

inline std::string to_string(ProcessingMode m) {
    switch (m) {
    case ProcessingMode::Radar: return "radar";
    case ProcessingMode::Communication: return "communication";
    case ProcessingMode::Both: return "both";
    }
    return "unknown";
}

inline Encoding parse_encoding(const std::string& s) {
    if (s == "direction") return Encoding::Direction;
    if (s == "frequency") return Encoding::Frequency;
    if (s == "phase") return Encoding::Phase;
    if (s == "duration") return Encoding::Duration;
    throw InvalidParameter("Unsupported encoding: " + s);
}

inline std::string to_string(Encoding e) {
    switch (e) {
    case Encoding::Direction: return "direction";
    case Encoding::Frequency: return "frequency";
    case Encoding::Phase: return "phase";
    case Encoding::Duration: return "duration";
    }
    return "unknown";
}

// Only the nonlinear shapes are selectable by name
inline ChirpShape parse_chirp_type(const std::string& s) {
    if (s == "quadratic") return ChirpShape::Quadratic;
    if (s == "logarithmic") return ChirpShape::Logarithmic;
    if (s == "exponential") return ChirpShape::Exponential;
    throw InvalidParameter("Unsupported chirp type: " + s);
}

inline std::string to_string(ChirpShape c) {
    switch (c) {
    case ChirpShape::Linear: return "linear";
    case ChirpShape::Quadratic: return "quadratic";
    case ChirpShape::Logarithmic: return "logarithmic";
    case ChirpShape::Exponential: return "exponential";
    }
    return "unknown";
}

inline Direction parse_direction(const std::string& s) {
    if (s == "up") return Direction::Up;
    if (s == "down") return Direction::Down;
    throw InvalidParameter("Unsupported chirp direction: " + s);
}

inline std::string to_string(Direction d) {
    return d == Direction::Up ? "up" : "down";
}

inline Spacing parse_spacing(const std::string& s) {
    if (s == "equal") return Spacing::Equal;
    if (s == "random") return Spacing::Random;
    throw InvalidParameter("Unsupported frequency spacing: " + s);
}

inline SaveFormat parse_save_format(const std::string& s) {
    if (s == "npy") return SaveFormat::Npy;
    if (s == "json") return SaveFormat::Json;
    if (s == "bin") return SaveFormat::Bin;
    if (s == "mat") throw InvalidParameter("MAT-file output is not supported, use npy or json");
    throw InvalidParameter("Unsupported save format: " + s);
}

inline std::string to_string(SaveFormat f) {
    switch (f) {
    case SaveFormat::Npy: return "npy";
    case SaveFormat::Json: return "json";
    case SaveFormat::Bin: return "bin";
    }
    return "unknown";
}

/**
 * @brief Outcome of a configuration check.
 *
 * Errors make the configuration unusable, warnings flag values outside the
 * hardware-verified envelope.
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(const std::string& msg) { valid = false; errors.push_back(msg); }
    void add_warning(const std::string& msg) { warnings.push_back(msg); }
};

/**
 * @brief System Configuration Structure.
 *
 * Holds the radio, waveform, beam-steering and processing parameters of the
 * testbed. Defaults are the values verified on a USRP B210 with a 28 GHz
 * beamformer front end.
 */
struct Config {
    // Radio device
    std::string device_args = "type=b200";
    std::string device_serial = "";
    double sample_rate = 30e6;             // Sample rate
    double center_freq_if = 2e9;           // IF centre frequency fed to the up/down converter
    double center_freq_rf = 28e9;          // RF carrier radiated by the beamformer
    double tx_gain = 20.0;                 // TX gain
    double rx_gain = 20.0;                 // RX gain
    std::string tx_antenna = "TX/RX";
    std::string rx_antenna = "RX2";
    std::string clocksource = "internal";  // Clock source
    std::string wire_format = "sc16";

    // Hardware limits
    double max_sample_rate = 56e6;
    double verified_sample_rate = 30e6;    // Highest rate verified stable over USB 3.0
    double max_bandwidth = 20e6;
    double min_freq = 50e6;
    double max_freq = 6e9;
    double tx_gain_min = 0.0;
    double tx_gain_max = 89.8;
    double rx_gain_min = 0.0;
    double rx_gain_max = 76.0;

    // Chirp waveform
    double chirp_duration = 100e-6;        // Seconds
    double chirp_bandwidth = 20e6;         // Hz
    double start_freq = 0.0;               // Baseband start frequency

    // ISAC operating mode
    std::string mode = "hybrid";           // radar | communication | hybrid
    std::string processing_mode = "both";  // radar | communication | both
    double radar_duty_cycle = 0.7;
    double comm_duty_cycle = 0.3;
    double hybrid_cycle_time = 0.1;        // Seconds per radar/comm cycle

    // Beam steering
    bool scan_enabled = true;
    std::vector<double> scan_angles = {-45, -35, -25, -15, -5, 5, 15, 25, 35, 45};
    double beam_dwell_time = 0.1;          // Seconds per beam position
    double scan_min = -45.0;               // Inclusive steering range (degrees)
    double scan_max = 45.0;
    double beam_target_freq_ghz = 28.0;
    double beam_default_gain = 15.0;
    int beam_lock_timeout_ms = 0;          // 0 = wait for the device lock indefinitely
    int max_retries = 3;
    double retry_delay = 0.01;             // Seconds between manual retries

    // Signal processing
    size_t fft_size = 1024;
    double overlap_factor = 0.5;
    std::string window_type = "hanning";
    size_t buffer_size = 16384;
    size_t num_recv_frames = 32;
    size_t num_send_frames = 32;

    // Radar
    size_t range_bins = 512;
    size_t doppler_bins = 64;
    std::vector<int> cfar_guard_cells = {2, 2};     // Not consumed by the detector
    std::vector<int> cfar_training_cells = {8, 8};  // Not consumed by the detector
    double cfar_pfa = 1e-3;
    double detection_threshold = 0.5;      // Fraction of the correlation peak

    // Communication
    std::string modulation = "chirp_bpsk";
    std::string encoding = "direction";
    double data_rate = 200e3;
    size_t frame_size = 1024;
    bool error_correction = true;

    // Paths
    std::string data_dir = "data";
    std::string log_dir = "logs";
    std::string temp_dir = "temp";

    std::string log_level = "info";        // trace | debug | info | warning | error | fatal

    // Samples in one chirp at the configured rate
    size_t samples_per_chirp() const {
        return static_cast<size_t>(std::floor(chirp_duration * sample_rate + 1e-9));
    }

    double range_resolution() const { return SPEED_OF_LIGHT / (2.0 * chirp_bandwidth); }

    double max_range() const { return range_resolution() * static_cast<double>(range_bins); }

    double total_scan_time() const {
        return static_cast<double>(scan_angles.size()) * beam_dwell_time;
    }

    double bandwidth_efficiency() const { return data_rate / chirp_bandwidth; }

    /**
     * @brief Check the configuration against hardware limits.
     *
     * Never throws; every problem is reported in the returned result.
     */
    ValidationResult validate() const {
        ValidationResult result;
        auto fmt = [](const char* label, double v, double scale, const char* unit) {
            std::ostringstream oss;
            oss << label << " " << v / scale << " " << unit;
            return oss.str();
        };

        if (sample_rate <= 0.0) {
            result.add_error("Sample rate must be positive");
        } else if (sample_rate > max_sample_rate) {
            result.add_error(fmt("Sample rate", sample_rate, 1e6, "MHz") +
                             " exceeds hardware maximum " + fmt("", max_sample_rate, 1e6, "MHz"));
        } else if (sample_rate > verified_sample_rate) {
            result.add_warning(fmt("Sample rate", sample_rate, 1e6, "MHz") +
                               " is above the verified stable rate");
        }

        if (chirp_bandwidth <= 0.0) {
            result.add_error("Chirp bandwidth must be positive");
        } else if (chirp_bandwidth > max_bandwidth) {
            result.add_error(fmt("Chirp bandwidth", chirp_bandwidth, 1e6, "MHz") +
                             " exceeds maximum " + fmt("", max_bandwidth, 1e6, "MHz"));
        }

        if (center_freq_if < min_freq || center_freq_if > max_freq) {
            result.add_error(fmt("IF frequency", center_freq_if, 1e9, "GHz") +
                             " outside supported range");
        }
        if (tx_gain < tx_gain_min || tx_gain > tx_gain_max) {
            result.add_error(fmt("TX gain", tx_gain, 1.0, "dB") + " outside supported range");
        }
        if (rx_gain < rx_gain_min || rx_gain > rx_gain_max) {
            result.add_error(fmt("RX gain", rx_gain, 1.0, "dB") + " outside supported range");
        }
        if (scan_min > scan_max) {
            result.add_error("Beam scan range is empty");
        }
        if (chirp_duration <= 0.0) {
            result.add_error("Chirp duration must be positive");
        } else if (chirp_duration * sample_rate < 10.0) {
            result.add_warning("Fewer than 10 samples per chirp");
        }
        if (chirp_bandwidth > 0.0 && range_resolution() > 10.0) {
            result.add_warning(fmt("Range resolution", range_resolution(), 1.0, "m") + " is coarse");
        }
        if (total_scan_time() > 5.0) {
            result.add_warning(fmt("Beam scan time", total_scan_time(), 1.0, "s") + " is long");
        }
        if (std::abs(radar_duty_cycle + comm_duty_cycle - 1.0) > 1e-6) {
            result.add_warning("Radar and communication duty cycles do not sum to 1");
        }

        try {
            parse_isac_mode(mode);
            parse_processing_mode(processing_mode);
            parse_encoding(encoding);
        } catch (const InvalidParameter& e) {
            result.add_error(e.what());
        }
        return result;
    }
};

/**
 * @brief Phase Unwrapping Utility.
 *
 * Removes 2*pi jumps between consecutive phase values in place.
 */
inline void unwrap(std::vector<float>& phase) {
    if (phase.size() > 1) {
        std::vector<float> diffs(phase.size());

        // Wrap differences into [-pi, pi]
        #pragma omp simd
        for (size_t i = 1; i < phase.size(); ++i) {
            float d = phase[i] - phase[i - 1];
            float k = std::round(d / (2 * (float)M_PI));
            d -= k * 2 * (float)M_PI;
            diffs[i] = d;
        }

        for (size_t i = 1; i < phase.size(); ++i) {
            phase[i] = phase[i - 1] + diffs[i];
        }
    }
}

} // namespace ChirpISAC

#endif // COMMON_HPP
