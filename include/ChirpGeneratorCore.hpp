#ifndef CHIRP_GENERATOR_CORE_HPP
#define CHIRP_GENERATOR_CORE_HPP

#include <vector>
#include <complex>
#include <cmath>
#include <random>
#include <optional>
#include <string>
#include <Common.hpp>
#include <ChirpSignalProcessing.hpp>

namespace ChirpISAC {
namespace Core {

    /**
     * @brief Parameters of one synthesized chirp.
     *
     * `alpha` is only meaningful for nonlinear shapes. `phase_offset` is the
     * constant phase applied by phase encoding.
     */
    struct ChirpParams {
        ChirpShape shape = ChirpShape::Linear;
        Direction direction = Direction::Up;
        double duration = 0.0;
        double bandwidth = 0.0;
        double start_freq = 0.0;
        double stop_freq = 0.0;
        double sample_rate = 0.0;
        size_t samples = 0;
        double chirp_rate = 0.0;     // Hz/s for linear chirps, shape constant k otherwise
        double alpha = 0.0;
        double phase_offset = 0.0;

        /**
         * @brief Instantaneous frequency at time t (seconds from chirp start).
         */
        double instantaneous_frequency(double t) const {
            const double k = chirp_rate;
            switch (shape) {
            case ChirpShape::Linear:
                return start_freq + k * t;
            case ChirpShape::Quadratic:
                return start_freq + k * std::pow(t, alpha);
            case ChirpShape::Logarithmic:
                return start_freq + k * std::log1p(alpha * t);
            case ChirpShape::Exponential:
                return start_freq + k * std::expm1(alpha * t);
            }
            return start_freq;
        }

        // Closed-form phase in radians, phi(0) = phase_offset
        double phase(double t) const {
            const double k = chirp_rate;
            double p = start_freq * t;
            switch (shape) {
            case ChirpShape::Linear:
                p += 0.5 * k * t * t;
                break;
            case ChirpShape::Quadratic:
                p += k * std::pow(t, alpha + 1.0) / (alpha + 1.0);
                break;
            case ChirpShape::Logarithmic: {
                const double u = 1.0 + alpha * t;
                p += k * (u * std::log(u) - alpha * t) / alpha;
                break;
            }
            case ChirpShape::Exponential:
                p += k * (std::expm1(alpha * t) / alpha - t);
                break;
            }
            return 2.0 * M_PI * p + phase_offset;
        }
    };

    /**
     * @brief A synthesized chirp with its time axis and frequency trace.
     */
    struct ChirpSignal {
        AlignedVector samples;
        AlignedVector windowed;      // Hann-windowed copy of `samples`
        std::vector<double> time;
        std::vector<double> instantaneous_freq;
        ChirpParams params;
    };

    struct EncodedChirps {
        std::vector<ChirpSignal> chirps;   // One chirp per bit
        BitVector bits;
        Encoding encoding = Encoding::Direction;
        double bit_rate = 0.0;
        size_t num_bits = 0;
    };

    struct MultiChirp {
        AlignedVector samples;             // Sample-wise sum of the components
        std::vector<ChirpSignal> components;
        size_t num_chirps = 0;
        Spacing spacing = Spacing::Equal;
        double bandwidth_per_chirp = 0.0;
    };

    struct NoisySignal {
        AlignedVector noisy;
        AlignedVector noise;
        double snr_db = 0.0;
        double signal_power = 0.0;
        double noise_power = 0.0;
    };

    struct TimeDomainStats {
        double duration = 0.0;
        size_t samples = 0;
        double amplitude_max = 0.0;
        double amplitude_mean = 0.0;
        double power = 0.0;
    };

    struct FrequencyDomainStats {
        double peak_freq = 0.0;
        double bandwidth_3db = 0.0;
        double spectral_centroid = 0.0;
        std::vector<double> frequencies;   // FFT order
        std::vector<double> magnitude;
    };

    struct ChirpAnalysis {
        TimeDomainStats time_domain;
        FrequencyDomainStats frequency_domain;
        DSP::Spectrogram spectrogram;      // Empty when the chirp is shorter than one segment
    };

    /**
     * @brief Chirp Waveform Generator
     *
     * Closed-form synthesis of linear and nonlinear swept-frequency waveforms,
     * bit encoding onto chirps, multi-chirp composites, noise injection and
     * basic spectral analysis. Holds only immutable defaults, so one instance
     * can be shared between threads.
     */
    class ChirpGenerator {
    public:
        struct Params {
            double sample_rate = 30e6;
            double chirp_duration = 100e-6;
            double bandwidth = 20e6;
            double start_freq = 0.0;
        };

        explicit ChirpGenerator(const Params& params) : _params(params) {
            if (_params.sample_rate <= 0.0) {
                throw InvalidParameter("Sample rate must be positive");
            }
        }

        explicit ChirpGenerator(const Config& cfg)
            : ChirpGenerator(Params{cfg.sample_rate, cfg.chirp_duration, cfg.chirp_bandwidth, cfg.start_freq}) {}

        const Params& params() const { return _params; }

        /**
         * @brief Linear chirp using the configured duration, bandwidth and start frequency.
         */
        ChirpSignal generate_linear_chirp(Direction direction = Direction::Up) const {
            return generate_linear_chirp(_params.chirp_duration, _params.bandwidth,
                                         _params.start_freq, _params.sample_rate, direction);
        }

        /**
         * @brief Linear chirp s[n] = exp(j*2*pi*(f0*t + k*t^2/2)), k = +/-B/T.
         *
         * @param duration Chirp duration T (s)
         * @param bandwidth Swept bandwidth B (Hz)
         * @param start_freq Start frequency f0 (Hz)
         * @param sample_rate Sample rate Fs (Hz)
         * @param direction Up sweeps to f0+B, down sweeps to f0-B
         */
        ChirpSignal generate_linear_chirp(double duration, double bandwidth, double start_freq,
                                          double sample_rate, Direction direction) const {
            ChirpParams p;
            p.shape = ChirpShape::Linear;
            p.direction = direction;
            p.duration = duration;
            p.bandwidth = bandwidth;
            p.start_freq = start_freq;
            p.sample_rate = sample_rate;
            p.samples = _num_samples(duration, sample_rate);
            p.chirp_rate = (direction == Direction::Up ? 1.0 : -1.0) * bandwidth / duration;
            p.stop_freq = start_freq + (direction == Direction::Up ? bandwidth : -bandwidth);
            return _synthesize(p);
        }

        ChirpSignal generate_nonlinear_chirp(const std::string& type, double alpha = 2.0) const {
            return generate_nonlinear_chirp(parse_chirp_type(type), alpha,
                                            _params.chirp_duration, _params.bandwidth);
        }

        /**
         * @brief Nonlinear chirp with closed-form phase.
         *
         * quadratic:   f = f0 + k*t^a,          k = B/T^a
         * logarithmic: f = f0 + k*ln(1+a*t),    k = B/ln(1+a*T)
         * exponential: f = f0 + k*(e^(a*t)-1),  k = B/(e^(a*T)-1)
         */
        ChirpSignal generate_nonlinear_chirp(ChirpShape shape, double alpha,
                                             double duration, double bandwidth) const {
            ChirpParams p;
            p.shape = shape;
            p.direction = Direction::Up;
            p.duration = duration;
            p.bandwidth = bandwidth;
            p.start_freq = _params.start_freq;
            p.stop_freq = _params.start_freq + bandwidth;
            p.sample_rate = _params.sample_rate;
            p.samples = _num_samples(duration, _params.sample_rate);
            p.alpha = alpha;

            switch (shape) {
            case ChirpShape::Linear:
                return generate_linear_chirp(duration, bandwidth, _params.start_freq,
                                             _params.sample_rate, Direction::Up);
            case ChirpShape::Quadratic:
                if (alpha <= -1.0) {
                    throw InvalidParameter("Quadratic chirp exponent must be greater than -1");
                }
                p.chirp_rate = bandwidth / std::pow(duration, alpha);
                break;
            case ChirpShape::Logarithmic:
                if (alpha == 0.0) {
                    throw InvalidParameter("Logarithmic chirp requires a nonzero alpha");
                }
                if (1.0 + alpha * duration <= 0.0) {
                    throw InvalidParameter("Logarithmic chirp requires 1 + alpha*T > 0");
                }
                p.chirp_rate = bandwidth / std::log1p(alpha * duration);
                break;
            case ChirpShape::Exponential:
                if (alpha == 0.0) {
                    throw InvalidParameter("Exponential chirp requires a nonzero alpha");
                }
                p.chirp_rate = bandwidth / std::expm1(alpha * duration);
                break;
            }
            if (!std::isfinite(p.chirp_rate)) {
                throw InvalidParameter("Chirp shape constant is not finite for the given alpha");
            }
            return _synthesize(p);
        }

        /**
         * @brief Encode bits onto a train of chirps, one chirp per bit.
         *
         * direction: 0 up, 1 down. frequency: 0 starts at 0 Hz, 1 at B/2.
         * phase: 1 adds a constant pi offset. duration: 1 lasts 1.5*T.
         * Any nonzero bit value counts as 1.
         */
        EncodedChirps encode_data_in_chirp(const BitVector& bits, Encoding encoding) const {
            EncodedChirps result;
            result.encoding = encoding;
            result.bits = bits;
            result.num_bits = bits.size();
            result.bit_rate = 1.0 / _params.chirp_duration;
            result.chirps.reserve(bits.size());

            const double T = _params.chirp_duration;
            const double B = _params.bandwidth;
            const double fs = _params.sample_rate;

            for (uint8_t bit : bits) {
                const bool one = bit != 0;
                switch (encoding) {
                case Encoding::Direction:
                    result.chirps.push_back(generate_linear_chirp(T, B, 0.0, fs, one ? Direction::Down : Direction::Up));
                    break;
                case Encoding::Frequency:
                    result.chirps.push_back(generate_linear_chirp(T, B, one ? B / 2.0 : 0.0, fs, Direction::Up));
                    break;
                case Encoding::Phase: {
                    ChirpSignal chirp = generate_linear_chirp(T, B, 0.0, fs, Direction::Up);
                    if (one) {
                        _apply_phase_offset(chirp, M_PI);
                    }
                    result.chirps.push_back(std::move(chirp));
                    break;
                }
                case Encoding::Duration:
                    result.chirps.push_back(generate_linear_chirp(one ? 1.5 * T : T, B, 0.0, fs, Direction::Up));
                    break;
                }
            }
            return result;
        }

        EncodedChirps encode_data_in_chirp(const BitVector& bits, const std::string& encoding) const {
            return encode_data_in_chirp(bits, parse_encoding(encoding));
        }

        /**
         * @brief Sum of K sub-chirps, each B/K wide, alternating up/down.
         *
         * Equal spacing places chirp i at i*B/K - B/2. Random spacing draws the
         * start frequency uniformly from [-B/2, B/2].
         */
        MultiChirp generate_multi_chirp(size_t num_chirps, Spacing spacing,
                                        std::optional<uint64_t> seed = std::nullopt) const {
            if (num_chirps < 1) {
                throw InvalidParameter("Multi-chirp requires at least one chirp");
            }
            MultiChirp result;
            result.num_chirps = num_chirps;
            result.spacing = spacing;

            const double B = _params.bandwidth;
            const double sub_bw = B / static_cast<double>(num_chirps);
            result.bandwidth_per_chirp = sub_bw;

            std::mt19937_64 rng(seed ? *seed : std::random_device{}());
            std::uniform_real_distribution<double> start_dist(-B / 2.0, B / 2.0);

            const size_t n = _num_samples(_params.chirp_duration, _params.sample_rate);
            result.samples.assign(n, std::complex<float>(0.0f, 0.0f));

            for (size_t i = 0; i < num_chirps; ++i) {
                const double f0 = spacing == Spacing::Equal
                                  ? static_cast<double>(i) * sub_bw - B / 2.0
                                  : start_dist(rng);
                const Direction dir = (i % 2 == 0) ? Direction::Up : Direction::Down;
                ChirpSignal sub = generate_linear_chirp(_params.chirp_duration, sub_bw, f0,
                                                        _params.sample_rate, dir);
                for (size_t k = 0; k < n; ++k) {
                    result.samples[k] += sub.samples[k];
                }
                result.components.push_back(std::move(sub));
            }
            return result;
        }

        MultiChirp generate_multi_chirp(size_t num_chirps, const std::string& spacing) const {
            return generate_multi_chirp(num_chirps, parse_spacing(spacing));
        }

        /**
         * @brief Add complex Gaussian noise at the requested SNR.
         *
         * Each call draws from its own engine. Pass a seed for reproducible noise.
         */
        static NoisySignal add_noise(const AlignedVector& signal, double snr_db,
                                     std::optional<uint64_t> seed = std::nullopt) {
            if (signal.empty()) {
                throw InvalidParameter("Cannot add noise to an empty signal");
            }
            std::mt19937_64 rng(seed ? *seed : std::random_device{}());
            NoisySignal result;
            result.snr_db = snr_db;
            result.signal_power = DSP::signal_power(signal);
            result.noise = DSP::add_awgn(signal, snr_db, rng, result.noisy, &result.noise_power);
            return result;
        }

        /**
         * @brief Time-domain, spectral and time-frequency summary of a chirp.
         */
        ChirpAnalysis analyze_chirp(const ChirpSignal& chirp) const {
            ChirpAnalysis a;
            const AlignedVector& x = chirp.samples;
            const size_t n = x.size();

            TimeDomainStats& td = a.time_domain;
            td.samples = n;
            td.duration = n > 0 ? chirp.time.back() - chirp.time.front() : 0.0;
            double amp_sum = 0.0;
            for (const auto& s : x) {
                const double amp = std::abs(s);
                td.amplitude_max = std::max(td.amplitude_max, amp);
                amp_sum += amp;
            }
            td.amplitude_mean = n > 0 ? amp_sum / static_cast<double>(n) : 0.0;
            td.power = DSP::signal_power(x);

            if (n == 0) return a;

            const double fs = chirp.params.sample_rate;
            FrequencyDomainStats& fd = a.frequency_domain;
            AlignedVector spectrum = DSP::fft(x);
            fd.frequencies = DSP::fftfreq(n, 1.0 / fs);
            fd.magnitude.resize(n);
            size_t peak_idx = 0;
            double mag_sum = 0.0;
            double weighted_sum = 0.0;
            for (size_t i = 0; i < n; ++i) {
                fd.magnitude[i] = std::abs(spectrum[i]);
                if (fd.magnitude[i] > fd.magnitude[peak_idx]) peak_idx = i;
                mag_sum += fd.magnitude[i];
                weighted_sum += fd.frequencies[i] * fd.magnitude[i];
            }
            fd.peak_freq = fd.frequencies[peak_idx];
            fd.spectral_centroid = mag_sum > 0.0 ? weighted_sum / mag_sum : 0.0;

            // -3 dB span measured between the first and last qualifying bins in FFT order
            const double half_power_level = fd.magnitude[peak_idx] / std::sqrt(2.0);
            size_t first = n, last = 0;
            for (size_t i = 0; i < n; ++i) {
                if (fd.magnitude[i] >= half_power_level) {
                    if (first == n) first = i;
                    last = i;
                }
            }
            fd.bandwidth_3db = first < n ? fd.frequencies[last] - fd.frequencies[first] : 0.0;

            a.spectrogram = DSP::spectrogram(x, fs);
            return a;
        }

    private:
        Params _params;

        static size_t _num_samples(double duration, double sample_rate) {
            if (!(duration > 0.0) || !(sample_rate > 0.0)) {
                throw InvalidParameter("Chirp duration and sample rate must be positive");
            }
            const size_t n = static_cast<size_t>(std::floor(duration * sample_rate + 1e-9));
            if (n == 0) {
                throw InvalidParameter("Chirp duration is shorter than one sample");
            }
            return n;
        }

        static ChirpSignal _synthesize(const ChirpParams& p) {
            ChirpSignal chirp;
            chirp.params = p;
            const size_t n = p.samples;
            const double dt = p.duration / static_cast<double>(n);

            chirp.samples.resize(n);
            chirp.time.resize(n);
            chirp.instantaneous_freq.resize(n);
            for (size_t i = 0; i < n; ++i) {
                const double t = static_cast<double>(i) * dt;
                chirp.time[i] = t;
                chirp.instantaneous_freq[i] = p.instantaneous_frequency(t);
                const double ph = std::fmod(p.phase(t), 2.0 * M_PI);
                chirp.samples[i] = std::complex<float>(static_cast<float>(std::cos(ph)),
                                                       static_cast<float>(std::sin(ph)));
            }
            _apply_window(chirp);
            return chirp;
        }

        static void _apply_window(ChirpSignal& chirp) {
            const AlignedFloatVector window = DSP::generate_hanning_window(chirp.samples.size());
            chirp.windowed.resize(chirp.samples.size());
            #pragma omp simd
            for (size_t i = 0; i < chirp.samples.size(); ++i) {
                chirp.windowed[i] = chirp.samples[i] * window[i];
            }
        }

        static void _apply_phase_offset(ChirpSignal& chirp, double offset) {
            const std::complex<float> rot(static_cast<float>(std::cos(offset)),
                                          static_cast<float>(std::sin(offset)));
            for (auto& s : chirp.samples) s *= rot;
            for (auto& s : chirp.windowed) s *= rot;
            chirp.params.phase_offset += offset;
        }
    };

} // namespace Core
} // namespace ChirpISAC

#endif // CHIRP_GENERATOR_CORE_HPP
