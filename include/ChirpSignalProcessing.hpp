#ifndef CHIRP_SIGNAL_PROCESSING_HPP
#define CHIRP_SIGNAL_PROCESSING_HPP

#include <vector>
#include <complex>
#include <cmath>
#include <cstdio>
#include <mutex>
#include <random>
#include <string>
#include <iostream>
#include <stdexcept>
#include <fftw3.h>
#include <Common.hpp>

namespace ChirpISAC {
namespace DSP {

    /**
     * @brief Manager for FFTW Wisdom.
     *
     * Imports and exports FFTW wisdom so repeated runs reuse measured plans.
     */
    class FFTWManager {
    public:
        static void import_wisdom(const std::string& filename = "fftw_wisdom.dat") {
            if (FILE* f = std::fopen(filename.c_str(), "r")) {
                fftwf_import_wisdom_from_file(f);
                std::fclose(f);
                std::cout << "Imported FFTW wisdom from " << filename << std::endl;
            } else {
                std::cout << "No existing FFTW wisdom found (will act as cold start)." << std::endl;
            }
        }

        static void export_wisdom(const std::string& filename = "fftw_wisdom.dat") {
            if (FILE* f = std::fopen(filename.c_str(), "w")) {
                fftwf_export_wisdom_to_file(f);
                std::fclose(f);
                std::cout << "Exported FFTW wisdom to " << filename << std::endl;
            } else {
                std::cerr << "Failed to export FFTW wisdom to " << filename << std::endl;
            }
        }

        // The FFTW planner is not re-entrant; plan creation and destruction share this lock.
        static std::mutex& planner_mutex() {
            static std::mutex m;
            return m;
        }
    };

    /**
     * @brief One-dimensional in-place FFT plan bound to its own buffer.
     *
     * Created per call by the stateless processors, so each caller owns its plan.
     */
    class FFTPlan {
    public:
        FFTPlan(size_t size, int sign) : _buffer(size) {
            std::lock_guard<std::mutex> lock(FFTWManager::planner_mutex());
            _plan = fftwf_plan_dft_1d(
                static_cast<int>(size),
                reinterpret_cast<fftwf_complex*>(_buffer.data()),
                reinterpret_cast<fftwf_complex*>(_buffer.data()),
                sign,
                FFTW_ESTIMATE
            );
            if (!_plan) {
                throw std::runtime_error("Failed to create FFTW plan of size " + std::to_string(size));
            }
        }

        ~FFTPlan() {
            std::lock_guard<std::mutex> lock(FFTWManager::planner_mutex());
            if (_plan) fftwf_destroy_plan(_plan);
        }

        FFTPlan(const FFTPlan&) = delete;
        FFTPlan& operator=(const FFTPlan&) = delete;

        AlignedVector& buffer() { return _buffer; }
        void execute() { fftwf_execute(_plan); }

    private:
        AlignedVector _buffer;
        fftwf_plan _plan = nullptr;
    };

    /**
     * @brief Hanning Window Generator
     *
     * w[n] = 0.5 - 0.5*cos(2*pi*n/(N-1)). A single-point window is 1.
     */
    inline AlignedFloatVector generate_hanning_window(size_t size) {
        AlignedFloatVector window(size);
        if (size == 1) {
            window[0] = 1.0f;
            return window;
        }
        for (size_t i = 0; i < size; ++i) {
            window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * M_PI * i / (size - 1))));
        }
        return window;
    }

    inline double signal_power(const std::complex<float>* data, size_t n) {
        if (n == 0) return 0.0;
        double acc = 0.0;
        for (size_t i = 0; i < n; ++i) {
            acc += static_cast<double>(std::norm(data[i]));
        }
        return acc / static_cast<double>(n);
    }

    inline double signal_power(const AlignedVector& x) { return signal_power(x.data(), x.size()); }

    /**
     * @brief FFT sample frequencies in standard order (DC, positive, negative).
     */
    inline std::vector<double> fftfreq(size_t n, double d) {
        std::vector<double> f(n);
        const double scale = 1.0 / (static_cast<double>(n) * d);
        const long half = static_cast<long>((n - 1) / 2) + 1;
        for (size_t i = 0; i < n; ++i) {
            long k = static_cast<long>(i) < half ? static_cast<long>(i)
                                                  : static_cast<long>(i) - static_cast<long>(n);
            f[i] = static_cast<double>(k) * scale;
        }
        return f;
    }

    // Forward FFT, unnormalized
    inline AlignedVector fft(const AlignedVector& in) {
        if (in.empty()) return AlignedVector();
        FFTPlan plan(in.size(), FFTW_FORWARD);
        std::copy(in.begin(), in.end(), plan.buffer().begin());
        plan.execute();
        return plan.buffer();
    }

    inline size_t next_pow2(size_t n) {
        size_t p = 1;
        while (p < n) p <<= 1;
        return p;
    }

    /**
     * @brief Full linear autocorrelation of a complex sequence.
     *
     * Output has 2N-1 entries; entry i holds lag (i - (N-1)),
     * r[k] = sum_n x[n+k] * conj(x[n]). Computed through a zero-padded FFT.
     */
    inline AlignedVector autocorrelate_full(const std::complex<float>* x, size_t n) {
        if (n == 0) return AlignedVector();
        const size_t out_len = 2 * n - 1;
        const size_t m = next_pow2(out_len);

        FFTPlan forward(m, FFTW_FORWARD);
        FFTPlan inverse(m, FFTW_BACKWARD);

        AlignedVector& fbuf = forward.buffer();
        std::fill(fbuf.begin(), fbuf.end(), std::complex<float>(0.0f, 0.0f));
        std::copy(x, x + n, fbuf.begin());
        forward.execute();

        AlignedVector& ibuf = inverse.buffer();
        #pragma omp simd
        for (size_t i = 0; i < m; ++i) {
            ibuf[i] = std::complex<float>(std::norm(fbuf[i]), 0.0f);
        }
        inverse.execute();

        AlignedVector out(out_len);
        const float scale = 1.0f / static_cast<float>(m);
        for (size_t i = 0; i < out_len; ++i) {
            long lag = static_cast<long>(i) - static_cast<long>(n - 1);
            size_t idx = lag >= 0 ? static_cast<size_t>(lag) : static_cast<size_t>(static_cast<long>(m) + lag);
            out[i] = ibuf[idx] * scale;
        }
        return out;
    }

    /**
     * @brief Add complex white Gaussian noise at a target SNR.
     *
     * Noise power is mean|x|^2 / 10^(snr/10), split evenly between I and Q.
     * Returns the noise realisation; `noisy` receives signal + noise.
     */
    template <typename Rng>
    AlignedVector add_awgn(const AlignedVector& signal, double snr_db, Rng& rng,
                           AlignedVector& noisy, double* noise_power_out = nullptr) {
        const double ps = signal_power(signal);
        const double pn = ps / std::pow(10.0, snr_db / 10.0);
        std::normal_distribution<double> dist(0.0, std::sqrt(pn / 2.0));

        AlignedVector noise(signal.size());
        noisy.resize(signal.size());
        for (size_t i = 0; i < signal.size(); ++i) {
            noise[i] = std::complex<float>(static_cast<float>(dist(rng)), static_cast<float>(dist(rng)));
            noisy[i] = signal[i] + noise[i];
        }
        if (noise_power_out) *noise_power_out = pn;
        return noise;
    }

    /**
     * @brief Short-time power spectral density.
     *
     * Rows are frequency bins (FFT order, two-sided for complex input),
     * columns are segment centres.
     */
    struct Spectrogram {
        std::vector<double> frequencies;
        std::vector<double> times;
        std::vector<std::vector<double>> power;

        bool empty() const { return times.empty(); }
    };

    /**
     * @brief Hann-windowed spectrogram with density scaling.
     *
     * Each segment has its mean removed before windowing. Signals shorter than
     * one segment yield an empty result.
     */
    inline Spectrogram spectrogram(const AlignedVector& x, double fs,
                                   size_t nperseg = 256, size_t noverlap = 32) {
        Spectrogram result;
        if (nperseg == 0 || noverlap >= nperseg || x.size() < nperseg) {
            return result;
        }

        // Periodic Hann window
        std::vector<double> window(nperseg);
        double win_energy = 0.0;
        for (size_t i = 0; i < nperseg; ++i) {
            window[i] = 0.5 - 0.5 * std::cos(2.0 * M_PI * i / static_cast<double>(nperseg));
            win_energy += window[i] * window[i];
        }
        const double scale = 1.0 / (fs * win_energy);
        const size_t step = nperseg - noverlap;
        const size_t num_segments = (x.size() - noverlap) / step;

        result.frequencies = fftfreq(nperseg, 1.0 / fs);
        result.power.assign(nperseg, std::vector<double>(num_segments, 0.0));

        FFTPlan plan(nperseg, FFTW_FORWARD);
        AlignedVector& buf = plan.buffer();
        for (size_t s = 0; s < num_segments; ++s) {
            const size_t start = s * step;
            std::complex<double> mean(0.0, 0.0);
            for (size_t i = 0; i < nperseg; ++i) {
                mean += std::complex<double>(x[start + i]);
            }
            mean /= static_cast<double>(nperseg);
            for (size_t i = 0; i < nperseg; ++i) {
                std::complex<double> v = (std::complex<double>(x[start + i]) - mean) * window[i];
                buf[i] = std::complex<float>(v);
            }
            plan.execute();
            for (size_t k = 0; k < nperseg; ++k) {
                result.power[k][s] = static_cast<double>(std::norm(buf[k])) * scale;
            }
            result.times.push_back((static_cast<double>(start) + nperseg / 2.0) / fs);
        }
        return result;
    }

} // namespace DSP
} // namespace ChirpISAC

#endif // CHIRP_SIGNAL_PROCESSING_HPP
