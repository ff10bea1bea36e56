#ifndef RADAR_PROCESSOR_CORE_HPP
#define RADAR_PROCESSOR_CORE_HPP

#include <vector>
#include <complex>
#include <chrono>
#include <optional>
#include <Common.hpp>
#include <ChirpSignalProcessing.hpp>

namespace ChirpISAC {
namespace Core {

    struct RadarDetection {
        std::vector<double> ranges;        // Meters, one per peak
        std::vector<size_t> peak_indices;  // Indices into the full correlation sequence
        size_t num_targets = 0;
        double timestamp = 0.0;            // Seconds since the Unix epoch
    };

    inline double unix_timestamp() {
        using namespace std::chrono;
        return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Radar Processing Engine
     *
     * Autocorrelation matched filter with a relative threshold:
     * 1. Full autocorrelation of the block (2N-1 lags)
     * 2. Strict local maxima above threshold * max|r|
     * 3. Range = (index / Fs) * c / 2 per peak
     *
     * Single dominant scatterer model; no Doppler and no CFAR.
     */
    class RadarProcessor {
    public:
        struct Params {
            double sample_rate = 30e6;
            double detection_threshold = 0.5;  // Fraction of the correlation maximum
            size_t min_samples = 100;
        };

        explicit RadarProcessor(const Params& params) : _params(params) {}

        explicit RadarProcessor(const Config& cfg)
            : RadarProcessor(Params{cfg.sample_rate, cfg.detection_threshold, 100}) {}

        std::optional<RadarDetection> process(const AlignedVector& block) const {
            return process(block.data(), block.size());
        }

        /**
         * @brief Detect correlation peaks in one block.
         *
         * @return std::nullopt for blocks shorter than min_samples or without a peak
         */
        std::optional<RadarDetection> process(const std::complex<float>* data, size_t n) const {
            if (n < _params.min_samples || n < 3) {
                return std::nullopt;
            }

            const AlignedVector corr = DSP::autocorrelate_full(data, n);
            std::vector<float> mag(corr.size());
            float max_mag = 0.0f;
            for (size_t i = 0; i < corr.size(); ++i) {
                mag[i] = std::abs(corr[i]);
                max_mag = std::max(max_mag, mag[i]);
            }
            const float threshold = max_mag * static_cast<float>(_params.detection_threshold);

            RadarDetection det;
            for (size_t i = 1; i + 1 < mag.size(); ++i) {
                if (mag[i] > threshold && mag[i] > mag[i - 1] && mag[i] > mag[i + 1]) {
                    det.peak_indices.push_back(i);
                    det.ranges.push_back(index_to_range(i));
                }
            }
            if (det.peak_indices.empty()) {
                return std::nullopt;
            }
            det.num_targets = det.peak_indices.size();
            det.timestamp = unix_timestamp();
            return det;
        }

        // The correlation index is used directly as the delay in samples
        double index_to_range(size_t index) const {
            const double delay = static_cast<double>(index) / _params.sample_rate;
            return delay * SPEED_OF_LIGHT / 2.0;
        }

        const Params& params() const { return _params; }

    private:
        Params _params;
    };

} // namespace Core
} // namespace ChirpISAC

#endif // RADAR_PROCESSOR_CORE_HPP
