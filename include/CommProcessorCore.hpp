#ifndef COMM_PROCESSOR_CORE_HPP
#define COMM_PROCESSOR_CORE_HPP

#include <vector>
#include <complex>
#include <optional>
#include <Common.hpp>
#include <RadarProcessorCore.hpp>

namespace ChirpISAC {
namespace Core {

    struct CommDecision {
        BitVector bits;
        size_t num_bits = 0;
        double mean_phase_step = 0.0;  // Radians per sample
        double timestamp = 0.0;
    };

    /**
     * @brief Chirp-direction bit detector.
     *
     * A rising instantaneous frequency (positive mean phase step) reads as 0,
     * anything else as 1.
     */
    class CommunicationProcessor {
    public:
        explicit CommunicationProcessor(size_t min_samples = 100) : _min_samples(min_samples) {}

        std::optional<CommDecision> process(const AlignedVector& block) const {
            return process(block.data(), block.size());
        }

        std::optional<CommDecision> process(const std::complex<float>* data, size_t n) const {
            if (n < _min_samples || n < 2) {
                return std::nullopt;
            }

            std::vector<float> phase(n);
            for (size_t i = 0; i < n; ++i) {
                phase[i] = std::arg(data[i]);
            }
            unwrap(phase);

            double sum = 0.0;
            for (size_t i = 1; i < n; ++i) {
                sum += static_cast<double>(phase[i]) - static_cast<double>(phase[i - 1]);
            }

            CommDecision decision;
            decision.mean_phase_step = sum / static_cast<double>(n - 1);
            decision.bits.push_back(decision.mean_phase_step > 0.0 ? 0 : 1);
            decision.num_bits = decision.bits.size();
            decision.timestamp = unix_timestamp();
            return decision;
        }

    private:
        size_t _min_samples;
    };

} // namespace Core
} // namespace ChirpISAC

#endif // COMM_PROCESSOR_CORE_HPP
