/**
 * Chirp Generator Tests
 *
 * Sample count, unit magnitude, frequency endpoints, parameter validation,
 * bit encodings and multi-chirp composition.
 */

#include <Common.hpp>
#include <ChirpGeneratorCore.hpp>

#include <iostream>
#include <cmath>

using namespace ChirpISAC;
using namespace ChirpISAC::Core;

static ChirpGenerator::Params defaultParams() {
    ChirpGenerator::Params p;
    p.sample_rate = 30e6;
    p.chirp_duration = 100e-6;
    p.bandwidth = 20e6;
    p.start_freq = 0.0;
    return p;
}

template <typename F>
static bool throwsInvalid(F&& fn) {
    try {
        fn();
    } catch (const InvalidParameter&) {
        return true;
    }
    return false;
}

// Test 1: Linear chirp length and envelope
bool testLinearChirpShape() {
    std::cout << "Test 1: Linear chirp length and magnitude... ";
    ChirpGenerator gen(defaultParams());
    ChirpSignal c = gen.generate_linear_chirp(Direction::Up);

    if (c.samples.size() != 3000 || c.windowed.size() != 3000 ||
        c.time.size() != 3000 || c.instantaneous_freq.size() != 3000) {
        std::cout << "FAILED (length " << c.samples.size() << ")\n";
        return false;
    }
    for (const auto& s : c.samples) {
        if (std::abs(std::abs(s) - 1.0f) > 1e-5f) {
            std::cout << "FAILED (|s| = " << std::abs(s) << ")\n";
            return false;
        }
    }
    // Hann-windowed copy starts at zero and peaks mid-chirp
    if (std::abs(c.windowed.front()) > 1e-6f || std::abs(c.windowed[1500]) < 0.99f) {
        std::cout << "FAILED (window)\n";
        return false;
    }
    // Non-integer T*Fs truncates
    ChirpSignal odd = gen.generate_linear_chirp(10.5e-6, 1e6, 0.0, 1e6, Direction::Up);
    if (odd.samples.size() != 10) {
        std::cout << "FAILED (truncation gives " << odd.samples.size() << ")\n";
        return false;
    }
    std::cout << "OK\n";
    return true;
}

// Test 2: Frequency endpoints for both directions
bool testFrequencyEndpoints() {
    std::cout << "Test 2: Frequency endpoints... ";
    ChirpGenerator::Params p = defaultParams();
    p.start_freq = 1e6;
    ChirpGenerator gen(p);

    ChirpSignal up = gen.generate_linear_chirp(Direction::Up);
    ChirpSignal down = gen.generate_linear_chirp(Direction::Down);
    const double T = p.chirp_duration;

    bool ok = std::abs(up.instantaneous_freq.front() - 1e6) < 1e-3 &&
              std::abs(up.params.instantaneous_frequency(T) - 21e6) < 1.0 &&
              std::abs(down.instantaneous_freq.front() - 1e6) < 1e-3 &&
              std::abs(down.params.instantaneous_frequency(T) + 19e6) < 1.0 &&
              up.params.chirp_rate > 0.0 && down.params.chirp_rate < 0.0 &&
              std::abs(up.params.chirp_rate - 2e11) < 1.0 &&
              up.params.stop_freq == 21e6 && down.params.stop_freq == -19e6;

    // Frequency trace is monotone in the sweep direction
    for (size_t i = 1; ok && i < up.instantaneous_freq.size(); ++i) {
        ok = up.instantaneous_freq[i] > up.instantaneous_freq[i - 1] &&
             down.instantaneous_freq[i] < down.instantaneous_freq[i - 1];
    }
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 3: Nonlinear chirps start at f0 and reach f0 + B
bool testNonlinearChirps() {
    std::cout << "Test 3: Nonlinear chirp endpoints... ";
    ChirpGenerator::Params p = defaultParams();
    p.start_freq = 2e6;
    ChirpGenerator gen(p);
    const double T = p.chirp_duration;

    for (const char* type : {"quadratic", "logarithmic", "exponential"}) {
        // alpha scaled to the chirp duration for log/exp shapes
        const double alpha = std::string(type) == "quadratic" ? 2.0 : 2.0 / T;
        ChirpSignal c = gen.generate_nonlinear_chirp(type, alpha);
        const double f0 = c.instantaneous_freq.front();
        const double fT = c.params.instantaneous_frequency(T);
        if (std::abs(f0 - 2e6) > 1e-3 || std::abs(fT - 22e6) / 22e6 > 1e-9 || c.samples.size() != 3000) {
            std::cout << "FAILED (" << type << ": f0 " << f0 << ", fT " << fT << ")\n";
            return false;
        }
        for (const auto& s : c.samples) {
            if (std::abs(std::abs(s) - 1.0f) > 1e-5f) {
                std::cout << "FAILED (" << type << " magnitude)\n";
                return false;
            }
        }
    }
    std::cout << "OK\n";
    return true;
}

// Test 4: Invalid parameters are rejected
bool testInvalidParameters() {
    std::cout << "Test 4: Invalid parameter rejection... ";
    ChirpGenerator gen(defaultParams());

    bool ok = throwsInvalid([&] { gen.generate_linear_chirp(0.0, 20e6, 0.0, 30e6, Direction::Up); }) &&
              throwsInvalid([&] { gen.generate_linear_chirp(-1e-6, 20e6, 0.0, 30e6, Direction::Up); }) &&
              throwsInvalid([&] { gen.generate_linear_chirp(100e-6, 20e6, 0.0, 0.0, Direction::Up); }) &&
              throwsInvalid([&] { gen.generate_linear_chirp(1e-9, 20e6, 0.0, 30e6, Direction::Up); }) &&
              throwsInvalid([&] { gen.generate_nonlinear_chirp("sinusoidal"); }) &&
              throwsInvalid([&] { gen.generate_nonlinear_chirp("quadratic", -1.0); }) &&
              throwsInvalid([&] { gen.generate_nonlinear_chirp("logarithmic", 0.0); }) &&
              throwsInvalid([&] { gen.generate_nonlinear_chirp("logarithmic", -2e4); }) &&   // 1 + alpha*T < 0
              throwsInvalid([&] { gen.generate_nonlinear_chirp("exponential", 0.0); }) &&
              throwsInvalid([&] { gen.encode_data_in_chirp({1, 0}, "amplitude"); }) &&
              throwsInvalid([&] { gen.generate_multi_chirp(0, Spacing::Equal); }) &&
              throwsInvalid([&] { gen.generate_multi_chirp(2, "log"); }) &&
              throwsInvalid([&] { ChirpGenerator::add_noise(AlignedVector(), 10.0); });

    ChirpGenerator::Params bad = defaultParams();
    bad.sample_rate = 0.0;
    ok = ok && throwsInvalid([&] { ChirpGenerator g(bad); });

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 5: Bit encodings
bool testEncodings() {
    std::cout << "Test 5: Data encodings... ";
    ChirpGenerator::Params p = defaultParams();
    ChirpGenerator gen(p);
    const BitVector bits = {0, 1, 1, 0};

    EncodedChirps dir = gen.encode_data_in_chirp(bits, Encoding::Direction);
    bool ok = dir.chirps.size() == 4 && dir.num_bits == 4 && dir.bits == bits &&
              std::abs(dir.bit_rate - 1e4) < 1e-6 &&
              dir.chirps[0].params.direction == Direction::Up &&
              dir.chirps[1].params.direction == Direction::Down;

    EncodedChirps freq = gen.encode_data_in_chirp(bits, "frequency");
    ok = ok && freq.chirps[0].params.start_freq == 0.0 && freq.chirps[1].params.start_freq == 10e6;

    EncodedChirps phase = gen.encode_data_in_chirp(bits, Encoding::Phase);
    const auto ratio = phase.chirps[1].samples[100] / phase.chirps[0].samples[100];
    ok = ok && std::abs(ratio - std::complex<float>(-1.0f, 0.0f)) < 1e-4f &&
         std::abs(phase.chirps[1].params.phase_offset - M_PI) < 1e-12;

    EncodedChirps dur = gen.encode_data_in_chirp(bits, Encoding::Duration);
    ok = ok && dur.chirps[0].samples.size() == 3000 && dur.chirps[1].samples.size() == 4500;

    // Any nonzero value is a one
    EncodedChirps loose = gen.encode_data_in_chirp({7}, Encoding::Direction);
    ok = ok && loose.chirps[0].params.direction == Direction::Down;

    EncodedChirps empty = gen.encode_data_in_chirp({}, Encoding::Direction);
    ok = ok && empty.chirps.empty() && empty.num_bits == 0;

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 6: Multi-chirp composition
bool testMultiChirp() {
    std::cout << "Test 6: Multi-chirp composition... ";
    ChirpGenerator gen(defaultParams());

    MultiChirp eq = gen.generate_multi_chirp(4, Spacing::Equal);
    bool ok = eq.num_chirps == 4 && eq.components.size() == 4 && eq.samples.size() == 3000 &&
              std::abs(eq.bandwidth_per_chirp - 5e6) < 1e-6 &&
              std::abs(eq.components[0].params.start_freq + 10e6) < 1e-6 &&
              std::abs(eq.components[3].params.start_freq - 5e6) < 1e-6 &&
              eq.components[1].params.direction == Direction::Down;

    for (size_t k = 0; ok && k < eq.samples.size(); k += 257) {
        std::complex<float> sum(0.0f, 0.0f);
        for (const auto& c : eq.components) sum += c.samples[k];
        ok = std::abs(sum - eq.samples[k]) < 1e-5f;
    }

    MultiChirp r1 = gen.generate_multi_chirp(3, Spacing::Random, 42);
    MultiChirp r2 = gen.generate_multi_chirp(3, Spacing::Random, 42);
    for (const auto& c : r1.components) {
        ok = ok && c.params.start_freq >= -10e6 && c.params.start_freq <= 10e6;
    }
    ok = ok && r1.samples == r2.samples;

    MultiChirp single = gen.generate_multi_chirp(1, "equal");
    ok = ok && single.components.size() == 1 && std::abs(single.bandwidth_per_chirp - 20e6) < 1e-6;

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 7: Analysis of a linear chirp
bool testAnalysis() {
    std::cout << "Test 7: Chirp analysis... ";
    ChirpGenerator gen(defaultParams());
    ChirpSignal c = gen.generate_linear_chirp();
    ChirpAnalysis a = gen.analyze_chirp(c);

    bool ok = a.time_domain.samples == 3000 &&
              std::abs(a.time_domain.power - 1.0) < 1e-4 &&
              std::abs(a.time_domain.amplitude_max - 1.0) < 1e-4 &&
              a.frequency_domain.frequencies.size() == 3000 &&
              std::abs(a.frequency_domain.peak_freq) <= 15e6 &&
              !a.spectrogram.empty() && a.spectrogram.frequencies.size() == 256;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

int main() {
    std::cout << "\n=== Chirp Generator Tests ===\n\n";

    int passed = 0, failed = 0;

    if (testLinearChirpShape()) passed++; else failed++;
    if (testFrequencyEndpoints()) passed++; else failed++;
    if (testNonlinearChirps()) passed++; else failed++;
    if (testInvalidParameters()) passed++; else failed++;
    if (testEncodings()) passed++; else failed++;
    if (testMultiChirp()) passed++; else failed++;
    if (testAnalysis()) passed++; else failed++;

    std::cout << "\n=== Results: " << passed << " passed, " << failed << " failed ===\n\n";

    return failed > 0 ? 1 : 0;
}
