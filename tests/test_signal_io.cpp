/**
 * Signal Persistence Tests
 *
 * JSON reload fidelity, NumPy header layout, raw fc32 output and format
 * rejection.
 */

#include <Common.hpp>
#include <ChirpGeneratorCore.hpp>
#include <SignalIO.hpp>

#include <iostream>
#include <fstream>
#include <iterator>
#include <cstring>
#include <filesystem>

using namespace ChirpISAC;
using namespace ChirpISAC::Core;
namespace fs = std::filesystem;

static fs::path testDir() {
    return fs::temp_directory_path() / "chirpisac_signal_io_test";
}

static ChirpSignal smallChirp() {
    ChirpGenerator::Params p;
    p.sample_rate = 1e6;
    p.chirp_duration = 256e-6;
    p.bandwidth = 200e3;
    p.start_freq = 10e3;
    return ChirpGenerator(p).generate_linear_chirp(Direction::Down);
}

static std::vector<char> readAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Test 1: JSON save and reload
bool testJsonRoundTrip() {
    std::cout << "Test 1: JSON save and reload... ";
    ChirpSignal c = smallChirp();
    fs::path path = IO::save_signal(c, testDir().string(), "chirp", "json");
    ChirpSignal r = IO::load_signal_json(path);

    const bool ok = path.filename() == "chirp.json" &&
                    r.samples == c.samples && r.windowed == c.windowed &&
                    r.time == c.time && r.instantaneous_freq == c.instantaneous_freq &&
                    r.params.direction == Direction::Down && r.params.shape == ChirpShape::Linear &&
                    r.params.samples == c.params.samples &&
                    r.params.start_freq == c.params.start_freq &&
                    r.params.stop_freq == c.params.stop_freq &&
                    r.params.chirp_rate == c.params.chirp_rate;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 2: NumPy header and payload
bool testNpyLayout() {
    std::cout << "Test 2: NPY header layout... ";
    ChirpSignal c = smallChirp();
    fs::path path = IO::save_signal(c, testDir().string(), "chirp", SaveFormat::Npy);
    std::vector<char> bytes = readAll(path);

    if (bytes.size() < 10 || static_cast<unsigned char>(bytes[0]) != 0x93 ||
        std::string(bytes.begin() + 1, bytes.begin() + 6) != "NUMPY" || bytes[6] != 1 || bytes[7] != 0) {
        std::cout << "FAILED (magic)\n";
        return false;
    }
    const size_t hlen = static_cast<unsigned char>(bytes[8]) | (static_cast<unsigned char>(bytes[9]) << 8);
    const size_t data_offset = 10 + hlen;
    const std::string header(bytes.begin() + 10, bytes.begin() + static_cast<long>(data_offset));

    bool ok = data_offset % 64 == 0 && header.back() == '\n' &&
              header.find("'descr': '<c8'") != std::string::npos &&
              header.find("'shape': (256,)") != std::string::npos &&
              bytes.size() == data_offset + 256 * sizeof(std::complex<float>);
    if (ok) {
        std::complex<float> first;
        std::memcpy(&first, bytes.data() + data_offset, sizeof(first));
        ok = first == c.samples[0];
    }
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 3: Raw fc32 and default naming
bool testBinAndDefaultName() {
    std::cout << "Test 3: Raw fc32 output and default name... ";
    ChirpSignal c = smallChirp();
    fs::path bin = IO::save_signal(c, testDir().string(), "raw", "bin");
    fs::path def = IO::save_signal(c, testDir().string());

    const bool ok = fs::file_size(bin) == c.samples.size() * sizeof(std::complex<float>) &&
                    def.extension() == ".npy" &&
                    def.filename().string().rfind("chirp_signal_", 0) == 0;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 4: Unsupported formats and unreadable files
bool testRejections() {
    std::cout << "Test 4: Rejected formats and bad input... ";
    ChirpSignal c = smallChirp();
    bool ok = false;
    try {
        IO::save_signal(c, testDir().string(), "chirp", "mat");
    } catch (const InvalidParameter&) {
        ok = true;
    }

    const fs::path garbage = testDir() / "garbage.json";
    {
        std::ofstream f(garbage);
        f << "{ not json";
    }
    bool parse_rejected = false;
    try {
        IO::load_signal_json(garbage);
    } catch (const std::runtime_error&) {
        parse_rejected = true;
    }
    bool missing_rejected = false;
    try {
        IO::load_signal_json(testDir() / "missing.json");
    } catch (const std::runtime_error&) {
        missing_rejected = true;
    }

    ok = ok && parse_rejected && missing_rejected && !fs::exists(testDir() / "chirp.mat");
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

int main() {
    std::cout << "\n=== Signal Persistence Tests ===\n\n";

    int passed = 0, failed = 0;

    if (testJsonRoundTrip()) passed++; else failed++;
    if (testNpyLayout()) passed++; else failed++;
    if (testBinAndDefaultName()) passed++; else failed++;
    if (testRejections()) passed++; else failed++;

    std::error_code ec;
    fs::remove_all(testDir(), ec);

    std::cout << "\n=== Results: " << passed << " passed, " << failed << " failed ===\n\n";

    return failed > 0 ? 1 : 0;
}
