#ifndef SIGNAL_IO_HPP
#define SIGNAL_IO_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <Common.hpp>
#include <ChirpGeneratorCore.hpp>

namespace ChirpISAC {
namespace IO {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    inline json params_to_json(const Core::ChirpParams& p) {
        json j;
        j["type"] = to_string(p.shape);
        j["direction"] = to_string(p.direction);
        j["duration"] = p.duration;
        j["bandwidth"] = p.bandwidth;
        j["start_freq"] = p.start_freq;
        j["stop_freq"] = p.stop_freq;
        j["sample_rate"] = p.sample_rate;
        j["samples"] = p.samples;
        j["chirp_rate"] = p.chirp_rate;
        if (p.shape != ChirpShape::Linear) j["alpha"] = p.alpha;
        if (p.phase_offset != 0.0) j["phase_offset"] = p.phase_offset;
        return j;
    }

    inline Core::ChirpParams params_from_json(const json& j) {
        Core::ChirpParams p;
        const std::string type = j.value("type", std::string("linear"));
        p.shape = type == "linear" ? ChirpShape::Linear : parse_chirp_type(type);
        p.direction = parse_direction(j.value("direction", std::string("up")));
        p.duration = j.value("duration", 0.0);
        p.bandwidth = j.value("bandwidth", 0.0);
        p.start_freq = j.value("start_freq", 0.0);
        p.stop_freq = j.value("stop_freq", 0.0);
        p.sample_rate = j.value("sample_rate", 0.0);
        p.samples = j.value("samples", static_cast<size_t>(0));
        p.chirp_rate = j.value("chirp_rate", 0.0);
        p.alpha = j.value("alpha", 0.0);
        p.phase_offset = j.value("phase_offset", 0.0);
        return p;
    }

    inline json complex_to_json(const AlignedVector& x) {
        std::vector<float> re(x.size()), im(x.size());
        for (size_t i = 0; i < x.size(); ++i) {
            re[i] = x[i].real();
            im[i] = x[i].imag();
        }
        return json{{"real", re}, {"imag", im}};
    }

    inline AlignedVector complex_from_json(const json& j) {
        const auto re = j.at("real").get<std::vector<float>>();
        const auto im = j.at("imag").get<std::vector<float>>();
        if (re.size() != im.size()) {
            throw std::runtime_error("Mismatched real/imag array lengths");
        }
        AlignedVector x(re.size());
        for (size_t i = 0; i < re.size(); ++i) x[i] = {re[i], im[i]};
        return x;
    }

    /**
     * @brief Write a complex64 array in NumPy .npy (format 1.0) layout.
     */
    inline void write_npy(const fs::path& path, const AlignedVector& x) {
        std::ostringstream hdr;
        hdr << "{'descr': '<c8', 'fortran_order': False, 'shape': (" << x.size() << ",), }";
        std::string header = hdr.str();
        // magic(6) + version(2) + length(2) + header, padded to 64 bytes, newline-terminated
        const size_t preamble = 10;
        const size_t total = ((preamble + header.size() + 1 + 63) / 64) * 64;
        header.append(total - preamble - header.size() - 1, ' ');
        header.push_back('\n');

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot open " + path.string() + " for writing");
        const char magic[] = {'\x93', 'N', 'U', 'M', 'P', 'Y', 1, 0};
        out.write(magic, sizeof(magic));
        const uint16_t hlen = static_cast<uint16_t>(header.size());
        const char len_bytes[2] = {static_cast<char>(hlen & 0xFF), static_cast<char>(hlen >> 8)};
        out.write(len_bytes, 2);
        out.write(header.data(), static_cast<std::streamsize>(header.size()));
        out.write(reinterpret_cast<const char*>(x.data()),
                  static_cast<std::streamsize>(x.size() * sizeof(std::complex<float>)));
        if (!out) throw std::runtime_error("Write failed: " + path.string());
    }

    inline void write_fc32(const fs::path& path, const AlignedVector& x) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot open " + path.string() + " for writing");
        out.write(reinterpret_cast<const char*>(x.data()),
                  static_cast<std::streamsize>(x.size() * sizeof(std::complex<float>)));
        if (!out) throw std::runtime_error("Write failed: " + path.string());
    }

    inline std::string default_signal_name() {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return "chirp_signal_" + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    /**
     * @brief Persist a chirp under `data_dir` as `<name>.<format>`.
     *
     * npy holds the complex samples only. json also carries the windowed copy,
     * time axis, frequency trace and parameters. bin is raw interleaved fc32.
     * The directory is created if missing.
     *
     * @return Path of the written file
     */
    inline fs::path save_signal(const Core::ChirpSignal& chirp, const std::string& data_dir,
                                std::string name, SaveFormat format) {
        if (name.empty()) name = default_signal_name();
        fs::create_directories(data_dir);
        const fs::path path = fs::path(data_dir) / (name + "." + to_string(format));

        switch (format) {
        case SaveFormat::Npy:
            write_npy(path, chirp.samples);
            break;
        case SaveFormat::Bin:
            write_fc32(path, chirp.samples);
            break;
        case SaveFormat::Json: {
            json j;
            j["signal"] = complex_to_json(chirp.samples);
            j["windowed_signal"] = complex_to_json(chirp.windowed);
            j["time"] = chirp.time;
            j["instantaneous_freq"] = chirp.instantaneous_freq;
            j["parameters"] = params_to_json(chirp.params);
            std::ofstream out(path, std::ios::trunc);
            if (!out) throw std::runtime_error("Cannot open " + path.string() + " for writing");
            out << j.dump(2);
            if (!out) throw std::runtime_error("Write failed: " + path.string());
            break;
        }
        }
        return path;
    }

    inline fs::path save_signal(const Core::ChirpSignal& chirp, const std::string& data_dir,
                                const std::string& name = "", const std::string& format = "npy") {
        return save_signal(chirp, data_dir, name, parse_save_format(format));
    }

    /**
     * @brief Read back a chirp written in json format.
     */
    inline Core::ChirpSignal load_signal_json(const fs::path& path) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Cannot open " + path.string());
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Invalid signal file " + path.string() + ": " + e.what());
        }

        Core::ChirpSignal chirp;
        chirp.samples = complex_from_json(j.at("signal"));
        if (j.contains("windowed_signal")) chirp.windowed = complex_from_json(j["windowed_signal"]);
        if (j.contains("time")) chirp.time = j["time"].get<std::vector<double>>();
        if (j.contains("instantaneous_freq")) chirp.instantaneous_freq = j["instantaneous_freq"].get<std::vector<double>>();
        if (j.contains("parameters")) chirp.params = params_from_json(j["parameters"]);
        return chirp;
    }

} // namespace IO
} // namespace ChirpISAC

#endif // SIGNAL_IO_HPP
