#ifndef ISAC_BLOCKS_HPP
#define ISAC_BLOCKS_HPP

#include <vector>
#include <complex>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>
#include <utility>
#include <iostream>
#include <iomanip>
#include <boost/circular_buffer.hpp>
#include <Common.hpp>
#include <ChirpGeneratorCore.hpp>
#include <RadarProcessorCore.hpp>
#include <CommProcessorCore.hpp>

namespace ChirpISAC {
namespace Core {

    /**
     * @brief Block that only produces samples.
     *
     * work() writes at most n samples and returns how many it wrote.
     */
    class SourceBlock {
    public:
        virtual ~SourceBlock() = default;
        virtual size_t work(std::complex<float>* out, size_t n) = 0;
        virtual std::string name() const = 0;
    };

    /**
     * @brief Block that consumes and produces at the same rate.
     */
    class SyncBlock {
    public:
        virtual ~SyncBlock() = default;
        virtual size_t work(const std::complex<float>* in, std::complex<float>* out, size_t n) = 0;
        virtual std::string name() const = 0;
    };

    struct SourceStats {
        size_t chirps_generated = 0;
        size_t data_bits_sent = 0;
        size_t beam_scans = 0;
        double runtime = 0.0;      // Seconds since construction
        double chirp_rate = 0.0;   // Chirps per second
        double data_rate = 0.0;    // Bits per second
        IsacMode mode = IsacMode::Hybrid;
        double tx_beam_angle = 0.0;
        double rx_beam_angle = 0.0;
    };

    /**
     * @brief ISAC Chirp Source
     *
     * Emits a continuous stream of chirps:
     * - radar: up-chirps, stepping the beam through the scan angles
     * - communication: one queued bit per chirp, idle up-chirp when the queue is empty
     * - hybrid: radar for the first radar_duty_cycle of each cycle, communication after
     */
    class ChirpISACSource : public SourceBlock {
    public:
        using BeamSteerCallback = std::function<void(double tx_angle, double rx_angle)>;
        using Clock = std::function<double()>;  // Seconds since the source started

        explicit ChirpISACSource(const Config& cfg, Clock clock = Clock())
            : _generator(cfg),
              _mode(parse_isac_mode(cfg.mode)),
              _encoding(parse_encoding(cfg.encoding)),
              _scan_enabled(cfg.scan_enabled),
              _scan_angles(cfg.scan_angles),
              _radar_duty_cycle(cfg.radar_duty_cycle),
              _cycle_time(cfg.hybrid_cycle_time),
              _start(std::chrono::steady_clock::now()),
              _clock(std::move(clock))
        {
            if (_cycle_time <= 0.0) {
                throw InvalidParameter("Hybrid cycle time must be positive");
            }
            if (!_clock) {
                _clock = [start = _start]() {
                    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
                };
            }
        }

        std::string name() const override { return "chirp_isac_source"; }

        void set_mode(const std::string& mode) {
            IsacMode m = parse_isac_mode(mode);
            std::lock_guard<std::mutex> lock(_mutex);
            _mode = m;
            std::cout << "ISAC source mode: " << mode << std::endl;
        }

        IsacMode mode() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _mode;
        }

        void add_data_to_send(const BitVector& bits) {
            std::lock_guard<std::mutex> lock(_mutex);
            _data_buffer.insert(_data_buffer.end(), bits.begin(), bits.end());
        }

        size_t pending_bits() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _data_buffer.size();
        }

        /**
         * @brief Point the beams; RX follows TX when no RX angle is given.
         */
        void set_beam_angle(double tx_angle, std::optional<double> rx_angle = std::nullopt) {
            std::optional<SteerRequest> steer;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _set_beam_angle(tx_angle, rx_angle.value_or(tx_angle));
                steer = _take_steer();
            }
            _dispatch(steer);
        }

        // Invoked on every beam change, e.g. to drive a BeamController.
        // Runs without the source lock held, so it may call back into the source.
        void set_beam_steer_callback(BeamSteerCallback cb) {
            std::lock_guard<std::mutex> lock(_mutex);
            _steer = std::move(cb);
        }

        ChirpSignal generate_next_chirp() {
            std::optional<SteerRequest> steer;
            ChirpSignal chirp;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                chirp = _generate_next_chirp();
                steer = _take_steer();
            }
            _dispatch(steer);
            return chirp;
        }

        /**
         * @brief Stream the current chirp, starting a new one when it is exhausted.
         *
         * Returns at most the remainder of the current chirp, so one call never
         * spans two chirps.
         */
        size_t work(std::complex<float>* out, size_t n) override {
            if (n == 0) return 0;
            std::optional<SteerRequest> steer;
            size_t count = 0;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                if (_current.empty() || _position >= _current.size()) {
                    _current = _generate_next_chirp().samples;
                    _position = 0;
                    _stats.chirps_generated++;
                    steer = _take_steer();
                }
                count = std::min(n, _current.size() - _position);
                std::copy(_current.begin() + _position, _current.begin() + _position + count, out);
                _position += count;
            }
            _dispatch(steer);
            return count;
        }

        SourceStats get_stats() const {
            std::lock_guard<std::mutex> lock(_mutex);
            SourceStats s = _stats;
            s.runtime = _clock();
            s.chirp_rate = s.runtime > 0.0 ? static_cast<double>(s.chirps_generated) / s.runtime : 0.0;
            s.data_rate = s.runtime > 0.0 ? static_cast<double>(s.data_bits_sent) / s.runtime : 0.0;
            s.mode = _mode;
            return s;
        }

        void print_stats() const {
            SourceStats s = get_stats();
            const std::ios::fmtflags flags = std::cout.flags();
            const std::streamsize precision = std::cout.precision();
            std::cout << "=== ChirpISAC Source Statistics ===" << std::endl
                      << "  Mode:             " << to_string(s.mode) << std::endl
                      << "  Runtime:          " << std::fixed << std::setprecision(2) << s.runtime << " s" << std::endl
                      << "  Chirps generated: " << s.chirps_generated << std::endl
                      << "  Data bits sent:   " << s.data_bits_sent << std::endl
                      << "  Beam scans:       " << s.beam_scans << std::endl
                      << "  Chirp rate:       " << s.chirp_rate << " chirps/s" << std::endl
                      << "  Data rate:        " << s.data_rate << " bit/s" << std::endl
                      << "  Beam angle:       TX " << s.tx_beam_angle << " deg, RX " << s.rx_beam_angle << " deg" << std::endl;
            std::cout.flags(flags);
            std::cout.precision(precision);
        }

    private:
        struct SteerRequest {
            BeamSteerCallback callback;
            double tx;
            double rx;
        };

        ChirpGenerator _generator;
        IsacMode _mode;
        Encoding _encoding;
        bool _scan_enabled;
        std::vector<double> _scan_angles;
        double _radar_duty_cycle;
        double _cycle_time;
        std::chrono::steady_clock::time_point _start;
        Clock _clock;
        BeamSteerCallback _steer;

        std::deque<uint8_t> _data_buffer;
        AlignedVector _current;
        size_t _position = 0;
        size_t _radar_index = 0;
        std::optional<std::pair<double, double>> _pending_steer;   // Latest beam change not yet reported
        SourceStats _stats;
        mutable std::mutex _mutex;

        // Caller holds _mutex; the callback is deferred until the lock is released
        void _set_beam_angle(double tx, double rx) {
            _stats.tx_beam_angle = tx;
            _stats.rx_beam_angle = rx;
            _pending_steer = std::make_pair(tx, rx);
        }

        std::optional<SteerRequest> _take_steer() {
            std::optional<SteerRequest> req;
            if (_pending_steer && _steer) {
                req = SteerRequest{_steer, _pending_steer->first, _pending_steer->second};
            }
            _pending_steer.reset();
            return req;
        }

        static void _dispatch(const std::optional<SteerRequest>& req) {
            if (req) req->callback(req->tx, req->rx);
        }

        ChirpSignal _generate_next_chirp() {
            switch (_mode) {
            case IsacMode::Radar:
                return _generate_radar_chirp();
            case IsacMode::Communication:
                return _generate_comm_chirp();
            case IsacMode::Hybrid: {
                const double phase = std::fmod(_clock(), _cycle_time) / _cycle_time;
                return phase < _radar_duty_cycle ? _generate_radar_chirp() : _generate_comm_chirp();
            }
            }
            return _generator.generate_linear_chirp();
        }

        ChirpSignal _generate_radar_chirp() {
            if (_scan_enabled && !_scan_angles.empty()) {
                const double angle = _scan_angles[_radar_index % _scan_angles.size()];
                _set_beam_angle(angle, angle);
            }
            _radar_index++;
            _stats.beam_scans++;
            return _generator.generate_linear_chirp(Direction::Up);
        }

        ChirpSignal _generate_comm_chirp() {
            if (_data_buffer.empty()) {
                return _generator.generate_linear_chirp(Direction::Up);
            }
            const uint8_t bit = _data_buffer.front();
            _data_buffer.pop_front();
            _stats.data_bits_sent++;

            if (_encoding == Encoding::Direction) {
                return _generator.generate_linear_chirp(bit == 0 ? Direction::Up : Direction::Down);
            }
            EncodedChirps encoded = _generator.encode_data_in_chirp(BitVector{bit}, _encoding);
            return std::move(encoded.chirps.front());
        }
    };

    enum class ResultType { Radar, Communication };

    struct ProcessingResult {
        ResultType type;
        std::optional<RadarDetection> radar;
        std::optional<CommDecision> comm;
    };

    /**
     * @brief ISAC Receive Processor
     *
     * Passes samples through unchanged while running the radar and/or
     * communication processors on each input block. Keeps the most recent
     * input samples and results in bounded ring buffers.
     */
    class ChirpISACProcessor : public SyncBlock {
    public:
        static constexpr size_t INPUT_HISTORY = 10000;
        static constexpr size_t RESULT_HISTORY = 1000;

        explicit ChirpISACProcessor(const Config& cfg)
            : _mode(parse_processing_mode(cfg.processing_mode)),
              _radar(cfg),
              _comm(),
              _input_buffer(INPUT_HISTORY),
              _results(RESULT_HISTORY)
        {}

        std::string name() const override { return "chirp_isac_processor"; }

        ProcessingMode mode() const { return _mode; }

        size_t work(const std::complex<float>* in, std::complex<float>* out, size_t n) override {
            std::optional<RadarDetection> radar;
            std::optional<CommDecision> comm;
            if (_mode == ProcessingMode::Radar || _mode == ProcessingMode::Both) {
                radar = _radar.process(in, n);
            }
            if (_mode == ProcessingMode::Communication || _mode == ProcessingMode::Both) {
                comm = _comm.process(in, n);
            }

            {
                std::lock_guard<std::mutex> lock(_mutex);
                for (size_t i = 0; i < n; ++i) _input_buffer.push_back(in[i]);
                if (radar) _results.push_back(ProcessingResult{ResultType::Radar, std::move(radar), std::nullopt});
                if (comm) _results.push_back(ProcessingResult{ResultType::Communication, std::nullopt, std::move(comm)});
            }

            if (out != in) std::copy(in, in + n, out);
            return n;
        }

        /**
         * @brief Snapshot of buffered results, oldest first, optionally filtered by type.
         */
        std::vector<ProcessingResult> get_latest_results(std::optional<ResultType> type = std::nullopt) const {
            std::lock_guard<std::mutex> lock(_mutex);
            std::vector<ProcessingResult> out;
            for (const auto& r : _results) {
                if (!type || r.type == *type) out.push_back(r);
            }
            return out;
        }

        size_t buffered_samples() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _input_buffer.size();
        }

        AlignedVector input_history() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return AlignedVector(_input_buffer.begin(), _input_buffer.end());
        }

    private:
        ProcessingMode _mode;
        RadarProcessor _radar;
        CommunicationProcessor _comm;
        boost::circular_buffer<std::complex<float>> _input_buffer;
        boost::circular_buffer<ProcessingResult> _results;
        mutable std::mutex _mutex;
    };

} // namespace Core
} // namespace ChirpISAC

#endif // ISAC_BLOCKS_HPP
