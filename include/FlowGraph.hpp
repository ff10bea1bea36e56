#ifndef FLOW_GRAPH_HPP
#define FLOW_GRAPH_HPP

#include <atomic>
#include <thread>
#include <mutex>
#include <chrono>
#include <fstream>
#include <string>
#include <exception>
#include <iostream>
#include <Common.hpp>
#include <ISACBlocks.hpp>

namespace ChirpISAC {
namespace Core {

    /**
     * @brief Linear source -> processor (-> file sink) pipeline.
     *
     * Blocks run on one worker thread. The optional sink writes the processor
     * output as raw interleaved fc32. An optional throttle holds the stream to
     * a nominal sample rate.
     */
    class FlowGraph {
    public:
        struct Params {
            size_t block_size = 4096;
            std::string sink_path = "";   // Empty disables the file sink
            double throttle_rate = 0.0;   // Samples per second, 0 = free-running
        };

        FlowGraph(SourceBlock& source, SyncBlock& processor, const Params& params)
            : _source(source),
              _processor(processor),
              _params(params),
              _in(params.block_size),
              _out(params.block_size)
        {
            if (_params.block_size == 0) {
                throw InvalidParameter("Flow graph block size must be positive");
            }
            if (!_params.sink_path.empty()) {
                _sink.open(_params.sink_path, std::ios::binary | std::ios::trunc);
                if (!_sink) {
                    throw std::runtime_error("Cannot open sink file: " + _params.sink_path);
                }
            }
        }

        ~FlowGraph() {
            _running.store(false);
            if (_worker.joinable()) _worker.join();
        }

        FlowGraph(const FlowGraph&) = delete;
        FlowGraph& operator=(const FlowGraph&) = delete;

        void start() {
            if (_running.load()) return;
            if (_worker.joinable()) _worker.join();   // Worker that exited on an error
            _error = nullptr;
            _running.store(true);
            _worker = std::thread(&FlowGraph::_run, this);
        }

        /**
         * @brief Stop the worker and rethrow any exception it raised.
         */
        void stop() {
            _running.store(false);
            if (_worker.joinable()) _worker.join();
            if (_error) {
                std::exception_ptr e = _error;
                _error = nullptr;
                std::rethrow_exception(e);
            }
        }

        bool running() const { return _running.load(); }

        void run_for(std::chrono::milliseconds duration) {
            start();
            std::this_thread::sleep_for(duration);
            stop();
        }

        // Synchronous execution on the calling thread; returns samples processed
        size_t run_iterations(size_t iterations) {
            if (_running.load()) {
                throw std::logic_error("Flow graph is already running");
            }
            size_t total = 0;
            for (size_t i = 0; i < iterations; ++i) {
                total += _iterate();
            }
            return total;
        }

        size_t samples_processed() const { return _samples.load(); }

    private:
        SourceBlock& _source;
        SyncBlock& _processor;
        Params _params;
        AlignedVector _in;
        AlignedVector _out;
        std::ofstream _sink;
        std::thread _worker;
        std::atomic<bool> _running{false};
        std::atomic<size_t> _samples{0};
        std::exception_ptr _error;

        size_t _iterate() {
            const size_t produced = _source.work(_in.data(), _params.block_size);
            if (produced == 0) return 0;
            const size_t consumed = _processor.work(_in.data(), _out.data(), produced);
            if (_sink.is_open()) {
                _sink.write(reinterpret_cast<const char*>(_out.data()),
                            static_cast<std::streamsize>(consumed * sizeof(std::complex<float>)));
                if (!_sink) {
                    throw std::runtime_error("Write to sink file failed: " + _params.sink_path);
                }
            }
            _samples.fetch_add(consumed);
            return consumed;
        }

        void _run() {
            const auto start = std::chrono::steady_clock::now();
            const size_t baseline = _samples.load();   // Throttle counts this run only
            try {
                while (_running.load(std::memory_order_relaxed)) {
                    _iterate();
                    if (_params.throttle_rate > 0.0) {
                        const auto due = start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                            std::chrono::duration<double>(static_cast<double>(_samples.load() - baseline) / _params.throttle_rate));
                        std::this_thread::sleep_until(due);
                    }
                }
            } catch (const std::exception& e) {
                std::cerr << "Flow graph stopped: " << e.what() << std::endl;
                _error = std::current_exception();
                _running.store(false);
            }
            if (_sink.is_open()) _sink.flush();
        }
    };

} // namespace Core
} // namespace ChirpISAC

#endif // FLOW_GRAPH_HPP
