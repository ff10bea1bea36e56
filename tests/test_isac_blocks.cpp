/**
 * ISAC Block Tests
 *
 * Source streaming and mode scheduling, receive processor results and ring
 * bounds, and the flow graph driving both.
 */

#include <Common.hpp>
#include <ISACBlocks.hpp>
#include <FlowGraph.hpp>

#include <iostream>
#include <vector>
#include <atomic>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <filesystem>

using namespace ChirpISAC;
using namespace ChirpISAC::Core;
namespace fs = std::filesystem;

static Config radarConfig() {
    Config cfg;
    cfg.mode = "radar";
    return cfg;
}

// Test 1: work() streams one chirp at a time
bool testSourceStreaming() {
    std::cout << "Test 1: Source streams whole chirps... ";
    ChirpISACSource source(radarConfig());
    AlignedVector buf(5000);

    const size_t a = source.work(buf.data(), 1000);
    const size_t b = source.work(buf.data(), 5000);   // Remainder of the first chirp only
    const size_t c = source.work(buf.data(), 5000);   // Starts the second chirp
    const bool ok = a == 1000 && b == 2000 && c == 3000 &&
                    source.get_stats().chirps_generated == 2 &&
                    source.work(buf.data(), 0) == 0;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 2: Radar mode steps through the scan angles
bool testRadarScan() {
    std::cout << "Test 2: Radar mode beam scanning... ";
    Config cfg = radarConfig();
    ChirpISACSource source(cfg);
    std::vector<double> angles;
    source.set_beam_steer_callback([&angles](double tx, double rx) {
        if (tx == rx) angles.push_back(tx);
    });

    for (size_t i = 0; i < cfg.scan_angles.size() + 1; ++i) {
        ChirpSignal c = source.generate_next_chirp();
        if (c.params.direction != Direction::Up) {
            std::cout << "FAILED (radar chirp direction)\n";
            return false;
        }
    }
    SourceStats st = source.get_stats();
    const bool ok = angles.size() == cfg.scan_angles.size() + 1 &&
                    angles.front() == -45.0 && angles[9] == 45.0 && angles[10] == -45.0 &&
                    st.beam_scans == 11 && st.tx_beam_angle == -45.0;

    Config fixed = radarConfig();
    fixed.scan_enabled = false;
    ChirpISACSource still(fixed);
    bool steered = false;
    still.set_beam_steer_callback([&steered](double, double) { steered = true; });
    still.generate_next_chirp();

    std::cout << (ok && !steered ? "OK\n" : "FAILED\n");
    return ok && !steered;
}

// Test 3: Communication mode consumes queued bits
bool testCommQueue() {
    std::cout << "Test 3: Communication mode bit queue... ";
    Config cfg;
    cfg.mode = "communication";
    ChirpISACSource source(cfg);
    source.add_data_to_send({0, 1});

    bool ok = source.pending_bits() == 2;
    ChirpSignal first = source.generate_next_chirp();
    ChirpSignal second = source.generate_next_chirp();
    ChirpSignal idle = source.generate_next_chirp();
    ok = ok && first.params.direction == Direction::Up &&
         second.params.direction == Direction::Down &&
         idle.params.direction == Direction::Up &&
         source.pending_bits() == 0 && source.get_stats().data_bits_sent == 2;

    Config phase = cfg;
    phase.encoding = "phase";
    ChirpISACSource phased(phase);
    phased.add_data_to_send({1});
    ok = ok && std::abs(phased.generate_next_chirp().params.phase_offset - M_PI) < 1e-12;

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 4: Hybrid mode follows the duty cycle of the injected clock
bool testHybridSchedule() {
    std::cout << "Test 4: Hybrid duty cycle... ";
    Config cfg;
    cfg.mode = "hybrid";
    double now = 0.0;
    ChirpISACSource source(cfg, [&now] { return now; });
    source.add_data_to_send({1, 1, 1});

    now = 0.01;   // 10% into the cycle: radar
    source.generate_next_chirp();
    SourceStats a = source.get_stats();

    now = 0.085;  // 85%: communication
    ChirpSignal comm = source.generate_next_chirp();
    SourceStats b = source.get_stats();

    now = 0.165;  // Second cycle, 65%: radar again
    source.generate_next_chirp();
    SourceStats c = source.get_stats();

    const bool ok = a.beam_scans == 1 && a.data_bits_sent == 0 &&
                    b.beam_scans == 1 && b.data_bits_sent == 1 &&
                    comm.params.direction == Direction::Down &&
                    c.beam_scans == 2 && c.data_bits_sent == 1 &&
                    source.pending_bits() == 2 &&
                    std::abs(c.runtime - 0.165) < 1e-12;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 5: Mode changes and manual beam control
bool testModeAndBeam() {
    std::cout << "Test 5: Mode switching and beam angles... ";
    ChirpISACSource source(radarConfig());
    bool ok = source.mode() == IsacMode::Radar;
    source.set_mode("communication");
    ok = ok && source.mode() == IsacMode::Communication;

    bool rejected = false;
    try {
        source.set_mode("sonar");
    } catch (const InvalidParameter&) {
        rejected = true;
    }
    ok = ok && rejected && source.mode() == IsacMode::Communication;

    source.set_beam_angle(12.0);
    SourceStats a = source.get_stats();
    source.set_beam_angle(5.0, -5.0);
    SourceStats b = source.get_stats();
    ok = ok && a.tx_beam_angle == 12.0 && a.rx_beam_angle == 12.0 &&
         b.tx_beam_angle == 5.0 && b.rx_beam_angle == -5.0;

    Config bad = radarConfig();
    bad.hybrid_cycle_time = 0.0;
    bool bad_cycle = false;
    try {
        ChirpISACSource s(bad);
    } catch (const InvalidParameter&) {
        bad_cycle = true;
    }

    std::cout << (ok && bad_cycle ? "OK\n" : "FAILED\n");
    return ok && bad_cycle;
}

// Test 6: Processor results, passthrough and bounded history
bool testProcessor() {
    std::cout << "Test 6: Receive processor... ";
    Config cfg;
    ChirpISACProcessor proc(cfg);
    ChirpGenerator gen(cfg);
    ChirpSignal down = gen.generate_linear_chirp(Direction::Down);

    AlignedVector out(down.samples.size());
    const size_t n = proc.work(down.samples.data(), out.data(), down.samples.size());
    auto radar = proc.get_latest_results(ResultType::Radar);
    auto comm = proc.get_latest_results(ResultType::Communication);
    bool ok = n == down.samples.size() && out == down.samples &&
              radar.size() == 1 && radar[0].radar && !radar[0].comm &&
              comm.size() == 1 && comm[0].comm && comm[0].comm->bits[0] == 1 &&
              proc.get_latest_results().size() == 2 &&
              proc.buffered_samples() == down.samples.size();

    // Short blocks pass through without results
    AlignedVector tiny(50, std::complex<float>(1.0f, 0.0f));
    AlignedVector tiny_out(50);
    proc.work(tiny.data(), tiny_out.data(), tiny.size());
    ok = ok && tiny_out == tiny && proc.get_latest_results().size() == 2;

    // 600 blocks x 2 results overflow the result ring; 60000 samples overflow the input ring
    AlignedVector block(down.samples.begin(), down.samples.begin() + 100);
    AlignedVector block_out(100);
    for (int i = 0; i < 600; ++i) {
        proc.work(block.data(), block_out.data(), block.size());
    }
    ok = ok && proc.get_latest_results().size() == ChirpISACProcessor::RESULT_HISTORY &&
         proc.buffered_samples() == ChirpISACProcessor::INPUT_HISTORY &&
         proc.input_history().back() == block.back();

    Config radar_only;
    radar_only.processing_mode = "radar";
    ChirpISACProcessor rproc(radar_only);
    rproc.work(down.samples.data(), out.data(), down.samples.size());
    ok = ok && rproc.get_latest_results(ResultType::Communication).empty() &&
         rproc.get_latest_results(ResultType::Radar).size() == 1;

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 7: Flow graph carries bits from source to processor
bool testFlowGraphIterations() {
    std::cout << "Test 7: Flow graph bit transfer... ";
    Config cfg;
    cfg.mode = "communication";
    ChirpISACSource source(cfg);
    ChirpISACProcessor proc(cfg);
    const BitVector bits = {1, 0, 0, 1, 0, 1};
    source.add_data_to_send(bits);

    const fs::path sink = fs::temp_directory_path() / "chirpisac_flowgraph_sink.fc32";
    FlowGraph::Params params;
    params.block_size = cfg.samples_per_chirp();
    params.sink_path = sink.string();

    bool ok = true;
    {
        FlowGraph graph(source, proc, params);
        const size_t total = graph.run_iterations(bits.size());
        ok = total == bits.size() * cfg.samples_per_chirp() &&
             graph.samples_processed() == total;
    }
    auto comm = proc.get_latest_results(ResultType::Communication);
    ok = ok && comm.size() == bits.size();
    for (size_t i = 0; ok && i < bits.size(); ++i) {
        ok = comm[i].comm->bits[0] == bits[i];
    }
    ok = ok && fs::file_size(sink) == bits.size() * cfg.samples_per_chirp() * sizeof(std::complex<float>);
    fs::remove(sink);

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 8: Threaded run, state checks and error propagation
class FailingSource : public SourceBlock {
public:
    size_t work(std::complex<float>*, size_t) override {
        throw std::runtime_error("source failure");
    }
    std::string name() const override { return "failing_source"; }
};

bool testFlowGraphThreaded() {
    std::cout << "Test 8: Threaded flow graph... ";
    Config cfg = radarConfig();
    ChirpISACSource source(cfg);
    ChirpISACProcessor proc(cfg);

    FlowGraph::Params params;
    params.block_size = cfg.samples_per_chirp();
    FlowGraph graph(source, proc, params);
    graph.start();
    bool busy_rejected = false;
    try {
        graph.run_iterations(1);
    } catch (const std::logic_error&) {
        busy_rejected = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    graph.stop();
    bool ok = busy_rejected && !graph.running() && graph.samples_processed() > 0 &&
              !proc.get_latest_results(ResultType::Radar).empty();

    FailingSource failing;
    FlowGraph broken(failing, proc, params);
    broken.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    bool rethrown = false;
    try {
        broken.stop();
    } catch (const std::runtime_error&) {
        rethrown = true;
    }
    ok = ok && rethrown;

    FlowGraph::Params bad_sink = params;
    bad_sink.sink_path = "/nonexistent_dir/for/sure/sink.fc32";
    bool sink_rejected = false;
    try {
        FlowGraph g(source, proc, bad_sink);
    } catch (const std::runtime_error&) {
        sink_rejected = true;
    }
    ok = ok && sink_rejected;

    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 9: The steering callback may call back into the source
bool testSteerCallbackReentry() {
    std::cout << "Test 9: Steering callback re-entry... ";
    Config cfg = radarConfig();
    ChirpISACSource source(cfg);
    std::vector<double> seen;
    source.set_beam_steer_callback([&source, &seen](double tx, double) {
        SourceStats st = source.get_stats();
        if (st.tx_beam_angle == tx && source.mode() == IsacMode::Radar) seen.push_back(tx);
    });

    source.generate_next_chirp();
    AlignedVector buf(cfg.samples_per_chirp());
    source.work(buf.data(), buf.size());
    source.set_beam_angle(7.5);

    const bool ok = seen.size() == 3 && seen[0] == cfg.scan_angles[0] &&
                    seen[1] == cfg.scan_angles[1] && seen[2] == 7.5;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 10: Printing statistics leaves the stream formatting untouched
bool testPrintStatsKeepsFormat() {
    std::cout << "Test 10: Statistics printing keeps stream format... ";
    ChirpISACSource source(radarConfig());
    const std::ios::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();
    source.print_stats();
    const bool ok = std::cout.flags() == flags && std::cout.precision() == precision;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

// Test 11: A restarted throttled graph paces from its own start
bool testThrottledRestart() {
    std::cout << "Test 11: Throttled graph restart... ";
    Config cfg = radarConfig();
    cfg.processing_mode = "communication";
    ChirpISACSource source(cfg);
    ChirpISACProcessor proc(cfg);

    FlowGraph::Params params;
    params.block_size = cfg.samples_per_chirp();
    params.throttle_rate = 1e6;   // One 3000-sample block every 3 ms
    FlowGraph graph(source, proc, params);

    graph.run_for(std::chrono::milliseconds(100));
    const size_t first = graph.samples_processed();

    graph.run_for(std::chrono::milliseconds(100));
    const size_t second = graph.samples_processed() - first;

    const bool ok = first >= 10 * params.block_size && second >= 10 * params.block_size;
    std::cout << (ok ? "OK\n" : "FAILED\n");
    return ok;
}

int main() {
    std::cout << "\n=== ISAC Block Tests ===\n\n";

    int passed = 0, failed = 0;

    if (testSourceStreaming()) passed++; else failed++;
    if (testRadarScan()) passed++; else failed++;
    if (testCommQueue()) passed++; else failed++;
    if (testHybridSchedule()) passed++; else failed++;
    if (testModeAndBeam()) passed++; else failed++;
    if (testProcessor()) passed++; else failed++;
    if (testFlowGraphIterations()) passed++; else failed++;
    if (testFlowGraphThreaded()) passed++; else failed++;
    if (testSteerCallbackReentry()) passed++; else failed++;
    if (testPrintStatsKeepsFormat()) passed++; else failed++;
    if (testThrottledRestart()) passed++; else failed++;

    std::cout << "\n=== Results: " << passed << " passed, " << failed << " failed ===\n\n";

    return failed > 0 ? 1 : 0;
}
