#ifndef UHD_RADIO_DEVICE_HPP
#define UHD_RADIO_DEVICE_HPP

#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <uhd/device.hpp>
#include <uhd/usrp/multi_usrp.hpp>
#include <uhd/types/tune_request.hpp>
#include <uhd/exception.hpp>
#include <uhd/utils/log.hpp>
#include <Common.hpp>
#include <RadioDevice.hpp>

namespace ChirpISAC {
namespace Device {

    /**
     * @brief USRP front end through multi_usrp.
     *
     * Single channel, fc32 host samples. UHD errors propagate as uhd::exception.
     */
    class UhdRadioDevice : public RadioDevice {
    public:
        /**
         * @brief List devices matching the hint (e.g. "type=b200").
         */
        static std::vector<std::string> find_devices(const std::string& hint) {
            std::vector<std::string> found;
            for (const auto& addr : uhd::device::find(uhd::device_addr_t(hint))) {
                found.push_back(addr.to_string());
            }
            return found;
        }

        UhdRadioDevice() = default;

        void configure(const RadioParams& params) override {
            _params = params;
            std::string args = params.device_args;
            auto append = [&args](const std::string& key, size_t value) {
                if (args.find(key) != std::string::npos) return;
                args += (args.empty() ? "" : ",") + key + "=" + std::to_string(value);
            };
            append("num_recv_frames", params.num_recv_frames);
            append("num_send_frames", params.num_send_frames);

            UHD_LOG_INFO("RADIO", "Creating USRP with args: " << args);
            _usrp = uhd::usrp::multi_usrp::make(args);

            _usrp->set_clock_source(params.clock_source);
            _usrp->set_tx_rate(params.sample_rate);
            _usrp->set_rx_rate(params.sample_rate);

            uhd::tune_request_t tune_req(params.center_freq);
            _usrp->set_tx_freq(tune_req, 0);
            _usrp->set_rx_freq(tune_req, 0);

            _usrp->set_tx_gain(params.tx_gain, 0);
            _usrp->set_rx_gain(params.rx_gain, 0);
            _usrp->set_tx_bandwidth(params.bandwidth, 0);
            _usrp->set_rx_bandwidth(params.bandwidth, 0);
            _usrp->set_tx_antenna(params.tx_antenna, 0);
            _usrp->set_rx_antenna(params.rx_antenna, 0);

            uhd::stream_args_t tx_stream_args("fc32", params.wire_format);
            tx_stream_args.channels = {0};
            _tx_stream = _usrp->get_tx_stream(tx_stream_args);

            uhd::stream_args_t rx_stream_args("fc32", params.wire_format);
            rx_stream_args.channels = {0};
            _rx_stream = _usrp->get_rx_stream(rx_stream_args);

            // Let the LOs lock before streaming
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            UHD_LOG_INFO("RADIO", "Actual TX rate " << _usrp->get_tx_rate(0) / 1e6 << " Msps, RX rate "
                         << _usrp->get_rx_rate(0) / 1e6 << " Msps, TX freq " << _usrp->get_tx_freq(0) / 1e9
                         << " GHz, RX freq " << _usrp->get_rx_freq(0) / 1e9 << " GHz");
        }

        size_t transmit(const AlignedVector& burst) override {
            _require_configured();
            uhd::tx_metadata_t md;
            md.start_of_burst = true;
            md.end_of_burst = false;
            md.has_time_spec = false;

            const size_t sent = _tx_stream->send(burst.data(), burst.size(), md, 2.0);
            if (sent < burst.size()) {
                UHD_LOG_WARNING("RADIO", "TX underflow: " << (burst.size() - sent) << " samples not sent");
            }

            md.start_of_burst = false;
            md.end_of_burst = true;
            _tx_stream->send("", 0, md);
            return sent;
        }

        AlignedVector receive(size_t num_samples, double timeout_s) override {
            _require_configured();
            AlignedVector buffer(num_samples);

            uhd::stream_cmd_t stream_cmd(uhd::stream_cmd_t::STREAM_MODE_NUM_SAMPS_AND_DONE);
            stream_cmd.num_samps = num_samples;
            stream_cmd.stream_now = true;
            _rx_stream->issue_stream_cmd(stream_cmd);

            uhd::rx_metadata_t md;
            size_t received = 0;
            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      std::chrono::duration<double>(timeout_s));
            while (received < num_samples && std::chrono::steady_clock::now() < deadline) {
                size_t num_rx = _rx_stream->recv(buffer.data() + received, num_samples - received, md, timeout_s, false);
                if (md.error_code != uhd::rx_metadata_t::ERROR_CODE_NONE) {
                    if (md.error_code == uhd::rx_metadata_t::ERROR_CODE_TIMEOUT) {
                        break;
                    }
                    UHD_LOG_WARNING("RADIO", "RX error: " << md.strerror());
                    if (md.error_code != uhd::rx_metadata_t::ERROR_CODE_OVERFLOW) {
                        break;
                    }
                }
                received += num_rx;
            }
            if (received < num_samples) {
                UHD_LOG_WARNING("RADIO", "Received " << received << " of " << num_samples << " samples");
            }
            buffer.resize(received);
            return buffer;
        }

        std::string describe() const override {
            return _usrp ? _usrp->get_pp_string() : std::string("USRP (not configured)");
        }

        uhd::usrp::multi_usrp::sptr usrp() const { return _usrp; }

    private:
        RadioParams _params;
        uhd::usrp::multi_usrp::sptr _usrp;
        uhd::tx_streamer::sptr _tx_stream;
        uhd::rx_streamer::sptr _rx_stream;

        void _require_configured() const {
            if (!_usrp || !_tx_stream || !_rx_stream) {
                throw std::runtime_error("USRP used before configure()");
            }
        }
    };

} // namespace Device
} // namespace ChirpISAC

#endif // UHD_RADIO_DEVICE_HPP
