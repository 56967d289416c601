#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/u_int8_multi_array.hpp>

#include "posix_term/hex_dump.hpp"
#include "posix_term/port_config.hpp"
#include "posix_term/term.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = rclcpp::Node::make_shared("posix_term_bridge");
    auto log = node->get_logger();

    const posix_term::PortConfig cfg = posix_term::PortConfig::declare(*node);
    const bool dump_rx = node->declare_parameter<bool>("dump_rx", false);

    RCLCPP_INFO(log, "Opening %s @ %d baud", cfg.dev.c_str(), cfg.baud);
    std::optional<posix_term::Term> port;
    try
    {
        port.emplace(posix_term::open_port(cfg));
    }
    catch (const posix_term::TermError &e)
    {
        RCLCPP_FATAL(log, "Failed to open serial device: %s", e.what());
        rclcpp::shutdown();
        return 1;
    }

    if (cfg.reset_on_open)
    {
        RCLCPP_INFO(log, "Pulsing DTR...");
        try
        {
            port->set_line(posix_term::ModemLine::DTR, false);
            std::this_thread::sleep_for(std::chrono::milliseconds(cfg.reset_pulse_ms));
            port->set_line(posix_term::ModemLine::DTR, true);
            RCLCPP_INFO(log, "Modem lines now %s", port->status().to_string().c_str());
        }
        catch (const posix_term::AttributeError &e)
        {
            // pseudo terminals and some USB adapters have no modem lines
            RCLCPP_WARN(log, "DTR reset skipped: %s", e.what());
        }
    }

    auto rx_pub = node->create_publisher<std_msgs::msg::UInt8MultiArray>("rx", rclcpp::QoS(10).reliable());
    auto tx_sub = node->create_subscription<std_msgs::msg::UInt8MultiArray>(
        "tx", rclcpp::QoS(10).reliable(),
        [&port, log](const std_msgs::msg::UInt8MultiArray::SharedPtr msg)
        {
            if (!port || !port->is_open() || msg->data.empty())
                return;
            try
            {
                port->write(msg->data.data(), msg->data.size());
            }
            catch (const posix_term::ShortWriteError &e)
            {
                RCLCPP_WARN(log, "TX short write: %zu of %zu bytes", e.written(), e.requested());
            }
            catch (const posix_term::IOError &e)
            {
                RCLCPP_ERROR(log, "TX failed: %s", e.what());
            }
        });

    std::vector<uint8_t> buf(static_cast<size_t>(std::max(cfg.read_buffer_bytes, 1)));
    rclcpp::WallRate idle_rate(std::chrono::milliseconds(2));

    while (rclcpp::ok())
    {
        size_t n = 0;
        bool timed_out = false;
        try
        {
            if (cfg.read_timeout_ms > 0)
            {
                // VMIN=0: returns after VTIME with whatever arrived; an empty
                // interval reads as EndOfStream
                n = port->read(buf.data(), buf.size());
            }
            else
            {
                // blocking reads would starve spin_some(); only read what is
                // queued. A hangup is not detected in this mode.
                size_t pending = port->available();
                if (pending > 0)
                    n = port->read(buf.data(), std::min(pending, buf.size()));
            }
        }
        catch (const posix_term::EndOfStream &)
        {
            if (cfg.read_timeout_ms <= 0)
            {
                RCLCPP_INFO(log, "End of stream on %s", port->path().c_str());
                break;
            }
            timed_out = true;
        }
        catch (const posix_term::TermError &e)
        {
            RCLCPP_ERROR(log, "RX failed: %s", e.what());
            break;
        }

        if (timed_out)
        {
            // a hung-up line also reads zero bytes, but rejects FIONREAD
            try
            {
                port->available();
            }
            catch (const posix_term::AttributeError &e)
            {
                RCLCPP_INFO(log, "Line hung up: %s", e.what());
                break;
            }
        }

        if (n > 0)
        {
            if (dump_rx)
                RCLCPP_DEBUG(log, "RX %zu bytes: %s", n, posix_term::hex_head(buf.data(), n).c_str());

            std_msgs::msg::UInt8MultiArray msg;
            msg.data.assign(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
            rx_pub->publish(msg);
        }
        else if (!timed_out)
        {
            idle_rate.sleep();
        }

        rclcpp::spin_some(node);
    }

    try
    {
        port->close();
    }
    catch (const posix_term::IOError &e)
    {
        RCLCPP_WARN(log, "Close failed: %s", e.what());
    }
    rclcpp::shutdown();
    return 0;
}
