#include "posix_term/port_config.hpp"

#include <chrono>

#include <rclcpp/logging.hpp>

namespace posix_term
{

    PortConfig PortConfig::declare(rclcpp::Node &node, const PortConfig &defaults)
    {
        PortConfig c;
        c.dev = node.declare_parameter<std::string>("dev", defaults.dev);
        c.baud = node.declare_parameter<int>("baud", defaults.baud);
        c.raw = node.declare_parameter<bool>("raw", defaults.raw);
        c.read_timeout_ms = node.declare_parameter<int>("read_timeout_ms", defaults.read_timeout_ms);
        c.flush_on_open = node.declare_parameter<bool>("flush_on_open", defaults.flush_on_open);
        c.reset_on_open = node.declare_parameter<bool>("reset_on_open", defaults.reset_on_open);
        c.reset_pulse_ms = node.declare_parameter<int>("reset_pulse_ms", defaults.reset_pulse_ms);
        c.read_buffer_bytes = node.declare_parameter<int>("read_buffer_bytes", defaults.read_buffer_bytes);
        return c;
    }

    Term open_port(const PortConfig &cfg)
    {
        Term term = Term::open(cfg.dev);

        // Term's destructor closes the descriptor if any step throws
        if (cfg.raw)
            term.set_raw();
        term.set_speed(cfg.baud);
        term.set_read_timeout(std::chrono::milliseconds(cfg.read_timeout_ms));
        if (cfg.flush_on_open)
            term.flush();

        RCLCPP_INFO(rclcpp::get_logger("posix_term"), "Configured %s @ %d baud (raw=%d, timeout=%d ms)",
                    cfg.dev.c_str(), cfg.baud, cfg.raw ? 1 : 0, cfg.read_timeout_ms);
        return term;
    }

} // namespace posix_term
