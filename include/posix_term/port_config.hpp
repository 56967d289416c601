#pragma once
#include <string>

#include <rclcpp/node.hpp>

#include "posix_term/term.hpp"

namespace posix_term
{

    struct PortConfig
    {
        std::string dev{"/dev/ttyUSB0"};
        int baud{115200};
        bool raw{true};
        int read_timeout_ms{100}; // 0 = block until a byte arrives
        bool flush_on_open{true};
        bool reset_on_open{false}; // pulse DTR after opening
        int reset_pulse_ms{50};
        int read_buffer_bytes{2048};

        // Declares every field as a node parameter (current value as the
        // default) and returns what the node resolved.
        static PortConfig declare(rclcpp::Node &node, const PortConfig &defaults = PortConfig{});
    };

    // Opens cfg.dev and applies raw mode, speed, read timeout and the
    // initial flush. Throws OpenError or AttributeError; on a failed
    // configuration step the port is closed again.
    Term open_port(const PortConfig &cfg);

} // namespace posix_term
