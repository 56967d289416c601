// Line control half of Term: every operation here goes through the OS
// line discipline (termios) or the modem-control ioctls.
#include "posix_term/term.hpp"

#include <sys/ioctl.h>
#include <termios.h>

#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

namespace posix_term
{

    namespace
    {
        rclcpp::Logger logger() { return rclcpp::get_logger("posix_term"); }
    }

    // Fresh fetch, mutate, store. Nothing is cached between calls and a
    // failed store is not rolled back.
    template <typename Fn>
    void Term::modify_attributes(Fn &&fn)
    {
        LineAttributes attrs = attributes();
        fn(attrs);
        set_attributes(attrs);
    }

    LineAttributes Term::attributes() const
    {
        require_control("tcgetattr");

        termios native{};
        if (::tcgetattr(fd_, &native) != 0)
            throw AttributeError("tcgetattr", path_, last_os_error());
        return LineAttributes::from_native(native);
    }

    void Term::set_attributes(const LineAttributes &attrs)
    {
        require_control("tcsetattr");

        termios native = attrs.to_native();
        if (::tcsetattr(fd_, TCSANOW, &native) != 0)
            throw AttributeError("tcsetattr", path_, last_os_error());
    }

    void Term::set_speed(int baud)
    {
        require_control("set_speed");
        if (!baud_to_speed(baud))
            throw AttributeError("set_speed", path_, make_error_code(TermErrc::unsupported_speed));

        modify_attributes([this, baud](LineAttributes &a)
                          {
                              if (!a.set_speed(baud))
                                  throw AttributeError("set_speed", path_, make_error_code(TermErrc::unsupported_speed));
                          });
        RCLCPP_DEBUG(logger(), "%s speed set to %d", path_.c_str(), baud);
    }

    int Term::speed() const
    {
        return attributes().output_speed();
    }

    void Term::set_raw()
    {
        modify_attributes([](LineAttributes &a)
                          { a.make_raw(); });
    }

    void Term::set_read_timeout(std::chrono::milliseconds timeout)
    {
        modify_attributes([timeout](LineAttributes &a)
                          { a.set_read_timeout(timeout); });
    }

    void Term::flush()
    {
        require_control("tcflush");
        if (::tcflush(fd_, TCIOFLUSH) != 0)
            throw AttributeError("tcflush", path_, last_os_error());
    }

    void Term::drain()
    {
        require_control("tcdrain");
        if (::tcdrain(fd_) != 0)
            throw AttributeError("tcdrain", path_, last_os_error());
    }

    void Term::send_break()
    {
        require_control("tcsendbreak");
        if (::tcsendbreak(fd_, 0) != 0)
            throw AttributeError("tcsendbreak", path_, last_os_error());
    }

    size_t Term::available() const
    {
        require_control("FIONREAD");
        int n = 0;
        if (::ioctl(fd_, FIONREAD, &n) != 0)
            throw AttributeError("FIONREAD", path_, last_os_error());
        return static_cast<size_t>(n);
    }

    size_t Term::buffered() const
    {
        require_control("TIOCOUTQ");
        int n = 0;
        if (::ioctl(fd_, TIOCOUTQ, &n) != 0)
            throw AttributeError("TIOCOUTQ", path_, last_os_error());
        return static_cast<size_t>(n);
    }

    Status Term::status() const
    {
        require_control("TIOCMGET");
        int bits = 0;
        if (::ioctl(fd_, TIOCMGET, &bits) != 0)
            throw AttributeError("TIOCMGET", path_, last_os_error());
        return Status(static_cast<uint32_t>(bits));
    }

    void Term::set_status(Status status)
    {
        require_control("TIOCMSET");
        int bits = static_cast<int>(status.bits());
        if (::ioctl(fd_, TIOCMSET, &bits) != 0)
            throw AttributeError("TIOCMSET", path_, last_os_error());
    }

    void Term::set_line(ModemLine line, bool asserted)
    {
        const char *op = asserted ? "TIOCMBIS" : "TIOCMBIC";
        require_control(op);
        int bit = static_cast<int>(modem_line_bit(line));
        if (::ioctl(fd_, asserted ? TIOCMBIS : TIOCMBIC, &bit) != 0)
            throw AttributeError(op, path_, last_os_error());
        RCLCPP_DEBUG(logger(), "%s %s %s", path_.c_str(), modem_line_info(line).name, asserted ? "on" : "off");
    }

} // namespace posix_term
