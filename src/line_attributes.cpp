#include "posix_term/line_attributes.hpp"

#include <algorithm>
#include <stdexcept>

namespace posix_term
{

    namespace
    {
        struct SpeedEntry
        {
            int baud;
            speed_t speed;
        };

        const SpeedEntry kSpeeds[] = {
            {0, B0},
            {50, B50},
            {75, B75},
            {110, B110},
            {134, B134},
            {150, B150},
            {200, B200},
            {300, B300},
            {600, B600},
            {1200, B1200},
            {1800, B1800},
            {2400, B2400},
            {4800, B4800},
            {9600, B9600},
            {19200, B19200},
            {38400, B38400},
            {57600, B57600},
            {115200, B115200},
            {230400, B230400},
#ifdef B460800
            {460800, B460800},
#endif
#ifdef B500000
            {500000, B500000},
#endif
#ifdef B576000
            {576000, B576000},
#endif
#ifdef B921600
            {921600, B921600},
#endif
#ifdef B1000000
            {1000000, B1000000},
#endif
#ifdef B1152000
            {1152000, B1152000},
#endif
#ifdef B1500000
            {1500000, B1500000},
#endif
#ifdef B2000000
            {2000000, B2000000},
#endif
#ifdef B2500000
            {2500000, B2500000},
#endif
#ifdef B3000000
            {3000000, B3000000},
#endif
#ifdef B3500000
            {3500000, B3500000},
#endif
#ifdef B4000000
            {4000000, B4000000},
#endif
        };

        constexpr int kDecisecondMs = 100;
        constexpr int kMaxVtime = 255;
    } // namespace

    std::optional<speed_t> baud_to_speed(int baud)
    {
        for (const auto &e : kSpeeds)
        {
            if (e.baud == baud)
                return e.speed;
        }
        return std::nullopt;
    }

    int speed_to_baud(speed_t speed)
    {
        for (const auto &e : kSpeeds)
        {
            if (e.speed == speed)
                return e.baud;
        }
        return -1;
    }

    LineAttributes::LineAttributes() : native_{} {}

    LineAttributes LineAttributes::from_native(const termios &native)
    {
        LineAttributes a;
        a.native_ = native;
        return a;
    }

    termios LineAttributes::to_native() const
    {
        return native_;
    }

    int LineAttributes::input_speed() const
    {
        return speed_to_baud(cfgetispeed(&native_));
    }

    int LineAttributes::output_speed() const
    {
        return speed_to_baud(cfgetospeed(&native_));
    }

    bool LineAttributes::set_speed(int baud)
    {
        auto spd = baud_to_speed(baud);
        if (!spd)
            return false;

        termios next = native_;
        if (cfsetispeed(&next, *spd) != 0 || cfsetospeed(&next, *spd) != 0)
            return false;
        native_ = next;
        return true;
    }

    cc_t LineAttributes::control_char(size_t index) const
    {
        if (index >= static_cast<size_t>(NCCS))
            throw std::out_of_range("LineAttributes control char index out of range");
        return native_.c_cc[index];
    }

    void LineAttributes::set_control_char(size_t index, cc_t value)
    {
        if (index >= static_cast<size_t>(NCCS))
            throw std::out_of_range("LineAttributes control char index out of range");
        native_.c_cc[index] = value;
    }

    void LineAttributes::make_raw()
    {
        cfmakeraw(&native_);
        native_.c_cflag |= (CLOCAL | CREAD);
    }

    void LineAttributes::set_read_timeout(std::chrono::milliseconds timeout)
    {
        if (timeout.count() <= 0)
        {
            native_.c_cc[VMIN] = 1;
            native_.c_cc[VTIME] = 0;
            return;
        }
        auto ds = (timeout.count() + kDecisecondMs - 1) / kDecisecondMs;
        native_.c_cc[VMIN] = 0;
        native_.c_cc[VTIME] = static_cast<cc_t>(std::min<decltype(ds)>(ds, kMaxVtime));
    }

} // namespace posix_term
