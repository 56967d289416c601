#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <termios.h>

namespace posix_term
{

    // Integer baud rate -> termios speed constant. nullopt when the
    // platform has no constant for it; rates are never rounded.
    std::optional<speed_t> baud_to_speed(int baud);

    // termios speed constant -> integer baud rate, -1 if unknown.
    int speed_to_baud(speed_t speed);

    // Snapshot of a device's line discipline configuration.
    //
    // from_native()/to_native() are the only conversion points to and
    // from struct termios. Fields without an accessor are carried
    // untouched so a store writes back what was fetched plus the
    // changes made through this class.
    class LineAttributes
    {
    public:
        LineAttributes();

        static LineAttributes from_native(const termios &native);
        termios to_native() const;

        int input_speed() const;
        int output_speed() const;

        // Sets both directions. Returns false (and changes nothing) when
        // baud has no speed constant.
        bool set_speed(int baud);

        tcflag_t input_flags() const { return native_.c_iflag; }
        tcflag_t output_flags() const { return native_.c_oflag; }
        tcflag_t control_flags() const { return native_.c_cflag; }
        tcflag_t local_flags() const { return native_.c_lflag; }
        void set_input_flags(tcflag_t f) { native_.c_iflag = f; }
        void set_output_flags(tcflag_t f) { native_.c_oflag = f; }
        void set_control_flags(tcflag_t f) { native_.c_cflag = f; }
        void set_local_flags(tcflag_t f) { native_.c_lflag = f; }

        cc_t control_char(size_t index) const;
        void set_control_char(size_t index, cc_t value);

        // No echo, no canonical processing, 8 bit chars, receiver on,
        // modem control lines ignored.
        void make_raw();

        // VMIN=0 / VTIME in deciseconds (rounded up, clamped to 255).
        // A zero timeout restores blocking single-byte reads.
        void set_read_timeout(std::chrono::milliseconds timeout);

    private:
        termios native_;
    };

} // namespace posix_term
