#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/ioctl.h>

namespace posix_term
{

    // RS-232 control lines other than RXD/TXD.
    enum class ModemLine
    {
        DTR,
        RTS,
        CTS,
        DSR,
        CD,
        RI,
    };

    struct ModemLineInfo
    {
        ModemLine line;
        uint32_t bit; // native TIOCM_* mask
        const char *name;
    };

    // Single lookup for the platform bit assignments.
    inline constexpr std::array<ModemLineInfo, 6> kModemLines{{
        {ModemLine::DTR, TIOCM_DTR, "DTR"},
        {ModemLine::RTS, TIOCM_RTS, "RTS"},
        {ModemLine::CTS, TIOCM_CTS, "CTS"},
        {ModemLine::DSR, TIOCM_DSR, "DSR"},
        {ModemLine::CD, TIOCM_CAR, "CD"},
        {ModemLine::RI, TIOCM_RNG, "RI"},
    }};

    constexpr bool modem_table_in_enum_order()
    {
        for (size_t i = 0; i < kModemLines.size(); ++i)
        {
            if (static_cast<size_t>(kModemLines[i].line) != i)
                return false;
        }
        return true;
    }
    static_assert(modem_table_in_enum_order(), "kModemLines must be indexed by ModemLine");

    constexpr const ModemLineInfo &modem_line_info(ModemLine line)
    {
        return kModemLines[static_cast<size_t>(line)];
    }

    constexpr uint32_t modem_line_bit(ModemLine line) { return modem_line_info(line).bit; }

    // "MODEM" status bits as read from / written to a Term. Plain value;
    // changes reach the device only through Term::set_status().
    class Status
    {
    public:
        constexpr Status() = default;
        constexpr explicit Status(uint32_t bits) : bits_(bits) {}

        constexpr uint32_t bits() const { return bits_; }

        constexpr bool line(ModemLine l) const
        {
            const uint32_t bit = modem_line_bit(l);
            return (bits_ & bit) == bit;
        }

        constexpr void set_line(ModemLine l, bool v)
        {
            if (v)
                bits_ |= modem_line_bit(l);
            else
                bits_ &= ~modem_line_bit(l);
        }

        constexpr bool dtr() const { return line(ModemLine::DTR); }
        constexpr void set_dtr(bool v) { set_line(ModemLine::DTR, v); }
        constexpr bool rts() const { return line(ModemLine::RTS); }
        constexpr void set_rts(bool v) { set_line(ModemLine::RTS, v); }
        constexpr bool cts() const { return line(ModemLine::CTS); }
        constexpr void set_cts(bool v) { set_line(ModemLine::CTS, v); }
        constexpr bool dsr() const { return line(ModemLine::DSR); }
        constexpr void set_dsr(bool v) { set_line(ModemLine::DSR, v); }
        constexpr bool cd() const { return line(ModemLine::CD); }
        constexpr void set_cd(bool v) { set_line(ModemLine::CD, v); }
        constexpr bool ri() const { return line(ModemLine::RI); }
        constexpr void set_ri(bool v) { set_line(ModemLine::RI, v); }

        // e.g. "[DTR RTS]"
        std::string to_string() const
        {
            std::string out = "[";
            for (const auto &info : kModemLines)
            {
                if (!line(info.line))
                    continue;
                if (out.size() > 1)
                    out += ' ';
                out += info.name;
            }
            out += ']';
            return out;
        }

        constexpr bool operator==(const Status &o) const { return bits_ == o.bits_; }
        constexpr bool operator!=(const Status &o) const { return bits_ != o.bits_; }

    private:
        uint32_t bits_{0};
    };

} // namespace posix_term
