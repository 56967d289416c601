#pragma once
#include <cstddef>
#include <string>
#include <system_error>

namespace posix_term
{

    // Conditions raised by this library itself (not by the OS).
    enum class TermErrc
    {
        end_of_stream = 1,
        short_write,
        unsupported_speed,
    };

    const std::error_category &term_category() noexcept;
    std::error_code make_error_code(TermErrc e) noexcept;

    // Base of every failure reported by a Term.
    // what() reads "<op> <path>: <message>".
    class TermError : public std::system_error
    {
    public:
        TermError(std::string op, std::string path, std::error_code ec);

        const std::string &op() const noexcept { return op_; }
        const std::string &path() const noexcept { return path_; }

    private:
        std::string op_;
        std::string path_;
    };

    class OpenError : public TermError
    {
    public:
        OpenError(const std::string &path, std::error_code ec)
            : TermError("open", path, ec) {}
    };

    class IOError : public TermError
    {
    public:
        using TermError::TermError;
    };

    // tcgetattr/tcsetattr/tcflush/ioctl failures and rejected attribute values.
    class AttributeError : public TermError
    {
    public:
        using TermError::TermError;
    };

    class ShortWriteError : public TermError
    {
    public:
        ShortWriteError(const std::string &path, size_t written, size_t requested)
            : TermError("write", path, make_error_code(TermErrc::short_write)),
              written_(written), requested_(requested) {}

        size_t written() const noexcept { return written_; }
        size_t requested() const noexcept { return requested_; }

    private:
        size_t written_;
        size_t requested_;
    };

    // Zero-byte read on a non-empty buffer. A normal terminal condition.
    class EndOfStream : public TermError
    {
    public:
        explicit EndOfStream(const std::string &path)
            : TermError("read", path, make_error_code(TermErrc::end_of_stream)) {}
    };

    // errno captured as a std::error_code
    std::error_code last_os_error() noexcept;

} // namespace posix_term

namespace std
{
    template <>
    struct is_error_code_enum<posix_term::TermErrc> : true_type
    {
    };
} // namespace std
