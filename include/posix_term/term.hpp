#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "posix_term/errors.hpp"
#include "posix_term/line_attributes.hpp"
#include "posix_term/status.hpp"

namespace posix_term
{

    // An asynchronous communications port: a UART or a terminal emulating one.
    //
    // Sole owner of one descriptor, opened O_RDWR | O_NOCTTY | O_CLOEXEC.
    // Every call is a blocking syscall; a Term is not synchronized, so
    // callers sharing one across threads must serialize access themselves.
    // Calls on a closed Term throw (IOError for I/O, AttributeError for
    // line control) carrying EBADF in std::system_category(), the same
    // category as every OS-reported failure.
    class Term
    {
    public:
        static constexpr int kInvalidFd = -1;

        // Throws OpenError.
        static Term open(const std::string &path);

        Term(const Term &) = delete;
        Term &operator=(const Term &) = delete;
        Term(Term &&other) noexcept;
        Term &operator=(Term &&other) noexcept;
        ~Term();

        const std::string &path() const { return path_; }
        int fd() const { return fd_; }
        bool is_open() const { return fd_ != kInvalidFd; }

        // Reads up to len bytes; short reads are returned as they are.
        // Throws EndOfStream on a zero-byte read of a non-empty buffer
        // (an expired read timeout included), IOError on OS failure.
        size_t read(uint8_t *buf, size_t len);

        // Throws ShortWriteError when fewer than len bytes were accepted
        // (checked first), IOError on OS failure.
        size_t write(const uint8_t *buf, size_t len);

        // Always leaves the handle closed, even when close(2) fails.
        void close();

        // ---- line control, all throw AttributeError ----

        LineAttributes attributes() const;
        void set_attributes(const LineAttributes &attrs);

        // Applied immediately (TCSANOW). Unsupported rates are rejected.
        void set_speed(int baud);
        int speed() const;

        void set_raw();
        void set_read_timeout(std::chrono::milliseconds timeout);

        // Discards received-but-unread and written-but-untransmitted data.
        void flush();
        // Blocks until all written data has been transmitted.
        void drain();
        // Break for the OS default duration.
        void send_break();

        size_t available() const;
        size_t buffered() const;

        Status status() const;
        void set_status(Status status);
        // Raises or drops a single line without touching the others.
        void set_line(ModemLine line, bool asserted);

    private:
        Term(std::string path, int fd);

        // Non-throwing close for the destructor and move assignment.
        void release() noexcept;
        void require_open(const char *op) const;
        void require_control(const char *op) const;

        template <typename Fn>
        void modify_attributes(Fn &&fn);

        std::string path_;
        int fd_;
    };

} // namespace posix_term
