#include "posix_term/term.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

namespace posix_term
{

    namespace
    {
        rclcpp::Logger logger() { return rclcpp::get_logger("posix_term"); }
    }

    Term Term::open(const std::string &path)
    {
        int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
        if (fd < 0)
            throw OpenError(path, last_os_error());

        RCLCPP_DEBUG(logger(), "Opened %s (fd %d)", path.c_str(), fd);
        return Term(path, fd);
    }

    Term::Term(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

    Term::Term(Term &&other) noexcept
        : path_(std::move(other.path_)),
          fd_(std::exchange(other.fd_, kInvalidFd)) {}

    Term &Term::operator=(Term &&other) noexcept
    {
        if (this != &other)
        {
            release();
            path_ = std::move(other.path_);
            fd_ = std::exchange(other.fd_, kInvalidFd);
        }
        return *this;
    }

    Term::~Term()
    {
        release();
    }

    void Term::release() noexcept
    {
        if (!is_open())
            return;
        if (::close(fd_) != 0)
        {
            auto ec = last_os_error();
            RCLCPP_WARN(logger(), "Implicit close of %s failed: %s", path_.c_str(), ec.message().c_str());
        }
        fd_ = kInvalidFd;
    }

    void Term::require_open(const char *op) const
    {
        if (!is_open())
            throw IOError(op, path_, std::error_code(EBADF, std::system_category()));
    }

    void Term::require_control(const char *op) const
    {
        if (!is_open())
            throw AttributeError(op, path_, std::error_code(EBADF, std::system_category()));
    }

    size_t Term::read(uint8_t *buf, size_t len)
    {
        require_open("read");

        ssize_t n = ::read(fd_, buf, len);
        auto ec = n < 0 ? last_os_error() : std::error_code();
        if (n < 0)
            n = 0;
        if (n == 0 && len > 0 && !ec)
            throw EndOfStream(path_);
        if (ec)
            throw IOError("read", path_, ec);
        return static_cast<size_t>(n);
    }

    size_t Term::write(const uint8_t *buf, size_t len)
    {
        require_open("write");

        ssize_t n = ::write(fd_, buf, len);
        auto ec = n < 0 ? last_os_error() : std::error_code();
        if (n < 0)
            n = 0;
        // short write takes precedence over the OS error
        if (static_cast<size_t>(n) != len)
            throw ShortWriteError(path_, static_cast<size_t>(n), len);
        if (ec)
            throw IOError("write", path_, ec);
        return static_cast<size_t>(n);
    }

    void Term::close()
    {
        require_open("close");

        int rc = ::close(fd_);
        auto ec = rc != 0 ? last_os_error() : std::error_code();
        RCLCPP_DEBUG(logger(), "Closed %s (fd %d)", path_.c_str(), fd_);
        fd_ = kInvalidFd;
        if (ec)
            throw IOError("close", path_, ec);
    }

} // namespace posix_term
