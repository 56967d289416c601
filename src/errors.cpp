#include "posix_term/errors.hpp"

#include <cerrno>
#include <utility>

namespace posix_term
{

    namespace
    {
        class TermCategory : public std::error_category
        {
        public:
            const char *name() const noexcept override { return "posix_term"; }

            std::string message(int ev) const override
            {
                switch (static_cast<TermErrc>(ev))
                {
                case TermErrc::end_of_stream:
                    return "end of stream";
                case TermErrc::short_write:
                    return "short write";
                case TermErrc::unsupported_speed:
                    return "unsupported baud rate";
                }
                return "unknown posix_term error";
            }
        };
    } // namespace

    const std::error_category &term_category() noexcept
    {
        static const TermCategory category;
        return category;
    }

    std::error_code make_error_code(TermErrc e) noexcept
    {
        return {static_cast<int>(e), term_category()};
    }

    std::error_code last_os_error() noexcept
    {
        return {errno, std::system_category()};
    }

    TermError::TermError(std::string op, std::string path, std::error_code ec)
        : std::system_error(ec, op + " " + path),
          op_(std::move(op)),
          path_(std::move(path))
    {
    }

} // namespace posix_term
