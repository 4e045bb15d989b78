#include "coop/stop_reason.hpp"

namespace coop
{
static const std::string stop_reason_unknown{"unknown"};
static const std::string stop_reason_cancelled{"cancelled"};
static const std::string stop_reason_timed_out{"timed_out"};

auto to_string(stop_reason reason) -> const std::string&
{
    switch (reason)
    {
        case stop_reason::cancelled:
            return stop_reason_cancelled;
        case stop_reason::timed_out:
            return stop_reason_timed_out;
        default:
            return stop_reason_unknown;
    }
}

auto make_error_code(stop_reason reason) noexcept -> std::error_code
{
    switch (reason)
    {
        case stop_reason::timed_out:
            return std::make_error_code(std::errc::timed_out);
        case stop_reason::cancelled:
        default:
            return std::make_error_code(std::errc::operation_canceled);
    }
}

} // namespace coop
