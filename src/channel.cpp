#include "coop/channel.hpp"

namespace coop::channel_result
{
static const std::string result_unknown{"unknown"};

static const std::string send_sent{"sent"};
static const std::string send_closed{"closed"};
static const std::string send_full{"full"};

auto to_string(send result) -> const std::string&
{
    switch (result)
    {
        case send::sent:
            return send_sent;
        case send::closed:
            return send_closed;
        case send::full:
            return send_full;
        default:
            return result_unknown;
    }
}

static const std::string recv_closed{"closed"};
static const std::string recv_stopped{"stopped"};
static const std::string recv_empty{"empty"};

auto to_string(recv result) -> const std::string&
{
    switch (result)
    {
        case recv::closed:
            return recv_closed;
        case recv::stopped:
            return recv_stopped;
        case recv::empty:
            return recv_empty;
        default:
            return result_unknown;
    }
}

} // namespace coop::channel_result
