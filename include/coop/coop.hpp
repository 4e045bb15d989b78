#pragma once

#include "coop/concepts/awaitable.hpp"
#include "coop/concepts/sequence.hpp"

#ifdef LIBCOOP_FEATURE_IO_TIMER
    #include "coop/io_timer.hpp"
#endif

#include "coop/channel.hpp"
#include "coop/deadline.hpp"
#include "coop/expected.hpp"
#include "coop/stop_reason.hpp"
#include "coop/stop_stream.hpp"
#include "coop/stop_token.hpp"
#include "coop/sync_wait.hpp"
#include "coop/task.hpp"
#include "coop/thread_pool.hpp"
#include "coop/thread_timer.hpp"
#include "coop/time.hpp"
#include "coop/timer.hpp"
#include "coop/until.hpp"
