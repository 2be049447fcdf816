#pragma once

#include <courier/schema/run_event.hpp>
#include <functional>

namespace courier::execution {

using event_sink_t = std::function<void(const courier::schema::run_event_t&)>;

}  // namespace courier::execution
