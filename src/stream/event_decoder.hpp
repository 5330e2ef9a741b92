#pragma once
#include "event.hpp"
#include <vector>

namespace kbchat {

// Decode one frame into events (usually one; a metadata frame carrying a
// routing decision yields Metadata followed by RoutingInfo).
//
// A malformed payload is logged and yields no events; it never stops the
// stream. Unknown kinds always yield a single Unknown event.
std::vector<ParsedEvent> decode_frame(const EventFrame& frame);

} // namespace kbchat
