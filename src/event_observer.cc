#include "skitter/event_observer.hh"

namespace skitter {

event_observer::~event_observer() {}

void event_observer::on_endpoint_up(const endpoint&, const tag_set&) {}

void event_observer::on_endpoint_down(const endpoint&) {}

} // namespace skitter
