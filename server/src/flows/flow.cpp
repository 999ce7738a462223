#include "flows/flow.hpp"
#include "session.hpp"

Flow::Flow(Session *s) : session(s) {
}
