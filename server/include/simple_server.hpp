#pragma once

#include "server_context.hpp"

// blocks serving clients until the listen socket fails; returns false on setup errors
bool start_simple_server(const ServerOptions &options);
