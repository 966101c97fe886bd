#pragma once

namespace nexstar {

/// Switch the default spdlog logger between info and debug.
/// Debug level shows every command and response on the wire.
void set_verbose_logging(bool verbose);

} // namespace nexstar
