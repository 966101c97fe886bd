#include "nexstar/logging.hpp"

#include <spdlog/spdlog.h>

namespace nexstar {

void set_verbose_logging(bool verbose) {
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace nexstar
