#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace boltjoint {

/**
 * @brief Get the library logger ("boltjoint")
 *
 * Created on first use with a colour stdout sink at level warn.
 * Stage results, per-joint warnings and per-joint failures are logged at
 * debug; the result records already carry them. Batch summaries go to info.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the library logger
 * @param level spdlog level (e.g. spdlog::level::debug)
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace boltjoint
