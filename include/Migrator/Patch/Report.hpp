/**
 * @file Report.hpp
 * @brief JSON rendering of patch, quiescence and migration reports
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_PATCH_REPORT_HPP
#define MIGRATOR_PATCH_REPORT_HPP

#include <Migrator/Patch/Migration.hpp>
#include <nlohmann/json.hpp>
#include <vector>

namespace Migrator::Patch {

/**
 * Error fields are rendered as {"code": <numeric>, "message": <text>}; the
 * "error" key is null on success.
 */
[[nodiscard]] nlohmann::json toJson(const PatchResult& result);
[[nodiscard]] nlohmann::json toJson(const QuiescenceReport& report);
[[nodiscard]] nlohmann::json toJson(const PrepareReport& report);
[[nodiscard]] nlohmann::json toJson(const MigrationReport& report);
[[nodiscard]] nlohmann::json toJson(const std::vector<DetectionEntry>& entries);

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_REPORT_HPP
