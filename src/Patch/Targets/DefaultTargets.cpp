/**
 * @file DefaultTargets.cpp
 * @brief Target list used by the migration workflow
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Targets.hpp>

namespace Migrator::Patch {

const std::vector<const PatchTarget*>& defaultTargets() {
    static const GameExecutable game;
    static const ServerExecutable server;
    static const std::vector<const PatchTarget*> targets = {&game, &server};
    return targets;
}

} // namespace Migrator::Patch
