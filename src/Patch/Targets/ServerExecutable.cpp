/**
 * @file ServerExecutable.cpp
 * @brief bf2_w32ded.exe provider profiles and substitution rules
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Targets.hpp>
#include <Migrator/Core/Logger.hpp>
#include <algorithm>
#include <string>

namespace Migrator::Patch {

namespace {

const ServerExecutable::Profile* findProfile(Provider provider) {
    const auto& profiles = ServerExecutable::profiles();
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [provider](const auto& profile) { return profile.provider == provider; });
    return it != profiles.end() ? &*it : nullptr;
}

std::string join(std::string_view prefix, std::string_view hostname, std::string_view suffix = {}) {
    std::string text(prefix);
    text.append(hostname);
    text.append(suffix);
    return text;
}

} // anonymous namespace

const std::vector<ServerExecutable::Profile>& ServerExecutable::profiles() {
    static const std::vector<Profile> table = {
        {Provider::GameSpy, "gamespy.com", DEFAULT_NETWORK_LIBRARY},
        {Provider::OpenSpy, "openspy.net", DEFAULT_NETWORK_LIBRARY},
        {Provider::BF2Hub, "gamespy.com", "bf2hub.dll"},
        {Provider::PlayBF2, "playbf2.ru", DEFAULT_NETWORK_LIBRARY},
    };
    return table;
}

ServerExecutable::ServerExecutable() {
    for (const auto& profile : profiles()) {
        m_fingerprints.push_back({profile.provider,
                                  {toBytes(profile.hostname), toBytes(profile.networkLibrary)}});
    }
}

Result<std::vector<Modification>> ServerExecutable::buildModifications(
    Provider oldProvider, Provider newProvider) const {
    const Profile* wipe = findProfile(oldProvider);
    const Profile* apply = findProfile(newProvider);
    if (wipe == nullptr || apply == nullptr) {
        MIGRATOR_LOG_ERROR_F("%s: missing fingerprint for %s -> %s", FILE_NAME.data(),
                             toString(oldProvider).data(), toString(newProvider).data());
        return ErrorCode::MissingFingerprint;
    }

    const std::string_view from = wipe->hostname;
    const std::string_view to = apply->hostname;

    return std::vector<Modification>{
        makeModification("BF2Web host", join("BF2Web.", from), join("BF2Web.", to), 19, 1),
        makeModification("ASP URL", join("http://BF2Web.", from, "/ASP/"),
                         join("http://BF2Web.", to, "/ASP/"), 30, 1),
        makeModification("gamestats host", join("gamestats.", from), join("gamestats.", to), 21, 2),
        makeModification("player info URL",
                         join("http://stage-net.", from, "/bf2/getplayerinfo.aspx?pid="),
                         join("http://stage-net.", to, "/bf2/getplayerinfo.aspx?pid="), 56, 1),
        makeModification("available host", join("%s.available.", from),
                         join("%s.available.", to), 24, 1),
        makeModification("master host", join("%s.master.", from), join("%s.master.", to), 21, 1),
        makeModification("network library", wipe->networkLibrary, apply->networkLibrary, 10, 1),
    };
}

} // namespace Migrator::Patch
