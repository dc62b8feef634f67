/**
 * @file GameExecutable.cpp
 * @brief BF2.exe provider profiles and substitution rules
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

const GameExecutable::Profile* findProfile(Provider provider) {
    const auto& profiles = GameExecutable::profiles();
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [provider](const auto& profile) { return profile.provider == provider; });
    return it != profiles.end() ? &*it : nullptr;
}

std::string join(std::string_view prefix, std::string_view hostname, std::string_view suffix = {}) {
    std::string text;
    text.reserve(prefix.size() + hostname.size() + suffix.size());
    text.append(prefix);
    text.append(hostname);
    text.append(suffix);
    return text;
}

std::string masterIndexTemplate(const GameExecutable::Profile& profile) {
    return join(profile.masterIndexPlaceholder ? "%s.ms%d." : "%s.ms.", profile.hostname);
}

} // anonymous namespace

const std::vector<GameExecutable::Profile>& GameExecutable::profiles() {
    static const std::vector<Profile> table = {
        {Provider::GameSpy, "gamespy.com", "\\drivers\\etc\\hosts", std::nullopt, true},
        {Provider::OpenSpy, "openspy.net", "\\drivers\\etz\\hosts", std::nullopt, true},
        // BF2Hub keeps the GameSpy hostname and redirects through its helper library
        {Provider::BF2Hub, "gamespy.com", "\\drivers\\xtc\\hosts", "bf2hbc.dll", true},
        {Provider::PlayBF2, "playbf2.ru", "\\drivers\\etc\\hasts", std::nullopt, false},
    };
    return table;
}

GameExecutable::GameExecutable() {
    for (const auto& profile : profiles()) {
        Fingerprint fingerprint;
        fingerprint.provider = profile.provider;
        fingerprint.ridges.push_back(toBytes(profile.hostname));
        fingerprint.ridges.push_back(toBytes(profile.hostsPath));
        if (profile.helperLibrary) {
            fingerprint.ridges.push_back(toBytes(*profile.helperLibrary));
        }
        m_fingerprints.push_back(std::move(fingerprint));
    }
}

Result<std::vector<Modification>> GameExecutable::buildModifications(
    Provider oldProvider, Provider newProvider) const {
    const Profile* wipe = findProfile(oldProvider);
    if (wipe == nullptr) {
        MIGRATOR_LOG_ERROR_F("%s: missing fingerprint for old provider %s",
                             FILE_NAME.data(), toString(oldProvider).data());
        return ErrorCode::MissingFingerprint;
    }

    const Profile* apply = findProfile(newProvider);
    if (apply == nullptr) {
        MIGRATOR_LOG_ERROR_F("%s: missing fingerprint for new provider %s",
                             FILE_NAME.data(), toString(newProvider).data());
        return ErrorCode::MissingFingerprint;
    }

    const std::string_view from = wipe->hostname;
    const std::string_view to = apply->hostname;

    std::vector<Modification> modifications = {
        makeModification("hosts path", wipe->hostsPath, apply->hostsPath, 18, 1),
        makeModification("gamestats host", join("gamestats.", from), join("gamestats.", to), 21, 2),
        makeModification("player info URL",
                         join("http://stage-net.", from, "/bf2/getplayerinfo.aspx?pid="),
                         join("http://stage-net.", to, "/bf2/getplayerinfo.aspx?pid="), 56, 1),
        // One byte over the literal so it cannot match inside the ASP URL below
        makeModification("BF2Web host", join("BF2Web.", from), join("BF2Web.", to), 19, 1),
        makeModification("ASP URL", join("http://BF2Web.", from, "/ASP/"),
                         join("http://BF2Web.", to, "/ASP/"), 30, 1),
        makeModification("available host", join("%s.available.", from),
                         join("%s.available.", to), 24, 1),
        makeModification("master host", join("%s.master.", from), join("%s.master.", to), 21, 1),
        makeModification("login host", join("gpcm.", from), join("gpcm.", to), 16, 1),
        makeModification("search host", join("gpsp.", from), join("gpsp.", to), 16, 1),
        // Drops or inserts "%d" when exactly one side uses the index
        makeModification("master index host", masterIndexTemplate(*wipe), masterIndexTemplate(*apply), 19, 1),
    };

    if (wipe->helperLibrary) {
        modifications.push_back(makeModification("network library", *wipe->helperLibrary,
                                                 DEFAULT_NETWORK_LIBRARY, 10, 1));
    }
    if (apply->helperLibrary) {
        modifications.push_back(makeModification("network library", DEFAULT_NETWORK_LIBRARY,
                                                 *apply->helperLibrary, 10, 1));
    }

    return modifications;
}

} // namespace Migrator::Patch
