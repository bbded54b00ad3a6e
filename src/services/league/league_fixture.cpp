/// @file league_fixture.cpp
/// @brief Fixture parsing with yaml-cpp.

#include "fcl/service/league_fixture.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace fcl::service {

using foundation::ErrorCode;
using foundation::LeagueError;
using namespace fcl::league;

namespace {

LeagueResult<PlayerColor> colorOf(const YAML::Node& node) {
    auto tag = node.as<std::string>();
    auto color = parseColor(tag);
    if (!color) {
        return LeagueResult<PlayerColor>::err(
            LeagueError(ErrorCode::InvalidArgument, "unknown color: " + tag));
    }
    return LeagueResult<PlayerColor>::ok(*color);
}

LeagueResult<Team> parseTeam(const YAML::Node& node, LobbyId lobby) {
    Team team;
    team.id = TeamId(node["id"].as<uint64_t>());
    team.owner = UserId(node["owner"].as<uint64_t>());
    team.lobby = lobby;
    team.matchday = static_cast<uint8_t>(node["matchday"].as<unsigned int>());
    team.name = node["name"].as<std::string>("Team " + std::to_string(team.id.value()));
    team.formation = node["formation"].as<std::string>("");

    auto tooMany = [&]() {
        return LeagueResult<Team>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "team " + std::to_string(team.id.value()) + " has more than " +
                std::to_string(kSlotsPerTeam) + " players"));
    };

    std::size_t index = 0;
    if (const auto& slots = node["slots"]; slots && slots.IsSequence()) {
        for (const auto& s : slots) {
            if (index >= kSlotsPerTeam) {
                return tooMany();
            }
            TeamSlot slot;
            slot.placeholder = s["placeholder"].as<bool>(false);
            slot.rating = s["rating"].as<int32_t>(0);
            if (s["card"]) {
                slot.cardId = CardId(s["card"].as<uint64_t>());
            }
            if (s["color"]) {
                auto color = colorOf(s["color"]);
                if (!color) {
                    return LeagueResult<Team>::err(color.error());
                }
                slot.color = color.value();
            }
            team.slots[index++] = slot;
        }
    }

    if (const auto& groups = node["groups"]; groups && groups.IsSequence()) {
        for (const auto& g : groups) {
            auto color = colorOf(g["color"]);
            if (!color) {
                return LeagueResult<Team>::err(color.error());
            }
            auto count = g["count"].as<unsigned int>();
            auto rating = g["rating"].as<int32_t>();
            for (unsigned int i = 0; i < count; ++i) {
                if (index >= kSlotsPerTeam) {
                    return tooMany();
                }
                PlayerCard card;
                card.id = CardId(team.id.value() * 100 + index + 1);
                card.rating = rating;
                card.color = color.value();
                team.slots[index++] = TeamSlot::fromCard(card);
            }
        }
    }
    return LeagueResult<Team>::ok(std::move(team));
}

} // namespace

LeagueResult<LeagueFixture> parseFixture(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        const auto& lobbyNode = root["lobby"];
        if (!lobbyNode) {
            return LeagueResult<LeagueFixture>::err(
                LeagueError(ErrorCode::InvalidArgument, "fixture has no lobby"));
        }

        LeagueFixture fixture;
        fixture.lobby.id = LobbyId(lobbyNode["id"].as<uint64_t>());
        fixture.lobby.name = lobbyNode["name"].as<std::string>("");
        for (const auto& member : lobbyNode["members"]) {
            fixture.lobby.members.emplace_back(member.as<uint64_t>());
        }

        for (const auto& teamNode : root["teams"]) {
            auto team = parseTeam(teamNode, fixture.lobby.id);
            if (!team) {
                return LeagueResult<LeagueFixture>::err(team.error());
            }
            fixture.teams.push_back(std::move(team).value());
        }
        return LeagueResult<LeagueFixture>::ok(std::move(fixture));
    } catch (const YAML::Exception& e) {
        return LeagueResult<LeagueFixture>::err(
            LeagueError(ErrorCode::ConfigLoadFailed, std::string("fixture error: ") + e.what()));
    }
}

LeagueResult<LeagueFixture> loadFixture(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        return parseFixture(YAML::Dump(root));
    } catch (const YAML::Exception& e) {
        return LeagueResult<LeagueFixture>::err(LeagueError(
            ErrorCode::ConfigLoadFailed,
            "failed to load fixture " + path.string() + ": " + e.what()));
    }
}

LeagueResult<void> seedStore(LeagueStore& store, const LeagueFixture& fixture) {
    if (auto r = store.saveLobby(fixture.lobby); !r) {
        return r;
    }
    for (const auto& team : fixture.teams) {
        if (auto r = store.saveTeam(team); !r) {
            return r;
        }
    }
    return LeagueResult<void>::ok();
}

} // namespace fcl::service
