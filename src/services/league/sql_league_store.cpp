/// @file sql_league_store.cpp
/// @brief SqlLeagueStore implementation.

#include "fcl/service/sql_league_store.hpp"

#include "fcl/foundation/league_logger.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace fcl::service {

using foundation::DbNull;
using foundation::DbRow;
using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::QueryResult;
using foundation::SqlStatement;
using foundation::Transaction;
using namespace fcl::league;

namespace {

// -- Row decoding ------------------------------------------------------------

std::optional<int64_t> optInt(const DbRow& row, const std::string& col) {
    auto it = row.find(col);
    if (it == row.end()) {
        return std::nullopt;
    }
    return std::visit([](auto&& v) -> std::optional<int64_t> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, std::string>) {
            int64_t out = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
            if (ec != std::errc{}) {
                return std::nullopt;
            }
            return out;
        } else {
            return static_cast<int64_t>(v);
        }
    }, it->second);
}

int64_t asInt(const DbRow& row, const std::string& col) {
    return optInt(row, col).value_or(0);
}

std::optional<std::string> optText(const DbRow& row, const std::string& col) {
    auto it = row.find(col);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    return std::nullopt;
}

std::string asText(const DbRow& row, const std::string& col) {
    return optText(row, col).value_or(std::string{});
}

int64_t toMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string_view sideName(Side side) {
    return side == Side::Home ? "home" : "away";
}

LeagueError corrupted(std::string message) {
    FCL_LOG_ERROR(LogCategory::Store, "corrupt row: " + message);
    return LeagueError(ErrorCode::StoreCorrupted, std::move(message));
}

/// Log a failed write and pass its error through.
LeagueError writeFailed(std::string_view what, LeagueError error, LogContext ctx) {
    ctx.extra["subsystem"] = std::string(foundation::errorSubsystem(error.code()));
    FCL_LOG_CTX(LogLevel::Error, LogCategory::Store,
                std::string(what) + " failed: " + std::string(error.message()), ctx);
    return error;
}

Match rowToMatch(const DbRow& row) {
    Match m;
    m.id = MatchId(static_cast<uint64_t>(asInt(row, "id")));
    m.lobby = LobbyId(static_cast<uint64_t>(asInt(row, "lobby_id")));
    m.matchday = static_cast<uint8_t>(asInt(row, "matchday"));
    m.homeTeam = TeamId(static_cast<uint64_t>(asInt(row, "home_team_id")));
    m.awayTeam = TeamId(static_cast<uint64_t>(asInt(row, "away_team_id")));
    m.homeUser = UserId(static_cast<uint64_t>(asInt(row, "home_user_id")));
    m.awayUser = UserId(static_cast<uint64_t>(asInt(row, "away_user_id")));
    m.homeScore = static_cast<int32_t>(asInt(row, "home_score"));
    m.awayScore = static_cast<int32_t>(asInt(row, "away_score"));
    m.played = asInt(row, "played") != 0;
    if (auto at = optInt(row, "played_at")) {
        m.playedAt = fromMillis(*at);
    }
    return m;
}

MatchEvent rowToEvent(const DbRow& row) {
    MatchEvent e;
    e.minute = static_cast<uint32_t>(asInt(row, "minute"));
    e.side = asText(row, "side") == "away" ? Side::Away : Side::Home;
    return e;
}

constexpr std::string_view kMatchColumns =
    "id, lobby_id, matchday, home_team_id, away_team_id, home_user_id, "
    "away_user_id, home_score, away_score, played, played_at";

// -- Queries usable on both LeagueDatabase and Transaction -------------------

template <typename Conn>
LeagueResult<Match> loadMatch(Conn& conn, MatchId id) {
    SqlStatement stmt("SELECT " + std::string(kMatchColumns) +
                      " FROM matches WHERE id = $id");
    stmt.bindInt("id", static_cast<int64_t>(id.value()));
    auto rows = conn.query(stmt.resolve());
    if (!rows) {
        return LeagueResult<Match>::err(rows.error());
    }
    if (rows.value().empty()) {
        return LeagueResult<Match>::err(LeagueError(
            ErrorCode::MatchNotFound, "match " + std::to_string(id.value()) + " not found"));
    }
    auto match = rowToMatch(rows.value().front());

    SqlStatement events("SELECT minute, side FROM match_events "
                        "WHERE match_id = $id ORDER BY seq");
    events.bindInt("id", static_cast<int64_t>(id.value()));
    auto eventRows = conn.query(events.resolve());
    if (!eventRows) {
        return LeagueResult<Match>::err(eventRows.error());
    }
    for (const auto& row : eventRows.value()) {
        match.events.push_back(rowToEvent(row));
    }
    return LeagueResult<Match>::ok(std::move(match));
}

template <typename Conn>
LeagueResult<bool> lobbyExists(Conn& conn, LobbyId lobby) {
    SqlStatement stmt("SELECT id FROM lobbies WHERE id = $id");
    stmt.bindInt("id", static_cast<int64_t>(lobby.value()));
    auto rows = conn.query(stmt.resolve());
    if (!rows) {
        return LeagueResult<bool>::err(rows.error());
    }
    return LeagueResult<bool>::ok(!rows.value().empty());
}

template <typename Conn>
LeagueResult<int64_t> countMatches(Conn& conn, LobbyId lobby, std::optional<uint8_t> matchday) {
    std::string sql = "SELECT COUNT(*) AS n FROM matches WHERE lobby_id = $lobby";
    if (matchday) {
        sql += " AND matchday = $matchday";
    }
    SqlStatement stmt(sql);
    stmt.bindInt("lobby", static_cast<int64_t>(lobby.value()));
    if (matchday) {
        stmt.bindInt("matchday", *matchday);
    }
    auto rows = conn.query(stmt.resolve());
    if (!rows) {
        return LeagueResult<int64_t>::err(rows.error());
    }
    return LeagueResult<int64_t>::ok(rows.value().empty() ? 0 : asInt(rows.value().front(), "n"));
}

LeagueResult<void> execute(Transaction& txn, const SqlStatement& stmt) {
    return txn.execute(stmt.resolve());
}

LeagueResult<std::vector<Match>> insertMatches(Transaction& txn, LobbyId lobby,
                                               std::vector<Match> matches) {
    auto next = txn.query("SELECT COALESCE(MAX(id), 0) AS max_id FROM matches");
    if (!next) {
        return LeagueResult<std::vector<Match>>::err(next.error());
    }
    auto nextId = (next.value().empty() ? 0 : asInt(next.value().front(), "max_id")) + 1;

    for (auto& m : matches) {
        m.id = MatchId(static_cast<uint64_t>(nextId++));
        m.lobby = lobby;
        m.played = false;

        SqlStatement stmt(
            "INSERT INTO matches (id, lobby_id, matchday, home_team_id, away_team_id, "
            "home_user_id, away_user_id, home_score, away_score, played, played_at) "
            "VALUES ($id, $lobby, $matchday, $home_team, $away_team, $home_user, "
            "$away_user, 0, 0, 0, NULL)");
        stmt.bindInt("id", static_cast<int64_t>(m.id.value()))
            .bindInt("lobby", static_cast<int64_t>(lobby.value()))
            .bindInt("matchday", m.matchday)
            .bindInt("home_team", static_cast<int64_t>(m.homeTeam.value()))
            .bindInt("away_team", static_cast<int64_t>(m.awayTeam.value()))
            .bindInt("home_user", static_cast<int64_t>(m.homeUser.value()))
            .bindInt("away_user", static_cast<int64_t>(m.awayUser.value()));
        if (auto r = execute(txn, stmt); !r) {
            return LeagueResult<std::vector<Match>>::err(r.error());
        }
    }
    return LeagueResult<std::vector<Match>>::ok(std::move(matches));
}

LeagueResult<void> updateLobby(Transaction& txn, LobbyId lobby,
                               LobbyStatus status, uint8_t currentMatchday) {
    SqlStatement stmt("UPDATE lobbies SET status = $status, "
                      "current_matchday = $matchday WHERE id = $id");
    stmt.bindString("status", std::string(lobbyStatusName(status)))
        .bindInt("matchday", currentMatchday)
        .bindInt("id", static_cast<int64_t>(lobby.value()));
    return execute(txn, stmt);
}

LeagueError lobbyNotFound(LobbyId id) {
    return LeagueError(ErrorCode::LobbyNotFound,
                       "lobby " + std::to_string(id.value()) + " not found");
}

} // namespace

SqlLeagueStore::SqlLeagueStore(std::shared_ptr<foundation::LeagueDatabase> db)
    : db_(std::move(db)) {}

SqlLeagueStore::~SqlLeagueStore() = default;

// -- Schema ------------------------------------------------------------------

LeagueResult<void> SqlLeagueStore::initializeSchema(const std::filesystem::path& schemaFile) {
    std::ifstream in(schemaFile);
    if (!in) {
        FCL_LOG_ERROR(LogCategory::Store, "cannot read schema file: " + schemaFile.string());
        return LeagueResult<void>::err(LeagueError(
            ErrorCode::StoreError, "cannot read schema file: " + schemaFile.string()));
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return applySchema(oss.str());
}

LeagueResult<void> SqlLeagueStore::applySchema(std::string_view script) {
    // Strip "--" comments, then split on ';'.
    std::string cleaned;
    std::istringstream lines{std::string(script)};
    for (std::string line; std::getline(lines, line);) {
        auto dash = line.find("--");
        cleaned += dash == std::string::npos ? line : line.substr(0, dash);
        cleaned += '\n';
    }

    std::istringstream statements(cleaned);
    for (std::string stmt; std::getline(statements, stmt, ';');) {
        auto first = stmt.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        if (auto r = db_->execute(stmt.substr(first)); !r) {
            return r;
        }
    }
    return LeagueResult<void>::ok();
}

// -- Collaborator data -------------------------------------------------------

LeagueResult<void> SqlLeagueStore::saveLobby(const Lobby& lobby) {
    if (!lobby.id.isValid()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "lobby id must be non-zero"));
    }
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<void>::err(txnResult.error());
    }
    auto& txn = txnResult.value();
    auto id = static_cast<int64_t>(lobby.id.value());

    SqlStatement delMembers("DELETE FROM lobby_members WHERE lobby_id = $id");
    delMembers.bindInt("id", id);
    SqlStatement delLobby("DELETE FROM lobbies WHERE id = $id");
    delLobby.bindInt("id", id);
    SqlStatement insLobby("INSERT INTO lobbies (id, name, status, current_matchday) "
                          "VALUES ($id, $name, $status, $matchday)");
    insLobby.bindInt("id", id)
        .bindString("name", lobby.name)
        .bindString("status", std::string(lobbyStatusName(lobby.status)))
        .bindInt("matchday", lobby.currentMatchday);

    for (const auto* stmt : {&delMembers, &delLobby, &insLobby}) {
        if (auto r = execute(txn, *stmt); !r) {
            return r;
        }
    }

    for (std::size_t seat = 0; seat < lobby.members.size(); ++seat) {
        SqlStatement ins("INSERT INTO lobby_members (lobby_id, seat, user_id) "
                         "VALUES ($lobby, $seat, $user)");
        ins.bindInt("lobby", id)
            .bindInt("seat", static_cast<int64_t>(seat))
            .bindInt("user", static_cast<int64_t>(lobby.members[seat].value()));
        if (auto r = execute(txn, ins); !r) {
            return r;
        }
    }
    return txn.commit();
}

LeagueResult<void> SqlLeagueStore::saveTeam(const Team& team) {
    if (!team.id.isValid()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "team id must be non-zero"));
    }
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<void>::err(txnResult.error());
    }
    auto& txn = txnResult.value();
    auto id = static_cast<int64_t>(team.id.value());

    SqlStatement delSlots("DELETE FROM team_slots WHERE team_id = $id");
    delSlots.bindInt("id", id);
    SqlStatement delTeam("DELETE FROM teams WHERE id = $id");
    delTeam.bindInt("id", id);
    SqlStatement insTeam("INSERT INTO teams (id, user_id, lobby_id, name, formation, matchday) "
                         "VALUES ($id, $user, $lobby, $name, $formation, $matchday)");
    insTeam.bindInt("id", id)
        .bindInt("user", static_cast<int64_t>(team.owner.value()))
        .bindInt("lobby", static_cast<int64_t>(team.lobby.value()))
        .bindString("name", team.name)
        .bindString("formation", team.formation)
        .bindInt("matchday", team.matchday);

    for (const auto* stmt : {&delSlots, &delTeam, &insTeam}) {
        if (auto r = execute(txn, *stmt); !r) {
            return r;
        }
    }

    for (std::size_t i = 0; i < team.slots.size(); ++i) {
        const auto& slot = team.slots[i];
        if (!slot.isFilled()) {
            continue;
        }
        SqlStatement ins("INSERT INTO team_slots (team_id, slot, card_id, rating, color, placeholder) "
                         "VALUES ($team, $slot, $card, $rating, $color, $placeholder)");
        ins.bindInt("team", id)
            .bindInt("slot", static_cast<int64_t>(i))
            .bindInt("rating", slot.rating)
            .bindInt("placeholder", slot.placeholder ? 1 : 0);
        if (slot.cardId) {
            ins.bindInt("card", static_cast<int64_t>(slot.cardId->value()));
        } else {
            ins.bindNull("card");
        }
        if (slot.color) {
            ins.bindString("color", std::string(colorName(*slot.color)));
        } else {
            ins.bindNull("color");
        }
        if (auto r = execute(txn, ins); !r) {
            return r;
        }
    }
    return txn.commit();
}

LeagueResult<Lobby> SqlLeagueStore::getLobby(LobbyId id) {
    SqlStatement stmt("SELECT id, name, status, current_matchday FROM lobbies WHERE id = $id");
    stmt.bindInt("id", static_cast<int64_t>(id.value()));
    auto rows = db_->query(stmt.resolve());
    if (!rows) {
        return LeagueResult<Lobby>::err(rows.error());
    }
    if (rows.value().empty()) {
        return LeagueResult<Lobby>::err(lobbyNotFound(id));
    }
    const auto& row = rows.value().front();

    auto status = parseLobbyStatus(asText(row, "status"));
    if (!status) {
        return LeagueResult<Lobby>::err(
            corrupted("lobby " + std::to_string(id.value()) + " has unknown status"));
    }

    Lobby lobby;
    lobby.id = id;
    lobby.name = asText(row, "name");
    lobby.status = *status;
    lobby.currentMatchday = static_cast<uint8_t>(asInt(row, "current_matchday"));

    SqlStatement members("SELECT user_id FROM lobby_members WHERE lobby_id = $id ORDER BY seat");
    members.bindInt("id", static_cast<int64_t>(id.value()));
    auto memberRows = db_->query(members.resolve());
    if (!memberRows) {
        return LeagueResult<Lobby>::err(memberRows.error());
    }
    for (const auto& m : memberRows.value()) {
        lobby.members.emplace_back(static_cast<uint64_t>(asInt(m, "user_id")));
    }
    return LeagueResult<Lobby>::ok(std::move(lobby));
}

LeagueResult<Team> SqlLeagueStore::getTeam(TeamId id) {
    SqlStatement stmt("SELECT id, user_id, lobby_id, name, formation, matchday "
                      "FROM teams WHERE id = $id");
    stmt.bindInt("id", static_cast<int64_t>(id.value()));
    auto rows = db_->query(stmt.resolve());
    if (!rows) {
        return LeagueResult<Team>::err(rows.error());
    }
    if (rows.value().empty()) {
        return LeagueResult<Team>::err(LeagueError(
            ErrorCode::TeamNotFound, "team " + std::to_string(id.value()) + " not found"));
    }
    const auto& row = rows.value().front();

    Team team;
    team.id = id;
    team.owner = UserId(static_cast<uint64_t>(asInt(row, "user_id")));
    team.lobby = LobbyId(static_cast<uint64_t>(asInt(row, "lobby_id")));
    team.name = asText(row, "name");
    team.formation = asText(row, "formation");
    team.matchday = static_cast<uint8_t>(asInt(row, "matchday"));

    SqlStatement slots("SELECT slot, card_id, rating, color, placeholder "
                       "FROM team_slots WHERE team_id = $id ORDER BY slot");
    slots.bindInt("id", static_cast<int64_t>(id.value()));
    auto slotRows = db_->query(slots.resolve());
    if (!slotRows) {
        return LeagueResult<Team>::err(slotRows.error());
    }
    for (const auto& s : slotRows.value()) {
        auto index = asInt(s, "slot");
        if (index < 0 || static_cast<std::size_t>(index) >= kSlotsPerTeam) {
            return LeagueResult<Team>::err(corrupted(
                "team " + std::to_string(id.value()) + " has slot index " +
                std::to_string(index)));
        }
        TeamSlot slot;
        if (auto card = optInt(s, "card_id")) {
            slot.cardId = CardId(static_cast<uint64_t>(*card));
        }
        slot.rating = static_cast<int32_t>(asInt(s, "rating"));
        if (auto color = optText(s, "color")) {
            slot.color = parseColor(*color);
            if (!slot.color) {
                return LeagueResult<Team>::err(corrupted("unknown color: " + *color));
            }
        }
        slot.placeholder = asInt(s, "placeholder") != 0;
        team.slots[static_cast<std::size_t>(index)] = slot;
    }
    return LeagueResult<Team>::ok(std::move(team));
}

LeagueResult<std::vector<Team>> SqlLeagueStore::getMatchdayTeams(
    LobbyId lobby, uint8_t matchday) {
    SqlStatement stmt("SELECT id FROM teams WHERE lobby_id = $lobby "
                      "AND matchday = $matchday ORDER BY id");
    stmt.bindInt("lobby", static_cast<int64_t>(lobby.value()))
        .bindInt("matchday", matchday);
    auto rows = db_->query(stmt.resolve());
    if (!rows) {
        return LeagueResult<std::vector<Team>>::err(rows.error());
    }

    std::vector<Team> teams;
    teams.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto team = getTeam(TeamId(static_cast<uint64_t>(asInt(row, "id"))));
        if (!team) {
            return LeagueResult<std::vector<Team>>::err(team.error());
        }
        teams.push_back(std::move(team).value());
    }
    return LeagueResult<std::vector<Team>>::ok(std::move(teams));
}

// -- Schedule ----------------------------------------------------------------

LeagueResult<std::vector<Match>> SqlLeagueStore::createSchedule(
    LobbyId lobby, std::vector<Match> matches) {
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<std::vector<Match>>::err(txnResult.error());
    }
    auto& txn = txnResult.value();

    auto exists = lobbyExists(txn, lobby);
    if (!exists) {
        return LeagueResult<std::vector<Match>>::err(exists.error());
    }
    if (!exists.value()) {
        return LeagueResult<std::vector<Match>>::err(lobbyNotFound(lobby));
    }

    auto count = countMatches(txn, lobby, std::nullopt);
    if (!count) {
        return LeagueResult<std::vector<Match>>::err(count.error());
    }
    if (count.value() > 0) {
        return LeagueResult<std::vector<Match>>::err(LeagueError(
            ErrorCode::AlreadyScheduled,
            "lobby " + std::to_string(lobby.value()) + " already has a league"));
    }

    auto stored = insertMatches(txn, lobby, std::move(matches));
    if (!stored) {
        return stored;
    }
    if (auto r = updateLobby(txn, lobby, LobbyStatus::InProgress, 1); !r) {
        return LeagueResult<std::vector<Match>>::err(r.error());
    }
    if (auto r = txn.commit(); !r) {
        return LeagueResult<std::vector<Match>>::err(r.error());
    }
    return stored;
}

LeagueResult<std::vector<Match>> SqlLeagueStore::addMatchday(
    LobbyId lobby, uint8_t matchday, std::vector<Match> matches) {
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<std::vector<Match>>::err(txnResult.error());
    }
    auto& txn = txnResult.value();

    auto exists = lobbyExists(txn, lobby);
    if (!exists) {
        return LeagueResult<std::vector<Match>>::err(exists.error());
    }
    if (!exists.value()) {
        return LeagueResult<std::vector<Match>>::err(lobbyNotFound(lobby));
    }

    auto count = countMatches(txn, lobby, matchday);
    if (!count) {
        return LeagueResult<std::vector<Match>>::err(count.error());
    }
    if (count.value() > 0) {
        return LeagueResult<std::vector<Match>>::err(LeagueError(
            ErrorCode::ScheduleAlreadyExists,
            "matchday " + std::to_string(matchday) + " already scheduled"));
    }

    for (auto& m : matches) {
        m.matchday = matchday;
    }
    auto stored = insertMatches(txn, lobby, std::move(matches));
    if (!stored) {
        return stored;
    }
    if (auto r = txn.commit(); !r) {
        return LeagueResult<std::vector<Match>>::err(r.error());
    }
    return stored;
}

LeagueResult<void> SqlLeagueStore::setLobbyProgress(
    LobbyId lobby, LobbyStatus status, uint8_t currentMatchday) {
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<void>::err(txnResult.error());
    }
    auto& txn = txnResult.value();

    auto exists = lobbyExists(txn, lobby);
    if (!exists) {
        return LeagueResult<void>::err(exists.error());
    }
    if (!exists.value()) {
        return LeagueResult<void>::err(lobbyNotFound(lobby));
    }
    if (auto r = updateLobby(txn, lobby, status, currentMatchday); !r) {
        return r;
    }
    return txn.commit();
}

// -- Matches -----------------------------------------------------------------

LeagueResult<Match> SqlLeagueStore::getMatch(MatchId id) {
    return loadMatch(*db_, id);
}

LeagueResult<std::vector<Match>> SqlLeagueStore::getLobbyMatches(LobbyId lobby) {
    SqlStatement stmt("SELECT " + std::string(kMatchColumns) +
                      " FROM matches WHERE lobby_id = $lobby ORDER BY matchday, id");
    stmt.bindInt("lobby", static_cast<int64_t>(lobby.value()));
    auto rows = db_->query(stmt.resolve());
    if (!rows) {
        return LeagueResult<std::vector<Match>>::err(rows.error());
    }

    std::vector<Match> matches;
    std::unordered_map<MatchId, std::size_t> index;
    matches.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto m = rowToMatch(row);
        index.emplace(m.id, matches.size());
        matches.push_back(std::move(m));
    }

    SqlStatement events("SELECT e.match_id AS match_id, e.minute AS minute, e.side AS side "
                        "FROM match_events e JOIN matches m ON m.id = e.match_id "
                        "WHERE m.lobby_id = $lobby ORDER BY e.match_id, e.seq");
    events.bindInt("lobby", static_cast<int64_t>(lobby.value()));
    auto eventRows = db_->query(events.resolve());
    if (!eventRows) {
        return LeagueResult<std::vector<Match>>::err(eventRows.error());
    }
    for (const auto& row : eventRows.value()) {
        auto it = index.find(MatchId(static_cast<uint64_t>(asInt(row, "match_id"))));
        if (it != index.end()) {
            matches[it->second].events.push_back(rowToEvent(row));
        }
    }
    return LeagueResult<std::vector<Match>>::ok(std::move(matches));
}

LeagueResult<Match> SqlLeagueStore::recordResult(MatchId id, const MatchResultRecord& result) {
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<Match>::err(txnResult.error());
    }
    auto& txn = txnResult.value();

    LogContext ctx;
    ctx.matchId = id;

    auto current = loadMatch(txn, id);
    if (!current) {
        return current;
    }
    if (current.value().played) {
        ctx.lobbyId = current.value().lobby;
        FCL_LOG_CTX(LogLevel::Debug, LogCategory::Store, "result rejected: already played", ctx);
        return LeagueResult<Match>::err(LeagueError(
            ErrorCode::AlreadyPlayed,
            "match " + std::to_string(id.value()) + " already played"));
    }

    SqlStatement update("UPDATE matches SET home_score = $home, away_score = $away, "
                        "played = 1, played_at = $at WHERE id = $id AND played = 0");
    update.bindInt("home", result.homeScore)
        .bindInt("away", result.awayScore)
        .bindInt("at", toMillis(result.playedAt))
        .bindInt("id", static_cast<int64_t>(id.value()));
    if (auto r = execute(txn, update); !r) {
        return LeagueResult<Match>::err(writeFailed("result write", r.error(), ctx));
    }

    for (std::size_t seq = 0; seq < result.events.size(); ++seq) {
        SqlStatement ins("INSERT INTO match_events (match_id, seq, minute, side) "
                         "VALUES ($id, $seq, $minute, $side)");
        ins.bindInt("id", static_cast<int64_t>(id.value()))
            .bindInt("seq", static_cast<int64_t>(seq))
            .bindInt("minute", result.events[seq].minute)
            .bindString("side", std::string(sideName(result.events[seq].side)));
        if (auto r = execute(txn, ins); !r) {
            return LeagueResult<Match>::err(writeFailed("event write", r.error(), ctx));
        }
    }

    auto updated = loadMatch(txn, id);
    if (!updated) {
        return updated;
    }
    if (auto r = txn.commit(); !r) {
        return LeagueResult<Match>::err(writeFailed("result commit", r.error(), ctx));
    }
    return updated;
}

// -- Rewards -----------------------------------------------------------------

LeagueResult<void> SqlLeagueStore::issueRewards(LobbyId lobby, const std::vector<Reward>& rewards) {
    if (rewards.empty()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "no rewards to issue"));
    }
    auto txnResult = db_->beginTransaction();
    if (!txnResult) {
        return LeagueResult<void>::err(txnResult.error());
    }
    auto& txn = txnResult.value();

    LogContext ctx;
    ctx.lobbyId = lobby;

    auto exists = lobbyExists(txn, lobby);
    if (!exists) {
        return LeagueResult<void>::err(exists.error());
    }
    if (!exists.value()) {
        return LeagueResult<void>::err(lobbyNotFound(lobby));
    }

    SqlStatement check("SELECT COUNT(*) AS n FROM rewards WHERE lobby_id = $lobby");
    check.bindInt("lobby", static_cast<int64_t>(lobby.value()));
    auto issued = txn.query(check.resolve());
    if (!issued) {
        return LeagueResult<void>::err(issued.error());
    }
    if (!issued.value().empty() && asInt(issued.value().front(), "n") > 0) {
        FCL_LOG_CTX(LogLevel::Debug, LogCategory::Store, "rewards rejected: already issued", ctx);
        return LeagueResult<void>::err(LeagueError(
            ErrorCode::RewardsAlreadyIssued,
            "rewards for lobby " + std::to_string(lobby.value()) + " already issued"));
    }

    for (const auto& reward : rewards) {
        auto user = static_cast<int64_t>(reward.userId.value());

        SqlStatement ins("INSERT INTO rewards (lobby_id, user_id, position, coins, issued_at) "
                         "VALUES ($lobby, $user, $position, $coins, $at)");
        ins.bindInt("lobby", static_cast<int64_t>(lobby.value()))
            .bindInt("user", user)
            .bindInt("position", reward.position)
            .bindInt("coins", reward.coins)
            .bindInt("at", toMillis(reward.issuedAt));
        if (auto r = execute(txn, ins); !r) {
            return LeagueResult<void>::err(writeFailed("reward write", r.error(), ctx));
        }

        SqlStatement balance("SELECT coins FROM user_balances WHERE user_id = $user");
        balance.bindInt("user", user);
        auto rows = txn.query(balance.resolve());
        if (!rows) {
            return LeagueResult<void>::err(rows.error());
        }
        SqlStatement credit(rows.value().empty()
            ? "INSERT INTO user_balances (user_id, coins) VALUES ($user, $coins)"
            : "UPDATE user_balances SET coins = coins + $coins WHERE user_id = $user");
        credit.bindInt("user", user).bindInt("coins", reward.coins);
        if (auto r = execute(txn, credit); !r) {
            return LeagueResult<void>::err(writeFailed("balance credit", r.error(), ctx));
        }
    }

    SqlStatement finish("UPDATE lobbies SET status = $status WHERE id = $id");
    finish.bindString("status", std::string(lobbyStatusName(LobbyStatus::Finished)))
        .bindInt("id", static_cast<int64_t>(lobby.value()));
    if (auto r = execute(txn, finish); !r) {
        return LeagueResult<void>::err(writeFailed("lobby finish", r.error(), ctx));
    }
    if (auto r = txn.commit(); !r) {
        return LeagueResult<void>::err(writeFailed("reward commit", r.error(), ctx));
    }
    return LeagueResult<void>::ok();
}

LeagueResult<std::vector<Reward>> SqlLeagueStore::getRewards(LobbyId lobby) {
    SqlStatement stmt("SELECT user_id, position, coins, issued_at FROM rewards "
                      "WHERE lobby_id = $lobby ORDER BY position");
    stmt.bindInt("lobby", static_cast<int64_t>(lobby.value()));
    auto rows = db_->query(stmt.resolve());
    if (!rows) {
        return LeagueResult<std::vector<Reward>>::err(rows.error());
    }

    std::vector<Reward> rewards;
    for (const auto& row : rows.value()) {
        Reward r;
        r.lobby = lobby;
        r.userId = UserId(static_cast<uint64_t>(asInt(row, "user_id")));
        r.position = static_cast<uint32_t>(asInt(row, "position"));
        r.coins = asInt(row, "coins");
        r.issuedAt = fromMillis(asInt(row, "issued_at"));
        rewards.push_back(r);
    }
    return LeagueResult<std::vector<Reward>>::ok(std::move(rewards));
}

LeagueResult<int64_t> SqlLeagueStore::getCoinBalance(UserId user) {
    SqlStatement stmt("SELECT coins FROM user_balances WHERE user_id = $user");
    stmt.bindInt("user", static_cast<int64_t>(user.value()));
    auto rows = db_->query(stmt.resolve());
    if (!rows) {
        return LeagueResult<int64_t>::err(rows.error());
    }
    return LeagueResult<int64_t>::ok(rows.value().empty() ? 0 : asInt(rows.value().front(), "coins"));
}

} // namespace fcl::service
