/*
 * 설명: 경주 틱 루프와 지연 리셋 타이머를 돌리고 플레이어 요청을 strand 위에서 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#include "cuberace/race_service.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "cuberace/projection.hpp"

namespace cuberace {
namespace {
std::string_view MoveKindName(MoveKind kind) {
  switch (kind) {
    case MoveKind::kUnchanged:
      return "unchanged";
    case MoveKind::kMoved:
      return "moved";
    case MoveKind::kMovedWithPush:
      return "pushed";
  }
  return "unchanged";
}
}  // namespace

RaceService::RaceService(boost::asio::io_context& ioc, std::shared_ptr<RealtimeCoordinator> coordinator,
                         std::shared_ptr<Observability> observability, MapCatalog catalog, const RaceTiming& timing)
    : strand_(boost::asio::make_strand(ioc)), tick_timer_(ioc), reset_timer_(ioc),
      coordinator_(std::move(coordinator)), observability_(std::move(observability)), catalog_(std::move(catalog)),
      timing_(timing), engine_(DefaultTeams(), catalog_.Current(), timing.command_cooldown) {}

void RaceService::Start() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->LogEvent(LogLevel::kInfo, "race_service_started", std::nullopt, std::nullopt,
                   {{"mapName", self->engine_.MapName()},
                    {"tickIntervalMs", self->timing_.tick_interval.count()},
                    {"cooldownMs", self->timing_.command_cooldown.count()}});
    self->tick_timer_.expires_after(self->timing_.tick_interval);
    self->ScheduleTick();
  });
}

void RaceService::Stop() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->stopped_ = true;
    self->tick_timer_.cancel();
    self->reset_timer_.cancel();
  });
}

void RaceService::Connect(const std::string& player_id) {
  boost::asio::post(strand_, [self = shared_from_this(), player_id]() {
    auto team_id = self->engine_.AddPlayer(player_id);
    self->coordinator_->AssignTeam(player_id, team_id);
    self->observability_->SetPlayersConnected(self->engine_.PlayerCount());
    self->coordinator_->SendEventToPlayer(player_id, "init", BuildInitPayload(self->engine_, player_id, team_id));
    self->LogEvent(LogLevel::kInfo, "player_connected", player_id, team_id);
  });
}

void RaceService::Disconnect(const std::string& player_id) {
  boost::asio::post(strand_, [self = shared_from_this(), player_id]() {
    auto team_id = self->engine_.TeamOf(player_id);
    if (!self->engine_.RemovePlayer(player_id)) {
      return;
    }
    self->observability_->SetPlayersConnected(self->engine_.PlayerCount());
    self->LogEvent(LogLevel::kInfo, "player_disconnected", player_id, team_id);
  });
}

void RaceService::SubmitCommand(const std::string& player_id, const std::string& direction) {
  boost::asio::post(strand_, [self = shared_from_this(), player_id, direction]() {
    auto result = self->engine_.SubmitCommand(player_id, direction, CommandIntake::Clock::now());
    self->observability_->IncrementCommand(result.accepted());
    switch (result.status) {
      case IntakeStatus::kAccepted:
        self->coordinator_->SendEventToTeam(result.team_id, player_id, "command_echo",
                                            {{"from", player_id}, {"direction", std::string(ToString(*result.direction))}});
        break;
      case IntakeStatus::kRaceNotRunning:
        self->coordinator_->SendErrorToPlayer(player_id, "race_not_started", "경주가 아직 시작되지 않았습니다");
        break;
      case IntakeStatus::kOnCooldown:
        self->coordinator_->SendErrorToPlayer(player_id, "rate_limited", "명령 대기 시간이 남아 있습니다",
                                              {{"remainingMs", result.remaining.count()}});
        break;
      case IntakeStatus::kInvalidDirection:
      case IntakeStatus::kUnknownPlayer:
        // 알림 없이 무시한다.
        self->LogEvent(LogLevel::kDebug, "command_ignored", player_id, std::nullopt,
                       {{"reason", std::string(ToString(result.status))}, {"direction", direction}});
        break;
    }
  });
}

void RaceService::RequestStart(const std::string& player_id) {
  boost::asio::post(strand_, [self = shared_from_this(), player_id]() {
    if (!self->engine_.StartRace()) {
      self->LogEvent(LogLevel::kDebug, "race_start_ignored", player_id, std::nullopt);
      return;
    }
    self->reset_timer_.cancel();
    self->observability_->SetRaceRunning(true);
    self->BroadcastSnapshot("race_started", std::nullopt);
    self->LogEvent(LogLevel::kInfo, "race_started", player_id, std::nullopt, {{"mapName", self->engine_.MapName()}});
  });
}

void RaceService::RequestNextMap(const std::string& player_id) {
  boost::asio::post(strand_, [self = shared_from_this(), player_id]() {
    self->engine_.ChangeMap(self->catalog_.Advance());
    self->reset_timer_.cancel();
    self->observability_->SetRaceRunning(false);
    self->BroadcastSnapshot("map_changed", std::nullopt);
    self->LogEvent(LogLevel::kInfo, "map_changed", player_id, std::nullopt, {{"mapName", self->engine_.MapName()}});
  });
}

void RaceService::ScheduleTick() {
  tick_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code& ec) {
        if (!ec) {
          self->HandleTick();
        }
      }));
}

void RaceService::HandleTick() {
  if (stopped_) {
    return;
  }
  auto report = engine_.TickOnce();
  observability_->IncrementTick();
  if (observability_->Enabled(LogLevel::kDebug)) {
    for (const auto& move : report.moves) {
      LogEvent(LogLevel::kDebug, "move_applied", std::nullopt, move.team_id,
               {{"tick", report.tick},
                {"direction", std::string(ToString(move.direction))},
                {"result", std::string(MoveKindName(move.outcome.kind))},
                {"cube", CellToJson(move.outcome.position)}});
    }
  }

  // 승리 틱의 state는 running 상태로 나간 뒤에 경주를 종료한다.
  BroadcastSnapshot("state", report.winner);

  if (report.winner) {
    if (auto ticket = engine_.FinishRace()) {
      observability_->IncrementRaceFinished();
      observability_->SetRaceRunning(false);
      LogEvent(LogLevel::kInfo, "race_won", std::nullopt, report.winner, {{"tick", report.tick}});
      ScheduleReset(*ticket);
    }
  }

  // 밀린 틱은 따라잡지 않는다.
  tick_timer_.expires_after(timing_.tick_interval);
  ScheduleTick();
}

void RaceService::ScheduleReset(std::uint64_t ticket) {
  reset_timer_.expires_after(timing_.reset_delay);
  reset_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this(), ticket](const boost::system::error_code& ec) {
        if (!ec) {
          self->HandleReset(ticket);
        }
      }));
}

void RaceService::HandleReset(std::uint64_t ticket) {
  if (stopped_) {
    return;
  }
  if (!engine_.ApplyScheduledReset(ticket)) {
    LogEvent(LogLevel::kDebug, "race_reset_superseded", std::nullopt, std::nullopt, {{"ticket", ticket}});
    return;
  }
  BroadcastSnapshot("reset", std::nullopt);
  LogEvent(LogLevel::kInfo, "race_reset", std::nullopt, std::nullopt, {{"mapName", engine_.MapName()}});
}

void RaceService::BroadcastSnapshot(const std::string& event, const std::optional<std::string>& winner) {
  coordinator_->Broadcast(event, BuildRaceSnapshot(engine_, winner));
}

void RaceService::LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& player_id,
                           const std::optional<std::string>& team_id, nlohmann::json detail) {
  if (!observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.player_id = player_id;
  ctx.team_id = team_id;
  ctx.name = name;
  ctx.detail = std::move(detail);
  observability_->Log(level, ctx);
}

}  // namespace cuberace
