#include "events/event_model.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

TEST_CASE("EventType maps to stable string values", "[core][events][json]") {
  using norma::events::EventType;
  REQUIRE(norma::events::ToJson(EventType::kSessionStarted) == "session_started");
  REQUIRE(norma::events::ToJson(EventType::kPlanInstalled) == "plan_installed");
  REQUIRE(norma::events::ToJson(EventType::kStepDispatched) == "step_dispatched");
  REQUIRE(norma::events::ToJson(EventType::kStepJudged) == "step_judged");
  REQUIRE(norma::events::ToJson(EventType::kReplanned) == "replanned");
  REQUIRE(norma::events::ToJson(EventType::kFinalized) == "finalized");
  REQUIRE(norma::events::ToJson(EventType::kEscalated) == "escalated");
  REQUIRE(norma::events::ToJson(EventType::kSessionError) == "session_error");
}

TEST_CASE("Event JSON serialization includes timestamp type and payload", "[core][events][json]") {
  norma::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  event.type = norma::events::EventType::kStepJudged;
  event.payload = {
      {"verdict", "REPLAN"},
      {"session_id", "session-2000"},
  };

  const std::string json = norma::events::ToJson(event);
  REQUIRE(
      json ==
      R"({"ts_utc":"1970-01-01T00:00:02.000Z","type":"step_judged","payload":{"session_id":"session-2000","verdict":"REPLAN"}})");
}

TEST_CASE("Event payload values are JSON-escaped", "[core][events][json]") {
  norma::events::Event event;
  event.type = norma::events::EventType::kEscalated;
  event.payload = {{"reason", "quote \" and backslash \\"}};

  const std::string json = norma::events::ToJson(event);
  REQUIRE(json.find(R"("reason":"quote \" and backslash \\")") != std::string::npos);
}
