/**
 * Tests for the substitution event log
 */

#include "test_fixtures.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

TEST(EventLog, FormatsReadableLine) {
    SubstitutionEvent event(TeamSide::HOME, 2, 392, "h1", "h6",
                            SubstitutionReason::STAMINA_CRITICAL, 68.0, 95.0);

    TEST_ASSERT_EQ("6:32", event.game_time());
    TEST_ASSERT_EQ("Q2 6:32 [home] OUT h1 (68.0) IN h6 (95.0) - stamina below threshold",
                   EventLog::format_event(event));
}

TEST(EventLog, ReasonCodesAreStable) {
    TEST_ASSERT_EQ(std::string("stamina_rule2"), to_string(SubstitutionReason::STAMINA_CRITICAL));
    TEST_ASSERT_EQ(std::string("starter_return_rule1"), to_string(SubstitutionReason::STARTER_RETURN));
    TEST_ASSERT_EQ(std::string("close_game_insert_closer"), to_string(SubstitutionReason::CLOSER_INSERT));
    TEST_ASSERT_EQ(std::string("garbage_time"), to_string(SubstitutionReason::GARBAGE_TIME));
    TEST_ASSERT_EQ(std::string("garbage time"), describe_reason(SubstitutionReason::GARBAGE_TIME));
}

TEST(EventLog, FiltersByTeamAndReason) {
    EventLog log;
    log.append(SubstitutionEvent(TeamSide::HOME, 1, 300, "h1", "h6",
                                 SubstitutionReason::MINUTES_QUOTA, 80.0, 100.0));
    log.append({
        SubstitutionEvent(TeamSide::AWAY, 1, 300, "a2", "a7", SubstitutionReason::MINUTES_QUOTA, 82.0, 100.0),
        SubstitutionEvent(TeamSide::AWAY, 1, 200, "a3", "a8", SubstitutionReason::STAMINA_CRITICAL, 65.0, 99.0)
    });

    TEST_ASSERT_EQ(3u, log.size());
    TEST_ASSERT_EQ(2u, log.for_team(TeamSide::AWAY).size());
    TEST_ASSERT_EQ(2u, log.with_reason(SubstitutionReason::MINUTES_QUOTA).size());

    // One line per event, in append order
    const std::string text = log.format();
    TEST_ASSERT_TRUE(text.find("OUT h1") < text.find("OUT a3"));
}

TEST(EventLog, JsonExport) {
    EventLog log;
    log.append(SubstitutionEvent(TeamSide::AWAY, 4, 95, "a1", "a6",
                                 SubstitutionReason::CLOSER_INSERT, 72.5, 88.0));

    nlohmann::json data = log.to_json();
    TEST_ASSERT_TRUE(data.is_array());
    TEST_ASSERT_EQ(1u, data.size());

    const auto& entry = data[0];
    TEST_ASSERT_EQ("away", entry["team"].get<std::string>());
    TEST_ASSERT_EQ(4, entry["quarter"].get<int>());
    TEST_ASSERT_EQ("1:35", entry["game_time"].get<std::string>());
    TEST_ASSERT_EQ("close_game_insert_closer", entry["reason"].get<std::string>());
    TEST_ASSERT_EQ("closer in for a close finish", entry["description"].get<std::string>());
    TEST_ASSERT_NEAR(72.5, entry["stamina_out"].get<double>(), 1e-9);

    auto parsed = nlohmann::json::parse(log.to_json_string());
    TEST_ASSERT_TRUE(parsed == data);
}

TEST(EventLog, ClockHelpers) {
    TEST_ASSERT_EQ("12:00", format_clock(720));
    TEST_ASSERT_EQ("0:05", format_clock(5));
    TEST_ASSERT_EQ("0:00", format_clock(-3));
    TEST_ASSERT_EQ(392, parse_clock("6:32").value());
    TEST_ASSERT_FALSE(parse_clock("6:75").has_value());
    TEST_ASSERT_FALSE(parse_clock("abc").has_value());
}

TEST(TraceLogger, WritesEventsToMatchTrace) {
    const std::string dir = (std::filesystem::temp_directory_path() / "hoops_trace_test").string();
    RotationTraceLogger logger(dir);
    TEST_ASSERT_TRUE(logger.is_enabled());

    logger.log_check(GameContext(2, 392, 30, 28));
    logger.log_event(SubstitutionEvent(TeamSide::HOME, 2, 392, "h1", "h6",
                                       SubstitutionReason::STAMINA_CRITICAL, 68.0, 95.0));

    std::ifstream file(logger.get_log_path());
    std::stringstream contents;
    contents << file.rdbuf();
    TEST_ASSERT_TRUE(contents.str().find("Q2 6:32 [home] OUT h1") != std::string::npos);
    TEST_ASSERT_TRUE(contents.str().find("[stamina_rule2]") != std::string::npos);

    logger.set_enabled(false);
    logger.log_event(SubstitutionEvent(TeamSide::AWAY, 3, 100, "a1", "a6",
                                       SubstitutionReason::MANUAL, 80.0, 90.0));
    std::ifstream reread(logger.get_log_path());
    std::stringstream after;
    after << reread.rdbuf();
    TEST_ASSERT_TRUE(after.str().find("OUT a1") == std::string::npos);
}
