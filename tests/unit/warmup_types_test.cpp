/**
 * warmup_types_test.cpp - Warmup value types, schedules, settings and requests
 *
 * Tests:
 * - Account key encoding and normalisation
 * - Cadence / schedule mode strings and daily slot computation
 * - WarmupSettings fallbacks and the Antigravity-only rule
 * - Auth file matching, payload shape and endpoint fallback
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ctime>
#include <string>
#include <vector>

#include "mocks/mock_management_api.hpp"
#include "settings/settings_store.hpp"
#include "warmup/warmup_request.hpp"
#include "warmup/warmup_schedule.hpp"
#include "warmup/warmup_settings.hpp"
#include "warmup/warmup_types.hpp"

using namespace proxyvisor;
using namespace proxyvisor::warmup;
using proxyvisor::tests::MockManagementApi;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;

namespace {

// Local wall-clock time. Dates stay in summer, clear of DST transitions.
TimePoint local_time(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

WarmupAccountKey antigravity(const std::string &account) {
    return WarmupAccountKey{quota::Provider::ANTIGRAVITY, account};
}

proxy::AuthFile auth_file(const std::string &provider, const std::string &name, const std::string &email,
                          const std::string &auth_index) {
    proxy::AuthFile file;
    file.provider = provider;
    file.name = name;
    file.email = email;
    file.auth_index = auth_index;
    return file;
}

}  // namespace

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

TEST(WarmupTypesTest, AccountKeyEncodesProviderAndAccount) {
    EXPECT_EQ(antigravity("user@example.com").to_id(), "antigravity::user@example.com");

    auto key = WarmupAccountKey::from_id("antigravity::user@example.com");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->provider, quota::Provider::ANTIGRAVITY);
    EXPECT_EQ(key->account_key, "user@example.com");
}

TEST(WarmupTypesTest, AccountKeySplitsOnFirstDelimiter) {
    auto key = WarmupAccountKey::from_id("codex::team::member");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->provider, quota::Provider::CODEX);
    EXPECT_EQ(key->account_key, "team::member");
}

TEST(WarmupTypesTest, AccountKeyRejectsMalformedIds) {
    EXPECT_FALSE(WarmupAccountKey::from_id("antigravity").has_value());
    EXPECT_FALSE(WarmupAccountKey::from_id("nosuchprovider::user").has_value());
    EXPECT_FALSE(WarmupAccountKey::from_id("").has_value());
}

TEST(WarmupTypesTest, NormalizeAccountKey) {
    EXPECT_EQ(normalize_account_key("User@Example.COM"), "user@example.com");
    EXPECT_EQ(normalize_account_key("user.gmail.com"), "user@gmail.com");
    EXPECT_EQ(normalize_account_key("john.doe.example.com"), "john.doe@example.com");
    EXPECT_EQ(normalize_account_key("example.com"), "example.com");
    EXPECT_EQ(normalize_account_key("plain"), "plain");
    EXPECT_EQ(normalize_account_key(""), "");
}

TEST(WarmupTypesTest, CadenceStrings) {
    EXPECT_STREQ(cadence_to_string(WarmupCadence::FIFTEEN_MINUTES), "15min");
    EXPECT_STREQ(cadence_to_string(WarmupCadence::FOUR_HOURS), "4h");
    EXPECT_EQ(cadence_from_string("30min"), WarmupCadence::THIRTY_MINUTES);
    EXPECT_EQ(cadence_from_string("2h"), WarmupCadence::TWO_HOURS);
    EXPECT_FALSE(cadence_from_string("5h").has_value());
}

TEST(WarmupTypesTest, CadenceIntervals) {
    EXPECT_EQ(cadence_interval(WarmupCadence::FIFTEEN_MINUTES), std::chrono::minutes(15));
    EXPECT_EQ(cadence_interval(WarmupCadence::ONE_HOUR), std::chrono::hours(1));
    EXPECT_EQ(cadence_interval(WarmupCadence::THREE_HOURS), std::chrono::hours(3));
}

TEST(WarmupTypesTest, ScheduleModeAndStateStrings) {
    EXPECT_STREQ(schedule_mode_to_string(ScheduleMode::DAILY), "daily");
    EXPECT_EQ(schedule_mode_from_string("interval"), ScheduleMode::INTERVAL);
    EXPECT_FALSE(schedule_mode_from_string("weekly").has_value());
    EXPECT_STREQ(model_state_to_string(ModelState::SUCCEEDED), "succeeded");
    EXPECT_STREQ(model_state_to_string(ModelState::FAILED), "failed");
}

// ---------------------------------------------------------------------------
// Schedule
// ---------------------------------------------------------------------------

TEST(WarmupScheduleTest, DailySlotLaterToday) {
    auto now = local_time(2026, 7, 15, 8, 0);
    EXPECT_EQ(next_daily_run(540, now), local_time(2026, 7, 15, 9, 0));
}

TEST(WarmupScheduleTest, DailySlotPassedRollsToTomorrow) {
    auto now = local_time(2026, 7, 15, 10, 0);
    EXPECT_EQ(next_daily_run(540, now), local_time(2026, 7, 16, 9, 0));
}

TEST(WarmupScheduleTest, DailySlotExactlyNowRollsToTomorrow) {
    auto now = local_time(2026, 7, 15, 9, 0);
    EXPECT_EQ(next_daily_run(540, now), local_time(2026, 7, 16, 9, 0));
}

TEST(WarmupScheduleTest, DailySlotAcrossMonthEnd) {
    auto now = local_time(2026, 7, 31, 23, 30);
    EXPECT_EQ(next_daily_run(15, now), local_time(2026, 8, 1, 0, 15));
}

TEST(WarmupScheduleTest, IntervalSlot) {
    auto now = local_time(2026, 7, 15, 10, 0);
    EXPECT_EQ(next_interval_run(WarmupCadence::THIRTY_MINUTES, now), local_time(2026, 7, 15, 10, 30));
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

class WarmupSettingsTest : public ::testing::Test {
protected:
    settings::SettingsStore store_;
    WarmupSettings settings_{store_};
};

TEST_F(WarmupSettingsTest, OnlyAntigravityCanBeEnabled) {
    WarmupAccountKey codex{quota::Provider::CODEX, "user@example.com"};
    auto status = settings_.set_enabled(codex, true);
    EXPECT_EQ(status.code(), common::ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(settings_.is_enabled(codex));

    ASSERT_TRUE(settings_.set_enabled(antigravity("user@example.com"), true));
    EXPECT_TRUE(settings_.is_enabled(antigravity("user@example.com")));
}

TEST_F(WarmupSettingsTest, DisableRemovesAccount) {
    ASSERT_TRUE(settings_.set_enabled(antigravity("a@example.com"), true));
    ASSERT_TRUE(settings_.set_enabled(antigravity("a@example.com"), false));
    EXPECT_FALSE(settings_.is_enabled(antigravity("a@example.com")));
    EXPECT_TRUE(settings_.targets().empty());
}

TEST_F(WarmupSettingsTest, TargetsAreSortedAndFiltered) {
    ASSERT_TRUE(settings_.set_enabled(antigravity("zed@example.com"), true));
    ASSERT_TRUE(settings_.set_enabled(antigravity("amy@example.com"), true));
    // Hand-edited entries for other providers are ignored
    ASSERT_TRUE(store_.set("warmupEnabledAccounts",
                           nlohmann::json::array({"antigravity::zed@example.com", "antigravity::amy@example.com",
                                                  "codex::someone@example.com", "garbage"})));

    auto targets = settings_.targets();
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].account_key, "amy@example.com");
    EXPECT_EQ(targets[1].account_key, "zed@example.com");
}

TEST_F(WarmupSettingsTest, CadenceFallsBackToGlobalThenDefault) {
    auto key = antigravity("a@example.com");
    EXPECT_EQ(settings_.cadence(key), WarmupCadence::ONE_HOUR);

    ASSERT_TRUE(settings_.set_default_cadence(WarmupCadence::THIRTY_MINUTES));
    EXPECT_EQ(settings_.cadence(key), WarmupCadence::THIRTY_MINUTES);

    ASSERT_TRUE(settings_.set_cadence(key, WarmupCadence::FOUR_HOURS));
    EXPECT_EQ(settings_.cadence(key), WarmupCadence::FOUR_HOURS);
    EXPECT_EQ(settings_.cadence(antigravity("b@example.com")), WarmupCadence::THIRTY_MINUTES);
}

TEST_F(WarmupSettingsTest, UnknownStoredCadenceUsesDefault) {
    ASSERT_TRUE(store_.set("warmupCadence", "7h"));
    EXPECT_EQ(settings_.cadence(antigravity("a@example.com")), WarmupCadence::ONE_HOUR);
}

TEST_F(WarmupSettingsTest, ScheduleModePerAccount) {
    auto key = antigravity("a@example.com");
    EXPECT_EQ(settings_.schedule_mode(key), ScheduleMode::INTERVAL);
    ASSERT_TRUE(settings_.set_schedule_mode(key, ScheduleMode::DAILY));
    EXPECT_EQ(settings_.schedule_mode(key), ScheduleMode::DAILY);
}

TEST_F(WarmupSettingsTest, DailyMinutesDefaultAndClamp) {
    auto key = antigravity("a@example.com");
    EXPECT_EQ(settings_.daily_minutes(key), kDefaultDailyMinutes);

    ASSERT_TRUE(settings_.set_daily_minutes(key, 2000));
    EXPECT_EQ(settings_.daily_minutes(key), 1439);

    ASSERT_TRUE(store_.set("warmupDailyMinutes", -5));
    EXPECT_EQ(settings_.daily_minutes(antigravity("b@example.com")), 0);
}

TEST_F(WarmupSettingsTest, SelectedModels) {
    auto key = antigravity("a@example.com");
    EXPECT_TRUE(settings_.selected_models(key).empty());

    ASSERT_TRUE(settings_.set_selected_models(key, {"gemini-3-pro-preview", "gemini-3-flash-preview"}));
    EXPECT_EQ(settings_.selected_models(key),
              (std::vector<std::string>{"gemini-3-pro-preview", "gemini-3-flash-preview"}));

    WarmupAccountKey claude{quota::Provider::CLAUDE, "a@example.com"};
    EXPECT_EQ(settings_.set_selected_models(claude, {"x"}).code(), common::ErrorCode::INVALID_ARGUMENT);
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

TEST(WarmupRequestTest, ModelAliases) {
    EXPECT_EQ(map_model_alias("gemini-3-pro-preview"), "gemini-3-pro-high");
    EXPECT_EQ(map_model_alias("Gemini-Claude-Sonnet-4-5"), "claude-sonnet-4-5");
    EXPECT_EQ(map_model_alias("gemini-2.5-computer-use-preview-10-2025"), "rev19-uic3-1p");
    EXPECT_EQ(map_model_alias("custom-model"), "custom-model");
}

TEST(WarmupRequestTest, PayloadShape) {
    auto payload = build_warmup_payload("gemini-3-flash");

    EXPECT_EQ(payload["model"].get<std::string>(), "gemini-3-flash");
    EXPECT_EQ(payload["userAgent"].get<std::string>(), "antigravity");

    const std::string project = payload["project"].get<std::string>();
    EXPECT_THAT(project, StartsWith("warmup-"));
    EXPECT_EQ(project.size(), 12u);
    EXPECT_THAT(payload["requestId"].get<std::string>(), StartsWith("agent-"));

    const auto &request = payload["request"];
    const std::string session = request["sessionId"].get<std::string>();
    EXPECT_THAT(session, StartsWith("-"));
    EXPECT_EQ(session.size(), 13u);
    EXPECT_EQ(request["generationConfig"]["maxOutputTokens"].get<int>(), 1);
    ASSERT_EQ(request["contents"].size(), 1u);
    EXPECT_EQ(request["contents"][0]["role"].get<std::string>(), "user");
    EXPECT_EQ(request["contents"][0]["parts"][0]["text"].get<std::string>(), ".");
}

TEST(WarmupRequestTest, PayloadIdsAreFresh) {
    auto first = build_warmup_payload("m");
    auto second = build_warmup_payload("m");
    EXPECT_NE(first["requestId"], second["requestId"]);
}

TEST(WarmupRequestTest, MatchesAntigravityFileByNormalizedEmail) {
    std::vector<proxy::AuthFile> files = {
        auth_file("gemini-cli", "gemini.json", "user@gmail.com", "g-1"),
        auth_file("antigravity", "  ag.json  ", "User@Gmail.com", ""),
    };
    files[1].id = "ag-id";

    auto match = match_auth_file(files, "user.gmail.com");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->auth_index, "ag-id");
    EXPECT_EQ(match->file_name, "ag.json");
}

TEST(WarmupRequestTest, MatchesByFileName) {
    std::vector<proxy::AuthFile> files = {auth_file("antigravity", "work-account", "", "idx-7")};

    auto match = match_auth_file(files, "Work-Account");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->auth_index, "idx-7");
}

TEST(WarmupRequestTest, SkipsFilesWithoutNameOrIndex) {
    std::vector<proxy::AuthFile> files = {
        auth_file("antigravity", "", "a@example.com", "idx-1"),
        auth_file("antigravity", "a.json", "a@example.com", ""),
    };
    EXPECT_FALSE(match_auth_file(files, "a@example.com").has_value());
}

TEST(WarmupRequestTest, SendUsesFirstSuccessfulEndpoint) {
    NiceMock<MockManagementApi> api;
    std::vector<proxy::ApiCallRequest> seen;

    EXPECT_CALL(api, api_call(_, _))
        .WillOnce(Invoke([&seen](const proxy::ApiCallRequest &request, proxy::ApiCallResponse &response) {
            seen.push_back(request);
            response.status_code = 503;
            response.body = "unavailable";
            return common::Status::ok();
        }))
        .WillOnce(Invoke([&seen](const proxy::ApiCallRequest &request, proxy::ApiCallResponse &response) {
            seen.push_back(request);
            response.status_code = 200;
            return common::Status::ok();
        }));

    auto status = send_warmup(api, "idx-1", "gemini-3-pro-preview");
    ASSERT_TRUE(status) << status.message();

    ASSERT_EQ(seen.size(), 2u);
    const auto &endpoints = warmup_endpoints();
    EXPECT_EQ(seen[0].url, endpoints[0] + "/v1internal:generateContent");
    EXPECT_EQ(seen[1].url, endpoints[1] + "/v1internal:generateContent");
    EXPECT_EQ(seen[0].auth_index, "idx-1");
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].headers.at("Authorization"), "Bearer $TOKEN$");
    auto body = nlohmann::json::parse(seen[0].data);
    EXPECT_EQ(body["model"].get<std::string>(), "gemini-3-pro-high");
}

TEST(WarmupRequestTest, SendReportsLastFailure) {
    NiceMock<MockManagementApi> api;
    EXPECT_CALL(api, api_call(_, _))
        .Times(static_cast<int>(warmup_endpoints().size()))
        .WillRepeatedly(Invoke([](const proxy::ApiCallRequest &, proxy::ApiCallResponse &response) {
            response.status_code = 500;
            response.body = "boom";
            return common::Status::ok();
        }));

    auto status = send_warmup(api, "idx-1", "gemini-3-flash");
    EXPECT_EQ(status.code(), common::ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(status.message(), "Warmup failed: HTTP 500: boom");
}

TEST(WarmupRequestTest, SendReportsTransportError) {
    NiceMock<MockManagementApi> api;
    ON_CALL(api, api_call(_, _))
        .WillByDefault(Return(common::Status::error(common::ErrorCode::NETWORK_ERROR, "connection refused")));

    auto status = send_warmup(api, "idx-1", "gemini-3-flash");
    EXPECT_FALSE(status);
    EXPECT_THAT(status.message(), HasSubstr("connection refused"));
}
