#include <catch2/catch_test_macros.hpp>

#include "achievement_evaluator.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono;

namespace {

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

UserMetrics two_weeks(WeeklyAggregate previous, WeeklyAggregate last) {
    UserMetrics m;
    m.session_count = previous.total_sessions + last.total_sessions;
    m.weekly_progress["2026-42"] = previous;
    m.weekly_progress["2026-43"] = last;
    return m;
}

} // namespace

TEST_CASE("achievements::catalog", "[achievements]") {
    REQUIRE(achievements::catalog().size() == 7);

    auto* def = achievements::find("consistency");
    REQUIRE(def != nullptr);
    REQUIRE(def->title == "Consistent Practice");
    REQUIRE(achievements::find("session-5")->title == "Getting Started");
    REQUIRE(achievements::find("nope") == nullptr);
}

TEST_CASE("achievements::detect milestones", "[achievements]") {
    auto now = sys_days{2026y / October / 19} + hours{9};

    SECTION("FifthSessionUnlocksOnce") {
        UserMetrics m;
        std::vector<int> earned_at;
        for (int i = 1; i <= 12; ++i) {
            m = aggregation::record_session(std::move(m), {"s" + std::to_string(i), 150, 5, 80, 60}, now);
            auto earned = achievements::detect(m);
            achievements::unlock(m, earned, now);
            if (contains(earned, "session-5")) earned_at.push_back(i);
        }
        REQUIRE(earned_at == std::vector<int>{5});
        REQUIRE(m.achievements.size() == 2);
        REQUIRE(m.achievements[0].id == "session-5");
        REQUIRE(m.achievements[1].id == "session-10");
    }

    SECTION("NotBeforeMilestone") {
        UserMetrics m;
        m.session_count = 4;
        REQUIRE(achievements::detect(m).empty());
    }

    SECTION("AlreadyUnlockedIsSkipped") {
        UserMetrics m;
        m.session_count = 7;
        achievements::unlock(m, std::vector<std::string>{"session-5"}, now);
        REQUIRE_FALSE(contains(achievements::detect(m), "session-5"));
    }

    SECTION("CustomMilestones") {
        UserMetrics m;
        m.session_count = 1;
        AchievementRules rules;
        rules.session_milestones = {1};
        REQUIRE(achievements::detect(m, rules) == std::vector<std::string>{"session-1"});
    }

    SECTION("MilestoneOutsideCatalogUnlocksOnce") {
        UserMetrics m;
        m.session_count = 7;
        AchievementRules rules;
        rules.session_milestones = {7};

        auto earned = achievements::detect(m, rules);
        REQUIRE(earned == std::vector<std::string>{"session-7"});
        REQUIRE(achievements::unlock(m, earned, now) == 1);
        REQUIRE(m.achievements[0].id == "session-7");
        REQUIRE(m.achievements[0].title == "7 Sessions");
        REQUIRE(m.achievements[0].description == "Completed 7 practice sessions");

        REQUIRE(achievements::detect(m, rules).empty());
    }
}

TEST_CASE("achievements::detect weekly improvements", "[achievements]") {

    SECTION("FillerReduction") {
        auto m = two_weeks({150, 10, 70, 1}, {150, 7, 70, 1});
        auto earned = achievements::detect(m);
        REQUIRE(contains(earned, "filler-reduction"));
        REQUIRE_FALSE(contains(earned, "speed-improvement"));
        REQUIRE_FALSE(contains(earned, "clarity-improvement"));
    }

    SECTION("FillerReductionNeedsTwentyPercent") {
        auto m = two_weeks({150, 10, 70, 1}, {150, 8.5, 70, 1});
        REQUIRE_FALSE(contains(achievements::detect(m), "filler-reduction"));
    }

    SECTION("SpeedImprovement") {
        REQUIRE(contains(achievements::detect(two_weeks({100, 5, 70, 1}, {121, 5, 70, 1})), "speed-improvement"));
        REQUIRE_FALSE(contains(achievements::detect(two_weeks({100, 5, 70, 1}, {119, 5, 70, 1})), "speed-improvement"));
    }

    SECTION("ClarityImprovement") {
        REQUIRE(contains(achievements::detect(two_weeks({150, 5, 60, 1}, {150, 5, 70, 1})), "clarity-improvement"));
        REQUIRE_FALSE(contains(achievements::detect(two_weeks({150, 5, 60, 1}, {150, 5, 68, 1})), "clarity-improvement"));
    }

    SECTION("ZeroBaselineIsNotImprovement") {
        auto earned = achievements::detect(two_weeks({0, 0, 0, 1}, {150, 5, 80, 1}));
        REQUIRE_FALSE(contains(earned, "speed-improvement"));
        REQUIRE_FALSE(contains(earned, "clarity-improvement"));
        REQUIRE_FALSE(contains(earned, "filler-reduction"));
    }

    SECTION("SingleWeekHasNoImprovements") {
        UserMetrics m;
        m.weekly_progress["2026-43"] = {150, 5, 80, 3};
        REQUIRE(achievements::detect(m).empty());
    }
}

TEST_CASE("achievements::detect consistency", "[achievements]") {
    UserMetrics m;

    SECTION("ThreeConsecutiveWeeks") {
        m.weekly_progress["2026-41"] = {150, 5, 80, 1};
        m.weekly_progress["2026-42"] = {150, 5, 80, 2};
        m.weekly_progress["2026-43"] = {150, 5, 80, 1};
        REQUIRE(contains(achievements::detect(m), "consistency"));
    }

    SECTION("GapBreaksStreak") {
        m.weekly_progress["2026-40"] = {150, 5, 80, 1};
        m.weekly_progress["2026-41"] = {150, 5, 80, 1};
        m.weekly_progress["2026-43"] = {150, 5, 80, 1};
        REQUIRE_FALSE(contains(achievements::detect(m), "consistency"));
    }

    SECTION("AcrossYearEnd") {
        m.weekly_progress["2026-52"] = {150, 5, 80, 1};
        m.weekly_progress["2026-53"] = {150, 5, 80, 1};
        m.weekly_progress["2027-01"] = {150, 5, 80, 1};
        REQUIRE(contains(achievements::detect(m), "consistency"));
    }

    SECTION("EmptyWeekBreaksStreak") {
        m.weekly_progress["2026-41"] = {150, 5, 80, 1};
        m.weekly_progress["2026-42"] = {0, 0, 0, 0};
        m.weekly_progress["2026-43"] = {150, 5, 80, 1};
        REQUIRE_FALSE(contains(achievements::detect(m), "consistency"));
    }

    SECTION("TwoWeeksNotEnough") {
        m.weekly_progress["2026-42"] = {150, 5, 80, 1};
        m.weekly_progress["2026-43"] = {150, 5, 80, 1};
        REQUIRE_FALSE(contains(achievements::detect(m), "consistency"));
    }
}

TEST_CASE("achievements::unlock", "[achievements]") {
    auto now = sys_days{2026y / October / 19} + hours{9};
    UserMetrics m;

    std::vector<std::string> ids = {"session-5", "bogus", "session-x", "session-0", "session-5", "consistency"};
    REQUIRE(achievements::unlock(m, ids, now) == 2);
    REQUIRE(m.achievements.size() == 2);
    REQUIRE(m.achievements[0].title == "Getting Started");
    REQUIRE(m.achievements[0].achieved_at == now);
    REQUIRE(m.achievements[1].id == "consistency");

    REQUIRE(achievements::unlock(m, ids, now + hours{1}) == 0);
    REQUIRE(m.achievements[0].achieved_at == now);
}
