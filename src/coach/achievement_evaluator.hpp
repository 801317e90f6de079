#pragma once

#include "metrics_aggregator.hpp"

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct AchievementRules {
    std::vector<int> session_milestones = {5, 10, 25};
    double filler_reduction = 0.20;   // fraction drop week over week
    double speed_improvement = 0.20;  // fraction rise week over week
    double clarity_improvement = 0.15;
    size_t consistency_weeks = 3;
};

struct AchievementDefinition {
    std::string_view id;
    std::string_view title;
    std::string_view description;
};

namespace achievements {

std::span<const AchievementDefinition> catalog();
const AchievementDefinition* find(std::string_view id);

// Ids of achievements the user qualifies for but has not unlocked yet.
std::vector<std::string> detect(const UserMetrics& metrics, const AchievementRules& rules = {});

// Appends catalog entries for the given ids, skipping unknown or already unlocked ones.
// Session milestones missing from the catalog ("session-7") get a generated entry.
// Returns the number appended.
size_t unlock(UserMetrics& metrics, std::span<const std::string> ids,
              std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace achievements
