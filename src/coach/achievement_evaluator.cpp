#include "achievement_evaluator.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <optional>

namespace achievements {

namespace {

constexpr std::array<AchievementDefinition, 7> definitions = {{
    {"session-5", "Getting Started", "Completed 5 practice sessions"},
    {"session-10", "Regular Practice", "Completed 10 practice sessions"},
    {"session-25", "Dedication", "Completed 25 practice sessions"},
    {"filler-reduction", "Filler Eliminator", "Reduced filler words by 20% in a week"},
    {"speed-improvement", "Speed Master", "Improved speaking pace by 20% in a week"},
    {"clarity-improvement", "Crystal Clear", "Improved clarity score by 15% in a week"},
    {"consistency", "Consistent Practice", "Practiced every week for 3 consecutive weeks"},
}};

// Parses "session-N" for a positive N.
std::optional<int> milestone_count(std::string_view id) {
    constexpr std::string_view prefix = "session-";
    if (!id.starts_with(prefix)) return std::nullopt;
    auto digits = id.substr(prefix.size());
    int n = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
    if (ec != std::errc{} || end != digits.data() + digits.size() || n <= 0) return std::nullopt;
    return n;
}

bool unlocked(const UserMetrics& metrics, std::string_view id) {
    return std::any_of(metrics.achievements.begin(), metrics.achievements.end(),
                       [id](const Achievement& a) { return a.id == id; });
}

} // namespace

std::span<const AchievementDefinition> catalog() {
    return definitions;
}

const AchievementDefinition* find(std::string_view id) {
    auto it = std::find_if(definitions.begin(), definitions.end(),
                           [id](const AchievementDefinition& d) { return d.id == id; });
    return it == definitions.end() ? nullptr : &*it;
}

std::vector<std::string> detect(const UserMetrics& metrics, const AchievementRules& rules) {
    std::vector<std::string> earned;
    auto award = [&](std::string id) {
        if (!unlocked(metrics, id)) earned.push_back(std::move(id));
    };

    for (int milestone : rules.session_milestones) {
        if (metrics.session_count >= milestone) {
            award(std::format("session-{}", milestone));
        }
    }

    const auto& weeks = metrics.weekly_progress;
    if (weeks.size() >= 2) {
        const auto& last = std::prev(weeks.end())->second;
        const auto& previous = std::prev(weeks.end(), 2)->second;

        if (last.filler_word_percentage < previous.filler_word_percentage * (1.0 - rules.filler_reduction)) {
            award("filler-reduction");
        }
        // A zero baseline (no timed sessions that week) cannot show an improvement.
        if (previous.words_per_minute > 0.0 &&
            last.words_per_minute > previous.words_per_minute * (1.0 + rules.speed_improvement)) {
            award("speed-improvement");
        }
        if (previous.clarity_score > 0.0 &&
            last.clarity_score > previous.clarity_score * (1.0 + rules.clarity_improvement)) {
            award("clarity-improvement");
        }
    }

    if (rules.consistency_weeks > 0 && weeks.size() >= rules.consistency_weeks) {
        auto first = std::prev(weeks.end(), static_cast<std::ptrdiff_t>(rules.consistency_weeks));
        bool consistent = true;
        for (auto it = first; it != weeks.end(); ++it) {
            if (it->second.total_sessions <= 0) consistent = false;
            auto next = std::next(it);
            if (next != weeks.end() && aggregation::next_week_id(it->first) != next->first) {
                consistent = false;
            }
        }
        if (consistent) award("consistency");
    }

    return earned;
}

size_t unlock(UserMetrics& metrics, std::span<const std::string> ids,
              std::chrono::system_clock::time_point now) {
    size_t added = 0;
    for (const auto& id : ids) {
        if (unlocked(metrics, id)) continue;

        Achievement a{.id = id, .achieved_at = now};
        if (const auto* def = find(id)) {
            a.title = def->title;
            a.description = def->description;
        } else if (auto n = milestone_count(id)) {
            // Milestones configured beyond the catalog.
            a.title = std::format("{} Sessions", *n);
            a.description = std::format("Completed {} practice sessions", *n);
        } else {
            continue;
        }
        metrics.achievements.push_back(std::move(a));
        ++added;
    }
    return added;
}

} // namespace achievements
