#pragma once

#include "metrics_aggregator.hpp"
#include "speech_types.hpp"

#include <nlohmann/json.hpp>

// Document shapes exchanged with the persistence collaborator. Field names are
// part of the stored format and must not change.

void to_json(nlohmann::json& j, const WordTiming& w);
void from_json(const nlohmann::json& j, WordTiming& w);

void to_json(nlohmann::json& j, const FillerOccurrence& f);
void from_json(const nlohmann::json& j, FillerOccurrence& f);

void to_json(nlohmann::json& j, const Pause& p);
void from_json(const nlohmann::json& j, Pause& p);

void to_json(nlohmann::json& j, const RapidWord& r);
void from_json(const nlohmann::json& j, RapidWord& r);

void to_json(nlohmann::json& j, const Sentence& s);
void from_json(const nlohmann::json& j, Sentence& s);

void to_json(nlohmann::json& j, const SpeechMetrics& m);
void from_json(const nlohmann::json& j, SpeechMetrics& m);

void to_json(nlohmann::json& j, const Feedback& f);

void to_json(nlohmann::json& j, const WeeklyAggregate& w);
void from_json(const nlohmann::json& j, WeeklyAggregate& w);

void to_json(nlohmann::json& j, const Achievement& a);
void from_json(const nlohmann::json& j, Achievement& a);

void to_json(nlohmann::json& j, const UserMetrics& m);
void from_json(const nlohmann::json& j, UserMetrics& m);

void to_json(nlohmann::json& j, const ProgressSummary& p);
