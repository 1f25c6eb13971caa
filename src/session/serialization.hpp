#pragma once

#include <nlohmann/json.hpp>
#include "session_types.hpp"

using json = nlohmann::json;

// JSON mapping of the session data model. Doubles are written with
// round-trip precision so stored impacts reload bit-for-bit.

void to_json(json &j, const CalibrationProfile &profile);
void from_json(const json &j, CalibrationProfile &profile);

void to_json(json &j, const Impact &impact);
void from_json(const json &j, Impact &impact);

void to_json(json &j, const SessionStatistics &stats);
void to_json(json &j, const SessionSummary &summary);

namespace serialization
{
    // Session metadata without the impact list
    json sessionHeader(const Session &session);

    // Full session including impacts and statistics
    json sessionToJson(const Session &session);

    json statusToJson(const StatusSnapshot &status);

    json commandToJson(const CommandResult &result);

    json eventToJson(const string &type, const string &session_id, const Impact *impact, const string &state, uint64_t timestamp);
}
