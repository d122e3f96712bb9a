/*
Beacon — TraceReader
Role: Loads recorded pointer traces (JSON) for beacon_replay and the replay tests.
Inputs/Outputs: {"scrollTop": n, "refreshMs": n, "refreshFails": b,
      "samples": [{"x","y","t","phase","pointerId"?}, ...]} in; PointerTrace out.
Threading: Stateless.
Observability: None; failures are reported by exception.
Assumptions: Sample timestamps are milliseconds and never decrease.
*/
#pragma once

#include "interaction/PointerTypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

struct PointerTrace {
    double scrollTop = 0.0;
    qint64 refreshMs = 0;          // Simulated refresh() duration for pull gestures
    bool refreshFails = false;
    std::vector<PointerSample> samples;
};

class TraceReader {
public:
    /// Throws std::runtime_error on malformed JSON or samples.
    static PointerTrace parse(const std::string& text);
    static PointerTrace parse(const nlohmann::json& document);

    /// Throws std::runtime_error when the file cannot be opened or parsed.
    static PointerTrace readFile(const std::string& path);

    static PointerPhase parsePhase(const std::string& phase);
};
