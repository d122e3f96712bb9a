#include "replay/TraceReader.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

double requireNumber(const nlohmann::json& sample, const char* key, size_t index) {
    if (!sample.contains(key) || !sample[key].is_number()) {
        throw std::runtime_error(fmt::format("sample {}: missing numeric field '{}'", index, key));
    }
    return sample[key].get<double>();
}

} // namespace

PointerPhase TraceReader::parsePhase(const std::string& phase) {
    if (phase == "start") return PointerPhase::Start;
    if (phase == "move") return PointerPhase::Move;
    if (phase == "end") return PointerPhase::End;
    if (phase == "cancel") return PointerPhase::Cancel;
    throw std::runtime_error(fmt::format("unknown phase '{}'", phase));
}

PointerTrace TraceReader::parse(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("trace is not valid JSON: {}", e.what()));
    }
    return parse(document);
}

PointerTrace TraceReader::parse(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("trace root must be an object");
    }
    if (!document.contains("samples") || !document["samples"].is_array()) {
        throw std::runtime_error("trace has no 'samples' array");
    }

    PointerTrace trace;
    trace.scrollTop = document.value("scrollTop", 0.0);
    trace.refreshMs = document.value("refreshMs", static_cast<qint64>(0));
    trace.refreshFails = document.value("refreshFails", false);

    const auto& samples = document["samples"];
    trace.samples.reserve(samples.size());

    qint64 lastT = 0;
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto& entry = samples[i];
        if (!entry.is_object()) {
            throw std::runtime_error(fmt::format("sample {}: expected an object", i));
        }

        PointerSample sample;
        sample.x = requireNumber(entry, "x", i);
        sample.y = requireNumber(entry, "y", i);
        sample.t = static_cast<qint64>(requireNumber(entry, "t", i));
        sample.pointerId = entry.value("pointerId", 0);

        try {
            sample.phase = parsePhase(entry.value("phase", std::string()));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(fmt::format("sample {}: {}", i, e.what()));
        }

        if (i > 0 && sample.t < lastT) {
            throw std::runtime_error(fmt::format("sample {}: timestamp {} goes back in time (previous {})",
                                                 i, sample.t, lastT));
        }
        lastT = sample.t;
        trace.samples.push_back(sample);
    }
    return trace;
}

PointerTrace TraceReader::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("cannot open trace '{}'", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}
