/*
Beacon — beacon_replay
Role: Replays a recorded pointer trace through the interaction stack on a virtual clock and
      prints every recognized gesture. Used to reproduce gesture bugs from field traces.
Usage: beacon_replay [-q] <trace.json> [config.ini]
*/
#include "Log.hpp"
#include "config/BeaconSettings.hpp"
#include "replay/TraceReader.hpp"
#include "replay/TraceReplayer.hpp"
#include <QCoreApplication>
#include <QStringList>
#include <fmt/format.h>
#include <exception>
#include <string>

namespace {

void printUsage(const char* argv0) {
    fmt::print(stderr, "usage: {} [-q] <trace.json> [config.ini]\n", argv0);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    QStringList args = app.arguments().mid(1);
    if (args.value(0) == QLatin1String("-q")) {
        beacon::Log::setLevel(beacon::Log::Level::WARN);
        args.removeFirst();
    }
    if (args.isEmpty()) {
        printUsage(argv[0]);
        return 2;
    }
    const std::string tracePath = args.at(0).toStdString();

    try {
        const BeaconSettings settings = BeaconSettings::load(args.value(1));
        const PointerTrace trace = TraceReader::readFile(tracePath);
        LOG_I("replay", "Loaded {} samples from {} (scrollTop {})", trace.samples.size(), tracePath, trace.scrollTop);

        TraceReplayer replayer(settings);
        replayer.setRippleTarget(QRectF(0.0, 0.0, 1.0e6, 1.0e6));
        const ReplayResult result = replayer.run(trace);

        for (const GestureEvent& event : result.gestures) {
            if (event.type == GestureType::DragDelta) {
                fmt::print("{:>8} {:<16} ({:.1f}, {:.1f}) dx={:.1f}\n", event.timestamp, toString(event.type),
                           event.position.x(), event.position.y(), event.dragDx);
            } else {
                fmt::print("{:>8} {:<16} ({:.1f}, {:.1f})\n", event.timestamp, toString(event.type),
                           event.position.x(), event.position.y());
            }
        }

        LOG_I("replay", "{} gestures, {} ripples, refreshes started/ok/failed {}/{}/{}, clock ended at {} ms",
              result.gestures.size(), result.ripplesCreated, result.refreshesStarted,
              result.refreshesSucceeded, result.refreshesFailed, result.endTimeMs);
    } catch (const std::exception& e) {
        LOG_E("replay", "{}", e.what());
        return 1;
    }
    return 0;
}
