#pragma once

#include "core/pipeline/ranking_engine.h"
#include "core/shared/settings.h"

#include <QIODevice>
#include <QJsonDocument>
#include <QStringList>

#include <optional>
#include <vector>

namespace nr {

// RankerCommand -- command line front end for one ranking run.
//
//   newsrank-ranker --articles <file.json> [--sources <file.json> | --registry <db>]
//                   [--settings <file.json>] [--save-settings <file.json>]
//                   [--preset NAME] [--limit N] [--offset N] [--diversity-cap N]
//                   [--now ISO8601] [--verbose]
//
// Prints {"preset", "count", "results"} to stdout.
class RankerCommand {
public:
    enum ExitCode {
        ExitOk = 0,
        ExitIoError = 1,
        ExitConfigError = 2,
    };

    // Parses arguments (including argv[0]) and runs. The JSON result is
    // written to output; diagnostics go to stderr.
    int run(const QStringList& arguments, QIODevice& output);

    // Reads a JSON array of article objects.
    static std::optional<std::vector<NormalizedArticle>> loadArticles(const QString& filePath);

    static QJsonDocument resultToJson(const EngineResult& result);
};

} // namespace nr
