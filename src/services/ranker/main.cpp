#include "ranker_command.h"
#include <QCoreApplication>
#include <QFile>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("newsrank-ranker"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QFile output;
    if (!output.open(stdout, QIODevice::WriteOnly)) {
        return nr::RankerCommand::ExitIoError;
    }

    nr::RankerCommand command;
    const int exitCode = command.run(app.arguments(), output);
    output.flush();
    return exitCode;
}
