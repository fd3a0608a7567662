// Entry point: parses the few command-line flags and runs the interactive upload.
#include "AppLogging.hpp"
#include "ConsolePrompter.hpp"
#include "TransferDriver.hpp"
#include "quickscp/Libssh2ScpSession.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <memory>

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("quickscp"));
    QCoreApplication::setApplicationVersion(QStringLiteral(QUICKSCP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Interactive SCP upload of a single file."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption verbose(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                               QStringLiteral("Print diagnostic logs to stderr."));
    parser.addOption(verbose);
    parser.process(app);

    qSetMessagePattern(QStringLiteral("[%{category}] %{type}: %{message}"));
    if (parser.isSet(verbose))
        quickscpapp::enableVerboseLogging();

    quickscpapp::ConsolePrompter prompter;
    quickscpapp::TransferDriver driver(
        prompter, std::make_unique<quickscp::Libssh2ScpSession>(),
        qEnvironmentVariable("HOME"));
    return driver.run();
}
