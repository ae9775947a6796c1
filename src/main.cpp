#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include <cstdio>

#include "commandrunner.h"
#include "services/connectionprofilestore.h"
#include "services/errorhandler.h"
#include "services/localfilesystem.h"
#include "services/sessionmanager.h"
#include "services/sessionoptions.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("hyperftp");
    app.setApplicationVersion(HYPERFTP_VERSION);
    app.setOrganizationName("hyperftp");
    app.setOrganizationDomain("example.com");

    QCommandLineParser parser;
    parser.setApplicationDescription("FTP/FTPS client for file transfers and remote browsing");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption hostOption("host", "Server host name or address.", "host");
    QCommandLineOption portOption("port", "Control connection port (default 21).", "port");
    QCommandLineOption userOption("user", "User name (anonymous if omitted).", "user");
    QCommandLineOption passwordOption("password", "Password.", "password");
    QCommandLineOption anonymousOption("anonymous", "Log in anonymously.");
    QCommandLineOption tlsOption("tls", "Use explicit FTPS (AUTH TLS).");
    QCommandLineOption activeOption("active", "Use active (PORT) data connections.");
    QCommandLineOption profileOption("profile", "Use a saved connection profile.", "name");
    QCommandLineOption saveProfileOption("save-profile", "Save the connection settings as a profile.", "name");
    QCommandLineOption chunkSizeOption("chunk-size", "Transfer chunk size in bytes.", "bytes");
    QCommandLineOption maxTransfersOption("max-transfers", "Maximum concurrent transfers (1-8).", "count");

    parser.addOptions({verboseOption, hostOption, portOption, userOption, passwordOption,
                       anonymousOption, tlsOption, activeOption, profileOption, saveProfileOption,
                       chunkSizeOption, maxTransfersOption});
    parser.addPositionalArgument("command",
        "ls [path] | get <remote> [localDir] | put <file> | put-dir <dir> | "
        "mkdir <name> | rmdir <name> | rm <name> | mv <old> <new> | profiles [rm <name>]");

    parser.process(app);

    hyperftp::verboseLogging = parser.isSet(verboseOption);

    if (hyperftp::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    ErrorHandler errors;
    QObject::connect(&errors, &ErrorHandler::statusMessage, &errors, [&err](const QString &message, int) {
        err << message << Qt::endl;
    });

    QString usageError;
    if (!CommandRunner::validateCommand(parser.positionalArguments(), &usageError)) {
        errors.handleError(ErrorCategory::Validation, ErrorSeverity::Warning,
                           "Invalid command", usageError);
        return 1;
    }

    QSettings settings;
    SessionOptions options;
    options.load(settings);
    if (parser.isSet(chunkSizeOption)) {
        options.chunkSize = parser.value(chunkSizeOption).toLongLong();
    }
    if (parser.isSet(maxTransfersOption)) {
        options.maxConcurrentTransfers = parser.value(maxTransfersOption).toInt();
    }
    options.normalize();

    ConnectionProfileStore store;
    if (!store.load()) {
        errors.handleError(ErrorCategory::System, ErrorSeverity::Warning,
                           "Cannot read profiles", store.filePath());
    }

    ConnectionProfile profile;
    if (parser.isSet(profileOption)) {
        const auto saved = store.profile(parser.value(profileOption));
        if (!saved) {
            errors.handleError(ErrorCategory::Validation, ErrorSeverity::Warning,
                               "Unknown profile", parser.value(profileOption));
            return 1;
        }
        profile = *saved;
    }

    // Explicit options override the saved profile
    if (parser.isSet(hostOption)) {
        profile.host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            errors.handleError(ErrorCategory::Validation, ErrorSeverity::Warning, "Invalid port",
                               QString("Port must be between 1 and 65535, got '%1'")
                                   .arg(parser.value(portOption)));
            return 1;
        }
        profile.port = static_cast<quint16>(port);
    }
    if (parser.isSet(userOption)) {
        profile.username = parser.value(userOption);
    }
    if (parser.isSet(passwordOption)) {
        profile.password = parser.value(passwordOption);
    }
    if (parser.isSet(anonymousOption)) {
        profile.anonymous = true;
    }
    if (parser.isSet(tlsOption)) {
        profile.tls = true;
    }
    if (parser.isSet(activeOption)) {
        profile.passive = false;
    }

    if (parser.isSet(saveProfileOption)) {
        profile.name = parser.value(saveProfileOption);
        if (!store.saveProfile(profile)) {
            errors.handleError(ErrorCategory::System, ErrorSeverity::Critical,
                               "Cannot save profile", profile.name);
            return 1;
        }
        out << "Saved profile '" << profile.name << "'" << Qt::endl;
    }

    LocalFileSystem fileSystem;
    SessionManager session(&fileSystem);
    session.setOptions(options);

    CommandRunner runner(&session, &store, out, err);
    QObject::connect(&runner, &CommandRunner::finished, &app, [&app](int exitCode) {
        // Let QUIT go out before the loop stops
        QTimer::singleShot(0, &app, [&app, exitCode]() { app.exit(exitCode); });
    });

    const QStringList arguments = parser.positionalArguments();
    QTimer::singleShot(0, &runner, [&runner, profile, arguments]() {
        runner.run(profile, arguments);
    });

    return app.exec();
}
