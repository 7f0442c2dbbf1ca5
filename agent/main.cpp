// sftppull: drains a remote SFTP directory into a local directory.
//
//   sftppull [config.ini]                 run the agent (default ./sftppull.ini,
//                                         or $SFTP_PULL_CONFIG)
//   sftppull --set-credential <name>      store username/password read from stdin
#include "AgentConfig.hpp"
#include "AgentLogging.hpp"
#include "ConnectionSupervisor.hpp"
#include "LogRotator.hpp"
#include "PollingLoop.hpp"
#include "SecretStore.hpp"
#include "ShutdownToken.hpp"
#include "TransferSequencer.hpp"
#include "sftppull/Libssh2SftpClient.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStringList>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <signal.h>

static ShutdownToken g_shutdown;

extern "C" void onShutdownSignal(int) {
    g_shutdown.requestStop();
}

static void installSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = onShutdownSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static int exitCode(ExitStatus st) {
    return static_cast<int>(st);
}

static int storeCredential(const QString &name) {
    QTextStream in(stdin);
    std::fprintf(stderr, "Username: ");
    const QString user = in.readLine().trimmed();
    std::fprintf(stderr, "Password: ");
    const QString pass = in.readLine();
    if (user.isEmpty() || pass.isEmpty()) {
        std::fprintf(stderr, "Username and password are required\n");
        return exitCode(ExitStatus::CredentialMissing);
    }
    SecretStore store;
    const auto r = store.setCredential(name, Credential{user, pass});
    if (!r.ok()) {
        std::fprintf(stderr, "Could not store credential %s: %s\n", qPrintable(name),
                     qPrintable(r.detail));
        return exitCode(ExitStatus::CredentialMissing);
    }
    std::fprintf(stderr, "Credential %s stored\n", qPrintable(name));
    return exitCode(ExitStatus::Ok);
}

static QString configPath(const QStringList &args) {
    if (args.size() > 1)
        return args.at(1);
    const QByteArray env = qgetenv("SFTP_PULL_CONFIG");
    if (!env.isEmpty())
        return QString::fromLocal8Bit(env);
    return QStringLiteral("sftppull.ini");
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sftppull"));
    applyLoggingRules();

    const QStringList args = QCoreApplication::arguments();
    if (args.size() > 1 && args.at(1) == QLatin1String("--set-credential")) {
        if (args.size() < 3) {
            std::fprintf(stderr, "usage: sftppull --set-credential <name>\n");
            return exitCode(ExitStatus::ConfigError);
        }
        return storeCredential(args.at(2));
    }

    const QString path = configPath(args);
    const ConfigLoadResult loaded = loadAgentConfig(path);
    if (!loaded.config) {
        qCCritical(spConfig).noquote() << loaded.error;
        return exitCode(ExitStatus::ConfigError);
    }
    const AgentConfig config = *loaded.config;

    LogRotator rotator(config.logFilePath, config.logFileSizeLimitBytes(), config.maxLogArchives);
    installLogRotator(&rotator);
    // Handler must not outlive the rotator
    struct HandlerGuard {
        ~HandlerGuard() { installLogRotator(nullptr); }
    } guard;

    qCInfo(spAgent).noquote() << QStringLiteral("sftppull starting with %1 (libssh2 %2, library %3)")
                                     .arg(QFileInfo(path).absoluteFilePath(),
                                          qs(sftppull::Libssh2SftpClient::libraryVersion()),
                                          config.transferClientLibraryPath);
    for (const QString &w : loaded.warnings)
        qCWarning(spConfig).noquote() << w;

    if (!QDir().mkpath(config.localDirectory)) {
        qCCritical(spConfig).noquote() << "Cannot create local directory" << config.localDirectory;
        return exitCode(ExitStatus::ConfigError);
    }

    SecretStore store;
    const auto credential = store.getCredential(config.credentialName);
    if (!credential) {
        qCCritical(spConfig).noquote() << "Credential" << config.credentialName
                                       << "not found in the credential store";
        return exitCode(ExitStatus::CredentialMissing);
    }
    if (SecretStore::insecureFallbackActive())
        qCWarning(spConfig) << "Credentials are read from the insecure QSettings fallback";

    installSignalHandlers();

    ConnectionSupervisor supervisor(config, *credential,
                                    std::make_unique<sftppull::Libssh2SftpClient>());
    TransferSequencer sequencer(config);
    PollingLoop loop(config, supervisor, sequencer, g_shutdown);
    const ExitStatus st = loop.run();
    qCInfo(spAgent) << "sftppull stopped with exit code" << exitCode(st);
    return exitCode(st);
}
