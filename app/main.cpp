// rdispatch: copy files to a remote host over SFTP or run a command there.
#include "AppSettings.hpp"
#include "CliLogging.hpp"
#include "rdispatch/Libssh2RemoteSession.hpp"
#include "rdispatch/RemoteDispatcher.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QStringList>
#include <QTextStream>

#include <cstdio>
#include <memory>

namespace {

constexpr int kExitDispatchError = 1;
constexpr int kExitUsage = 2;

int usageError(QCommandLineParser &parser, const QString &msg) {
    QTextStream err(stderr);
    err << "rdispatch: " << msg << "\n\n" << parser.helpText();
    return kExitUsage;
}

bool confirmHostKey(const std::string &host, std::uint16_t port,
                    const std::string &algorithm, const std::string &fingerprint) {
    QTextStream err(stderr);
    err << "The authenticity of host '" << QString::fromStdString(host) << ":" << port
        << "' can't be established.\n"
        << QString::fromStdString(algorithm) << " key fingerprint is "
        << QString::fromStdString(fingerprint) << ".\n"
        << "Continue connecting (yes/no)? ";
    err.flush();
    QTextStream in(stdin);
    const QString answer = in.readLine().trimmed().toLower();
    return answer == "yes" || answer == "y";
}

void printPlan(const rdispatch::TransferPlan &plan) {
    QTextStream out(stdout);
    for (const std::string &d : plan.directories)
        out << "mkdir " << QString::fromStdString(d) << "\n";
    for (const rdispatch::FileMapping &f : plan.files)
        out << "put " << QString::fromStdString(f.local_path) << " -> "
            << QString::fromStdString(f.remote_path) << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("RDispatch");
    QCoreApplication::setApplicationName("RDispatch");
    QCoreApplication::setApplicationVersion(RDISPATCH_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Secure copy and command execution on a remote host.\n\n"
        "  rdispatch [options] <host> scp <source> <destination>\n"
        "  rdispatch [options] <host> exec <command...>");
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();
    const QCommandLineOption portOpt({"p", "port"}, "SSH port.", "port");
    const QCommandLineOption userOpt({"u", "user"}, "Remote user name.", "user");
    const QCommandLineOption identityOpt({"i", "identity"}, "Private key file.", "file");
    const QCommandLineOption passwordEnvOpt(
        "password-env", "Read the password from environment variable <name>.", "name");
    const QCommandLineOption passphraseEnvOpt(
        "passphrase-env", "Read the key passphrase from environment variable <name>.", "name");
    const QCommandLineOption recursiveOpt({"r", "recursive"},
                                          "Copy directories and multi-match patterns.");
    const QCommandLineOption dryRunOpt({"n", "dry-run"},
                                       "Print the transfer plan without changing anything.");
    const QCommandLineOption knownHostsOpt("known-hosts", "known_hosts file.", "file");
    const QCommandLineOption policyOpt("known-hosts-policy",
                                       "strict, accept-new or off.", "policy");
    const QCommandLineOption configOpt("config", "Read settings from INI file <file>.", "file");
    const QCommandLineOption verboseOpt({"v", "verbose"}, "Debug output.");
    parser.addOptions({portOpt, userOpt, identityOpt, passwordEnvOpt, passphraseEnvOpt,
                       recursiveOpt, dryRunOpt, knownHostsOpt, policyOpt, configOpt,
                       verboseOpt});
    parser.addPositionalArgument("host", "Host, user@host or saved site name.");
    parser.addPositionalArgument("action", "scp or exec.");
    parser.addPositionalArgument("args", "Action arguments.", "[args...]");

    if (!parser.parse(app.arguments()))
        return usageError(parser, parser.errorText());
    if (parser.isSet(helpOpt))
        parser.showHelp(0);
    if (parser.isSet(versionOpt))
        parser.showVersion();

    applyLogVerbosity(parser.isSet(verboseOpt));

    const QStringList pos = parser.positionalArguments();
    if (pos.size() < 2)
        return usageError(parser, "missing <host> or <action>");
    const QString action = pos.at(1);
    const QStringList args = pos.mid(2);
    if (action == "scp") {
        if (args.size() != 2)
            return usageError(parser, "scp expects <source> <destination>");
    } else if (action == "exec") {
        if (args.isEmpty())
            return usageError(parser, "exec expects a command");
    } else {
        return usageError(parser, QString("unknown action '%1'").arg(action));
    }

    CliOverrides cli;
    if (parser.isSet(portOpt)) {
        bool ok = false;
        const uint port = parser.value(portOpt).toUInt(&ok);
        if (!ok || port == 0 || port > 65535)
            return usageError(parser, QString("invalid port '%1'").arg(parser.value(portOpt)));
        cli.port = static_cast<quint16>(port);
    }
    cli.user = parser.value(userOpt);
    cli.identity = parser.value(identityOpt);
    cli.knownHosts = parser.value(knownHostsOpt);
    cli.knownHostsPolicy = parser.value(policyOpt);
    cli.passwordEnv = parser.value(passwordEnvOpt);
    cli.passphraseEnv = parser.value(passphraseEnvOpt);

    std::unique_ptr<QSettings> settings =
        parser.isSet(configOpt)
            ? std::make_unique<QSettings>(parser.value(configOpt), QSettings::IniFormat)
            : std::make_unique<QSettings>("RDispatch", "RDispatch");

    rdispatch::SessionOptions opt;
    QString settingsError;
    if (!resolveSessionOptions(*settings, pos.at(0), cli, opt, &settingsError))
        return usageError(parser, settingsError);
    opt.hostkey_confirm_cb = confirmHostKey;

    qCDebug(rdSession) << "target" << QString::fromStdString(opt.username) << "@"
                       << QString::fromStdString(opt.host) << "port" << opt.port
                       << "known_hosts policy" << knownHostsPolicyName(opt.known_hosts_policy);
    if (opt.password && rdispatch::sensitiveLoggingEnabled())
        qCDebug(rdSession) << "password length" << opt.password->size();

    rdispatch::RemoteDispatcher dispatcher(std::make_unique<rdispatch::Libssh2RemoteSession>(), opt);
    dispatcher.setLogger(makeCoreLogger(rdXfer()));

    rdispatch::DispatchError err;
    int rc = 0;
    if (action == "scp") {
        const std::string source = args.at(0).toStdString();
        const std::string destination = args.at(1).toStdString();
        const bool recursive = parser.isSet(recursiveOpt);
        if (parser.isSet(dryRunOpt)) {
            rdispatch::TransferPlan plan;
            if (dispatcher.plan(source, destination, recursive, plan, err))
                printPlan(plan);
            else
                rc = kExitDispatchError;
        } else if (!dispatcher.scp(source, destination, recursive, err)) {
            rc = kExitDispatchError;
        }
    } else {
        rdispatch::CommandResult result;
        if (dispatcher.execute(args.join(' ').toStdString(), result, err)) {
            std::fwrite(result.output.data(), 1, result.output.size(), stdout);
            std::fflush(stdout);
            rc = result.exit_status;
        } else {
            rc = kExitDispatchError;
        }
    }
    dispatcher.close();

    if (rc == kExitDispatchError && !err.empty()) {
        QTextStream(stderr) << "rdispatch: " << QString::fromStdString(err.describe()) << "\n";
        qCDebug(rdCli) << "failed with" << rdispatch::errorKindName(err.kind);
    }
    return rc;
}
