#include "AppSettings.hpp"
#include <QDir>
#include <QtGlobal>

static QString expandHome(const QString &path) {
    if (path == "~")
        return QDir::homePath();
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

std::optional<rdispatch::KnownHostsPolicy> parseKnownHostsPolicy(const QString &s) {
    const QString v = s.trimmed().toLower();
    if (v == "strict" || v == "0")
        return rdispatch::KnownHostsPolicy::Strict;
    if (v == "accept-new" || v == "acceptnew" || v == "1")
        return rdispatch::KnownHostsPolicy::AcceptNew;
    if (v == "off" || v == "no" || v == "2")
        return rdispatch::KnownHostsPolicy::Off;
    return std::nullopt;
}

QString knownHostsPolicyName(rdispatch::KnownHostsPolicy p) {
    switch (p) {
    case rdispatch::KnownHostsPolicy::Strict:
        return "strict";
    case rdispatch::KnownHostsPolicy::AcceptNew:
        return "accept-new";
    case rdispatch::KnownHostsPolicy::Off:
        return "off";
    }
    return "strict";
}

// Shared by the "defaults" group and each "sites" entry.
static void readConnectionKeys(QSettings &s, rdispatch::SessionOptions &opt) {
    if (s.contains("host"))
        opt.host = s.value("host").toString().trimmed().toStdString();
    if (s.contains("port"))
        opt.port = static_cast<std::uint16_t>(s.value("port", 22).toUInt());
    const QString user = s.value("user").toString().trimmed();
    if (!user.isEmpty())
        opt.username = user.toStdString();
    const QString kp = s.value("keyPath").toString();
    if (!kp.isEmpty())
        opt.private_key_path = expandHome(kp).toStdString();
    const QString kh = s.value("knownHosts").toString();
    if (!kh.isEmpty())
        opt.known_hosts_path = expandHome(kh).toStdString();
    if (s.contains("khPolicy")) {
        if (auto p = parseKnownHostsPolicy(s.value("khPolicy").toString()))
            opt.known_hosts_policy = *p;
    }
    if (s.contains("timeoutMs"))
        opt.timeout_ms = s.value("timeoutMs").toLongLong();
}

QVector<SiteEntry> loadSites(QSettings &s, const rdispatch::SessionOptions &base) {
    QVector<SiteEntry> sites;
    const int n = s.beginReadArray("sites");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        SiteEntry e;
        e.opt = base;
        e.name = s.value("name").toString().trimmed();
        readConnectionKeys(s, e.opt);
        if (!e.name.isEmpty())
            sites.push_back(e);
    }
    s.endArray();
    return sites;
}

rdispatch::SessionOptions loadDefaults(QSettings &s) {
    rdispatch::SessionOptions opt;
    s.beginGroup("defaults");
    readConnectionKeys(s, opt);
    s.endGroup();
    opt.host.clear();
    return opt;
}

bool resolveSessionOptions(QSettings &s, const QString &target,
                           const CliOverrides &cli,
                           rdispatch::SessionOptions &out, QString *error) {
    auto fail = [&](const QString &msg) {
        if (error)
            *error = msg;
        return false;
    };

    const rdispatch::SessionOptions defaults = loadDefaults(s);
    rdispatch::SessionOptions opt = defaults;

    QString host = target.trimmed();
    QString user;
    const int at = host.lastIndexOf('@');
    if (at > 0) {
        user = host.left(at);
        host = host.mid(at + 1);
    }

    bool fromSite = false;
    for (const SiteEntry &site : loadSites(s, defaults)) {
        if (site.name != host)
            continue;
        fromSite = true;
        opt = site.opt;
        break;
    }
    if (!fromSite)
        opt.host = host.toStdString();
    if (!user.isEmpty())
        opt.username = user.toStdString();

    if (cli.port)
        opt.port = *cli.port;
    if (!cli.user.isEmpty())
        opt.username = cli.user.toStdString();
    if (!cli.identity.isEmpty())
        opt.private_key_path = expandHome(cli.identity).toStdString();
    if (!cli.knownHosts.isEmpty())
        opt.known_hosts_path = expandHome(cli.knownHosts).toStdString();
    if (!cli.knownHostsPolicy.isEmpty()) {
        auto p = parseKnownHostsPolicy(cli.knownHostsPolicy);
        if (!p)
            return fail(QString("Unknown known-hosts policy: %1").arg(cli.knownHostsPolicy));
        opt.known_hosts_policy = *p;
    }
    if (!cli.passwordEnv.isEmpty()) {
        const QString pw = qEnvironmentVariable(cli.passwordEnv.toUtf8().constData());
        if (pw.isEmpty())
            return fail(QString("Environment variable %1 is not set").arg(cli.passwordEnv));
        opt.password = pw.toStdString();
    }
    if (!cli.passphraseEnv.isEmpty()) {
        const QString pp = qEnvironmentVariable(cli.passphraseEnv.toUtf8().constData());
        if (pp.isEmpty())
            return fail(QString("Environment variable %1 is not set").arg(cli.passphraseEnv));
        opt.private_key_passphrase = pp.toStdString();
    }

    if (opt.username.empty()) {
        QString envUser = qEnvironmentVariable("LOGNAME");
        if (envUser.isEmpty())
            envUser = qEnvironmentVariable("USER");
        opt.username = envUser.toStdString();
    }
    if (opt.host.empty())
        return fail(QString("No host given for '%1'").arg(target));
    if (opt.username.empty())
        return fail("No username given and neither LOGNAME nor USER is set");

    out = opt;
    return true;
}
