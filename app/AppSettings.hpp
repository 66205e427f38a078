// Connection settings for the command-line front end: saved sites and
// defaults from QSettings, overridden by command-line options.
#pragma once
#include "rdispatch/RemoteTypes.hpp"
#include <QSettings>
#include <QString>
#include <QVector>
#include <optional>

struct SiteEntry {
    QString name;
    rdispatch::SessionOptions opt;
};

// Values given explicitly on the command line; unset means "not given".
struct CliOverrides {
    std::optional<quint16> port;
    QString user;
    QString identity;
    QString knownHosts;
    QString knownHostsPolicy;
    QString passwordEnv;
    QString passphraseEnv;
};

// "strict" | "accept-new" | "off" (case-insensitive); legacy integer values
// are accepted too.
std::optional<rdispatch::KnownHostsPolicy> parseKnownHostsPolicy(const QString &s);
QString knownHostsPolicyName(rdispatch::KnownHostsPolicy p);

// Each site starts from `base`; only the keys a site sets replace it.
QVector<SiteEntry> loadSites(QSettings &s,
                             const rdispatch::SessionOptions &base = rdispatch::SessionOptions());

// Defaults applied to every connection ("defaults" group).
rdispatch::SessionOptions loadDefaults(QSettings &s);

// Builds the effective options for `target`, which is either a saved site
// name or a host, optionally written as user@host. Precedence: command line,
// then site, then defaults, then $LOGNAME/$USER for the username.
bool resolveSessionOptions(QSettings &s, const QString &target,
                           const CliOverrides &cli,
                           rdispatch::SessionOptions &out, QString *error);
