// libssh2 backend: manages the TCP socket, the SSH session, the SFTP channel
// and exec channels. Includes keepalive and known_hosts validation.
#include "rdispatch/Libssh2RemoteSession.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <csignal>
#include <cstring>
#include <string>
#include <vector>
#include <memory>
#include <cstdlib>
#include <cstdio>
#include <sstream>
#include <utility>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <pwd.h>

namespace rdispatch {

// Global libssh2 initialisation (once per process)
static bool g_libssh2_inited = false;

namespace {

// Context for keyboard-interactive: answers the username or the password
// depending on the prompt text.
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

bool promptAsksForUser(const char* prompt) {
    std::string p(prompt ? prompt : "");
    for (char& c : p)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

void kbint_password_callback(const char*, int, const char*, int,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        const char* ans = promptAsksForUser(prompt) ? ctx->user : ctx->pass;
        const size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0) continue;
        // libssh2 frees the responses with its own allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(alen + 1));
        if (!buf) continue;
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(alen);
    }
}

struct HostKeyAlg {
    int knownhostMask;
    const char* name;
};

HostKeyAlg hostKeyAlg(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return {LIBSSH2_KNOWNHOST_KEY_SSHRSA, "RSA"};
        case LIBSSH2_HOSTKEY_TYPE_DSS: return {LIBSSH2_KNOWNHOST_KEY_SSHDSS, "DSA"};
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return {LIBSSH2_KNOWNHOST_KEY_ECDSA_256, "ECDSA-256"};
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return {LIBSSH2_KNOWNHOST_KEY_ECDSA_384, "ECDSA-384"};
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return {LIBSSH2_KNOWNHOST_KEY_ECDSA_521, "ECDSA-521"};
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return {LIBSSH2_KNOWNHOST_KEY_ED25519, "ED25519"};
#endif
        default: return {0, "UNKNOWN"};
    }
}

std::string homeDirFor(const std::string& username) {
    if (!username.empty()) {
        if (const struct passwd* pw = ::getpwnam(username.c_str())) {
            if (pw->pw_dir && *pw->pw_dir)
                return pw->pw_dir;
        }
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

using ChannelPtr = std::unique_ptr<LIBSSH2_CHANNEL, int (*)(LIBSSH2_CHANNEL*)>;

} // namespace

Libssh2RemoteSession::Libssh2RemoteSession() {
    if (!g_libssh2_inited) {
        int rc = libssh2_init(0);
        (void)rc;
        g_libssh2_inited = true;
    }
}

Libssh2RemoteSession::~Libssh2RemoteSession() {
    disconnect();
}

bool Libssh2RemoteSession::isConnected() const {
    return connected_ && session_ != nullptr;
}

std::string Libssh2RemoteSession::lastSessionError() const {
    if (!session_) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string();
}

std::vector<std::string> Libssh2RemoteSession::defaultIdentityFiles(const std::string& username) {
    std::vector<std::string> out;
    const std::string home = homeDirFor(username);
    if (home.empty()) return out;
    for (const char* name : {"id_ed25519", "id_rsa", "id_dsa"})
        out.push_back(home + "/.ssh/" + name);
    return out;
}

int Libssh2RemoteSession::exitStatusForSignal(const std::string& name) {
    static const struct {
        const char* name;
        int number;
    } kSignals[] = {
        {"HUP", SIGHUP},   {"INT", SIGINT},   {"QUIT", SIGQUIT}, {"ILL", SIGILL},
        {"ABRT", SIGABRT}, {"FPE", SIGFPE},   {"KILL", SIGKILL}, {"SEGV", SIGSEGV},
        {"PIPE", SIGPIPE}, {"ALRM", SIGALRM}, {"TERM", SIGTERM}, {"USR1", SIGUSR1},
        {"USR2", SIGUSR2},
    };
    for (const auto& sig : kSignals) {
        if (name == sig.name)
            return 128 + sig.number;
    }
    return 255;
}

// Sends an SSH keepalive when the configured interval has elapsed.
bool Libssh2RemoteSession::sendKeepalive(std::string& err) {
    int nextSecs = 0;
    if (libssh2_keepalive_send(session_, &nextSecs) != 0) {
        err = "Connection lost: " + lastSessionError();
        return false;
    }
    return true;
}

bool Libssh2RemoteSession::tcpConnect(const std::string& host, std::uint16_t port, DispatchError& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connection, "getaddrinfo(" + host + "): " + gai_strerror(gai));
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::Connection,
            "Could not connect to " + host + ":" + std::to_string(port));
    return false;
}

bool Libssh2RemoteSession::verifyHostKey(const SessionOptions& opt, DispatchError& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::HostKey, "Could not initialise known_hosts");
        return false;
    }
    // Freed on every return below
    std::unique_ptr<LIBSSH2_KNOWNHOSTS, void (*)(LIBSSH2_KNOWNHOSTS*)> guard(nh, libssh2_knownhost_free);

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const std::string home = homeDirFor({});
        if (!home.empty()) khPath = home + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorKind::HostKey, "known_hosts missing or unreadable (strict policy): " + khPath);
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err.set(ErrorKind::HostKey, "Could not obtain the server host key");
        return false;
    }
    const HostKeyAlg alg = hostKeyAlg(keytype);

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg.knownhostMask;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg.knownhostMask;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;

    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err.set(ErrorKind::HostKey, "Host key for " + opt.host + " does not match known_hosts");
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorKind::HostKey, "Unknown host " + opt.host + " (not in known_hosts)");
        return false;
    }

    // AcceptNew and not found: ask for confirmation, then store.
    std::string fpStr;
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (h) {
        std::ostringstream oss;
        oss << "SHA256:";
        for (int i = 0; i < 32; ++i) {
            if (i) oss << ':';
            char b[4];
            std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
            oss << b;
        }
        fpStr = oss.str();
    }
    const bool confirmed = opt.hostkey_confirm_cb &&
                           opt.hostkey_confirm_cb(opt.host, opt.port, alg.name, fpStr);
    if (!confirmed) {
        err.set(ErrorKind::HostKey, "Unknown host " + opt.host + ": fingerprint not confirmed");
        return false;
    }
    if (khPath.empty()) {
        err.set(ErrorKind::HostKey, "No known_hosts path to store the new host key");
        return false;
    }
    const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg.knownhostMask;
    const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                             hostkey, keylen, nullptr, 0, addMask, nullptr);
    if (addrc != 0 ||
        libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        err.set(ErrorKind::HostKey, "Could not write host key to " + khPath);
        return false;
    }
    return true;
}

bool Libssh2RemoteSession::authWithKeyFile(const SessionOptions& opt,
                                           const std::string& keyPath,
                                           const char* passphrase,
                                           DispatchError& err) {
    if (::access(keyPath.c_str(), R_OK) != 0) {
        err.set(ErrorKind::KeyLoad, "Invalid private key file: " + keyPath + " (not readable)");
        return false;
    }
    // Public key path NULL: derived from the private key
    int rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(),
                                                 nullptr, keyPath.c_str(), passphrase);
    if (rc == 0) return true;
    if (rc == LIBSSH2_ERROR_FILE) {
        err.set(ErrorKind::KeyLoad, "Invalid private key file: " + keyPath +
                                        " (" + lastSessionError() + ")");
    } else {
        err.set(ErrorKind::Authentication, "Key authentication failed for " + opt.username +
                                               "@" + opt.host + " with " + keyPath);
    }
    return false;
}

bool Libssh2RemoteSession::authWithAgent(const std::string& username) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3; // conservative, servers count failures
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                prev = identity;
                ++tries;
                if (libssh2_agent_userauth(agent, username.c_str(), identity) == 0) {
                    authed = true;
                    break;
                }
            }
        }
        libssh2_agent_disconnect(agent);
    }
    if (agent) libssh2_agent_free(agent);
    return authed;
}

// Order: explicit key, password (then keyboard-interactive), default key
// files, ssh-agent.
bool Libssh2RemoteSession::authenticate(const SessionOptions& opt, DispatchError& err) {
    const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
    if (opt.private_key_path.has_value())
        return authWithKeyFile(opt, *opt.private_key_path, passphrase, err);

    char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                          static_cast<unsigned>(opt.username.size()));
    if (!methods && libssh2_userauth_authenticated(session_))
        return true; // "none" accepted
    const std::string authlist = methods ? std::string(methods) : std::string();
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (opt.password.has_value()) {
        int rc = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
        if (rc == 0) return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::Connection, "Server closed the connection after the password attempt");
            return false;
        }
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            rc = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
            if (abs) *abs = nullptr;
            if (rc == 0) return true;
        }
        const std::string last = lastSessionError();
        err.set(ErrorKind::Authentication,
                "Password authentication failed for " + opt.username + "@" + opt.host +
                    (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                    (last.empty() ? std::string() : " - " + last));
        return false;
    }

    DispatchError keyErr;
    if (authlist.empty() || hasMethod("publickey")) {
        for (const std::string& keyPath : defaultIdentityFiles(opt.username)) {
            if (::access(keyPath.c_str(), F_OK) != 0) continue;
            keyErr.clear();
            if (authWithKeyFile(opt, keyPath, passphrase, keyErr)) return true;
        }
        if (authWithAgent(opt.username)) return true;
    }
    if (!keyErr.empty()) {
        err = keyErr;
        return false;
    }
    err.set(ErrorKind::Authentication,
            "You have not specified a password or key, and no default key or agent identity was accepted");
    return false;
}

bool Libssh2RemoteSession::connect(const SessionOptions& opt, DispatchError& err) {
    if (connected_) {
        err.set(ErrorKind::Connection, "Already connected");
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorKind::InvalidArgument, "Host and username are required");
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Connection, "libssh2_session_init failed");
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_ms);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err.set(ErrorKind::Connection, "SSH handshake with " + opt.host + " failed: " + lastSessionError());
        disconnect();
        return false;
    }
    // SSH keepalive every 30s, sent between uploads and while a command is
    // quiet (see sendKeepalive)
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2RemoteSession::disconnect() {
    closeFileChannel();
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2RemoteSession::openFileChannel(std::string& err) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    if (sftp_) return true;
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not start the SFTP subsystem: " + lastSessionError();
        return false;
    }
    return true;
}

void Libssh2RemoteSession::closeFileChannel() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
}

// Follows symlinks, like the directory checks on the local side.
bool Libssh2RemoteSession::probe(const std::string& remote_path,
                                 RemoteEntryState& state,
                                 std::string& err) {
    state = RemoteEntryState::Absent;
    if (!isConnected() || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_STAT, &st);

    if (rc == 0) {
        const bool isDir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                           ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
        state = isDir ? RemoteEntryState::Directory : RemoteEntryState::Other;
        return true;
    }

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_NO_SUCH_PATH) {
            err.clear();
            return true; // does not exist
        }
        err = "remote stat failed (sftp status " + std::to_string(sftp_err) + ")";
        return false;
    }
    err = "remote stat failed: " + lastSessionError();
    return false;
}

bool Libssh2RemoteSession::createDirectory(const std::string& remote_dir,
                                           std::string& err,
                                           unsigned int mode) {
    if (!isConnected() || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode));
    if (rc != 0) {
        err = (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
                  ? "sftp_mkdir failed (sftp status " + std::to_string(libssh2_sftp_last_error(sftp_)) + ")"
                  : "sftp_mkdir failed: " + lastSessionError();
        return false;
    }
    return true;
}

// Uploads a local file (create/truncate) and reports progress.
bool Libssh2RemoteSession::uploadFile(const std::string& local,
                                      const std::string& remote,
                                      std::string& err,
                                      ProgressCB progress) {
    if (!isConnected() || !sftp_) {
        err = "Not connected";
        return false;
    }

    if (!sendKeepalive(err))
        return false;

    FILE* lf = ::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }

    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for writing";
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            char* p = buf.data();
            size_t remain = n;
            while (remain > 0) {
                ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    err = "Remote write failed";
                    libssh2_sftp_close(wh);
                    std::fclose(lf);
                    return false;
                }
                remain -= static_cast<size_t>(w);
                p += w;
                done += static_cast<size_t>(w);
                if (progress && total) progress(done, total);
            }
        } else {
            if (std::ferror(lf)) {
                err = "Local read failed";
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
    }

    const int closeRc = libssh2_sftp_close(wh);
    std::fclose(lf);
    if (closeRc != 0) {
        err = "Closing remote file failed";
        return false;
    }
    return true;
}

bool Libssh2RemoteSession::runCommand(const std::string& command,
                                      CommandResult& result,
                                      std::string& err) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    ChannelPtr ch(libssh2_channel_open_session(session_), libssh2_channel_free);
    if (!ch) {
        err = "Could not open a session channel: " + lastSessionError();
        return false;
    }
    // Reading only stdout while stderr fills up would stall the remote
    // process, so both streams are merged into one.
    libssh2_channel_handle_extended_data2(ch.get(), LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);

    if (libssh2_channel_exec(ch.get(), command.c_str()) != 0) {
        err = "Could not execute '" + command + "': " + lastSessionError();
        return false;
    }

    std::string output;
    char buf[16 * 1024];
    while (true) {
        ssize_t n = libssh2_channel_read(ch.get(), buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break; // EOF
        } else if (n == LIBSSH2_ERROR_TIMEOUT) {
            // The session timeout bounds each read, not the command: a
            // command may stay silent for as long as it runs.
            if (!sendKeepalive(err))
                return false;
        } else {
            err = "Reading output of '" + command + "' failed: " + lastSessionError();
            return false;
        }
    }

    libssh2_channel_close(ch.get());
    int rc;
    while ((rc = libssh2_channel_wait_closed(ch.get())) == LIBSSH2_ERROR_TIMEOUT) {
        if (!sendKeepalive(err))
            return false;
    }
    if (rc != 0) {
        err = "Waiting for '" + command + "' to finish failed: " + lastSessionError();
        return false;
    }

    result.exit_status = libssh2_channel_get_exit_status(ch.get());
    result.exit_signal.clear();
    char* sig = nullptr;
    size_t sigLen = 0;
    if (libssh2_channel_get_exit_signal(ch.get(), &sig, &sigLen,
                                        nullptr, nullptr, nullptr, nullptr) == 0 && sig) {
        result.exit_signal.assign(sig, sigLen);
        libssh2_free(session_, sig);
    }
    // get_exit_status reports 0 for a process killed by a signal
    if (!result.exit_signal.empty())
        result.exit_status = exitStatusForSignal(result.exit_signal);
    result.output = std::move(output);
    return true;
}

} // namespace rdispatch
