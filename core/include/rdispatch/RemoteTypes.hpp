// Basic types shared between the CLI and the core: session options, remote
// entry states and command results. Kept as plain structs so the front end can
// fill them without knowing the backend.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace rdispatch {

// Validation policy for the server host key against known_hosts.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: accepts and stores new hosts; rejects changed keys.
    Off         // No verification (not recommended).
};

// Result of a single remote probe.
enum class RemoteEntryState {
    Absent,
    Directory,
    Other
};

// Output of a remote command. stderr is merged into stdout. A command killed
// by a signal reports 128 + the signal number, shell style.
struct CommandResult {
    int         exit_status = -1;
    std::string output;
    std::string exit_signal; // "TERM", "KILL", ... or empty
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Returns true to accept and store, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Blocking timeout applied to every libssh2 call, in milliseconds.
    long timeout_ms = 20000;
};

} // namespace rdispatch
