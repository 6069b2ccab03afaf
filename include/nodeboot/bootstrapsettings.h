#pragma once

#include <nodeboot/base/fwd/diagnostics.h>

#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/downloads.h>
#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>

#include <nodeboot/platform.h>

#include <string>
#include <vector>

namespace nodeboot
{
    // Everything the bootstrapper reads from its environment, gathered in one place so that tests can construct it
    // directly.
    struct BootstrapSettings
    {
        PlatformTokens platform = get_host_platform_tokens();
        std::string runtime_version = RuntimeVersion.to_string();
        std::string mirror_url = DefaultRuntimeMirror.to_string();
        Path home_dir;
        std::string search_path;
        std::string program_files = DefaultProgramFiles.to_string();
        std::string local_app_data;
        // System-wide directories searched on Unix after the private install and before the per-user ones.
        std::vector<Path> system_directories{"/usr/local/bin", "/usr/bin"};
        DownloadTimeouts timeouts;

        // Reads HOME (or USERPROFILE), PATH, PROGRAMFILES, LOCALAPPDATA, the mirror overrides, and the timeout
        // overrides. Malformed timeouts are reported as warnings and the defaults kept. Returns nullopt after
        // reporting an error if the home directory cannot be determined.
        static Optional<BootstrapSettings> from_environment(DiagnosticContext& context);

        // <home>/.claude-ssh-mcp
        Path product_dir() const;
        // <home>/.claude-ssh-mcp/node
        Path install_dir() const;
        // <home>/.claude-ssh-mcp/install.lock
        Path install_lock_file() const;
        // <home>/.claude-ssh-mcp/tmp-<pid>
        Path scratch_dir(long process_id) const;
    };

    // Parses a positive number of seconds; nullopt for anything else.
    Optional<long> parse_timeout_seconds(StringView text);
}
