DECLARE_MESSAGE(ChecksFailedCheck, (), "", "nodeboot has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(CurlDownloadTimeout, (msg::url), "", "{url}: the download timed out")
DECLARE_MESSAGE(DownloadFailedCurl,
                (msg::url, msg::exit_code, msg::error_msg),
                "",
                "{url}: curl failed to download with exit code {exit_code} ({error_msg})")
DECLARE_MESSAGE(DownloadFailedStatusCode,
                (msg::url, msg::value),
                "{value} is an HTTP status code",
                "{url}: failed: status code {value}")
DECLARE_MESSAGE(DownloadingRuntime, (msg::url), "", "Downloading Node.js from {url}...")
DECLARE_MESSAGE(EnvIntegerInvalid,
                (msg::env_var, msg::value),
                "{value} is the text the user set",
                "ignoring {env_var}={value}: expected a positive integer")
DECLARE_MESSAGE(EnvVarMustBeAbsolutePath,
                (msg::path, msg::env_var),
                "",
                "{path} ({env_var}) is not an absolute path")
DECLARE_MESSAGE(ExtractedDirectoryNotFound,
                (msg::path, msg::value),
                "{value} is a directory name prefix such as 'node-'",
                "could not find an extracted directory starting with '{value}' in {path}")
DECLARE_MESSAGE(ExtractingRuntime, (msg::path), "", "Extracting {path}...")
DECLARE_MESSAGE(ExtractionFailed,
                (msg::path, msg::exit_code),
                "",
                "failed to extract {path}: the extraction tool exited with code {exit_code}")
DECLARE_MESSAGE(FailedToTakeFileSystemLock, (msg::path), "", "failed to take the filesystem lock on {path}")
DECLARE_MESSAGE(HomeDirectoryNotFound,
                (msg::env_var),
                "",
                "unable to determine the home directory; {env_var} is not set")
DECLARE_MESSAGE(InstallVerificationFailed,
                (msg::path),
                "",
                "Node.js installation failed: expected {path} to exist after installing")
DECLARE_MESSAGE(InstalledRuntime, (msg::version, msg::path), "", "Node.js v{version} installed to {path}")
DECLARE_MESSAGE(LauncherNotFound,
                (msg::tool_name),
                "",
                "could not find {tool_name}; please install Node.js manually")
DECLARE_MESSAGE(LaunchingProgramFailed, (msg::tool_name), "", "failed to launch {tool_name}")
DECLARE_MESSAGE(RestoringPreviousInstall, (msg::path), "", "restoring the previous installation at {path}")
DECLARE_MESSAGE(RuntimeNotFoundInstalling, (msg::version), "", "Node.js not found. Installing Node.js v{version}...")
DECLARE_MESSAGE(SystemApiErrorMessage,
                (msg::system_api, msg::exit_code, msg::error_msg),
                "",
                "calling {system_api} failed with {exit_code} ({error_msg})")
DECLARE_MESSAGE(WaitingToTakeFilesystemLock, (msg::path), "", "waiting to take filesystem lock on {path}...")
