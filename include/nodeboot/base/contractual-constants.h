#pragma once

#include <nodeboot/base/stringview.h>

// Names and values that are observable from outside the tool: environment variables, directory layout, URLs.
// Changing any of these changes behavior users or other programs rely on.
namespace nodeboot
{
    inline constexpr StringLiteral EnvironmentVariableConnectTimeout = "NODEBOOT_CONNECT_TIMEOUT";
    inline constexpr StringLiteral EnvironmentVariableDebug = "NODEBOOT_DEBUG";
    inline constexpr StringLiteral EnvironmentVariableHome = "HOME";
    inline constexpr StringLiteral EnvironmentVariableLocalAppData = "LOCALAPPDATA";
    inline constexpr StringLiteral EnvironmentVariableNodeMirror = "NODEBOOT_NODE_MIRROR";
    inline constexpr StringLiteral EnvironmentVariableNodeJsOrgMirror = "NODEJS_ORG_MIRROR";
    inline constexpr StringLiteral EnvironmentVariablePath = "PATH";
    inline constexpr StringLiteral EnvironmentVariableProcessorArchitecture = "PROCESSOR_ARCHITECTURE";
    inline constexpr StringLiteral EnvironmentVariableProcessorArchiteW6432 = "PROCESSOR_ARCHITEW6432";
    inline constexpr StringLiteral EnvironmentVariableProgramFiles = "PROGRAMFILES";
    inline constexpr StringLiteral EnvironmentVariableStallTimeout = "NODEBOOT_STALL_TIMEOUT";
    inline constexpr StringLiteral EnvironmentVariableUserprofile = "USERPROFILE";

    inline constexpr StringLiteral DefaultProgramFiles = "C:\\Program Files";
    inline constexpr int DefaultConnectTimeoutSeconds = 30;
    inline constexpr int DefaultStallTimeoutSeconds = 60;

    inline constexpr StringLiteral ProductName = "claude-ssh-mcp";
    inline constexpr StringLiteral ProductDirectoryName = ".claude-ssh-mcp";
    inline constexpr StringLiteral RuntimeDirectoryName = "node";
    inline constexpr StringLiteral RuntimeVersion = "20.11.0";
    inline constexpr StringLiteral RuntimeBaseName = "node";
    inline constexpr StringLiteral LauncherBaseName = "npx";
    inline constexpr StringLiteral DistributionDirectoryPrefix = "node-";
    inline constexpr StringLiteral DefaultRuntimeMirror = "https://nodejs.org/dist";

    inline constexpr StringLiteral FileInstallLock = "install.lock";
    inline constexpr StringLiteral ScratchDirectoryPrefix = "tmp-";
    inline constexpr StringLiteral PreviousInstallDirectoryName = "previous";
    inline constexpr StringLiteral RejectedInstallDirectoryName = "rejected";
    inline constexpr StringLiteral ExtractDirectoryName = "extract";

    inline constexpr StringLiteral LauncherAutoConfirmArgument = "-y";
}
