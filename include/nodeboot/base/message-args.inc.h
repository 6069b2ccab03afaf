DECLARE_MSG_ARG(env_var, "HOME")
DECLARE_MSG_ARG(error_msg, "File Not Found")
DECLARE_MSG_ARG(exit_code, "127")
DECLARE_MSG_ARG(path, "/home/user/.claude-ssh-mcp/node")
DECLARE_MSG_ARG(system_api, "CreateProcessW")
DECLARE_MSG_ARG(tool_name, "npx")
DECLARE_MSG_ARG(url, "https://nodejs.org/dist/v20.11.0/node-v20.11.0-linux-x64.tar.xz")
DECLARE_MSG_ARG(value, "")
DECLARE_MSG_ARG(version, "20.11.0")
