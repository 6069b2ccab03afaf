#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <nodeboot/base/contractual-constants.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

int main(int argc, char** argv)
{
    if (nodeboot::get_environment_variable(nodeboot::EnvironmentVariableDebug).value_or("") == "1")
    {
        nodeboot::Debug::g_debugging = true;
    }

    // Tests build their own settings; a mirror override from the developer's shell must not leak into them.
    nodeboot::set_environment_variable(nodeboot::EnvironmentVariableNodeMirror, nodeboot::nullopt);
    nodeboot::set_environment_variable(nodeboot::EnvironmentVariableNodeJsOrgMirror, nodeboot::nullopt);

    return Catch::Session().run(argc, argv);
}
