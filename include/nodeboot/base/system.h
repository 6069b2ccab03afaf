#pragma once

#include <nodeboot/base/expected.h>
#include <nodeboot/base/optional.h>
#include <nodeboot/base/path.h>
#include <nodeboot/base/stringview.h>

#include <string>

namespace nodeboot
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept;

    // HOME, or USERPROFILE on Windows; must be set and absolute.
    const ExpectedL<Path>& get_home_dir() noexcept;

    long get_process_id();

    // "windows", "darwin", "linux", or another lowercase kernel name.
    std::string get_host_os_name();

    // The machine hardware name as reported by uname -m, or the PROCESSOR_ARCHITECTURE spelling on Windows.
    std::string get_host_machine_name();
}
