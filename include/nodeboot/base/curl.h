#pragma once

#include <nodeboot/base/pragmas.h>

NODEBOOT_MSVC_WARNING(push)
// note: disable warning triggered by curl headers
// ws2tcpip.h(968): warning C6101: Returning uninitialized memory '*Mtu':  A successful path through the function does
// not set the named _Out_ parameter.
NODEBOOT_MSVC_WARNING(disable : 6101)
#include <curl/curl.h>
NODEBOOT_MSVC_WARNING(pop)

#ifndef NODEBOOT_VERSION_AS_STRING
#define NODEBOOT_VERSION_AS_STRING "0.0.0"
#endif

namespace nodeboot
{
    CURLcode get_curl_global_init_status() noexcept;
    void curl_set_system_ssl_root_certs(CURL* curl);

    struct CurlEasyHandle
    {
        CurlEasyHandle();
        CurlEasyHandle(const CurlEasyHandle&) = delete;
        CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;
        ~CurlEasyHandle();

        CURL* get();

    private:
        CURL* m_ptr = nullptr;
    };

    constexpr char nodeboot_curl_user_agent[] = "nodeboot/" NODEBOOT_VERSION_AS_STRING " (curl)";
}
