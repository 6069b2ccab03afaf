#include <nodeboot/base/checks.h>
#include <nodeboot/base/curl.h>
#include <nodeboot/base/system.debug.h>

#include <array>
#include <string>

#if defined(__linux__)
#include <sys/stat.h>
#include <unistd.h>
#endif

#include <cstdlib>

namespace
{
    struct CurlGlobalInit
    {
        CurlGlobalInit() : init_status(curl_global_init(CURL_GLOBAL_DEFAULT)) { }
        ~CurlGlobalInit() { curl_global_cleanup(); }

        CurlGlobalInit(const CurlGlobalInit&) = delete;
        CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;

        CURLcode get_init_status() const { return init_status; }

    private:
        CURLcode init_status;
    };

#if defined(__linux__)
    // A statically linked or relocated libcurl may not know where this distribution keeps its trust store.
    struct CurlCaBundle
    {
        std::string ca_file;
        std::string ca_path;
    };

    bool path_exists(const char* path, bool require_directory)
    {
        struct stat st;
        if (stat(path, &st) != 0)
        {
            return false;
        }

        return require_directory ? S_ISDIR(st.st_mode) : S_ISREG(st.st_mode);
    }

    CurlCaBundle compute_curl_ca_bundle()
    {
        CurlCaBundle bundle;
        const char* ssl_ca_file = std::getenv("SSL_CERT_FILE");
        const char* ssl_ca_dir = std::getenv("SSL_CERT_DIR");
        if (ssl_ca_file && *ssl_ca_file)
        {
            bundle.ca_file = ssl_ca_file;
        }

        if (ssl_ca_dir && *ssl_ca_dir)
        {
            bundle.ca_path = ssl_ca_dir;
        }

        if (bundle.ca_file.empty())
        {
            static constexpr std::array<const char*, 5> cert_files = {
                "/etc/ssl/certs/ca-certificates.crt",                // Debian/Ubuntu
                "/etc/pki/tls/certs/ca-bundle.crt",                  // Fedora/RHEL
                "/etc/ssl/ca-bundle.pem",                            // OpenSUSE
                "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem", // CentOS
                "/etc/ssl/cert.pem",                                 // Alpine
            };

            for (const auto* f : cert_files)
            {
                if (path_exists(f, false))
                {
                    bundle.ca_file = f;
                    break;
                }
            }
        }

        if (bundle.ca_path.empty() && path_exists("/etc/ssl/certs", true))
        {
            bundle.ca_path = "/etc/ssl/certs";
        }

        return bundle;
    }
#endif
}

namespace nodeboot
{
    CURLcode get_curl_global_init_status() noexcept
    {
        static CurlGlobalInit g_curl_global_init;
        return g_curl_global_init.get_init_status();
    }

    void curl_set_system_ssl_root_certs(CURL* curl)
    {
#if defined(__linux__)
        static const CurlCaBundle bundle = compute_curl_ca_bundle();
        if (!bundle.ca_file.empty())
        {
            Debug::println("Using CA bundle ", bundle.ca_file);
            curl_easy_setopt(curl, CURLOPT_CAINFO, bundle.ca_file.c_str());
        }

        if (!bundle.ca_path.empty())
        {
            curl_easy_setopt(curl, CURLOPT_CAPATH, bundle.ca_path.c_str());
        }
#else
        (void)curl;
#endif
    }

    CurlEasyHandle::CurlEasyHandle() { get_curl_global_init_status(); }
    CurlEasyHandle::~CurlEasyHandle()
    {
        if (m_ptr)
        {
            curl_easy_cleanup(m_ptr);
        }
    }
    CURL* CurlEasyHandle::get()
    {
        if (!m_ptr)
        {
            m_ptr = curl_easy_init();
            if (!m_ptr)
            {
                Checks::unreachable(NODEBOOT_LINE_INFO);
            }
        }
        return m_ptr;
    }
}
