#include <nodeboot/base/curl.h>
#include <nodeboot/base/diagnostics.h>
#include <nodeboot/base/downloads.h>
#include <nodeboot/base/files.h>
#include <nodeboot/base/messages.h>
#include <nodeboot/base/strings.h>
#include <nodeboot/base/system.debug.h>
#include <nodeboot/base/system.h>

#include <string>

namespace
{
    using namespace nodeboot;

    std::string url_encode_spaces(StringView url)
    {
        std::string result;
        for (auto ch : url)
        {
            if (ch == ' ')
            {
                result.append("%20");
            }
            else
            {
                result.push_back(ch);
            }
        }

        return result;
    }

    size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* param)
    {
        if (!param) return 0;
        return static_cast<WriteFilePointer*>(param)->write(contents, size, nmemb);
    }

    bool perform_download(DiagnosticContext& context,
                          const Filesystem& fs,
                          StringView raw_url,
                          const Path& download_path,
                          const DownloadTimeouts& timeouts)
    {
        std::error_code ec;
        auto fileptr = fs.open_for_write(download_path, ec);
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, "fopen", {download_path}));
            return false;
        }

        const auto encoded_url = url_encode_spaces(raw_url);
        CurlEasyHandle handle;
        CURL* curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_USERAGENT, nodeboot_curl_user_agent);
        curl_easy_setopt(curl, CURLOPT_URL, encoded_url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeouts.connect_timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeouts.stall_timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_file_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&fileptr));
        curl_set_system_ssl_root_certs(curl);
        Debug::println("Downloading ", raw_url, " to ", download_path);
        const auto curl_code = curl_easy_perform(curl);
        fileptr.close();

        if (curl_code == CURLE_OPERATION_TIMEDOUT)
        {
            context.report_error(msgCurlDownloadTimeout, msg::url = raw_url);
            return false;
        }

        if (curl_code != CURLE_OK)
        {
            context.report_error(msgDownloadFailedCurl,
                                 msg::url = raw_url,
                                 msg::exit_code = static_cast<int>(curl_code),
                                 msg::error_msg = curl_easy_strerror(curl_code));
            return false;
        }

        long response_code = -1;
        const auto get_info_code = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
        if (get_info_code != CURLE_OK)
        {
            context.report_error(msgDownloadFailedCurl,
                                 msg::url = raw_url,
                                 msg::exit_code = static_cast<int>(get_info_code),
                                 msg::error_msg = curl_easy_strerror(get_info_code));
            return false;
        }

        if ((response_code >= 200 && response_code < 300) || (raw_url.starts_with("file://") && response_code == 0))
        {
            return true;
        }

        context.report_error(msgDownloadFailedStatusCode, msg::url = raw_url, msg::value = response_code);
        return false;
    }
}

namespace nodeboot
{
    bool download_file(DiagnosticContext& context,
                       const Filesystem& fs,
                       StringView url,
                       const Path& download_path,
                       const DownloadTimeouts& timeouts)
    {
        auto download_path_part_path = download_path;
        download_path_part_path += ".";
        download_path_part_path += std::to_string(get_process_id());
        download_path_part_path += ".part";

        if (!perform_download(context, fs, url, download_path_part_path, timeouts))
        {
            fs.remove(download_path_part_path, IgnoreErrors{});
            return false;
        }

        std::error_code ec;
        fs.rename(download_path_part_path, download_path, ec);
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, "rename", {download_path_part_path, download_path}));
            fs.remove(download_path_part_path, IgnoreErrors{});
            return false;
        }

        return true;
    }
}
