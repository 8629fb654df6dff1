#include <absl/status/status.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <net/HttpClient.hpp>
#include <string>
#include <utility>
#include <vector>

#include <AbslLogCompat.hpp>

namespace {

size_t appendToString(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents),
                                             size * nmemb);
    return size * nmemb;
}

}  // namespace

HttpClient::HttpClient(std::string userAgent)
    : userAgent_(std::move(userAgent)),
      curl_(RAII<CURL*>::create<void>(curl_easy_init(), curl_easy_cleanup)) {
    if (!curl_) {
        LOG(ERROR) << "Cannot initialize curl";
    }
}

absl::StatusOr<HttpResponse> HttpClient::get(
    const std::string_view url, const Fields& headers,
    const std::optional<std::chrono::milliseconds> timeout) {
    return perform(url, headers, std::nullopt, timeout);
}

absl::StatusOr<HttpResponse> HttpClient::postForm(const std::string_view url,
                                                  const Fields& form,
                                                  const Fields& headers) {
    Fields allHeaders = headers;
    allHeaders.emplace_back("Content-Type",
                            "application/x-www-form-urlencoded");
    return perform(url, allHeaders, encodeForm(form), std::nullopt);
}

absl::StatusOr<HttpResponse> HttpClient::postJson(const std::string_view url,
                                                  std::string body,
                                                  const Fields& headers) {
    Fields allHeaders = headers;
    allHeaders.emplace_back("Content-Type", "application/json");
    return perform(url, allHeaders, std::move(body), std::nullopt);
}

std::string HttpClient::encodeForm(const Fields& form) {
    std::string encoded;
    const std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : form) {
        if (!encoded.empty()) {
            encoded += '&';
        }
        for (const auto* part : {&key, &value}) {
            char* escaped = curl_easy_escape(curl_.get(), part->c_str(),
                                             static_cast<int>(part->size()));
            if (escaped != nullptr) {
                encoded += escaped;
                curl_free(escaped);
            }
            if (part == &key) {
                encoded += '=';
            }
        }
    }
    return encoded;
}

void HttpClient::setCookie(const std::string_view domain,
                           const std::string_view name,
                           const std::string_view value) {
    // Netscape cookie file format
    const auto line =
        fmt::format("{}\tTRUE\t/\tFALSE\t0\t{}\t{}", domain, name, value);
    const std::lock_guard<std::mutex> lock(mutex_);
    curl_easy_setopt(curl_.get(), CURLOPT_COOKIEFILE, "");
    if (const auto res =
            curl_easy_setopt(curl_.get(), CURLOPT_COOKIELIST, line.c_str());
        res != CURLE_OK) {
        LOG(WARNING) << "Cannot set cookie " << name << ": "
                     << curl_easy_strerror(res);
    }
}

std::optional<std::string> HttpClient::cookie(const std::string_view name) {
    const std::lock_guard<std::mutex> lock(mutex_);
    curl_slist* cookies = nullptr;
    if (curl_easy_getinfo(curl_.get(), CURLINFO_COOKIELIST, &cookies) !=
        CURLE_OK) {
        return std::nullopt;
    }
    std::optional<std::string> found;
    for (auto* it = cookies; it != nullptr; it = it->next) {
        std::vector<std::string> fields = absl::StrSplit(it->data, '\t');
        if (fields.size() >= 7 && fields[5] == name) {
            found = fields[6];
        }
    }
    curl_slist_free_all(cookies);
    return found;
}

absl::StatusOr<HttpResponse> HttpClient::perform(
    const std::string_view url, const Fields& headers,
    std::optional<std::string> postBody,
    const std::optional<std::chrono::milliseconds> timeout) {
    if (!curl_) {
        return absl::UnavailableError("curl is not initialized");
    }
    const std::lock_guard<std::mutex> lock(mutex_);
    CURL* curl = curl_.get();

    // Keeps cookies, drops everything else from the previous request
    curl_easy_reset(curl);
    const std::string urlString(url);
    curl_easy_setopt(curl, CURLOPT_URL, urlString.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (timeout) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(timeout->count()));
    }

    auto headerList = RAII<curl_slist*>::create<void>(nullptr, curl_slist_free_all);
    curl_slist* rawList = nullptr;
    for (const auto& [key, value] : headers) {
        rawList = curl_slist_append(rawList,
                                    fmt::format("{}: {}", key, value).c_str());
    }
    headerList.reset(rawList);
    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
    }

    if (postBody) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postBody->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(postBody->size()));
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return absl::DeadlineExceededError(
            fmt::format("{}: {}", url, curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        DLOG(WARNING) << url << ": " << curl_easy_strerror(res);
        return absl::UnavailableError(
            fmt::format("{}: {}", url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.code);
    char* effective = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) ==
            CURLE_OK &&
        effective != nullptr) {
        response.effectiveUrl = effective;
    } else {
        response.effectiveUrl = urlString;
    }
    return response;
}
