#include <courier/common/error.hpp>
#include <courier/net/curl/http_client.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace courier::net {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr =
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

}  // namespace

curl_http_client::curl_http_client(curl_options options)
    : options_{std::move(options)} {
  auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    throw courier::common::http_error{
        std::string{"curl_global_init failed: "} + curl_easy_strerror(rc)};
  }
}

curl_http_client::~curl_http_client() {
  curl_global_cleanup();
}

http_response curl_http_client::get(const std::string& url,
                                    const http_headers_t& headers) {
  return perform(url, nullptr, headers);
}

http_response curl_http_client::post(const std::string& url,
                                     const std::string& body,
                                     const http_headers_t& headers) {
  return perform(url, &body, headers);
}

http_response curl_http_client::perform(const std::string& url,
                                        const std::string* body,
                                        const http_headers_t& headers) {
  auto curl = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    throw courier::common::http_error{"curl_easy_init failed"};
  }

  auto header_list = curl_slist_ptr{nullptr, curl_slist_free_all};
  for (const auto& [name, value] : headers) {
    auto line = name + ": " + value;
    auto* appended = curl_slist_append(header_list.get(), line.c_str());
    if (appended == nullptr) {
      throw courier::common::http_error{"curl_slist_append failed"};
    }
    header_list.release();
    header_list.reset(appended);
  }

  auto response = http_response{};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(options_.timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(options_.connect_timeout_ms));
  if (body != nullptr) {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body->size()));
  }

  spdlog::debug("HTTP {} {}", body != nullptr ? "POST" : "GET", url);
  auto rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw courier::common::http_error{
        std::string{"HTTP request to "} + url +
        " failed: " + curl_easy_strerror(rc)};
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  spdlog::debug("HTTP {} -> {} ({} bytes)", url, response.status,
                response.body.size());
  return response;
}

}  // namespace courier::net
