#include "http/http_client.hpp"

#include <memory>
#include <string>

#include <curl/curl.h>

namespace flight_search::http {
namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct CurlStringDeleter {
  void operator()(char* value) const {
    if (value != nullptr) {
      curl_free(value);
    }
  }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

std::string escape(CURL* handle, const std::string& value) {
  CurlStringPtr escaped(curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size())));
  if (!escaped) {
    throw HttpError("failed to encode query parameter");
  }
  return std::string(escaped.get());
}

std::string build_url(CURL* handle, const std::string& url, const QueryParams& query) {
  std::string full = url;
  char separator = url.find('?') == std::string::npos ? '?' : '&';
  for (const auto& [name, value] : query) {
    full.push_back(separator);
    full += escape(handle, name);
    full.push_back('=');
    full += escape(handle, value);
    separator = '&';
  }
  return full;
}

template <typename T>
void set_option(CURL* handle, CURLoption option, T value) {
  const CURLcode rc = curl_easy_setopt(handle, option, value);
  if (rc != CURLE_OK) {
    throw HttpError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
  }
}

}  // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options) : options_(std::move(options)) {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    throw HttpError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
  }
}

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string& url, const QueryParams& query) {
  CurlEasyPtr handle(curl_easy_init());
  if (!handle) {
    throw HttpError("curl_easy_init failed");
  }

  const std::string full_url = build_url(handle.get(), url, query);
  std::string body;

  set_option(handle.get(), CURLOPT_URL, full_url.c_str());
  set_option(handle.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  set_option(handle.get(), CURLOPT_WRITEFUNCTION, &write_callback);
  set_option(handle.get(), CURLOPT_WRITEDATA, static_cast<void*>(&body));
  set_option(handle.get(), CURLOPT_HTTPGET, 1L);
  set_option(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  set_option(handle.get(), CURLOPT_MAXREDIRS, 10L);
  set_option(handle.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  set_option(handle.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  set_option(handle.get(), CURLOPT_NOSIGNAL, 1L);
  set_option(handle.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
  set_option(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));

  const CURLcode rc = curl_easy_perform(handle.get());
  if (rc != CURLE_OK) {
    throw HttpError(curl_easy_strerror(rc));
  }

  HttpResponse response{};
  const CURLcode info_rc = curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
  if (info_rc != CURLE_OK) {
    throw HttpError(std::string("unable to read response code: ") + curl_easy_strerror(info_rc));
  }
  response.body = std::move(body);
  return response;
}

}  // namespace flight_search::http
