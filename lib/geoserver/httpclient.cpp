#include "httpclient.hpp"

#include <chrono>
#include <cstdio>
#include <memory>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace {

size_t curl_write_cb(void *contents, size_t size, size_t nmemb, void *userp) {
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

struct CurlDeleter {
  void operator()(CURL *c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
  void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};

struct FileCloser {
  void operator()(FILE *f) const { fclose(f); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle curl_easy() {
  CurlHandle c(curl_easy_init());
  if (c) {
    curl_easy_setopt(c.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.get(), CURLOPT_USERAGENT, "geoshell/1.0");
  }
  return c;
}

} // namespace

std::string HttpResponse::describe(const std::string &what) const {
  if (!error.empty())
    return what + ": " + error;
  std::string text = what + ": HTTP " + std::to_string(status);
  if (!body.empty())
    text += " " + body;
  return text;
}

CurlGlobal::CurlGlobal() {
  m_ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobal::~CurlGlobal() {
  if (m_ok)
    curl_global_cleanup();
}

HttpResponse HttpClient::request(const std::string &method,
                                 const std::string &url,
                                 const std::string &body,
                                 const std::string &content_type,
                                 const std::string &accept) const {
  HttpResponse r;
  CurlHandle c = curl_easy();
  if (!c) {
    r.error = "failed to initialise HTTP handle";
    return r;
  }

  std::string response;
  std::unique_ptr<curl_slist, SlistDeleter> headers;
  auto add_header = [&headers](const std::string &line) {
    headers.reset(curl_slist_append(headers.release(), line.c_str()));
  };
  if (!accept.empty())
    add_header("Accept: " + accept);
  if (!content_type.empty())
    add_header("Content-Type: " + content_type);

  curl_easy_setopt(c.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(c.get(), CURLOPT_TIMEOUT_MS, m_timeout_ms);
  curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
  curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(c.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  if (!m_username.empty()) {
    curl_easy_setopt(c.get(), CURLOPT_USERNAME, m_username.c_str());
    curl_easy_setopt(c.get(), CURLOPT_PASSWORD, m_password.c_str());
  }
  if (headers)
    curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER, headers.get());
  if (method == "POST" || method == "PUT") {
    curl_easy_setopt(c.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  }

  auto t0 = std::chrono::steady_clock::now();
  auto code = curl_easy_perform(c.get());
  auto t1 = std::chrono::steady_clock::now();
  r.latency_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count());

  if (code != CURLE_OK) {
    r.error = curl_easy_strerror(code);
    spdlog::debug("{} {} failed: {}", method, url, r.error);
  } else {
    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &r.status);
    r.body = std::move(response);
    spdlog::debug("{} {} -> {} ({} ms)", method, url, r.status, r.latency_ms);
  }
  return r;
}

HttpResponse HttpClient::putFile(const std::string &url,
                                 const std::string &path,
                                 const std::string &content_type) const {
  HttpResponse r;
  std::unique_ptr<FILE, FileCloser> file(fopen(path.c_str(), "rb"));
  if (!file) {
    r.error = "failed to open file " + path;
    return r;
  }

  fseek(file.get(), 0, SEEK_END);
  long size = ftell(file.get());
  fseek(file.get(), 0, SEEK_SET);

  CurlHandle c = curl_easy();
  if (!c) {
    r.error = "failed to initialise HTTP handle";
    return r;
  }

  std::string response;
  std::unique_ptr<curl_slist, SlistDeleter> headers(
      curl_slist_append(nullptr, ("Content-Type: " + content_type).c_str()));

  curl_easy_setopt(c.get(), CURLOPT_URL, url.c_str());
  // Uploads can be large; only the connect phase is bounded
  curl_easy_setopt(c.get(), CURLOPT_CONNECTTIMEOUT_MS, m_timeout_ms);
  curl_easy_setopt(c.get(), CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(c.get(), CURLOPT_READDATA, file.get());
  curl_easy_setopt(c.get(), CURLOPT_INFILESIZE_LARGE,
                   static_cast<curl_off_t>(size));
  curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
  curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &response);
  if (!m_username.empty()) {
    curl_easy_setopt(c.get(), CURLOPT_USERNAME, m_username.c_str());
    curl_easy_setopt(c.get(), CURLOPT_PASSWORD, m_password.c_str());
  }

  auto code = curl_easy_perform(c.get());
  if (code != CURLE_OK) {
    r.error = curl_easy_strerror(code);
    spdlog::warn("PUT {} failed: {}", url, r.error);
  } else {
    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &r.status);
    r.body = std::move(response);
    spdlog::debug("PUT {} ({} bytes) -> {}", url, size, r.status);
  }
  return r;
}

std::string HttpClient::escape(const std::string &value) {
  char *escaped = curl_easy_escape(nullptr, value.c_str(),
                                   static_cast<int>(value.size()));
  if (!escaped)
    return value;
  std::string out(escaped);
  curl_free(escaped);
  return out;
}
