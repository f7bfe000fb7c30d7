// SPDX-License-Identifier: MIT
#include "crates/client.hh"

#include <curl/curl.h>
#include <sys/epoll.h>
#include <systemd/sd-event.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "crates/interrupt.hh"

namespace crates {

namespace {

// How long a single turn of the event loop may block before the interrupt
// flag is looked at again.
constexpr uint64_t kLoopTickUsec = 100 * 1000;

std::string_view GetEnv(const char* name) {
  const auto* value = getenv(name);
  return value ? std::string_view(value) : std::string_view();
}

uint32_t EpollEventsFromCurlAction(int action) {
  switch (action) {
    case CURL_POLL_IN:
      return EPOLLIN;
    case CURL_POLL_OUT:
      return EPOLLOUT;
    case CURL_POLL_INOUT:
      return EPOLLIN | EPOLLOUT;
  }
  return 0;
}

int CurlActionFromEpollEvents(uint32_t revents) {
  int action = 0;
  if (revents & (EPOLLIN | EPOLLHUP)) {
    action |= CURL_CSELECT_IN;
  }
  if (revents & EPOLLOUT) {
    action |= CURL_CSELECT_OUT;
  }
  if (revents & EPOLLERR) {
    action |= CURL_CSELECT_ERR;
  }
  return action;
}

absl::Status StatusFromHttpCode(long http_status) {
  switch (http_status) {
    case 200:
    case 304:
      return absl::OkStatus();
    case 404:
    case 410:
    case 451:
      // The index has no such crate. Callers need to tell this apart from
      // real failures.
      return absl::NotFoundError("Not Found");
    case 429:
      return absl::ResourceExhaustedError(
          "Too many requests: the index is rate limiting this client");
  }

  if (http_status >= 500) {
    return absl::UnavailableError(absl::StrCat("HTTP ", http_status));
  }

  return absl::InternalError(absl::StrCat("HTTP ", http_status));
}

absl::Status StatusFromCurlResult(CURLcode result, const char* error_buffer) {
  std::string message =
      error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);

  switch (result) {
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
      return absl::UnavailableError(std::move(message));
    default:
      return absl::UnknownError(std::move(message));
  }
}

long CurlHttpVersion(Client::HttpVersion version) {
  switch (version) {
    case Client::HttpVersion::NEGOTIATE:
      return CURL_HTTP_VERSION_NONE;
    case Client::HttpVersion::HTTP1_1:
      return CURL_HTTP_VERSION_1_1;
    case Client::HttpVersion::HTTP2:
      return CURL_HTTP_VERSION_2;
    case Client::HttpVersion::HTTP2_PRIOR_KNOWLEDGE:
      return CURL_HTTP_VERSION_2_PRIOR_KNOWLEDGE;
  }

  return CURL_HTTP_VERSION_NONE;
}

// Owns everything belonging to one request, from the moment it is queued
// until its callback has run.
class PendingRequest {
 public:
  PendingRequest(const KrateRequest& request, std::string_view baseurl,
                 Client::ResponseCallback callback)
      : name_(request.name()),
        url_(request.Url(baseurl)),
        timeout_(request.timeout()),
        callback_(std::move(callback)) {
    for (const auto& header : request.Headers()) {
      headers_ = curl_slist_append(headers_, header.c_str());
    }
  }

  ~PendingRequest() { curl_slist_free_all(headers_); }

  PendingRequest(const PendingRequest&) = delete;
  PendingRequest& operator=(const PendingRequest&) = delete;

  static size_t OnBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* request = static_cast<PendingRequest*>(userdata);
    request->response_.bytes.append(ptr, size * nmemb);
    return size * nmemb;
  }

  static size_t OnHeader(char* ptr, size_t size, size_t nmemb,
                         void* userdata) {
    auto* request = static_cast<PendingRequest*>(userdata);
    request->response_.AddHeader(std::string_view(ptr, size * nmemb));
    return size * nmemb;
  }

  // Writes outgoing request headers to the trace file.
  static int OnTrace(CURL*, curl_infotype type, char* data, size_t size,
                     void* userdata) {
    if (type == CURLINFO_HEADER_OUT) {
      static_cast<std::ofstream*>(userdata)->write(data, size);
    }
    return 0;
  }

  // Hands the outcome of the transfer to the callback.
  int Complete(CURL* curl, CURLcode result) {
    absl::Status status;
    if (result == CURLE_OK) {
      long http_status = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
      status = StatusFromHttpCode(http_status);
      response_.not_modified = http_status == 304;
    } else {
      status = StatusFromCurlResult(result, error_buffer_.data());
    }

    return Complete(std::move(status));
  }

  int Complete(absl::Status status) {
    if (!status.ok()) {
      return std::move(callback_)(std::move(status));
    }
    return std::move(callback_)(std::move(response_));
  }

  const std::string& name() const { return name_; }
  const std::string& url() const { return url_; }
  absl::Duration timeout() const { return timeout_; }
  curl_slist* headers() const { return headers_; }
  char* error_buffer() { return error_buffer_.data(); }

 private:
  std::string name_;
  std::string url_;
  absl::Duration timeout_;
  curl_slist* headers_ = nullptr;
  Client::ResponseCallback callback_;

  KrateResponse response_;
  std::array<char, CURL_ERROR_SIZE> error_buffer_ = {};
};

}  // namespace

class ClientImpl : public Client {
 public:
  ClientImpl(Options options, CURLM* multi, sd_event* event);
  ~ClientImpl() override;

  ClientImpl(const ClientImpl&) = delete;
  ClientImpl& operator=(const ClientImpl&) = delete;

  void QueueRequest(const KrateRequest& request,
                    ResponseCallback callback) override;

  int Wait() override;

 private:
  enum class Trace {
    NONE,
    // curl's verbose output on stderr.
    VERBOSE,
    // Outgoing request headers written to a file, on top of VERBOSE.
    REQUESTS,
  };

  void StartTransfer(PendingRequest* request);

  // Removes a transfer from the multi handle. Its callback runs only if
  // dispatch is set; otherwise the request is dropped silently.
  int FinishTransfer(CURL* curl, CURLcode result, bool dispatch);

  int DrainCompletedTransfers();
  int SocketAction(curl_socket_t fd, int action);
  uint64_t DeadlineUsec(absl::Duration from_now) const;

  void CancelAll();

  static int OnCurlSocket(CURL*, curl_socket_t fd, int action, void* userdata,
                          void* socketp);
  static int OnCurlTimerChange(CURLM*, long timeout_ms, void* userdata);
  static int OnSocketReady(sd_event_source*, int fd, uint32_t revents,
                           void* userdata);
  static int OnTimerExpired(sd_event_source*, uint64_t, void* userdata);
  static int OnDelayElapsed(sd_event_source* source, uint64_t,
                            void* userdata);

  Options options_;
  CURLM* multi_;
  sd_event* event_;
  sd_event_source* curl_timer_ = nullptr;

  absl::flat_hash_set<CURL*> transfers_;
  absl::flat_hash_map<sd_event_source*, PendingRequest*> delayed_;
  bool cancelled_ = false;

  Trace trace_ = Trace::NONE;
  std::ofstream trace_stream_;
};

ClientImpl::ClientImpl(Options options, CURLM* multi, sd_event* event)
    : options_(std::move(options)), multi_(multi), event_(event) {
  curl_multi_setopt(multi_, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
  curl_multi_setopt(multi_, CURLMOPT_MAX_TOTAL_CONNECTIONS,
                    options_.max_connections);
  curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &ClientImpl::OnCurlSocket);
  curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
  curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION,
                    &ClientImpl::OnCurlTimerChange);
  curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);

  std::string_view debug = GetEnv("YANKED_DEBUG");
  if (absl::ConsumePrefix(&debug, "requests:")) {
    trace_ = Trace::REQUESTS;
    trace_stream_.open(std::string(debug), std::ofstream::trunc);
  } else if (!debug.empty()) {
    trace_ = Trace::VERBOSE;
  }
}

ClientImpl::~ClientImpl() {
  CancelAll();

  curl_multi_cleanup(multi_);
  curl_global_cleanup();

  sd_event_source_unref(curl_timer_);
  sd_event_unref(event_);
}

uint64_t ClientImpl::DeadlineUsec(absl::Duration from_now) const {
  uint64_t now = 0;
  if (sd_event_now(event_, CLOCK_MONOTONIC, &now) < 0) {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    now = absl::ToInt64Microseconds(absl::DurationFromTimespec(ts));
  }

  return now + std::max<int64_t>(absl::ToInt64Microseconds(from_now), 0);
}

void ClientImpl::CancelAll() {
  if (transfers_.empty() && delayed_.empty()) {
    return;
  }

  cancelled_ = true;

  while (!transfers_.empty()) {
    FinishTransfer(*transfers_.begin(), CURLE_ABORTED_BY_CALLBACK,
                   /*dispatch=*/false);
  }

  for (auto& [source, request] : delayed_) {
    sd_event_source_disable_unref(source);
    delete request;
  }
  delayed_.clear();
}

// static
int ClientImpl::OnCurlSocket(CURL*, curl_socket_t fd, int action,
                             void* userdata, void* socketp) {
  auto* client = static_cast<ClientImpl*>(userdata);
  auto* io = static_cast<sd_event_source*>(socketp);

  if (action == CURL_POLL_REMOVE) {
    sd_event_source_disable_unref(io);
    return 0;
  }

  const uint32_t events = EpollEventsFromCurlAction(action);

  if (io == nullptr) {
    if (sd_event_add_io(client->event_, &io, fd, events,
                        &ClientImpl::OnSocketReady, client) < 0) {
      return -1;
    }
    return curl_multi_assign(client->multi_, fd, io) == CURLM_OK ? 0 : -1;
  }

  if (sd_event_source_set_io_events(io, events) < 0 ||
      sd_event_source_set_enabled(io, SD_EVENT_ON) < 0) {
    return -1;
  }

  return 0;
}

// static
int ClientImpl::OnCurlTimerChange(CURLM*, long timeout_ms, void* userdata) {
  auto* client = static_cast<ClientImpl*>(userdata);

  if (timeout_ms < 0) {
    return client->curl_timer_ == nullptr
               ? 0
               : sd_event_source_set_enabled(client->curl_timer_, SD_EVENT_OFF);
  }

  const uint64_t usec = client->DeadlineUsec(absl::Milliseconds(timeout_ms));

  if (client->curl_timer_ == nullptr) {
    return sd_event_add_time(client->event_, &client->curl_timer_,
                             CLOCK_MONOTONIC, usec, 0,
                             &ClientImpl::OnTimerExpired, client) < 0
               ? -1
               : 0;
  }

  if (sd_event_source_set_time(client->curl_timer_, usec) < 0 ||
      sd_event_source_set_enabled(client->curl_timer_, SD_EVENT_ONESHOT) < 0) {
    return -1;
  }

  return 0;
}

// static
int ClientImpl::OnSocketReady(sd_event_source*, int fd, uint32_t revents,
                              void* userdata) {
  return static_cast<ClientImpl*>(userdata)->SocketAction(
      fd, CurlActionFromEpollEvents(revents));
}

// static
int ClientImpl::OnTimerExpired(sd_event_source*, uint64_t, void* userdata) {
  return static_cast<ClientImpl*>(userdata)->SocketAction(CURL_SOCKET_TIMEOUT,
                                                          0);
}

// static
int ClientImpl::OnDelayElapsed(sd_event_source* source, uint64_t,
                               void* userdata) {
  auto* client = static_cast<ClientImpl*>(userdata);

  auto iter = client->delayed_.find(source);
  if (iter == client->delayed_.end()) {
    return 0;
  }

  PendingRequest* request = iter->second;
  client->delayed_.erase(iter);
  sd_event_source_disable_unref(source);

  client->StartTransfer(request);
  return 0;
}

int ClientImpl::SocketAction(curl_socket_t fd, int action) {
  int running;
  if (curl_multi_socket_action(multi_, fd, action, &running) != CURLM_OK) {
    return -EINVAL;
  }

  return DrainCompletedTransfers();
}

int ClientImpl::DrainCompletedTransfers() {
  int queued;
  while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
    if (msg->msg != CURLMSG_DONE) {
      continue;
    }

    // Read everything out of msg before it is invalidated.
    CURL* curl = msg->easy_handle;
    const CURLcode result = msg->data.result;

    if (FinishTransfer(curl, result, /*dispatch=*/true) < 0) {
      CancelAll();
      break;
    }
  }

  return 0;
}

int ClientImpl::FinishTransfer(CURL* curl, CURLcode result, bool dispatch) {
  PendingRequest* request = nullptr;
  curl_easy_getinfo(curl, CURLINFO_PRIVATE, &request);

  transfers_.erase(curl);
  curl_multi_remove_handle(multi_, curl);

  int r = 0;
  if (dispatch) {
    r = request->Complete(curl, result);
  }

  curl_easy_cleanup(curl);
  delete request;

  return r;
}

void ClientImpl::StartTransfer(PendingRequest* request) {
  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    request->Complete(absl::InternalError(
        absl::StrCat("failed to create transfer for ", request->name())));
    delete request;
    return;
  }

  curl_easy_setopt(curl, CURLOPT_URL, request->url().c_str());
  curl_easy_setopt(curl, CURLOPT_PRIVATE, request);
  curl_easy_setopt(curl, CURLOPT_HTTP_VERSION,
                   CurlHttpVersion(options_.http_version));
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(
      curl, CURLOPT_CONNECTTIMEOUT_MS,
      static_cast<long>(absl::ToInt64Milliseconds(options_.connect_timeout)));
  if (!options_.useragent.empty()) {
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.useragent.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &PendingRequest::OnBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, request);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &PendingRequest::OnHeader);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, request);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, request->error_buffer());

  if (request->headers() != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request->headers());
  }

  if (request->timeout() > absl::ZeroDuration()) {
    // curl reads a zero timeout as "forever".
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(std::max<int64_t>(
                         absl::ToInt64Milliseconds(request->timeout()), 1)));
  }

  if (trace_ == Trace::REQUESTS) {
    curl_easy_setopt(curl, CURLOPT_DEBUGFUNCTION, &PendingRequest::OnTrace);
    curl_easy_setopt(curl, CURLOPT_DEBUGDATA, &trace_stream_);
  }
  if (trace_ != Trace::NONE) {
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
  }

  if (curl_multi_add_handle(multi_, curl) != CURLM_OK) {
    request->Complete(absl::InternalError(
        absl::StrCat("failed to start transfer for ", request->name())));
    curl_easy_cleanup(curl);
    delete request;
    return;
  }

  transfers_.insert(curl);
}

void ClientImpl::QueueRequest(const KrateRequest& request,
                              ResponseCallback callback) {
  auto* pending =
      new PendingRequest(request, options_.baseurl, std::move(callback));

  if (request.delay() <= absl::ZeroDuration()) {
    StartTransfer(pending);
    return;
  }

  sd_event_source* source = nullptr;
  if (sd_event_add_time(event_, &source, CLOCK_MONOTONIC,
                        DeadlineUsec(request.delay()), 0,
                        &ClientImpl::OnDelayElapsed, this) < 0) {
    StartTransfer(pending);
    return;
  }

  delayed_.emplace(source, pending);
}

int ClientImpl::Wait() {
  cancelled_ = false;

  while (!transfers_.empty() || !delayed_.empty()) {
    if (IsInterrupted()) {
      CancelAll();
      break;
    }

    if (int r = sd_event_run(event_, kLoopTickUsec); r < 0 && r != -EINTR) {
      CancelAll();
      return r;
    }
  }

  return cancelled_ ? -ECANCELED : 0;
}

// static
absl::StatusOr<std::unique_ptr<Client>> Client::New(Client::Options options) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    return absl::InternalError("failed to initialize libcurl");
  }

  CURLM* multi = curl_multi_init();
  if (multi == nullptr) {
    curl_global_cleanup();
    return absl::InternalError("failed to create curl multi handle");
  }

  sd_event* event = nullptr;
  if (int r = sd_event_new(&event); r < 0) {
    curl_multi_cleanup(multi);
    curl_global_cleanup();
    return absl::InternalError(
        absl::StrCat("failed to create event loop: ", strerror(-r)));
  }

  return std::make_unique<ClientImpl>(std::move(options), multi, event);
}

}  // namespace crates

/* vim: set et ts=2 sw=2: */
