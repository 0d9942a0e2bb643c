#include "spirc/spirc.h"
#include "spirc/codec.h"
#include "spirc/collaborators.h"
#include "spirc/controller.h"
#include "spirc/test_hooks.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

#include <sys/select.h>

namespace spirc {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

void LogToStderr(LogLevel level, const std::string& message) {
  std::cerr << "[spirc] " << LogLevelName(level) << ": " << message << std::endl;
}

std::string DescribeFrame(const Envelope& frame) {
  std::ostringstream oss;
  oss << MessageTypeName(frame.type) << " \"" << frame.device.name << "\" "
      << frame.ident << " seq=" << frame.seq_nr
      << " update=" << frame.state_update_id << " recipients=[";
  for (size_t i = 0; i < frame.recipients.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << frame.recipients[i];
  }
  oss << "]";
  return oss.str();
}

}  // namespace

std::string TrackIdToHex(const TrackId& id) {
  std::string out;
  out.reserve(id.size() * 2);
  for (const uint8_t byte : id) {
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0f]);
  }
  return out;
}

bool TrackIdFromHex(const std::string& text, TrackId* out) {
  if (!out || text.size() != kTrackIdLength * 2) {
    return false;
  }
  TrackId id{};
  for (size_t i = 0; i < id.size(); ++i) {
    const int high = HexValue(text[i * 2]);
    const int low = HexValue(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    id[i] = static_cast<uint8_t>((high << 4) | low);
  }
  *out = id;
  return true;
}

const char* MessageTypeName(MessageType type) {
  switch (type) {
    case MessageType::kHello: return "Hello";
    case MessageType::kGoodbye: return "Goodbye";
    case MessageType::kProbe: return "Probe";
    case MessageType::kNotify: return "Notify";
    case MessageType::kLoad: return "Load";
    case MessageType::kPlay: return "Play";
    case MessageType::kPause: return "Pause";
    case MessageType::kPlayPause: return "PlayPause";
    case MessageType::kSeek: return "Seek";
    case MessageType::kPrev: return "Prev";
    case MessageType::kNext: return "Next";
    case MessageType::kVolume: return "Volume";
    case MessageType::kShuffle: return "Shuffle";
    case MessageType::kRepeat: return "Repeat";
    case MessageType::kVolumeDown: return "VolumeDown";
    case MessageType::kVolumeUp: return "VolumeUp";
    case MessageType::kReplace: return "Replace";
    case MessageType::kLogout: return "Logout";
    case MessageType::kAction: return "Action";
    case MessageType::kRename: return "Rename";
  }
  return "Unknown";
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kError: return "error";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kInfo: return "info";
    case LogLevel::kDebug: return "debug";
    case LogLevel::kTrace: return "trace";
  }
  return "unknown";
}

std::vector<Capability> DefaultCapabilities() {
  std::vector<Capability> caps;
  caps.push_back({CapabilityType::kCanBePlayer, {0}, {}});
  caps.push_back({CapabilityType::kDeviceType, {1}, {}});
  caps.push_back({CapabilityType::kGaiaEqConnectId, {1}, {}});
  caps.push_back({CapabilityType::kSupportsLogout, {1}, {}});
  caps.push_back({CapabilityType::kSupportsRename, {1}, {}});
  caps.push_back({CapabilityType::kIsObservable, {1}, {}});
  caps.push_back({CapabilityType::kVolumeSteps, {kVolumeSteps}, {}});
  caps.push_back({CapabilityType::kSupportedContexts, {}, {}});
  caps.push_back({CapabilityType::kSupportedTypes, {},
                  {"audio/local", "audio/track", "local", "track"}});
  return caps;
}

Logger::Logger(LogLevel level, Config::LogCallback callback)
    : level_(level), callback_(std::move(callback)) {}

void Logger::Log(LogLevel level, const std::string& message) const {
  if (!Enabled(level)) {
    return;
  }
  if (callback_) {
    try {
      callback_(level, message);
      return;
    } catch (const std::exception& ex) {
      LogToStderr(LogLevel::kError, std::string("log callback threw: ") + ex.what());
    } catch (...) {
      LogToStderr(LogLevel::kError, "log callback threw a non-standard exception");
    }
  }
  LogToStderr(level, message);
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (device_name.empty()) {
    return fail("device_name must not be empty");
  }
  if (device_id.empty()) {
    return fail("device_id must not be empty");
  }
  if (idle_wait.count() <= 0) {
    return fail("idle_wait must be positive");
  }
  if (max_pending_frames == 0) {
    return fail("max_pending_frames must be positive");
  }
  if (send_max_retries < 0) {
    return fail("send_max_retries must not be negative");
  }
  if (send_retry_backoff.count() < 0) {
    return fail("send_retry_backoff must not be negative");
  }
  return true;
}

struct SessionMetricsAtomic {
  std::atomic<uint64_t> frames_received{0};
  std::atomic<uint64_t> frames_dispatched{0};
  std::atomic<uint64_t> frames_filtered{0};
  std::atomic<uint64_t> frames_sent{0};
  std::atomic<uint64_t> frames_dropped{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> decode_errors{0};
  std::atomic<uint64_t> callback_exceptions{0};

  SessionMetrics Snapshot() const {
    SessionMetrics snapshot;
    snapshot.frames_received = frames_received.load();
    snapshot.frames_dispatched = frames_dispatched.load();
    snapshot.frames_filtered = frames_filtered.load();
    snapshot.frames_sent = frames_sent.load();
    snapshot.frames_dropped = frames_dropped.load();
    snapshot.send_errors = send_errors.load();
    snapshot.decode_errors = decode_errors.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

struct Session::Impl {
#ifdef SPIRC_TESTING
  friend bool test::Tick(Session& session);
  friend size_t test::PendingFrameCount(Session& session);
  friend const Controller& test::GetController(Session& session);
#endif

  Impl(Config config, MessageChannel& channel, ConnectionSource& connections,
       Player& player)
      : config_(std::move(config)),
        logger_(config_.log_level, config_.log_callback),
        channel_(channel),
        connections_(connections),
        player_(player),
        controller_(config_) {}

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    std::string error;
    if (!config_.Validate(&error)) {
      SetLastError(error);
      logger_.Error(error);
      running_ = false;
      return false;
    }
    if (failed_) {
      logger_.Error("session already failed: " + GetLastError());
      running_ = false;
      return false;
    }
    try {
      loop_thread_ = std::thread([this]() { RunLoop(); });
    } catch (const std::exception& ex) {
      SetLastError(std::string("thread start failed: ") + ex.what());
      logger_.Error(GetLastError());
      running_ = false;
      return false;
    }
    return true;
  }

  void Stop() {
    running_ = false;
    if (loop_thread_.joinable()) {
      loop_thread_.join();
    }
    subscription_.reset();
    publisher_.reset();
  }

  bool IsRunning() const { return running_; }

  void SetFrameCallback(FrameCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    frame_cb_ = std::move(cb);
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  SessionMetrics GetMetrics() const { return metrics_.Snapshot(); }

 private:
  struct PendingFrame {
    uint32_t seq_nr = 0;
    MessageType type = MessageType::kNotify;
    std::string payload;
    int attempts = 0;
    /// Earliest time the next send may be tried after a failure.
    std::chrono::steady_clock::time_point next_attempt{};
  };

  void RunLoop() {
    while (running_ && !failed_) {
      const bool progress = Tick();
      if (failed_) {
        break;
      }
      if (!progress) {
        WaitForSources();
      }
    }
    running_ = false;
  }

  // One scheduling pass over all sources in fixed priority order.
  bool Tick() {
    if (failed_) {
      return false;
    }
    bool progress = false;
    std::string error;

    ConnectionEvent connection;
    switch (connections_.Poll(&connection, &error)) {
      case PollResult::kReady:
        Apply(controller_.Handle(connection));
        progress = true;
        break;
      case PollResult::kError:
        Fail("connection source failed: " + error);
        return false;
      case PollResult::kPending:
        break;
    }
    if (failed_) {
      return false;
    }

    if (subscription_) {
      std::string payload;
      switch (subscription_->Poll(&payload, &error)) {
        case PollResult::kReady:
          progress = true;
          if (!HandlePayload(payload)) {
            return false;
          }
          break;
        case PollResult::kError:
          Fail("subscription failed: " + error);
          return false;
        case PollResult::kPending:
          break;
      }
    }

    if (FlushPending()) {
      progress = true;
    }

    PlayerEvent player_event;
    switch (player_.PollEvent(&player_event, &error)) {
      case PollResult::kReady:
        Apply(controller_.Handle(player_event));
        progress = true;
        break;
      case PollResult::kError:
        Fail("player failed: " + error);
        return false;
      case PollResult::kPending:
        break;
    }
    return progress && !failed_;
  }

  bool HandlePayload(const std::string& payload) {
    metrics_.frames_received.fetch_add(1);
    Envelope frame;
    std::string error;
    if (!DecodeEnvelope(payload, &frame, &error)) {
      metrics_.decode_errors.fetch_add(1);
      Fail("decode failure: " + error);
      return false;
    }
    if (!ShouldDispatch(frame, controller_.ident())) {
      metrics_.frames_filtered.fetch_add(1);
      return true;
    }
    if (logger_.Enabled(LogLevel::kTrace)) {
      logger_.Trace(DescribeFrame(frame));
    }
    metrics_.frames_dispatched.fetch_add(1);
    NotifyFrameCallback(frame);
    Apply(controller_.Handle(frame));
    return !failed_;
  }

  void NotifyFrameCallback(const Envelope& frame) {
    FrameCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = frame_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(frame);
    } catch (const std::exception& ex) {
      RecordCallbackException(ex.what());
    } catch (...) {
      RecordCallbackException("unknown exception");
    }
  }

  void RecordCallbackException(const std::string& what) {
    metrics_.callback_exceptions.fetch_add(1);
    logger_.Error("FrameCallback threw: " + what);
  }

  // Execute controller actions against the collaborators, in order.
  void Apply(const Actions& actions) {
    for (const auto& action : actions) {
      if (failed_) {
        return;
      }
      if (const auto* open = std::get_if<OpenChannelAction>(&action)) {
        OpenChannel(open->topic);
      } else if (const auto* send = std::get_if<SendFrameAction>(&action)) {
        Enqueue(send->envelope);
      } else if (const auto* load = std::get_if<LoadTrackAction>(&action)) {
        logger_.Debug("loading track " + TrackIdToHex(load->track));
        player_.Load(load->track);
      } else if (std::holds_alternative<StopPlaybackAction>(action)) {
        logger_.Debug("stopping playback");
        player_.Stop();
      }
    }
  }

  void OpenChannel(const std::string& topic) {
    DropPending("channel reopened on " + topic);
    subscription_.reset();
    publisher_.reset();
    std::string error;
    subscription_ = channel_.Subscribe(topic, &error);
    if (!subscription_) {
      Fail("subscribe(" + topic + ") failed: " + error);
      return;
    }
    publisher_ = channel_.CreatePublisher(topic, &error);
    if (!publisher_) {
      subscription_.reset();
      Fail("publisher(" + topic + ") failed: " + error);
      return;
    }
    logger_.Info("subscribed to " + topic);
  }

  void Enqueue(const Envelope& frame) {
    if (pending_.size() >= config_.max_pending_frames) {
      metrics_.frames_dropped.fetch_add(1);
      logger_.Warn(std::string("outbound queue full, dropping ") +
                   MessageTypeName(frame.type) + " frame");
      return;
    }
    PendingFrame pending;
    pending.seq_nr = frame.seq_nr;
    pending.type = frame.type;
    std::string error;
    if (!EncodeEnvelope(frame, &pending.payload, &error)) {
      metrics_.frames_dropped.fetch_add(1);
      logger_.Error(error);
      return;
    }
    pending_.push_back(std::move(pending));
  }

  // Frames built for a previous channel are never published on a new one.
  void DropPending(const std::string& reason) {
    while (!pending_.empty()) {
      const PendingFrame dropped = std::move(pending_.front());
      pending_.pop_front();
      metrics_.frames_dropped.fetch_add(1);
      Apply(controller_.Handle(
          SendCompletion{dropped.seq_nr, dropped.type, false, reason}));
    }
  }

  // Publish at most one pending frame. Returns true when the queue moved.
  bool FlushPending() {
    if (!publisher_ || pending_.empty()) {
      return false;
    }
    PendingFrame& head = pending_.front();
    if (std::chrono::steady_clock::now() < head.next_attempt) {
      return false;
    }
    std::string error;
    switch (publisher_->Send(head.payload, &error)) {
      case SendResult::kSent: {
        metrics_.frames_sent.fetch_add(1);
        const SendCompletion completion{head.seq_nr, head.type, true, {}};
        pending_.pop_front();
        Apply(controller_.Handle(completion));
        return true;
      }
      case SendResult::kWouldBlock:
        return false;
      case SendResult::kFailed:
        break;
    }
    metrics_.send_errors.fetch_add(1);
    head.attempts += 1;
    if (config_.send_failure_policy == SendFailurePolicy::kRetry &&
        head.attempts <= config_.send_max_retries) {
      std::ostringstream oss;
      oss << "send of " << MessageTypeName(head.type) << " seq=" << head.seq_nr
          << " failed (attempt " << head.attempts << "): " << error;
      logger_.Warn(oss.str());
      head.next_attempt =
          std::chrono::steady_clock::now() + config_.send_retry_backoff;
      return false;
    }
    metrics_.frames_dropped.fetch_add(1);
    const SendCompletion completion{head.seq_nr, head.type, false, error};
    pending_.pop_front();
    Apply(controller_.Handle(completion));
    return true;
  }

  // Sleep until a source descriptor is readable or idle_wait elapses.
  void WaitForSources() {
    fd_set readfds;
    FD_ZERO(&readfds);
    int max_fd = -1;
    auto add = [&](int fd) {
      if (fd >= 0 && fd < FD_SETSIZE) {
        FD_SET(fd, &readfds);
        max_fd = std::max(max_fd, fd);
      }
    };
    add(connections_.fd());
    if (subscription_) {
      add(subscription_->fd());
    }
    add(player_.fd());

    const auto wait_us =
        std::chrono::duration_cast<std::chrono::microseconds>(config_.idle_wait).count();
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(wait_us / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(wait_us % 1000000);
    const int ready = ::select(max_fd + 1, &readfds, nullptr, nullptr, &tv);
    if (ready < 0 && errno != EINTR) {
      logger_.Warn("select() failed: " + std::string(std::strerror(errno)));
    }
  }

  void Fail(const std::string& message) {
    failed_ = true;
    SetLastError(message);
    logger_.Error(message);
  }

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
  }

  Config config_;
  Logger logger_;
  MessageChannel& channel_;
  ConnectionSource& connections_;
  Player& player_;
  Controller controller_;

  std::unique_ptr<Subscription> subscription_;
  std::unique_ptr<Publisher> publisher_;
  std::deque<PendingFrame> pending_;

  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
  std::thread loop_thread_;

  mutable std::mutex callback_mutex_;
  FrameCallback frame_cb_;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  SessionMetricsAtomic metrics_;
};

Session::Session(Config config, MessageChannel& channel,
                 ConnectionSource& connections, Player& player)
    : impl_(new Impl(std::move(config), channel, connections, player)) {}

Session::~Session() { impl_->Stop(); }

bool Session::Start() { return impl_->Start(); }
void Session::Stop() { impl_->Stop(); }
bool Session::IsRunning() const { return impl_->IsRunning(); }

void Session::SetFrameCallback(FrameCallback cb) {
  impl_->SetFrameCallback(std::move(cb));
}

std::string Session::GetLastError() const { return impl_->GetLastError(); }

SessionMetrics Session::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef SPIRC_TESTING
namespace test {

bool Tick(Session& session) { return session.impl_->Tick(); }

size_t PendingFrameCount(Session& session) {
  return session.impl_->pending_.size();
}

const Controller& GetController(Session& session) {
  return session.impl_->controller_;
}

}  // namespace test
#endif

}  // namespace spirc
