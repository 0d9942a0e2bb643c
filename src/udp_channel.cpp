#include "spirc/udp_channel.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace spirc {
namespace {

constexpr uint8_t kDatagramHeader[10] = {
    0x53, 0x70, 0x69, 0x72, 0x63, 0x4c, 0x69, 0x6e, 0x6b, 0x31,
};

constexpr size_t kHeaderSize = sizeof(kDatagramHeader);
constexpr size_t kTopicLengthOffset = kHeaderSize;
constexpr size_t kTopicOffset = kTopicLengthOffset + 2;

constexpr size_t kMaxDatagramSize = 65507;
constexpr size_t kMaxReplayPacketSize = kMaxDatagramSize;

uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t ReadBe32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

void AppendBe16(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

void AppendBe32(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>((value >> 24) & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

// Build a datagram: magic header + topic length + topic + payload length + payload.
std::vector<uint8_t> BuildDatagram(const std::string& topic,
                                   const std::string& payload) {
  std::vector<uint8_t> packet;
  packet.reserve(kTopicOffset + topic.size() + 4 + payload.size());
  packet.insert(packet.end(), kDatagramHeader, kDatagramHeader + kHeaderSize);
  AppendBe16(packet, static_cast<uint32_t>(topic.size()));
  packet.insert(packet.end(), topic.begin(), topic.end());
  AppendBe32(packet, static_cast<uint32_t>(payload.size()));
  packet.insert(packet.end(), payload.begin(), payload.end());
  return packet;
}

// Split a datagram into topic and payload; false when it is not one of ours.
bool ParseDatagram(const uint8_t* data, size_t length, std::string* topic,
                   std::string* payload) {
  if (!topic || !payload || length < kTopicOffset) {
    return false;
  }
  if (std::memcmp(data, kDatagramHeader, kHeaderSize) != 0) {
    return false;
  }
  const size_t topic_length = ReadBe16(data, kTopicLengthOffset);
  const size_t payload_length_offset = kTopicOffset + topic_length;
  if (length < payload_length_offset + 4) {
    return false;
  }
  const size_t payload_length = ReadBe32(data, payload_length_offset);
  const size_t payload_offset = payload_length_offset + 4;
  if (length - payload_offset != payload_length) {
    return false;
  }
  topic->assign(reinterpret_cast<const char*>(data + kTopicOffset), topic_length);
  payload->assign(reinterpret_cast<const char*>(data + payload_offset),
                  payload_length);
  return true;
}

// Convert a string address and port into a sockaddr_in.
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

// Minimal UDP socket wrapper for broadcast send and non-blocking receive.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, bool allow_broadcast) {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      last_error_ = "setsockopt(SO_REUSEADDR) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
    // Several endpoints on one host share the channel port.
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
      last_error_ = "setsockopt(SO_REUSEPORT) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
    if (allow_broadcast) {
      int broadcast = 1;
      if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        last_error_ = "setsockopt(SO_BROADCAST) failed: " + std::string(std::strerror(errno));
        Close();
        return false;
      }
    }
    sockaddr_in addr = MakeSockaddr(bind_address, port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << bind_address << ":" << port << ") failed: "
          << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    return true;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
    return ::sendto(fd_, data.data(), data.size(), 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length) {
    return ::recvfrom(fd_, buffer, length, 0, nullptr, nullptr);
  }

 private:
  int fd_ = -1;
  std::string last_error_;
};

// Appends inbound payloads as (timestamp_us, length, bytes) records.
class CaptureWriter {
 public:
  bool Open(const std::string& path) {
    stream_.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
    return static_cast<bool>(stream_);
  }

  bool Write(const std::string& payload) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    const uint64_t timestamp_us =
        std::chrono::duration_cast<std::chrono::microseconds>(now).count();
    const uint32_t length_u32 = static_cast<uint32_t>(payload.size());
    stream_.write(reinterpret_cast<const char*>(&timestamp_us),
                  sizeof(timestamp_us));
    stream_.write(reinterpret_cast<const char*>(&length_u32),
                  sizeof(length_u32));
    stream_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    return static_cast<bool>(stream_);
  }

 private:
  std::ofstream stream_;
};

class UdpSubscription : public Subscription {
 public:
  UdpSubscription(std::string topic, std::unique_ptr<CaptureWriter> capture)
      : topic_(std::move(topic)), capture_(std::move(capture)) {}

  bool Open(const UdpChannelConfig& config, std::string* error) {
    if (!socket_.Open(config.port, config.bind_address, true)) {
      if (error) {
        *error = socket_.last_error();
      }
      return false;
    }
    return true;
  }

  PollResult Poll(std::string* payload, std::string* error) override {
    std::string topic;
    std::string body;
    while (true) {
      const ssize_t bytes = socket_.RecvFrom(buffer_.data(), buffer_.size());
      if (bytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return PollResult::kPending;
        }
        if (errno == EINTR) {
          continue;
        }
        if (error) {
          *error = "recvfrom() failed: " + std::string(std::strerror(errno));
        }
        return PollResult::kError;
      }
      // Foreign traffic and other users' topics share the port.
      if (!ParseDatagram(buffer_.data(), static_cast<size_t>(bytes), &topic, &body) ||
          topic != topic_) {
        continue;
      }
      if (capture_ && !capture_->Write(body)) {
        if (error) {
          *error = "failed to write capture file";
        }
        return PollResult::kError;
      }
      if (payload) {
        *payload = std::move(body);
      }
      return PollResult::kReady;
    }
  }

  int fd() const override { return socket_.fd(); }

 private:
  std::string topic_;
  std::unique_ptr<CaptureWriter> capture_;
  UdpSocket socket_;
  std::array<uint8_t, kMaxDatagramSize> buffer_{};
};

// Yields payloads from a capture file, paced by their recorded timestamps.
class ReplaySubscription : public Subscription {
 public:
  bool Open(const std::string& path, std::string* error) {
    stream_.open(path, std::ios::binary | std::ios::in);
    if (!stream_) {
      if (error) {
        *error = "failed to open replay file: " + path;
      }
      return false;
    }
    return true;
  }

  PollResult Poll(std::string* payload, std::string* error) override {
    if (!next_.has_value()) {
      Record record;
      if (!ReadRecord(&record, error)) {
        return PollResult::kError;
      }
      next_ = std::move(record);
    }
    const auto now = std::chrono::steady_clock::now();
    if (!started_) {
      started_ = true;
      start_time_ = now;
      first_timestamp_us_ = next_->timestamp_us;
    }
    const uint64_t offset_us = next_->timestamp_us >= first_timestamp_us_
                                   ? next_->timestamp_us - first_timestamp_us_
                                   : 0;
    if (now < start_time_ + std::chrono::microseconds(offset_us)) {
      return PollResult::kPending;
    }
    if (payload) {
      *payload = std::move(next_->payload);
    }
    next_.reset();
    return PollResult::kReady;
  }

 private:
  struct Record {
    uint64_t timestamp_us = 0;
    std::string payload;
  };

  bool ReadRecord(Record* record, std::string* error) {
    uint64_t ts = 0;
    uint32_t length = 0;
    stream_.read(reinterpret_cast<char*>(&ts), sizeof(ts));
    if (stream_) {
      stream_.read(reinterpret_cast<char*>(&length), sizeof(length));
    }
    if (!stream_) {
      if (error) {
        *error = "replay file exhausted";
      }
      return false;
    }
    if (length > kMaxReplayPacketSize) {
      if (error) {
        *error = "replay packet too large";
      }
      return false;
    }
    record->timestamp_us = ts;
    record->payload.resize(length);
    if (length > 0) {
      stream_.read(&record->payload[0], static_cast<std::streamsize>(length));
      if (!stream_) {
        if (error) {
          *error = "replay file truncated";
        }
        return false;
      }
    }
    return true;
  }

  std::ifstream stream_;
  std::optional<Record> next_;
  bool started_ = false;
  std::chrono::steady_clock::time_point start_time_;
  uint64_t first_timestamp_us_ = 0;
};

class UdpPublisher : public Publisher {
 public:
  UdpPublisher(std::string topic, const UdpChannelConfig& config)
      : topic_(std::move(topic)),
        addr_(MakeSockaddr(config.broadcast_address, config.port)) {}

  bool Open(const std::string& bind_address, std::string* error) {
    if (!socket_.Open(0, bind_address, true)) {
      if (error) {
        *error = socket_.last_error();
      }
      return false;
    }
    return true;
  }

  SendResult Send(const std::string& payload, std::string* error) override {
    const auto packet = BuildDatagram(topic_, payload);
    if (packet.size() > kMaxDatagramSize) {
      if (error) {
        *error = "frame exceeds datagram size";
      }
      return SendResult::kFailed;
    }
    const ssize_t result = socket_.SendTo(packet, addr_);
    if (result < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
        return SendResult::kWouldBlock;
      }
      if (error) {
        *error = "sendto() failed: " + std::string(std::strerror(errno));
      }
      return SendResult::kFailed;
    }
    if (static_cast<size_t>(result) != packet.size()) {
      if (error) {
        std::ostringstream oss;
        oss << "partial send: " << result << " of " << packet.size() << " bytes";
        *error = oss.str();
      }
      return SendResult::kFailed;
    }
    return SendResult::kSent;
  }

 private:
  std::string topic_;
  sockaddr_in addr_;
  UdpSocket socket_;
};

}  // namespace

bool UdpChannelConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (port == 0) {
    return fail("port must be non-zero");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0" &&
      !IsValidIpv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (!IsValidIpv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  if (!capture_file.empty() && !replay_file.empty()) {
    return fail("capture_file and replay_file are mutually exclusive");
  }
  return true;
}

UdpMessageChannel::UdpMessageChannel(UdpChannelConfig config)
    : config_(std::move(config)) {}

UdpMessageChannel::~UdpMessageChannel() = default;

std::unique_ptr<Subscription> UdpMessageChannel::Subscribe(const std::string& topic,
                                                           std::string* error) {
  if (!config_.Validate(error)) {
    return nullptr;
  }
  if (!config_.replay_file.empty()) {
    auto replay = std::make_unique<ReplaySubscription>();
    if (!replay->Open(config_.replay_file, error)) {
      return nullptr;
    }
    return replay;
  }
  std::unique_ptr<CaptureWriter> capture;
  if (!config_.capture_file.empty()) {
    capture = std::make_unique<CaptureWriter>();
    if (!capture->Open(config_.capture_file)) {
      if (error) {
        *error = "failed to open capture file: " + config_.capture_file;
      }
      return nullptr;
    }
  }
  auto subscription = std::make_unique<UdpSubscription>(topic, std::move(capture));
  if (!subscription->Open(config_, error)) {
    return nullptr;
  }
  return subscription;
}

std::unique_ptr<Publisher> UdpMessageChannel::CreatePublisher(const std::string& topic,
                                                              std::string* error) {
  if (!config_.Validate(error)) {
    return nullptr;
  }
  auto publisher = std::make_unique<UdpPublisher>(topic, config_);
  if (!publisher->Open(config_.bind_address, error)) {
    return nullptr;
  }
  return publisher;
}

#ifdef SPIRC_TESTING
namespace test {

std::vector<uint8_t> BuildDatagram(const std::string& topic,
                                   const std::string& payload) {
  return spirc::BuildDatagram(topic, payload);
}

bool ParseDatagram(const std::vector<uint8_t>& data, std::string* topic,
                   std::string* payload) {
  return spirc::ParseDatagram(data.data(), data.size(), topic, payload);
}

}  // namespace test
#endif

}  // namespace spirc
