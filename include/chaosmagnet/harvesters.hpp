#pragma once

// chaosmagnet/harvesters.hpp: Built-in Linux harvester variants.
//
//   OS_RNG  getrandom(2), /dev/urandom fallback
//   SYSTEM  scheduler/timer jitter, getrusage, /proc/stat
//   AUDIO   raw PCM from an OSS-compatible capture node, LSB of each 4th sample
//   VIDEO   V4L2 read() frames, low nibble of every 7th byte
//   HID     evdev event timing deltas and values
//   TRNG    hardware RNG character device
//
// Device paths come from SourceConfig::device_path. None of the reads block:
// device nodes are opened O_NONBLOCK and EAGAIN means "no data this poll".

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "chaosmagnet/config.hpp"
#include "chaosmagnet/harvester.hpp"
#include "chaosmagnet/unique_fd.hpp"

namespace chaosmagnet {

// Fills buf from the kernel CSPRNG. Retries EINTR; falls back to /dev/urandom
// when getrandom is unavailable.
ErrorCode read_os_entropy(uint8_t* buf, std::size_t len);

class OsRngHarvester : public Harvester {
 public:
  explicit OsRngHarvester(const SourceConfig& cfg);

 protected:
  ErrorCode open_device() override;
  void close_device() override {}
  ErrorCode read_noise(std::string* out) override;
};

class SystemJitterHarvester : public Harvester {
 public:
  explicit SystemJitterHarvester(const SourceConfig& cfg);

 protected:
  ErrorCode open_device() override;
  void close_device() override {}
  ErrorCode read_noise(std::string* out) override;

 private:
  std::string stat_path_;
};

class AudioHarvester : public Harvester {
 public:
  explicit AudioHarvester(const SourceConfig& cfg);

 protected:
  ErrorCode open_device() override;
  void close_device() override { fd_.reset(); }
  ErrorCode read_noise(std::string* out) override;

 private:
  std::string path_;
  UniqueFd    fd_;
};

class VideoHarvester : public Harvester {
 public:
  explicit VideoHarvester(const SourceConfig& cfg);

 protected:
  ErrorCode open_device() override;
  void close_device() override;
  ErrorCode read_noise(std::string* out) override;

 private:
  std::string          path_;
  UniqueFd             fd_;
  std::vector<uint8_t> frame_;
  std::string          previous_digest_;
};

class HidHarvester : public Harvester {
 public:
  explicit HidHarvester(const SourceConfig& cfg);

 protected:
  ErrorCode open_device() override;
  void close_device() override { fd_.reset(); }
  ErrorCode read_noise(std::string* out) override;

 private:
  std::string path_;
  UniqueFd    fd_;
  uint64_t    last_event_ns_{0};
};

class TrngHarvester : public Harvester {
 public:
  explicit TrngHarvester(const SourceConfig& cfg);

 protected:
  ErrorCode open_device() override;
  void close_device() override { fd_.reset(); }
  ErrorCode read_noise(std::string* out) override;

 private:
  std::string path_;
  UniqueFd    fd_;
};

// nullptr for ids that are not built in.
std::unique_ptr<Harvester> make_harvester(const SourceConfig& cfg);

}  // namespace chaosmagnet
