#include "chaosmagnet/harvesters.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <linux/input.h>
#include <linux/soundcard.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <sys/random.h>
#include <sys/resource.h>
#include <unistd.h>

#include "chaosmagnet/hash.hpp"

namespace chaosmagnet {

namespace {

constexpr std::size_t kOsRngChunk = 1024;
constexpr int kJitterRounds = 256;
constexpr std::size_t kAudioFrameBytes = 2048;
constexpr std::size_t kAudioMaxSamples = 256;
constexpr std::size_t kVideoStride = 7;
constexpr std::size_t kVideoMaxNoise = 4096;
constexpr std::size_t kHidMaxEvents = 64;
constexpr std::size_t kTrngChunk = 256;

std::chrono::milliseconds poll_of(const SourceConfig& cfg) {
  return std::chrono::milliseconds(cfg.poll_interval_ms);
}

std::string errno_detail(const std::string& what, const std::string& path, int err) {
  return what + " " + path + ": " + std::strerror(err);
}

// Folds a 64-bit delta into one byte so the slowly varying high bits do not
// dominate the symbol distribution.
inline char fold_byte(uint64_t v) {
  return static_cast<char>((v ^ (v >> 8) ^ (v >> 16) ^ (v >> 24)) & 0xFF);
}

bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK || err == EINTR; }

}  // namespace

ErrorCode read_os_entropy(uint8_t* buf, std::size_t len) {
  std::size_t filled = 0;
  while (filled < len) {
    const ssize_t ret = ::getrandom(buf + filled, len - filled, 0);
    if (ret > 0) {
      filled += static_cast<std::size_t>(ret);
      continue;
    }
    if (ret < 0 && errno == EINTR) continue;
    if (ret < 0 && errno == ENOSYS) break;
    return ErrorCode::device_io_failed;
  }
  if (filled == len) return ErrorCode::none;

  // Fallback: /dev/urandom
  UniqueFd fd(::open("/dev/urandom", O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) return errno_to_error(errno);
  while (filled < len) {
    const ssize_t ret = ::read(fd.get(), buf + filled, len - filled);
    if (ret > 0) {
      filled += static_cast<std::size_t>(ret);
    } else if (ret < 0 && errno == EINTR) {
      continue;
    } else {
      return ErrorCode::device_io_failed;
    }
  }
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// OS_RNG
// ---------------------------------------------------------------------------

OsRngHarvester::OsRngHarvester(const SourceConfig& cfg) : Harvester(kSourceOsRng, poll_of(cfg)) {}

ErrorCode OsRngHarvester::open_device() {
  uint8_t first[16];
  const ErrorCode ec = read_os_entropy(first, sizeof(first));
  if (ec != ErrorCode::none) note("kernel CSPRNG unavailable");
  return ec;
}

ErrorCode OsRngHarvester::read_noise(std::string* out) {
  out->resize(kOsRngChunk);
  const ErrorCode ec = read_os_entropy(reinterpret_cast<uint8_t*>(out->data()), out->size());
  if (ec != ErrorCode::none) {
    out->clear();
    note("getrandom failed");
  }
  return ec;
}

// ---------------------------------------------------------------------------
// SYSTEM: timer jitter around a data-dependent busy loop, plus process and
// kernel counters.
// ---------------------------------------------------------------------------

SystemJitterHarvester::SystemJitterHarvester(const SourceConfig& cfg)
    : Harvester(kSourceSystem, poll_of(cfg)),
      stat_path_(cfg.device_path.empty() ? "/proc/stat" : cfg.device_path) {}

ErrorCode SystemJitterHarvester::open_device() {
  std::ifstream stat(stat_path_);
  if (!stat) {
    // Jitter alone is still usable; the counters are a bonus.
    stat_path_.clear();
  }
  return ErrorCode::none;
}

ErrorCode SystemJitterHarvester::read_noise(std::string* out) {
  out->reserve(kJitterRounds + 64);

  volatile uint64_t scratch = monotonic_ns();
  uint64_t prev = monotonic_ns();
  for (int i = 0; i < kJitterRounds; ++i) {
    const int work = 32 + static_cast<int>(scratch & 31);
    for (int j = 0; j < work; ++j) scratch = scratch * 6364136223846793005ull + 1442695040888963407ull;
    const uint64_t now = monotonic_ns();
    out->push_back(fold_byte(now - prev));
    prev = now;
  }

  struct rusage ru{};
  if (::getrusage(RUSAGE_SELF, &ru) == 0) {
    out->push_back(fold_byte(static_cast<uint64_t>(ru.ru_utime.tv_usec)));
    out->push_back(fold_byte(static_cast<uint64_t>(ru.ru_stime.tv_usec)));
    out->push_back(fold_byte(static_cast<uint64_t>(ru.ru_minflt)));
    out->push_back(fold_byte(static_cast<uint64_t>(ru.ru_nivcsw)));
  }

  if (!stat_path_.empty()) {
    std::ifstream stat(stat_path_);
    std::string line;
    if (std::getline(stat, line)) {
      // "cpu  user nice system idle iowait irq softirq ..." in jiffies
      std::istringstream fields(line);
      std::string label;
      fields >> label;
      uint64_t jiffies = 0;
      while (fields >> jiffies) out->push_back(fold_byte(jiffies));
    }
  }
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// AUDIO
// ---------------------------------------------------------------------------

AudioHarvester::AudioHarvester(const SourceConfig& cfg)
    : Harvester(kSourceAudio, poll_of(cfg)),
      path_(cfg.device_path.empty() ? "/dev/dsp" : cfg.device_path) {}

ErrorCode AudioHarvester::open_device() {
  fd_.reset(::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
  if (!fd_.valid()) {
    const int err = errno;
    note(errno_detail("open", path_, err));
    return errno_to_error(err);
  }
  // Ask an OSS node for 16-bit mono. Plain files and FIFOs reject the ioctls
  // and are read as raw little-endian samples.
  int format = AFMT_S16_LE;
  int channels = 1;
  if (::ioctl(fd_.get(), SNDCTL_DSP_SETFMT, &format) == 0) {
    if (::ioctl(fd_.get(), SNDCTL_DSP_CHANNELS, &channels) != 0) {
      const int err = errno;
      note(errno_detail("configure", path_, err));
      return ErrorCode::device_io_failed;
    }
  }
  return ErrorCode::none;
}

ErrorCode AudioHarvester::read_noise(std::string* out) {
  std::array<uint8_t, kAudioFrameBytes> pcm{};
  const ssize_t n = ::read(fd_.get(), pcm.data(), pcm.size());
  if (n < 0) {
    const int err = errno;
    if (would_block(err)) return ErrorCode::none;
    note(errno_detail("read", path_, err));
    return errno_to_error(err);
  }
  const std::size_t samples = static_cast<std::size_t>(n) / 2;
  // Least significant byte of every 4th sample: the quantization noise floor.
  for (std::size_t i = 0; i < samples && out->size() < kAudioMaxSamples; i += 4) {
    out->push_back(static_cast<char>(pcm[i * 2]));
  }
  if (!out->empty()) out->push_back(fold_byte(monotonic_ns()));
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// VIDEO
// ---------------------------------------------------------------------------

VideoHarvester::VideoHarvester(const SourceConfig& cfg)
    : Harvester(kSourceVideo, poll_of(cfg)),
      path_(cfg.device_path.empty() ? "/dev/video0" : cfg.device_path) {}

ErrorCode VideoHarvester::open_device() {
  fd_.reset(::open(path_.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC));
  if (!fd_.valid()) {
    const int err = errno;
    note(errno_detail("open", path_, err));
    return errno_to_error(err);
  }

  struct v4l2_capability cap{};
  if (::ioctl(fd_.get(), VIDIOC_QUERYCAP, &cap) != 0) {
    const int err = errno;
    note(errno_detail("VIDIOC_QUERYCAP", path_, err));
    return errno_to_error(err);
  }
  const uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps : cap.capabilities;
  if (!(caps & V4L2_CAP_VIDEO_CAPTURE) || !(caps & V4L2_CAP_READWRITE)) {
    note(path_ + " does not support read() capture");
    return ErrorCode::device_unavailable;
  }

  struct v4l2_format fmt{};
  fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  std::size_t frame_bytes = 640 * 480 * 2;
  if (::ioctl(fd_.get(), VIDIOC_G_FMT, &fmt) == 0 && fmt.fmt.pix.sizeimage > 0) {
    frame_bytes = fmt.fmt.pix.sizeimage;
  }
  frame_.assign(frame_bytes, 0);
  previous_digest_.clear();
  return ErrorCode::none;
}

void VideoHarvester::close_device() {
  fd_.reset();
  frame_.clear();
  frame_.shrink_to_fit();
}

ErrorCode VideoHarvester::read_noise(std::string* out) {
  const ssize_t n = ::read(fd_.get(), frame_.data(), frame_.size());
  if (n < 0) {
    const int err = errno;
    if (would_block(err)) return ErrorCode::none;
    note(errno_detail("read", path_, err));
    return errno_to_error(err);
  }
  const std::size_t len = static_cast<std::size_t>(n);
  for (std::size_t i = 0; i < len && out->size() < kVideoMaxNoise; i += kVideoStride) {
    out->push_back(static_cast<char>(frame_[i] & 0x0F));
  }
  if (out->empty()) return ErrorCode::none;

  // Chain on the previous frame's noise digest: a frozen or covered sensor
  // repeats it exactly, and a repeated frame carries no new noise.
  std::string digest = hash_bytes_blake3(*out);
  if (digest == previous_digest_) {
    out->clear();
    return ErrorCode::none;
  }
  previous_digest_ = std::move(digest);
  out->push_back(fold_byte(monotonic_ns()));
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// HID
// ---------------------------------------------------------------------------

HidHarvester::HidHarvester(const SourceConfig& cfg)
    : Harvester(kSourceHid, poll_of(cfg)),
      path_(cfg.device_path.empty() ? "/dev/input/event0" : cfg.device_path) {}

ErrorCode HidHarvester::open_device() {
  fd_.reset(::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
  if (!fd_.valid()) {
    const int err = errno;
    note(errno_detail("open", path_, err));
    return errno_to_error(err);
  }
  last_event_ns_ = 0;
  return ErrorCode::none;
}

ErrorCode HidHarvester::read_noise(std::string* out) {
  std::array<struct input_event, kHidMaxEvents> events{};
  const ssize_t n = ::read(fd_.get(), events.data(), sizeof(events));
  if (n < 0) {
    const int err = errno;
    if (would_block(err)) return ErrorCode::none;
    note(errno_detail("read", path_, err));
    return errno_to_error(err);
  }
  const std::size_t count = static_cast<std::size_t>(n) / sizeof(struct input_event);
  for (std::size_t i = 0; i < count; ++i) {
    const auto& ev = events[i];
    if (ev.type != EV_REL && ev.type != EV_ABS && ev.type != EV_KEY) continue;
    // Arrival time on our clock: the kernel timestamp has coarse granularity
    // for some drivers.
    const uint64_t now = monotonic_ns();
    if (last_event_ns_ != 0) out->push_back(fold_byte(now - last_event_ns_));
    last_event_ns_ = now;
    out->push_back(static_cast<char>(static_cast<uint32_t>(ev.value) & 0xFF));
  }
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// TRNG
// ---------------------------------------------------------------------------

TrngHarvester::TrngHarvester(const SourceConfig& cfg)
    : Harvester(kSourceTrng, poll_of(cfg)),
      path_(cfg.device_path.empty() ? "/dev/hwrng" : cfg.device_path) {}

ErrorCode TrngHarvester::open_device() {
  fd_.reset(::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
  if (!fd_.valid()) {
    const int err = errno;
    note(errno_detail("open", path_, err));
    return errno_to_error(err);
  }
  return ErrorCode::none;
}

ErrorCode TrngHarvester::read_noise(std::string* out) {
  std::array<uint8_t, kTrngChunk> buf{};
  const ssize_t n = ::read(fd_.get(), buf.data(), buf.size());
  if (n < 0) {
    const int err = errno;
    if (would_block(err)) return ErrorCode::none;
    note(errno_detail("read", path_, err));
    return errno_to_error(err);
  }
  out->assign(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n));
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------

std::unique_ptr<Harvester> make_harvester(const SourceConfig& cfg) {
  if (cfg.id == kSourceOsRng)  return std::make_unique<OsRngHarvester>(cfg);
  if (cfg.id == kSourceSystem) return std::make_unique<SystemJitterHarvester>(cfg);
  if (cfg.id == kSourceAudio)  return std::make_unique<AudioHarvester>(cfg);
  if (cfg.id == kSourceVideo)  return std::make_unique<VideoHarvester>(cfg);
  if (cfg.id == kSourceHid)    return std::make_unique<HidHarvester>(cfg);
  if (cfg.id == kSourceTrng)   return std::make_unique<TrngHarvester>(cfg);
  return nullptr;
}

}  // namespace chaosmagnet
