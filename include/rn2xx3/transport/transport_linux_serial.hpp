#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios; non-blocking).
 *
 * Depends on: unistd.h, fcntl.h, termios.h. STL only for std::string (Linux-only path).
 *
 * RN2483/RN2903 defaults: 57600 baud, 8N1, no flow control. The port is opened
 * O_NONBLOCK and put in raw mode, so both byte calls return immediately.
 * Reads go through a small cache to avoid one syscall per byte.
 *
 * Owns its file descriptor. Move-only: moving transfers the fd, the source is
 * left closed. This is what lets `Driver::destroy()` hand the port back.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "rn2xx3/transport/transport_base.hpp"
#include <string>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <cerrno>
#include <utility>

namespace rn2xx3::transport {

struct SerialConfig {
  std::string path;   // e.g. /dev/serial/by-id/usb-Microchip_RN2483-if00
  int baud{57600};
};

class LinuxSerial : public ITransport {
public:
  static constexpr std::size_t RX_CACHE = 64;

  explicit LinuxSerial(const std::string& dev_path = {}, int baud = 57600)
  : dev_path_(dev_path), baud_(baud) {}

  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  LinuxSerial(LinuxSerial&& o) noexcept
  : ITransport(std::move(o)), fd_(o.fd_), dev_path_(std::move(o.dev_path_)), baud_(o.baud_),
    rx_len_(o.rx_len_), rx_pos_(o.rx_pos_) {
    for (std::size_t i = 0; i < RX_CACHE; ++i) rx_[i] = o.rx_[i];
    o.fd_ = -1;
    o.rx_len_ = o.rx_pos_ = 0;
  }

  LinuxSerial& operator=(LinuxSerial&& o) noexcept {
    if (this != &o) {
      end();
      fd_ = o.fd_;
      dev_path_ = std::move(o.dev_path_);
      baud_ = o.baud_;
      for (std::size_t i = 0; i < RX_CACHE; ++i) rx_[i] = o.rx_[i];
      rx_len_ = o.rx_len_;
      rx_pos_ = o.rx_pos_;
      o.fd_ = -1;
      o.rx_len_ = o.rx_pos_ = 0;
    }
    return *this;
  }

  bool begin(const SerialConfig& cfg) {
    if (!cfg.path.empty()) dev_path_ = cfg.path;
    baud_ = cfg.baud;
    return begin();
  }

  bool begin() {
    end();
    if (dev_path_.empty()) return false;

    fd_ = ::open(dev_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) return false;

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) { end(); return false; }
    ::cfmakeraw(&tio);

    speed_t sp = B57600;
    switch (baud_) {
      case 9600:   sp = B9600; break;
      case 19200:  sp = B19200; break;
      case 38400:  sp = B38400; break;
      case 57600:  sp = B57600; break;
      case 115200: sp = B115200; break;
#ifdef B230400
      case 230400: sp = B230400; break;
#endif
      default:     end(); return false;   // module autobauds, but only to these
    }

    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);
    tio.c_cflag |= CLOCAL | CREAD;       // enable receiver, ignore modem ctrl
    tio.c_cflag &= ~CSTOPB;              // 8N1
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) { end(); return false; }
    ::tcflush(fd_, TCIOFLUSH);           // drop boot noise
    return true;
  }

  void end() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    rx_len_ = rx_pos_ = 0;
  }

  bool is_open() const { return fd_ >= 0; }
  const std::string& path() const { return dev_path_; }

  ReadStatus try_read_byte(uint8_t& out) override {
    if (fd_ < 0) return ReadStatus::Error;
    if (rx_pos_ == rx_len_) {
      rx_pos_ = rx_len_ = 0;
      ssize_t r = ::read(fd_, rx_, RX_CACHE);
      if (r > 0) rx_len_ = static_cast<std::size_t>(r);
      else if (r == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return ReadStatus::WouldBlock;
      else
        return ReadStatus::Error;
    }
    out = rx_[rx_pos_++];
    return ReadStatus::Ready;
  }

  WriteStatus try_write_byte(uint8_t b) override {
    if (fd_ < 0) return WriteStatus::Error;
    ssize_t w = ::write(fd_, &b, 1);
    if (w == 1) return WriteStatus::Sent;
    if (w == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
      return WriteStatus::WouldBlock;
    return WriteStatus::Error;
  }

  const char* name() const override { return "linux-serial"; }

private:
  int fd_{-1};
  std::string dev_path_;
  int baud_{57600};
  uint8_t rx_[RX_CACHE]{};
  std::size_t rx_len_{0};
  std::size_t rx_pos_{0};
};

} // namespace rn2xx3::transport
