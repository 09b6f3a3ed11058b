#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport for the RN2903 (header-only over serial_io).
 *
 * Depends on: serial_io.hpp (termios, poll). STL only for std::string (Linux-only path).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "rn2903/transport/transport_base.hpp"
#include "serial_io.hpp"
#include <string>

namespace rn2903::transport {

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  /// Open and configure @p dev_path. Closes any port already held.
  bool open(const std::string& dev_path, int baud = 57600, int boot_delay_ms = 100) {
    close();
    fd_ = rn2903::open_serial(dev_path, baud, boot_delay_ms);
    if (fd_ < 0) return false;
    dev_path_ = dev_path;
    return true;
  }

  void close() {
    if (fd_ >= 0) { rn2903::close_serial(fd_); fd_ = -1; }
  }

  bool is_open() const { return fd_ >= 0; }
  const std::string& path() const { return dev_path_; }

  IoResult write(const uint8_t* data, std::size_t len) override {
    return rn2903::write_all(fd_, data, len) ? IoResult::Ok : IoResult::Error;
  }

  IoResult read_until(uint8_t delim, uint32_t timeout_ms,
                      uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    return rn2903::read_line(fd_, delim, timeout_ms, out, cap, out_len);
  }

  void discard_input() override { rn2903::discard_input(fd_); }

  const char* name() const override { return "linux-serial"; }

private:
  int fd_{-1};
  std::string dev_path_;
};

} // namespace rn2903::transport
