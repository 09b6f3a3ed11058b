/**
 * @page rn2903-serial-io-hdr RN2903 Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move CR LF terminated lines over it.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the minimal surface needed to talk to an RN2903 module
 * from a Linux host: the module sits behind a USB-UART bridge or a Pi UART and
 * speaks 57600 baud 8N1 text. serial_io.cpp does the POSIX work. The goal is
 * to keep the link boring and predictable so the driver above it can focus on
 * protocol state.
 *
 * ROLE IN RN2903
 * --------------
 * - rn2903::open_serial: acquire a file descriptor, set raw 8N1, absorb boot noise.
 * - rn2903::write_all: push one command line out completely.
 * - rn2903::read_line: poll and accumulate bytes until the delimiter arrives.
 * - rn2903::discard_input: drop anything received but not read yet.
 * - rn2903::close_serial: close the descriptor cleanly.
 *
 * These functions are used by transport::LinuxSerial (the driver's link) and
 * by the device scanner in device_registry.cpp.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions, no class hierarchy, no hidden threads.
 * - POSIX termios and poll only. Runs on laptops, Pi, thin clients.
 * - read_line reads one byte at a time so it never consumes past the
 *   delimiter. The next line stays in the kernel buffer for the next call.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = rn2903::open_serial("/dev/ttyUSB0", 57600, 100);
 *   if (fd < 0) { // handle open failure  }
 *
 *   const char cmd[] = "sys get ver\r\n";
 *   rn2903::write_all(fd, reinterpret_cast<const uint8_t*>(cmd), sizeof(cmd) - 1);
 *
 *   uint8_t line[128]; size_t n = 0;
 *   if (rn2903::read_line(fd, '\n', 1000, line, sizeof(line), n) == rn2903::transport::IoResult::Ok) {
 *       // line[0..n) = "RN2903 1.0.3 Aug  8 2017 15:11:09\r\n"
 *   }
 *   rn2903::close_serial(fd);
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * - Baud table: a small set of common rates. Unknown values fall back to 57600.
 * - Concurrency: do not share one fd between threads without external locking.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "rn2903/transport/transport_base.hpp"

namespace rn2903 {

/**
 * @brief Open a TTY, configure raw 8N1 at @p baud, and return its descriptor.
 *
 * Opens with O_RDWR | O_NOCTTY | O_NONBLOCK, applies raw mode, sleeps
 * @p boot_delay_ms for USB bridges that reset on open, then flushes whatever
 * arrived meanwhile.
 *
 * @return File descriptor (>= 0) on success, -1 if open or termios setup failed.
 */
int open_serial(const std::string& dev, int baud = 57600, int boot_delay_ms = 100);

/// Write all @p len bytes, waiting for the driver buffer when it is full.
bool write_all(int fd, const uint8_t* data, std::size_t len);

/**
 * @brief Read bytes until @p delim (included) or the deadline.
 *
 * @return Ok with @p out_len bytes in @p out; Timeout when @p timeout_ms
 *         elapsed first; Overflow when @p cap bytes came without @p delim;
 *         Error on a poll/read failure or hang-up.
 */
transport::IoResult read_line(int fd, uint8_t delim, uint32_t timeout_ms,
                              uint8_t* out, std::size_t cap, std::size_t& out_len);

/// Drop unread input (tcflush TCIFLUSH).
void discard_input(int fd);

/// Close @p fd. No-op for negative values.
void close_serial(int fd);

} // namespace rn2903
