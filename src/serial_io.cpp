// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // open_serial(), write_all(), read_line(), discard_input(), close_serial()

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based I/O
#include <cerrno>
#include <chrono>

namespace rn2903 {

using transport::IoResult;

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - Disables echo, line buffering, and flow control (8N1 raw mode).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
//
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // wipe into raw 8N1 mode
    cfsetispeed(&tio, baud);                      // set baud in/out
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // RN2903 UART has no RTS/CTS
    tio.c_cflag &= ~CSTOPB;                       // one stop bit
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
        case 57600:
        default:     return B57600;               // RN2903 factory rate
    }
}

// Milliseconds left until @p deadline, clamped at zero.
static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    using namespace std::chrono;
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port at the requested baud.
// - O_NOCTTY: don't steal the controlling terminal. O_NONBLOCK: poll() times.
// - Sleeps boot_delay_ms for USB bridges that toggle DTR on open.
// - Flushes boot chatter after the delay.
//
// Returns: file descriptor (>=0) or -1 on failure.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;                        // open failed (perm, missing, etc.)

    if (!set_raw(fd, to_speed(baud))) {           // not a tty, or driver refused
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // flush any reboot chatter
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop until every byte is accepted. EAGAIN waits for POLLOUT (bounded, so a
// wedged adapter cannot hang the caller forever).
// ---------------------------------------------------------------------------
bool write_all(int fd, const uint8_t* data, std::size_t len) {
    static constexpr int WRITE_STALL_MS = 1000;

    if (fd < 0 || (!data && len)) return false;
    std::size_t done = 0;
    while (done < len) {
        ssize_t w = ::write(fd, data + done, len - done);
        if (w > 0) { done += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, WRITE_STALL_MS) <= 0) return false;
            continue;
        }
        return false;
    }
    return true;
}


// ---------------------------------------------------------------------------
// read_line()
// -----------
// Poll against one overall deadline (not per byte), read one byte at a time,
// stop right after the delimiter.
// ---------------------------------------------------------------------------
IoResult read_line(int fd, uint8_t delim, uint32_t timeout_ms,
                   uint8_t* out, std::size_t cap, std::size_t& out_len) {
    out_len = 0;
    if (fd < 0 || !out || cap == 0) return IoResult::Error;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{fd, POLLIN, 0};

    while (true) {
        int pr = ::poll(&pfd, 1, remaining_ms(deadline));
        if (pr == 0) return IoResult::Timeout;
        if (pr < 0) {
            if (errno == EINTR) continue;
            return IoResult::Error;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return IoResult::Error;   // unplugged
        if (!(pfd.revents & POLLIN)) continue;

        uint8_t byte = 0;
        ssize_t n = ::read(fd, &byte, 1);
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        if (n <= 0) return IoResult::Error;

        out[out_len++] = byte;
        if (byte == delim) return IoResult::Ok;
        if (out_len == cap) return IoResult::Overflow;
    }
}


void discard_input(int fd) {
    if (fd >= 0) tcflush(fd, TCIFLUSH);
}


void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace rn2903
