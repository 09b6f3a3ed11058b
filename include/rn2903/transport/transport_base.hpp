#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal duplex byte channel the transaction engine talks through.
 *
 * Header-only on purpose for easy embedding. No STL in the embedded path.
 *
 * The driver never opens, configures or closes a link. It receives an
 * already-open ITransport and owns it exclusively for its lifetime.
 */

#include <cstddef>
#include <cstdint>

namespace rn2903::transport {

// Return codes kept simple for embedded sanity.
enum class IoResult : uint8_t { Ok=0, Timeout=1, Error=2, Overflow=3 };

/**
 * @brief Transport trait every link (serial port, pty, test double) implements.
 *
 * Contract:
 *  - write(data,len) pushes the whole buffer or reports Error. One call per command.
 *  - read_until(delim,timeout_ms,out,cap,out_len) blocks until @p delim has been
 *    copied into @p out (delimiter included), or the deadline passes (Timeout),
 *    or @p cap bytes arrive without a delimiter (Overflow).
 *  - discard_input() drops whatever the peer already sent and nobody read yet.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual IoResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual IoResult    read_until(uint8_t delim, uint32_t timeout_ms,
                                 uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual void        discard_input() = 0;
  virtual const char* name() const = 0;
};

} // namespace rn2903::transport
