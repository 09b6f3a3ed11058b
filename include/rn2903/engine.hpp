/**
 * @file engine.hpp
 * @brief The transaction engine: one command out, one classified line back.
 *
 * @details
 * PURPOSE
 * -------
 * The RN2903 is half-duplex at the protocol level: it cannot be asked a second
 * question before it has answered the first. The engine owns that cycle:
 *
 *   transact(cmd) -> [discard stale input if needed] -> write(cmd) once
 *                 -> read_until('\n', timeout) at most once
 *                 -> strip CR LF -> classify() -> ClassifiedResponse
 *
 * `await_response()` is the read-only half, used where the device sends a
 * second line later (radio rx / radio tx completion).
 *
 * GUARANTEES
 * ----------
 * - Exactly one write and at most one read per transact(). No retries, no
 *   second command. Retry policy belongs to the caller.
 * - Timeouts surface as StatusCode::Timeout, I/O errors as IoFailure. A
 *   classified device error is NOT an engine failure: transact() returns Ok
 *   and the caller inspects the ClassifiedResponse.
 * - No locking, no queue. One engine per link, strictly sequential calls.
 *
 * STALE INPUT AFTER A TIMEOUT
 * ---------------------------
 * A reply that arrives after its deadline would otherwise be read as the
 * answer to the *next* command. After a Timeout, I/O error or overlong line
 * the engine marks the link desynchronized, and the next transact() asks the
 * transport to discard pending input before it writes. The discard is not a
 * read and does not count against the one-read guarantee.
 *
 * TRACING
 * -------
 * The engine does not log. A caller may install a plain function pointer that
 * sees every line written (without CR LF) and every line read.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

#include "rn2903/classifier.hpp"
#include "rn2903/commands.hpp"
#include "rn2903/status.hpp"
#include "rn2903/transport/transport_base.hpp"

namespace rn2903 {

enum class TraceDir : uint8_t { Tx = 0, Rx = 1 };

/// Trace callback: direction plus the line text (no CR LF, not NUL-terminated).
using TraceFn = void (*)(void* ctx, TraceDir dir, const char* text, size_t len);

class Engine {
public:
  static constexpr uint8_t DELIMITER = '\n';

  explicit Engine(transport::ITransport& link) : link_(link) {}

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /**
   * @brief Write @p cmd, read one line within @p timeout_ms, classify it.
   * @return Ok (see @p out), Timeout, IoFailure, or BadResponse for a line
   *         longer than RN2903_LINE_MAX.
   */
  Status transact(const Command& cmd, Expect expect, uint32_t timeout_ms,
                  ClassifiedResponse& out);

  /// Read and classify one more line without writing anything.
  Status await_response(Expect expect, uint32_t timeout_ms, ClassifiedResponse& out);

  void set_trace(TraceFn fn, void* ctx) { trace_ = fn; trace_ctx_ = ctx; }

  /// True after a failure that may have left unread bytes on the link.
  bool desynchronized() const { return desync_; }

private:
  Status read_line(Expect expect, uint32_t timeout_ms, ClassifiedResponse& out);
  void   emit(TraceDir dir, const char* text, size_t len) const;

  transport::ITransport& link_;
  bool    desync_{false};
  TraceFn trace_{nullptr};
  void*   trace_ctx_{nullptr};
  uint8_t buf_[RN2903_LINE_MAX + 2];   // room for CR LF
};

} // namespace rn2903
