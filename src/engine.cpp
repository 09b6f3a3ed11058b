// ============================================================================
// engine.cpp: implementation for engine.hpp
// ============================================================================

#include "rn2903/engine.hpp"

namespace rn2903 {

using transport::IoResult;

void Engine::emit(TraceDir dir, const char* text, size_t len) const {
  if (trace_) trace_(trace_ctx_, dir, text, len);
}

Status Engine::transact(const Command& cmd, Expect expect, uint32_t timeout_ms,
                        ClassifiedResponse& out) {
  // A late reply to an abandoned command must not answer this one.
  if (desync_) {
    link_.discard_input();
    desync_ = false;
  }

  emit(TraceDir::Tx, cmd.c_str(), cmd.body_size());

  const IoResult w = link_.write(cmd.data(), cmd.size());   // the only write
  if (w != IoResult::Ok) {
    desync_ = true;                                          // partial command may be on the wire
    return Status::from(w == IoResult::Timeout ? StatusCode::Timeout
                                               : StatusCode::IoFailure);
  }

  return read_line(expect, timeout_ms, out);                 // the only read
}

Status Engine::await_response(Expect expect, uint32_t timeout_ms, ClassifiedResponse& out) {
  return read_line(expect, timeout_ms, out);
}

// ---------------------------------------------------------------------------
// read_line()
// -----------
// One read_until() on the transport, then delimiter stripping and
// classification. Any failure leaves the link flagged for a discard.
// ---------------------------------------------------------------------------
Status Engine::read_line(Expect expect, uint32_t timeout_ms, ClassifiedResponse& out) {
  size_t n = 0;
  const IoResult r = link_.read_until(DELIMITER, timeout_ms, buf_, sizeof(buf_), n);

  switch (r) {
    case IoResult::Ok:
      break;
    case IoResult::Timeout:
      desync_ = true;
      return Status::from(StatusCode::Timeout);
    case IoResult::Overflow:
      desync_ = true;                                        // rest of the line is still pending
      return Status::from(StatusCode::BadResponse);
    case IoResult::Error:
    default:
      desync_ = true;
      return Status::from(StatusCode::IoFailure);
  }

  // Strip "\r\n" (tolerate a bare "\n").
  if (n > sizeof(buf_)) n = sizeof(buf_);
  if (n > 0 && buf_[n - 1] == '\n') --n;
  if (n > 0 && buf_[n - 1] == '\r') --n;

  const char* line = reinterpret_cast<const char*>(buf_);
  emit(TraceDir::Rx, line, n);
  out = classify(line, n, expect);
  return Status::success();
}

} // namespace rn2903
