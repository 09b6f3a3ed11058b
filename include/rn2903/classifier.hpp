/**
 * @file classifier.hpp
 * @brief Closed-set interpretation of one RN2903 response line.
 *
 * @details
 * Every reply the module sends is one of three things: the literal success
 * token `ok`, an error token from a fixed vocabulary, or a value whose shape
 * depends on the command that produced it. The classifier turns a
 * delimiter-stripped line into a tagged `ClassifiedResponse` so that no call
 * site ever string-matches device output on its own.
 *
 * | Input line                         | Expect::Ack          | Expect::Value          |
 * |------------------------------------|----------------------|------------------------|
 * | `ok`                               | Ok                   | Ok                     |
 * | `invalid_param`, `busy`, ...       | DeviceError(kind)    | DeviceError(kind)      |
 * | `foo_err`, `invalid_xyz`, `err`    | DeviceError(Unknown) | DeviceError(Unknown)   |
 * | anything else, non-empty           | Unrecognized(text)   | OkWithValue(text)      |
 * | empty                              | Unrecognized("")     | Unrecognized("")       |
 *
 * The caller picks the context: commands that answer with a value (version,
 * NVM byte, pause duration, received packet) classify with Expect::Value;
 * commands that only acknowledge use Expect::Ack. Unrecognized text is always
 * carried through unchanged so a desynchronized link shows up as data, not as
 * a silently defaulted value.
 *
 * Pure functions. No I/O, no state.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

#include "rn2903/status.hpp"
#include "rn2903/types.hpp"

namespace rn2903 {

/// What the issuing command is allowed to answer with.
enum class Expect : uint8_t { Ack = 0, Value = 1 };

enum class ResponseKind : uint8_t { Ok = 0, OkWithValue, DeviceError, Unrecognized };

struct ClassifiedResponse {
  ResponseKind    kind{ResponseKind::Unrecognized};
  DeviceErrorKind error{DeviceErrorKind::None};   ///< set for DeviceError only
  LineStr         text;                           ///< value, unrecognized bytes, or the error token

  bool is(ResponseKind k) const { return kind == k; }
  bool is_device_error(DeviceErrorKind k) const {
    return kind == ResponseKind::DeviceError && error == k;
  }
};

/// Success token as sent by the device.
static constexpr const char* RN2903_OK_TOKEN = "ok";

/**
 * @brief Map an error token to its category.
 * @return true if @p token is error-shaped (known or not); @p out is Unknown
 *         for error-shaped tokens outside the vocabulary.
 */
bool error_kind_from_token(const char* token, size_t len, DeviceErrorKind& out);

/**
 * @brief Classify one response line.
 * @param line   Response bytes with CR/LF already removed.
 * @param len    Number of bytes in @p line.
 * @param expect Context supplied by the issuing command.
 */
ClassifiedResponse classify(const char* line, size_t len, Expect expect);

inline ClassifiedResponse classify(const etl::istring& line, Expect expect) {
  return classify(line.data(), line.size(), expect);
}

const char* to_string(ResponseKind kind);

} // namespace rn2903
