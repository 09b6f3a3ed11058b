/**
 * @file hex.hpp
 * @brief Numeric text helpers for the ASCII command protocol.
 *
 * The RN2903 mixes two encodings on the wire: lowercase hexadecimal for NVM
 * addresses, NVM bytes, EUIs and radio payloads, and plain decimal for
 * frequencies, powers, window sizes and durations. These helpers append to and
 * parse from bounded buffers only; nothing allocates.
 *
 * Parsers take (pointer, length) so they can work on a slice of a response line
 * without copying it. They reject empty input, stray characters and overflow.
 */
#pragma once
#include "etl/string.h"
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>

namespace rn2903 {

/// Append @p v as exactly two lowercase hex digits. false if @p out is full.
bool append_hex_u8(etl::istring& out, uint8_t v);

/// Append @p v in lowercase hex without leading zeros ("300", "0" for zero).
bool append_hex(etl::istring& out, uint32_t v);

/// Append every byte of @p data as two lowercase hex digits.
bool append_hex_bytes(etl::istring& out, const uint8_t* data, size_t len);

/// Append @p v in decimal.
bool append_dec(etl::istring& out, uint32_t v);

/// Append @p v in decimal with a leading '-' when negative.
bool append_dec_signed(etl::istring& out, int32_t v);

/// Parse up to 16 hex digits (either case) into @p out.
bool parse_hex_u64(const char* s, size_t len, uint64_t& out);

/// Parse up to 8 hex digits.
bool parse_hex_u32(const char* s, size_t len, uint32_t& out);

/// Parse one or two hex digits.
bool parse_hex_u8(const char* s, size_t len, uint8_t& out);

/// Parse an even-length hex string into bytes. Clears @p out first.
bool parse_hex_bytes(const char* s, size_t len, etl::ivector<uint8_t>& out);

/// Parse a plain unsigned decimal that fits in 32 bits.
bool parse_dec_u32(const char* s, size_t len, uint32_t& out);

} // namespace rn2903
