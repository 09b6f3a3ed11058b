// ============================================================================
// types.cpp: implementation for types.hpp
// ============================================================================

#include "rn2903/types.hpp"

#include <strings.h>   // strcasecmp

namespace rn2903 {

const char* to_string(ModulationMode mode) {
  switch (mode) {
    case ModulationMode::LoRa: return "lora";
    case ModulationMode::Fsk:  return "fsk";
  }
  return "lora";
}

bool parse_modulation(const char* text, ModulationMode& out) {
  if (!text) return false;
  if (strcasecmp(text, "lora") == 0) { out = ModulationMode::LoRa; return true; }
  if (strcasecmp(text, "fsk") == 0)  { out = ModulationMode::Fsk;  return true; }
  return false;
}

Status NvmAddress::create(uint16_t raw, NvmAddress& out) {
  if (raw < RN2903_NVM_FIRST || raw > RN2903_NVM_LAST)
    return Status::from(StatusCode::InvalidAddress);
  out = NvmAddress(raw);
  return Status::success();
}

} // namespace rn2903
