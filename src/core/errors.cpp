#include "jdki/errors.hpp"

namespace jdki {

const char *stageName(Stage stage) {
  switch (stage) {
  case Stage::Configuration: return "configuration";
  case Stage::Resolution:    return "resolution";
  case Stage::Acquisition:   return "acquisition";
  case Stage::Extraction:    return "extraction";
  case Stage::Environment:   return "environment";
  case Stage::Verification:  return "verification";
  default:                   return "unknown";
  }
}

} // namespace jdki
