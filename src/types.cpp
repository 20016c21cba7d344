// SPDX-License-Identifier: MIT

#include "qrem/types.hpp"

namespace qrem {

const char* to_string(ErrorCode code){
  switch(code){
    case ErrorCode::InvalidLength: return "InvalidLength";
    case ErrorCode::UnknownQubit: return "UnknownQubit";
    case ErrorCode::UncalibratedQubit: return "UncalibratedQubit";
    case ErrorCode::UncalibratedSubset: return "UncalibratedSubset";
    case ErrorCode::SubsetTooLarge: return "SubsetTooLarge";
    case ErrorCode::DimensionMismatch: return "DimensionMismatch";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string& what)
  : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

} // namespace qrem
