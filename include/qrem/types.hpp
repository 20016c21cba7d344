// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace qrem {

// Bit i of a BitIndex is position i of the bitstring (rightmost character).
using BitIndex = std::uint64_t;
constexpr std::size_t kMaxSubsetBits = 64;
// Largest correlated calibration group accepted unless configured otherwise.
constexpr std::size_t kDefaultMaxCorrelatedSubset = 10;

// Raw shot counts keyed by bitstring ("msb..lsb").
using Counts = std::map<std::string, std::uint64_t>;

using SparseVector = std::unordered_map<BitIndex, double>;

enum class ErrorCode {
  InvalidLength,
  UnknownQubit,
  UncalibratedQubit,
  UncalibratedSubset,
  SubsetTooLarge,
  DimensionMismatch,
  InvalidArgument
};

const char* to_string(ErrorCode code);

class Error : public std::runtime_error {
  ErrorCode code_;
public:
  Error(ErrorCode code, const std::string& what);
  ErrorCode code() const noexcept { return code_; }
};

} // namespace qrem
