/***
 * Name: cmfmt::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from CmfmtException.
 */
#pragma once

#include <string>
#include <utility>

#include "cmfmt/exceptions/cmfmt_exception.h"

namespace cmfmt {
namespace exceptions {

class FileReadError : public CmfmtException {
 public:
  explicit FileReadError(std::string msg) noexcept : CmfmtException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace cmfmt
