/***
 * Name: cmfmt::exceptions::ConfigError
 * Purpose: Exception for configuration files and option values.
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

class ConfigError : public CmfmtException {
 public:
  explicit ConfigError(std::string msg) noexcept : CmfmtException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace cmfmt
