/***
 * Name: cmfmt::exceptions::CmfmtException
 * Purpose: Base class for all cmfmt exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in cmfmt must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace cmfmt {
namespace exceptions {

class CmfmtException : public std::exception {
 public:
  virtual ~CmfmtException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit CmfmtException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace cmfmt
