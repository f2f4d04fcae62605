/***
 * Name: cmfmt::exceptions::CmfmtException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "cmfmt/exceptions/cmfmt_exception.h"

namespace cmfmt::exceptions {

const char* CmfmtException::what() const noexcept { return message_.c_str(); }

}  // namespace cmfmt::exceptions
