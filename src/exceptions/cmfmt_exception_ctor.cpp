/***
 * Name: cmfmt::exceptions::CmfmtException::CmfmtException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "cmfmt/exceptions/cmfmt_exception.h"

#include <utility>

namespace cmfmt {
namespace exceptions {

CmfmtException::CmfmtException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace cmfmt
