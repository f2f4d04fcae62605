/***
 * Name: cmfmt::support::UpperCase / FoldCase
 * Purpose: ICU-backed case mapping used to normalize keywords and command names.
 * Inputs: UTF-8 text
 * Outputs: Mapped UTF-8 text; the input is returned unchanged if ICU rejects it
 */
#include "cmfmt/support/case.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/ustring.h>

namespace cmfmt::support {

namespace {

bool toUtf16(std::string_view text, std::vector<UChar>& out) {
  UErrorCode status = U_ZERO_ERROR;
  const auto nb = static_cast<int32_t>(text.size());
  int32_t uLen = 0;
  u_strFromUTF8(nullptr, 0, &uLen, text.data(), nb, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR;
  out.assign(static_cast<std::size_t>(uLen) + 1, 0);
  u_strFromUTF8(out.data(), uLen + 1, nullptr, text.data(), nb, &status);
  if (U_FAILURE(status)) { return false; }
  out.resize(static_cast<std::size_t>(uLen));
  return true;
}

bool toUtf8(const std::vector<UChar>& text, std::string& out) {
  UErrorCode status = U_ZERO_ERROR;
  const auto uLen = static_cast<int32_t>(text.size());
  int32_t outLen = 0;
  u_strToUTF8(nullptr, 0, &outLen, text.data(), uLen, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR;
  std::vector<char> buf(static_cast<std::size_t>(outLen) + 1);
  u_strToUTF8(buf.data(), outLen + 1, nullptr, text.data(), uLen, &status);
  if (U_FAILURE(status)) { return false; }
  out.assign(buf.data(), static_cast<std::size_t>(outLen));
  return true;
}

}  // namespace

std::string UpperCase(std::string_view text) {
  if (text.empty()) { return {}; }
  std::vector<UChar> ustr;
  if (!toUtf16(text, ustr)) { return std::string(text); }
  const auto uLen = static_cast<int32_t>(ustr.size());
  UErrorCode status = U_ZERO_ERROR;
  // "" selects the root locale so results do not depend on the environment
  const int32_t upLen = u_strToUpper(nullptr, 0, ustr.data(), uLen, "", &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return std::string(text); }
  status = U_ZERO_ERROR;
  std::vector<UChar> ubuf(static_cast<std::size_t>(upLen) + 1);
  u_strToUpper(ubuf.data(), upLen + 1, ustr.data(), uLen, "", &status);
  if (U_FAILURE(status)) { return std::string(text); }
  ubuf.resize(static_cast<std::size_t>(upLen));
  std::string out;
  if (!toUtf8(ubuf, out)) { return std::string(text); }
  return out;
}

std::string FoldCase(std::string_view text) {
  if (text.empty()) { return {}; }
  std::vector<UChar> ustr;
  if (!toUtf16(text, ustr)) { return std::string(text); }
  const auto uLen = static_cast<int32_t>(ustr.size());
  UErrorCode status = U_ZERO_ERROR;
  const int32_t fLen = u_strFoldCase(nullptr, 0, ustr.data(), uLen, U_FOLD_CASE_DEFAULT, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return std::string(text); }
  status = U_ZERO_ERROR;
  std::vector<UChar> fbuf(static_cast<std::size_t>(fLen) + 1);
  u_strFoldCase(fbuf.data(), fLen + 1, ustr.data(), uLen, U_FOLD_CASE_DEFAULT, &status);
  if (U_FAILURE(status)) { return std::string(text); }
  fbuf.resize(static_cast<std::size_t>(fLen));
  std::string out;
  if (!toUtf8(fbuf, out)) { return std::string(text); }
  return out;
}

}  // namespace cmfmt::support
