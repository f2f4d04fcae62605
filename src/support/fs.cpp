/***
 * Name: cmfmt::support::ReadFile / WriteFile
 * Purpose: Byte-exact listfile IO.
 * Theory of Operation:
 *   Reads are binary so CRLF and a leading BOM reach the lexer untouched.
 *   Writes go to a sibling temporary file that is renamed over the target,
 *   so a failed write never leaves a truncated listfile behind.
 */
#include "cmfmt/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <sstream>
#include <system_error>

namespace cmfmt {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "is a directory: " + path;
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  if (in.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = contents.str();
  return true;
}

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::string staging = path + ".cmfmt-tmp";
  {
    std::ofstream outFile(staging, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
      err = "failed to open file for write: " + path;
      return false;
    }
    outFile.write(data.data(), static_cast<std::streamsize>(data.size()));
    outFile.flush();
    if (!outFile.good()) {
      err = "failed to write file: " + path;
      outFile.close();
      std::error_code ignored;
      std::filesystem::remove(staging, ignored);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    err = "failed to replace " + path + ": " + ec.message();
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace cmfmt
