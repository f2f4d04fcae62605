/***
 * Name: cmfmt::support (fs)
 * Purpose: Minimal file IO helpers for reading and writing listfiles.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream to centralize error handling.
 *   Both directions are binary so CRLF line endings survive a round trip.
 */
#pragma once

#include <string>

namespace cmfmt {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace cmfmt
