#pragma once

#include <string>
#include <vector>

namespace tpl::security {

/// Deterministic encoding and hashing primitives behind the template functions
/// base64(), base64ToString(), uniqueString() and guid().
/// Class abbreviation: hs
class HashService {
 public:
  HashService() = delete;

  /// Standard base64 with padding, no line breaks.
  static std::string base64Encode(const std::string& sInput);

  /// Decode standard base64. Throws std::runtime_error on invalid input.
  static std::string base64Decode(const std::string& sEncoded);

  /// 13-character lowercase base32 string derived from SHA-256 of the parts
  /// joined with '-'. Same parts always yield the same string.
  static std::string uniqueString(const std::vector<std::string>& vParts);

  /// Name-based (version 5) UUID over the parts joined with '-'.
  /// Format: xxxxxxxx-xxxx-5xxx-yxxx-xxxxxxxxxxxx, lowercase.
  static std::string deterministicGuid(const std::vector<std::string>& vParts);

 private:
  static std::vector<unsigned char> digest(const std::string& sInput, bool bSha1);
};

}  // namespace tpl::security
