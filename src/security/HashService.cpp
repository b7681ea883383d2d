#include "security/HashService.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tpl::security {

namespace {

// Namespace UUID for guid(); fixed so results are stable across releases.
constexpr unsigned char kGuidNamespace[16] = {0x11, 0xfb, 0x06, 0xfb, 0x71, 0x2d, 0x4d, 0xdd,
                                              0x98, 0xc7, 0xe7, 0x1b, 0xbd, 0x58, 0x88, 0x30};

constexpr char kBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr int kUniqueStringLen = 13;

std::string joinParts(const std::vector<std::string>& vParts) {
  std::string sJoined;
  for (size_t i = 0; i < vParts.size(); ++i) {
    if (i > 0) sJoined += '-';
    sJoined += vParts[i];
  }
  return sJoined;
}

}  // namespace

// ── Base64 encode/decode ───────────────────────────────────────────────────

std::string HashService::base64Encode(const std::string& sInput) {
  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }

  EVP_EncodeInit(pCtx);

  // Output buffer: 4/3 * input + padding + newlines
  const int iMaxOut = static_cast<int>(sInput.size()) * 2 + 64;
  std::vector<unsigned char> vOut(static_cast<size_t>(iMaxOut));
  int iOutLen = 0;
  int iTotalLen = 0;

  if (EVP_EncodeUpdate(pCtx, vOut.data(), &iOutLen,
                       reinterpret_cast<const unsigned char*>(sInput.data()),
                       static_cast<int>(sInput.size())) != 1) {
    EVP_ENCODE_CTX_free(pCtx);
    throw std::runtime_error("Base64 encode failed");
  }
  iTotalLen += iOutLen;

  EVP_EncodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  iTotalLen += iOutLen;

  EVP_ENCODE_CTX_free(pCtx);

  std::string sResult(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iTotalLen));
  // Remove newlines that EVP_Encode adds
  std::erase(sResult, '\n');
  return sResult;
}

std::string HashService::base64Decode(const std::string& sEncoded) {
  if (sEncoded.size() % 4 != 0) {
    throw std::runtime_error("Base64 decode failed: length is not a multiple of 4");
  }

  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }

  EVP_DecodeInit(pCtx);

  std::vector<unsigned char> vOut(sEncoded.size() + 4);
  int iOutLen = 0;
  int iTotalLen = 0;

  int iRet = EVP_DecodeUpdate(pCtx, vOut.data(), &iOutLen,
                              reinterpret_cast<const unsigned char*>(sEncoded.data()),
                              static_cast<int>(sEncoded.size()));
  if (iRet < 0) {
    EVP_ENCODE_CTX_free(pCtx);
    throw std::runtime_error("Base64 decode failed");
  }
  iTotalLen += iOutLen;

  iRet = EVP_DecodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  EVP_ENCODE_CTX_free(pCtx);
  if (iRet < 0) {
    throw std::runtime_error("Base64 decode failed");
  }
  iTotalLen += iOutLen;

  return std::string(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iTotalLen));
}

// ── Digests ────────────────────────────────────────────────────────────────

std::vector<unsigned char> HashService::digest(const std::string& sInput, bool bSha1) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, bSha1 ? EVP_sha1() : EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sInput.data(), sInput.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("Digest computation failed");
  }

  EVP_MD_CTX_free(pCtx);
  return std::vector<unsigned char>(vHash, vHash + uHashLen);
}

// ── Template identifiers ───────────────────────────────────────────────────

std::string HashService::uniqueString(const std::vector<std::string>& vParts) {
  const auto vHash = digest(joinParts(vParts), false);

  uint64_t uValue = 0;
  for (int i = 0; i < 8; ++i) {
    uValue = (uValue << 8) | vHash[static_cast<size_t>(i)];
  }

  // 13 groups of 5 bits cover the 64-bit value plus one zero bit
  std::string sResult;
  sResult.reserve(kUniqueStringLen);
  for (int i = 0; i < kUniqueStringLen; ++i) {
    const int iShift = 64 - 5 * (i + 1);
    const uint64_t uGroup = iShift >= 0 ? (uValue >> iShift) : (uValue << -iShift);
    sResult += kBase32Alphabet[uGroup & 0x1f];
  }
  return sResult;
}

std::string HashService::deterministicGuid(const std::vector<std::string>& vParts) {
  std::string sInput(reinterpret_cast<const char*>(kGuidNamespace), sizeof(kGuidNamespace));
  sInput += joinParts(vParts);

  auto vHash = digest(sInput, true);
  vHash[6] = static_cast<unsigned char>((vHash[6] & 0x0f) | 0x50);  // version 5
  vHash[8] = static_cast<unsigned char>((vHash[8] & 0x3f) | 0x80);  // RFC 4122 variant

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
    oss << std::setw(2) << static_cast<int>(vHash[static_cast<size_t>(i)]);
  }
  return oss.str();
}

}  // namespace tpl::security
