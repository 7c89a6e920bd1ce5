#include "docchat_core/extractors/text_extractor.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <iomanip>
#include <iterator>
#include <sstream>

#include "docchat_core/errors.hpp"

namespace docchat_core {

ExtractionResult TextExtractor::extract_with_hash(const std::string& bytes) const {
  return {compute_content_hash(bytes), extract(bytes)};
}

std::string TextExtractor::compute_content_hash(const std::string& bytes) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ExtractionFailedError("failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionFailedError("failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, bytes.data(), bytes.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionFailedError("failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionFailedError("failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string TextExtractor::normalize_text(const std::string& bytes) {
  std::string valid;
  if (utf8::is_valid(bytes.begin(), bytes.end())) {
    valid = bytes;
  } else {
    utf8::replace_invalid(bytes.begin(), bytes.end(), std::back_inserter(valid));
  }

  if (utf8::starts_with_bom(valid.begin(), valid.end())) {
    valid.erase(0, 3);
  }

  std::string out;
  out.reserve(valid.size());
  for (size_t i = 0; i < valid.size(); ++i) {
    if (valid[i] == '\r') {
      if (i + 1 < valid.size() && valid[i + 1] == '\n') {
        continue;
      }
      out.push_back('\n');
      continue;
    }
    out.push_back(valid[i]);
  }
  return out;
}

}  // namespace docchat_core
