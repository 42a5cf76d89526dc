#include "skillreg/common/sha256.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace skillreg::common {

void Sha256::CtxDeleter::operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ == nullptr || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    ctx_.reset();
  }
}

Status Sha256::update(const void *data, const std::size_t size) {
  if (ctx_ == nullptr || finished_) {
    return Status::error("sha256 context is not usable");
  }
  if (size == 0) {
    return Status::success();
  }
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    return Status::error("sha256 update failed");
  }
  return Status::success();
}

Status Sha256::update(const std::string_view data) { return update(data.data(), data.size()); }

Result<std::string> Sha256::finish_hex() {
  if (ctx_ == nullptr || finished_) {
    return Result<std::string>::failure("sha256 context is not usable");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
    return Result<std::string>::failure("sha256 finalize failed");
  }
  finished_ = true;

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return Result<std::string>::success(stream.str());
}

std::string sha256_hex(const std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
    return "";
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return stream.str();
}

} // namespace skillreg::common
