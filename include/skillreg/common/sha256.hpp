#pragma once

#include "skillreg/common/result.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace skillreg::common {

/// Incremental SHA-256 over OpenSSL's EVP digest API.
class Sha256 {
public:
  Sha256();

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;
  Sha256(Sha256 &&) noexcept = default;
  Sha256 &operator=(Sha256 &&) noexcept = default;

  [[nodiscard]] Status update(const void *data, std::size_t size);
  [[nodiscard]] Status update(std::string_view data);

  /// Lowercase hex digest. The context cannot be updated afterwards.
  [[nodiscard]] Result<std::string> finish_hex();

private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const;
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool finished_ = false;
};

[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace skillreg::common
