#include <coffer/common/critical.hpp>
#include <coffer/crypto/keypair.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace coffer::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const coffer::schema::ed25519_seed_t& seed) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
  if (!pkey) {
    coffer::common::critical("failed to load ed25519 private key");
  }
  return pkey;
}

}  // namespace

keypair_t generate_keypair() {
  auto seed = coffer::schema::ed25519_seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    coffer::common::critical("failed to gather randomness for ed25519 key");
  }
  return keypair_from_seed(seed);
}

keypair_t keypair_from_seed(const coffer::schema::ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  auto keypair = keypair_t{.seed = seed};
  auto length = keypair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data(),
                                  &length) != 1 ||
      length != keypair.public_key.size()) {
    coffer::common::critical("failed to derive ed25519 public key");
  }
  return keypair;
}

coffer::schema::ed25519_signature_t sign(
    const coffer::schema::bytes_view_t& message,
    const keypair_t& keypair) {
  auto pkey = make_private_key(keypair.seed);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    coffer::common::critical("failed to allocate EVP_MD_CTX");
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    coffer::common::critical("failed to initialize ed25519 signing");
  }

  auto signature = coffer::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    coffer::common::critical("failed to produce ed25519 signature");
  }
  return signature;
}

}  // namespace coffer::crypto
