#include "signer.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <stdexcept>
#include <vector>

#include "internal/chain/keccak.hpp"
#include "internal/chain/rlp.hpp"

namespace mintgate::chain {

namespace {

struct BnDeleter {
  void operator()(BIGNUM* bn) const {
    BN_free(bn);
  }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const {
    BN_CTX_free(ctx);
  }
};
struct PointDeleter {
  void operator()(EC_POINT* point) const {
    EC_POINT_free(point);
  }
};
struct SigDeleter {
  void operator()(ECDSA_SIG* sig) const {
    ECDSA_SIG_free(sig);
  }
};

using BnPtr    = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using SigPtr   = std::unique_ptr<ECDSA_SIG, SigDeleter>;

void Check(int rc, const char* what) {
  if (rc != 1) {
    throw std::runtime_error(std::string("secp256k1: ") + what + " failed");
  }
}

template <typename T>
T* CheckAlloc(T* ptr, const char* what) {
  if (!ptr) {
    throw std::runtime_error(std::string("secp256k1: ") + what + " failed");
  }
  return ptr;
}

std::string AddressFromPoint(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
  std::uint8_t encoded[65];
  if (EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED, encoded, sizeof(encoded), ctx) != sizeof(encoded)) {
    throw std::runtime_error("secp256k1: public key encoding failed");
  }
  // Skip the 0x04 uncompressed marker; the address is the low 20 bytes of the hash.
  const auto hash = Keccak256(encoded + 1, 64);
  return util::ToHex(hash.data() + 12, 20);
}

util::Bytes Minimal(const BIGNUM* bn) {
  util::Bytes out(static_cast<std::size_t>(BN_num_bytes(bn)));
  if (!out.empty()) {
    BN_bn2bin(bn, out.data());
  }
  return out;
}

// Finds which of the two candidate R points reproduces our public key.
int RecoveryId(const EC_GROUP* group, const Hash256& digest, const BIGNUM* r, const BIGNUM* s, const EC_POINT* public_key, BN_CTX* ctx) {
  const BIGNUM* order = EC_GROUP_get0_order(group);

  BnPtr e(CheckAlloc(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr), "digest load"));
  BnPtr r_inv(CheckAlloc(BN_mod_inverse(nullptr, r, order, ctx), "r inverse"));
  BnPtr u1(CheckAlloc(BN_new(), "bn alloc"));
  BnPtr u2(CheckAlloc(BN_new(), "bn alloc"));

  // Q = r^-1 (s*R - e*G)  =>  u1 = -e * r^-1, u2 = s * r^-1 (mod n)
  Check(BN_mod_mul(u1.get(), e.get(), r_inv.get(), order, ctx), "u1");
  if (!BN_is_zero(u1.get())) {
    Check(BN_sub(u1.get(), order, u1.get()), "u1 negate");
  }
  Check(BN_mod_mul(u2.get(), s, r_inv.get(), order, ctx), "u2");

  for (int id = 0; id < 2; ++id) {
    PointPtr candidate(CheckAlloc(EC_POINT_new(group), "point alloc"));
    if (EC_POINT_set_compressed_coordinates(group, candidate.get(), r, id, ctx) != 1) {
      ERR_clear_error();
      continue;
    }

    PointPtr recovered(CheckAlloc(EC_POINT_new(group), "point alloc"));
    Check(EC_POINT_mul(group, recovered.get(), u1.get(), candidate.get(), u2.get(), ctx), "recover");
    if (EC_POINT_cmp(group, recovered.get(), public_key, ctx) == 0) {
      return id;
    }
  }

  throw std::runtime_error("secp256k1: could not derive signature recovery id");
}

} // namespace

Signer::Signer(std::string_view private_key_hex) {
  auto raw = util::FromHex(private_key_hex);
  if (!raw || raw->size() != 32) {
    throw std::invalid_argument("signing key must be 32 bytes of hex");
  }

  key_.reset(CheckAlloc(EC_KEY_new_by_curve_name(NID_secp256k1), "key alloc"));
  const EC_GROUP* group = EC_KEY_get0_group(key_.get());

  BnPtr priv(CheckAlloc(BN_bin2bn(raw->data(), static_cast<int>(raw->size()), nullptr), "key load"));
  OPENSSL_cleanse(raw->data(), raw->size());
  if (BN_is_zero(priv.get()) || BN_cmp(priv.get(), EC_GROUP_get0_order(group)) >= 0) {
    throw std::invalid_argument("signing key is outside the secp256k1 scalar range");
  }

  BnCtxPtr ctx(CheckAlloc(BN_CTX_new(), "ctx alloc"));
  PointPtr pub(CheckAlloc(EC_POINT_new(group), "point alloc"));
  Check(EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, ctx.get()), "public key derivation");
  Check(EC_KEY_set_private_key(key_.get(), priv.get()), "set private key");
  Check(EC_KEY_set_public_key(key_.get(), pub.get()), "set public key");
  BN_clear(priv.get());

  address_ = AddressFromPoint(group, pub.get(), ctx.get());
}

SignedTransaction Signer::SignLegacy(const LegacyTransaction& tx, std::uint64_t chain_id) const {
  auto to = util::FromHex(tx.to);
  if (!to || to->size() != 20) {
    throw std::invalid_argument("transaction recipient must be a 20-byte address");
  }

  std::vector<util::Bytes> fields = {rlp::EncodeUint(tx.nonce), rlp::EncodeUint(tx.gas_price), rlp::EncodeUint(tx.gas_limit),
                                     rlp::EncodeBytes(*to),     rlp::EncodeUint(tx.value),     rlp::EncodeBytes(tx.data)};

  // EIP-155 signing payload: (nonce, gasPrice, gas, to, value, data, chainId, 0, 0)
  auto preimage = fields;
  preimage.push_back(rlp::EncodeUint(chain_id));
  preimage.push_back(rlp::EncodeUint(std::uint64_t{0}));
  preimage.push_back(rlp::EncodeUint(std::uint64_t{0}));
  const auto digest = Keccak256(rlp::EncodeList(preimage));

  const EC_GROUP* group = EC_KEY_get0_group(key_.get());
  const BIGNUM*   order = EC_GROUP_get0_order(group);
  BnCtxPtr        ctx(CheckAlloc(BN_CTX_new(), "ctx alloc"));

  SigPtr sig(CheckAlloc(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), key_.get()), "sign"));
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  // Homestead rule: s must be in the lower half of the order.
  BnPtr low_s(CheckAlloc(BN_dup(s), "bn dup"));
  BnPtr half_order(CheckAlloc(BN_new(), "bn alloc"));
  Check(BN_rshift1(half_order.get(), order), "half order");
  if (BN_cmp(low_s.get(), half_order.get()) > 0) {
    Check(BN_sub(low_s.get(), order, low_s.get()), "s normalize");
  }

  const int recovery_id = RecoveryId(group, digest, r, low_s.get(), EC_KEY_get0_public_key(key_.get()), ctx.get());

  SignedTransaction signed_tx;
  signed_tx.v = chain_id * 2 + 35 + static_cast<std::uint64_t>(recovery_id);

  fields.push_back(rlp::EncodeUint(signed_tx.v));
  fields.push_back(rlp::EncodeBytes(Minimal(r)));
  fields.push_back(rlp::EncodeBytes(Minimal(low_s.get())));
  signed_tx.raw = rlp::EncodeList(fields);

  const auto hash = Keccak256(signed_tx.raw);
  signed_tx.hash  = util::ToHex(hash.data(), hash.size());
  return signed_tx;
}

} // namespace mintgate::chain
