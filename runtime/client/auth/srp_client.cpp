#include "srp_client.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>

#include "encoding.h"
#include "platform_random.h"

namespace ica::client {

namespace {

constexpr char kGroupPrimeHex[] =
    "AC6BDB41324A9A9BF166DE5E1389582FAF72B6651987EE07FC3192943DB56050"
    "A37329CBB4A099ED8193E0757767A13DD52312AB4B03310DCD7F48A9DA04FD50"
    "E8083969EDB767B0CF6095179A163AB3661A05FBD5FAAAE82918A9962F0B93B8"
    "55F97993EC975EEAA80D740ADBF4FF747359D041D5C33EA71D281E446B14773B"
    "CA97B43A23FB801676BD207A436C6481F1D2B9078717461A5B9D32E688F87748"
    "544523B524B0D57D5EA77A2775D2ECFA032CFBDBF52FB3786160279004E57AE6"
    "AF874E7303CE53299CCC041C7BC308D82A5698F3A8D0C38271AE35F8E9DBFBB6"
    "94B5C803D89F7AE435DE236D525F54759B65E372FCD68EF20FA7111F9E4AFF73";
constexpr unsigned long kGroupGenerator = 2;
constexpr std::size_t kPrivateValueBytes = 32;

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

using Bytes = std::vector<std::uint8_t>;

BnPtr NewBn() { return BnPtr(BN_new()); }

BnPtr BnFromBytes(const Bytes& bytes) {
  return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

// Minimal big-endian encoding, no leading zeros.
Bytes BnToBytes(const BIGNUM* bn) {
  Bytes out(static_cast<std::size_t>(BN_num_bytes(bn)));
  if (!out.empty()) {
    BN_bn2bin(bn, out.data());
  }
  return out;
}

// Left-padded to |width| bytes.
Bytes BnToPadded(const BIGNUM* bn, std::size_t width) {
  Bytes out(width, 0);
  if (BN_bn2binpad(bn, out.data(), static_cast<int>(width)) < 0) {
    return BnToBytes(bn);
  }
  return out;
}

Bytes StripLeadingZeros(const Bytes& in) {
  auto it = std::find_if(in.begin(), in.end(),
                         [](std::uint8_t b) { return b != 0; });
  return Bytes(it, in.end());
}

class Sha256 {
 public:
  Sha256() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
  }
  ~Sha256() { EVP_MD_CTX_free(ctx_); }
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  Sha256& Update(const std::uint8_t* data, std::size_t len) {
    if (ok_ && len > 0) {
      ok_ = EVP_DigestUpdate(ctx_, data, len) == 1;
    }
    return *this;
  }
  Sha256& Update(const Bytes& data) { return Update(data.data(), data.size()); }
  Sha256& Update(std::string_view text) {
    return Update(reinterpret_cast<const std::uint8_t*>(text.data()),
                  text.size());
  }

  bool Final(Bytes& out) {
    out.assign(SHA256_DIGEST_LENGTH, 0);
    unsigned int len = 0;
    if (!ok_ || EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 ||
        len != SHA256_DIGEST_LENGTH) {
      out.clear();
      return false;
    }
    return true;
  }

 private:
  EVP_MD_CTX* ctx_{nullptr};
  bool ok_{false};
};

}  // namespace

struct SrpClient::Impl {
  BnPtr n;
  BnPtr g;
  BnPtr k;
  BnPtr a;
  BnPtr big_a;
  BnCtxPtr ctx;
  std::size_t width{0};
};

bool ParseSrpProtocol(std::string_view text, SrpProtocol& out) {
  if (text == "s2k") {
    out = SrpProtocol::kS2k;
    return true;
  }
  if (text == "s2k_fo") {
    out = SrpProtocol::kS2kFo;
    return true;
  }
  return false;
}

const char* SrpProtocolName(SrpProtocol protocol) {
  return protocol == SrpProtocol::kS2kFo ? "s2k_fo" : "s2k";
}

bool DerivePassword(std::string_view password, const Bytes& salt,
                    std::uint32_t iterations, std::size_t key_length,
                    SrpProtocol protocol, common::SecureBuffer& out,
                    std::string& error) {
  error.clear();
  if (iterations == 0 || key_length == 0) {
    error = "invalid key derivation parameters";
    return false;
  }
  Bytes digest;
  if (!Sha256().Update(password).Final(digest)) {
    error = "password hash failed";
    return false;
  }
  common::ScopedWipe digest_wipe(digest);

  std::string prehash;
  if (protocol == SrpProtocol::kS2kFo) {
    prehash = common::BytesToHexLower(digest.data(), digest.size());
  } else {
    prehash.assign(digest.begin(), digest.end());
  }
  common::ScopedWipe prehash_wipe(prehash);

  common::SecureBuffer derived(key_length);
  if (PKCS5_PBKDF2_HMAC(prehash.data(), static_cast<int>(prehash.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(key_length), derived.data()) != 1) {
    error = "pbkdf2 failed";
    return false;
  }
  out = std::move(derived);
  return true;
}

SrpClient::SrpClient() : impl_(std::make_unique<Impl>()) {
  BIGNUM* n = nullptr;
  if (BN_hex2bn(&n, kGroupPrimeHex) > 0) {
    impl_->n.reset(n);
  }
  impl_->g = NewBn();
  if (impl_->g) {
    BN_set_word(impl_->g.get(), kGroupGenerator);
  }
  impl_->ctx.reset(BN_CTX_new());
  if (impl_->n) {
    impl_->width = static_cast<std::size_t>(BN_num_bytes(impl_->n.get()));
  }
}

SrpClient::~SrpClient() = default;

bool SrpClient::Start(std::string& error) {
  Bytes a(kPrivateValueBytes);
  if (!ica::platform::RandomBytes(a.data(), a.size())) {
    error = "random generation failed";
    return false;
  }
  common::ScopedWipe wipe(a);
  return StartWithPrivate(a, error);
}

bool SrpClient::StartWithPrivate(const Bytes& private_value,
                                 std::string& error) {
  error.clear();
  public_.clear();
  expected_m2_.clear();
  Impl& s = *impl_;
  if (!s.n || !s.g || !s.ctx) {
    error = "srp group init failed";
    return false;
  }
  if (private_value.empty()) {
    error = "srp private value empty";
    return false;
  }

  // k = H(PAD(N) | PAD(g))
  Bytes k_bytes;
  if (!Sha256()
           .Update(BnToPadded(s.n.get(), s.width))
           .Update(BnToPadded(s.g.get(), s.width))
           .Final(k_bytes)) {
    error = "srp hash failed";
    return false;
  }
  s.k = BnFromBytes(k_bytes);
  s.a = BnFromBytes(private_value);
  s.big_a = NewBn();
  if (!s.k || !s.a || !s.big_a ||
      BN_mod_exp(s.big_a.get(), s.g.get(), s.a.get(), s.n.get(),
                 s.ctx.get()) != 1) {
    error = "srp public value failed";
    return false;
  }
  public_ = BnToBytes(s.big_a.get());
  return true;
}

bool SrpClient::ProcessChallenge(std::string_view identity,
                                 const common::SecureBuffer& derived_password,
                                 const Bytes& salt, const Bytes& server_public,
                                 SrpProof& out, std::string& error) {
  error.clear();
  Impl& s = *impl_;
  if (!s.a || !s.big_a) {
    error = "srp not started";
    return false;
  }
  if (server_public.empty() || salt.empty()) {
    error = "srp challenge incomplete";
    return false;
  }
  BIGNUM* n = s.n.get();
  BN_CTX* ctx = s.ctx.get();

  BnPtr b = BnFromBytes(server_public);
  BnPtr check = NewBn();
  if (!b || !check || BN_nnmod(check.get(), b.get(), n, ctx) != 1) {
    error = "srp server value invalid";
    return false;
  }
  if (BN_is_zero(check.get())) {
    error = "srp server value rejected";
    return false;
  }

  // u = H(PAD(A) | PAD(B))
  Bytes u_bytes;
  if (!Sha256()
           .Update(BnToPadded(s.big_a.get(), s.width))
           .Update(BnToPadded(b.get(), s.width))
           .Final(u_bytes)) {
    error = "srp hash failed";
    return false;
  }
  BnPtr u = BnFromBytes(u_bytes);
  if (!u || BN_is_zero(u.get())) {
    error = "srp scrambling parameter rejected";
    return false;
  }

  // x = H(salt | H(":" | P)), both operands as minimal integers.
  Bytes inner;
  if (!Sha256()
           .Update(":")
           .Update(derived_password.data(), derived_password.size())
           .Final(inner)) {
    error = "srp hash failed";
    return false;
  }
  common::ScopedWipe inner_wipe(inner);
  Bytes inner_min = StripLeadingZeros(inner);
  common::ScopedWipe inner_min_wipe(inner_min);
  Bytes x_bytes;
  if (!Sha256().Update(StripLeadingZeros(salt)).Update(inner_min).Final(
          x_bytes)) {
    error = "srp hash failed";
    return false;
  }
  common::ScopedWipe x_wipe(x_bytes);
  BnPtr x = BnFromBytes(x_bytes);

  // S = (B - k * g^x) ^ (a + u * x) mod N
  BnPtr gx = NewBn();
  BnPtr kgx = NewBn();
  BnPtr base = NewBn();
  BnPtr ux = NewBn();
  BnPtr exp = NewBn();
  BnPtr secret = NewBn();
  if (!x || !gx || !kgx || !base || !ux || !exp || !secret ||
      BN_mod_exp(gx.get(), s.g.get(), x.get(), n, ctx) != 1 ||
      BN_mod_mul(kgx.get(), s.k.get(), gx.get(), n, ctx) != 1 ||
      BN_mod_sub(base.get(), b.get(), kgx.get(), n, ctx) != 1 ||
      BN_mul(ux.get(), u.get(), x.get(), ctx) != 1 ||
      BN_add(exp.get(), s.a.get(), ux.get()) != 1 ||
      BN_mod_exp(secret.get(), base.get(), exp.get(), n, ctx) != 1) {
    error = "srp secret computation failed";
    return false;
  }

  Bytes secret_bytes = BnToBytes(secret.get());
  common::ScopedWipe secret_wipe(secret_bytes);
  Bytes key;
  if (!Sha256().Update(secret_bytes).Final(key)) {
    error = "srp hash failed";
    return false;
  }

  // M1 = H(H(N) ^ H(PAD(g)) | H(I) | s | A | B | K)
  Bytes hn;
  Bytes hg;
  Bytes hi;
  if (!Sha256().Update(BnToBytes(n)).Final(hn) ||
      !Sha256().Update(BnToPadded(s.g.get(), s.width)).Final(hg) ||
      !Sha256().Update(identity).Final(hi)) {
    error = "srp hash failed";
    return false;
  }
  for (std::size_t i = 0; i < hn.size(); ++i) {
    hn[i] ^= hg[i];
  }
  Bytes m1;
  if (!Sha256()
           .Update(hn)
           .Update(hi)
           .Update(StripLeadingZeros(salt))
           .Update(public_)
           .Update(BnToBytes(b.get()))
           .Update(key)
           .Final(m1)) {
    error = "srp hash failed";
    return false;
  }
  // M2 = H(A | M1 | K)
  Bytes m2;
  if (!Sha256().Update(public_).Update(m1).Update(key).Final(m2)) {
    error = "srp hash failed";
    return false;
  }

  out.m1 = m1;
  out.m2 = m2;
  out.session_key.assign(key.data(), key.size());
  common::SecureWipe(key);
  expected_m2_ = std::move(m2);
  return true;
}

bool SrpClient::VerifyServerProof(const Bytes& server_m2) const {
  if (expected_m2_.empty() || server_m2.size() != expected_m2_.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected_m2_.data(), server_m2.data(),
                       server_m2.size()) == 0;
}

}  // namespace ica::client
