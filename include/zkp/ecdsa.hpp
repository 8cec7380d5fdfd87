/*
 * Copyright (C) 2023-2025 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/*
 * ECDSA verification over a Weierstrass curve
 */

#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <string>

#include <params.hpp>
#include <types.hpp>
#include <util/mpz_bytes.hpp>
#include <zkp/weierstrass.hpp>

namespace cairo::vm::zkp {

/** Inverse of `s` modulo the group order `n`, throws vm_error(encoding) if none exists */
inline mpz_class scalar_invert(const mpz_class& s, const mpz_class& n) {
    mpz_class w;
    if (s <= 0 || mpz_invert(w.get_mpz_t(), s.get_mpz_t(), n.get_mpz_t()) == 0) {
        throw vm_error(error_kind::encoding,
                       "scalar " + mpz_to_hex(s) + " is not invertible modulo the group order");
    }
    return w;
}

/** Big-endian message hash as an integer, keeping its leading `bits` bits */
inline mpz_class hash_to_int(std::span<const uint8_t> hash, size_t bits) {
    const size_t max_bytes = (bits + 7) / 8;
    if (hash.size() > max_bytes) {
        hash = hash.first(max_bytes);
    }

    mpz_class e = mpz_import_be(hash);
    const size_t len = e == 0 ? 0 : mpz_sizeinbase(e.get_mpz_t(), 2);
    if (len > bits) {
        e >>= (len - bits);
    }
    return e;
}

struct ecdsa_signature {
    using bytes_type = std::array<uint8_t, params::signature_bytes>;

    mpz_class r;
    mpz_class s;

    /** r || s, each as 32 big-endian bytes */
    bytes_type to_bytes() const {
        bytes_type out{};
        auto rb = mpz_export_be<params::felt_bytes>(r);
        auto sb = mpz_export_be<params::felt_bytes>(s);
        std::copy(rb.begin(), rb.end(), out.begin());
        std::copy(sb.begin(), sb.end(), out.begin() + params::felt_bytes);
        return out;
    }

    /** Decode r || s. Both halves must be canonical scalars in [1, n). */
    static ecdsa_signature from_bytes(std::span<const uint8_t> bytes, const mpz_class& n) {
        if (bytes.size() != params::signature_bytes) {
            throw vm_error(error_kind::encoding,
                           "signature must be " + std::to_string(params::signature_bytes)
                           + " bytes, got " + std::to_string(bytes.size()));
        }

        ecdsa_signature sig {
            mpz_import_be(bytes.first(params::felt_bytes)),
            mpz_import_be(bytes.subspan(params::felt_bytes))
        };

        if (sig.r == 0 || sig.r >= n) {
            throw vm_error(error_kind::encoding,
                           "signature r " + mpz_to_hex(sig.r) + " is not a canonical scalar");
        }
        if (sig.s == 0 || sig.s >= n) {
            throw vm_error(error_kind::encoding,
                           "signature s " + mpz_to_hex(sig.s) + " is not a canonical scalar");
        }
        return sig;
    }
};

/// Verifies an ECDSA signature over a message hash given as binary data
template <WeierstrassCurveDef CurveDef>
bool ecdsa_verify(const typename weierstrass_curve<CurveDef>::point& pub_key,
                  std::span<const uint8_t> msg_hash,
                  const ecdsa_signature& sig) {
    using curve = weierstrass_curve<CurveDef>;

    const mpz_class n = CurveDef::order();
    if (sig.r <= 0 || sig.r >= n || sig.s <= 0 || sig.s >= n) {
        return false;
    }

    mpz_class e = hash_to_int(msg_hash, CurveDef::scalar_bits);
    mpz_class w = scalar_invert(sig.s, n);

    mpz_class u1 = e * w;
    mpz_class u2 = sig.r * w;
    mpz_fdiv_r(u1.get_mpz_t(), u1.get_mpz_t(), n.get_mpz_t());
    mpz_fdiv_r(u2.get_mpz_t(), u2.get_mpz_t(), n.get_mpz_t());

    // R = u1 x G + u2 x Q
    auto R = curve::point_add(curve::scalar_mul(u1, curve::generator()),
                              curve::scalar_mul(u2, pub_key));
    if (R.is_infinity()) {
        return false;
    }

    mpz_class x = R.x().data();
    mpz_fdiv_r(x.get_mpz_t(), x.get_mpz_t(), n.get_mpz_t());
    return x == sig.r;
}

}  // namespace cairo::vm::zkp
