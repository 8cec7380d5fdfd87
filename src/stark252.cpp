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

#include <cassert>
#include <ostream>

#include <types.hpp>
#include <util/mpz_bytes.hpp>
#include <zkp/finite_field_gmp.hpp>

namespace cairo::vm::zkp {

typename stark252_gmp::value_type
stark252_gmp::modulus("3618502788666131213697322783095070105623107215331596699973092056135872020481");

typename stark252_gmp::value_type
stark252_gmp::modulus_middle("1809251394333065606848661391547535052811553607665798349986546028067936010240");

// P - 1 = 2^192 * (2^59 + 17)
typename stark252_gmp::value_type
stark252_gmp::odd_factor("576460752303423505");

// 3 is the smallest quadratic non-residue
typename stark252_gmp::value_type
stark252_gmp::root_of_unity("145784604816374866144131285430889962727208297722245411306711449302875041684");

void stark252_gmp::reduce(value_type& out, const value_type& x) {
    mpz_fdiv_r(out.get_mpz_t(), x.get_mpz_t(), modulus.get_mpz_t());
}

void stark252_gmp::negate(value_type& out, const value_type& x) {
    assert(x < modulus);
    out = x == 0 ? x : modulus - x;
}

void stark252_gmp::invmod(value_type& out, const value_type& x) {
    assert(x < modulus);
    if (mpz_invert(out.get_mpz_t(), x.get_mpz_t(), modulus.get_mpz_t()) == 0) {
        throw vm_error(error_kind::encoding, "field element 0 has no inverse");
    }
}

void stark252_gmp::addmod(value_type& out, const value_type& x, const value_type& y) {
    out = x + y;
    if (out >= modulus)
        out -= modulus;
}

void stark252_gmp::submod(value_type& out, const value_type& x, const value_type& y) {
    out = x - y;
    if (out < 0)
        out += modulus;
}

void stark252_gmp::mulmod(value_type& out, const value_type& x, const value_type& y) {
    thread_local value_type z;

    z = x * y;
    mpz_fdiv_r(out.get_mpz_t(), z.get_mpz_t(), modulus.get_mpz_t());
}

void stark252_gmp::divmod(value_type& out, const value_type& x, const value_type& y) {
    value_type inv;
    stark252_gmp::invmod(inv, y);
    stark252_gmp::mulmod(out, x, inv);
}

void stark252_gmp::powmod(value_type& out, const value_type& x, const value_type& exp) {
    mpz_powm(out.get_mpz_t(), x.get_mpz_t(), exp.get_mpz_t(), modulus.get_mpz_t());
}

bool stark252_gmp::sqrt(value_type& out, const value_type& x) {
    if (x == 0) {
        out = 0;
        return true;
    }

    if (mpz_legendre(x.get_mpz_t(), modulus.get_mpz_t()) != 1) {
        return false;
    }

    // Invariant: r^2 = x * t, t has order 2^m, c has order 2^m
    value_type c = root_of_unity;
    value_type t, r, exp, b;
    size_t m = two_adicity;

    powmod(t, x, odd_factor);
    exp = (odd_factor + 1) / 2;
    powmod(r, x, exp);

    while (t != 1) {
        size_t i = 0;
        value_type tt = t;
        while (tt != 1) {
            mulmod(tt, tt, tt);
            ++i;
        }
        assert(i < m);

        b = c;
        for (size_t j = 0; j + i + 1 < m; j++) {
            mulmod(b, b, b);
        }

        m = i;
        mulmod(c, b, b);
        mulmod(t, t, c);
        mulmod(r, r, b);
    }

    if (r > modulus_middle) {
        r = modulus - r;
    }
    out = r;
    return true;
}

stark252_gmp stark252_gmp::from_string(std::string_view str) {
    std::string digits{ str };
    int base = 10;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        digits = digits.substr(2);
        base = 16;
    }

    value_type v;
    if (digits.empty() || digits[0] == '-' || v.set_str(digits, base) != 0) {
        throw vm_error(error_kind::encoding,
                       "malformed field element \"" + std::string(str) + "\"");
    }
    if (v >= modulus) {
        throw vm_error(error_kind::encoding,
                       "value " + std::string(str) + " is not below the field prime");
    }

    stark252_gmp ret;
    ret.data_ = std::move(v);
    return ret;
}

stark252_gmp stark252_gmp::from_bytes_be(std::span<const uint8_t> bytes) {
    value_type v = mpz_import_be(bytes);
    if (v >= modulus) {
        throw vm_error(error_kind::encoding, "encoding is not below the field prime");
    }

    stark252_gmp ret;
    ret.data_ = std::move(v);
    return ret;
}

typename stark252_gmp::bytes_type stark252_gmp::to_bytes_be() const {
    return mpz_export_be<num_bytes>(data_);
}

std::string stark252_gmp::to_hex() const {
    return mpz_to_hex(data_);
}


stark252_gmp operator+(const stark252_gmp& x, const stark252_gmp& y) {
    stark252_gmp z;
    stark252_gmp::addmod(z.data(), x.data(), y.data());
    return z;
}

stark252_gmp operator-(const stark252_gmp& x, const stark252_gmp& y) {
    stark252_gmp z;
    stark252_gmp::submod(z.data(), x.data(), y.data());
    return z;
}

stark252_gmp operator*(const stark252_gmp& x, const stark252_gmp& y) {
    stark252_gmp z;
    stark252_gmp::mulmod(z.data(), x.data(), y.data());
    return z;
}

stark252_gmp operator/(const stark252_gmp& x, const stark252_gmp& y) {
    stark252_gmp z;
    stark252_gmp::divmod(z.data(), x.data(), y.data());
    return z;
}

std::ostream& operator<<(std::ostream& os, const stark252_gmp& f) {
    return os << f.data();
}

}  // namespace cairo::vm::zkp
