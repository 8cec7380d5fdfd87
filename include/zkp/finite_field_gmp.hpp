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

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

#include <gmp.h>
#include <gmpxx.h>

namespace cairo::vm::zkp {

/************************************************************
 * Element of the STARK prime field, P = 2^251 + 17 * 2^192 + 1.
 *
 * The value is always kept reduced in [0, P).
 ************************************************************/
struct stark252_gmp {
    using value_type = mpz_class;
    using bytes_type = std::array<uint8_t, 32>;

    constexpr static size_t num_bits          = 252;
    constexpr static size_t num_rounded_bits  = 256;
    constexpr static size_t num_bytes         = num_rounded_bits / 8;
    constexpr static size_t two_adicity       = 192;

    static value_type modulus;
    static value_type modulus_middle;   // (P - 1) / 2
    static value_type odd_factor;       // (P - 1) / 2^192
    static value_type root_of_unity;    // 3^odd_factor, a primitive 2^192-th root

    static void reduce(value_type& out, const value_type& x);
    static void negate(value_type& out, const value_type& x);
    static void invmod(value_type& out, const value_type& x);
    static void addmod(value_type& out, const value_type& a, const value_type& b);
    static void submod(value_type& out, const value_type& a, const value_type& b);
    static void mulmod(value_type& out, const value_type& a, const value_type& b);
    static void divmod(value_type& out, const value_type& a, const value_type& b);
    static void powmod(value_type& out, const value_type& x, const value_type& exp);

    /** Tonelli-Shanks. Returns false if `x` is not a quadratic residue,
     *  otherwise stores the root that is not greater than (P - 1) / 2. */
    static bool sqrt(value_type& out, const value_type& x);

    /** Parse decimal or `0x` prefixed hex, throws vm_error(encoding) on
     *  malformed input or values outside [0, P) */
    static stark252_gmp from_string(std::string_view str);

    /** Decode a big-endian encoding, throws vm_error(encoding) if >= P */
    static stark252_gmp from_bytes_be(std::span<const uint8_t> bytes);

    stark252_gmp() : data_(0) { }
    stark252_gmp(int num) : data_(num) {
        if (num < 0) {
            data_ += modulus;
        }
    }
    stark252_gmp(uint32_t num) : data_(num) { }
    stark252_gmp(uint64_t num) : data_(0) {
        mpz_import(data_.get_mpz_t(), 1, -1, sizeof(num), 0, 0, &num);
    }
    stark252_gmp(const mpz_class& num) : data_(num) {
        normalize();
    }
    template <typename... Args>
    stark252_gmp(const __gmp_expr<Args...>& expr) : data_(expr) { normalize(); }

    stark252_gmp& operator=(const mpz_class& num) {
        data_ = num;
        normalize();
        return *this;
    }

    bool operator==(const stark252_gmp& other) const {
        return data_ == other.data_;
    }

    auto& data() { return data_; }
    const auto& data() const { return data_; }

    bool is_zero() const { return data_ == 0; }

    stark252_gmp& operator+=(const stark252_gmp& other) {
        addmod(data_, data_, other.data_);
        return *this;
    }

    stark252_gmp& operator-=(const stark252_gmp& other) {
        submod(data_, data_, other.data_);
        return *this;
    }

    stark252_gmp& operator*=(const stark252_gmp& other) {
        mulmod(data_, data_, other.data_);
        return *this;
    }

    stark252_gmp operator-() const {
        stark252_gmp r{};
        negate(r.data_, data_);
        return r;
    }

    stark252_gmp& normalize() {
        reduce(data_, data_);
        return *this;
    }

    stark252_gmp inv() const {
        stark252_gmp ret;
        invmod(ret.data(), data_);
        return ret;
    }

    bytes_type  to_bytes_be() const;
    std::string to_hex() const;

protected:
    value_type data_;
};

stark252_gmp operator+(const stark252_gmp& x, const stark252_gmp& y);
stark252_gmp operator-(const stark252_gmp& x, const stark252_gmp& y);
stark252_gmp operator*(const stark252_gmp& x, const stark252_gmp& y);
stark252_gmp operator/(const stark252_gmp& x, const stark252_gmp& y);
std::ostream& operator<<(std::ostream& os, const stark252_gmp& f);

}  // namespace cairo::vm::zkp
