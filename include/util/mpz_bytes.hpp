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
#include <span>
#include <string>
#include <gmpxx.h>

/// @file mpz_bytes.hpp
/// @brief Fixed-width big-endian and hex conversions for GMP integers

namespace cairo
{
/// Render a non-negative integer as `0x`-prefixed lowercase hex
///
/// No zero padding is applied, zero renders as "0x0".
///
/// @param val The GMP integer to convert, must be non-negative
/// @return The hex string
inline std::string mpz_to_hex(const mpz_class& val)
{
  return "0x" + val.get_str(16);
}

/// Export an integer as a fixed-width big-endian byte string
///
/// @param val The GMP integer to convert, must be non-negative
/// @return std::array<uint8_t, N> The big-endian encoding (lower N bytes if larger)
template <size_t N>
std::array<uint8_t, N> mpz_export_be(const mpz_class& val)
{
  std::array<uint8_t, N> out{};
  mpz_class low;
  mpz_fdiv_r_2exp(low.get_mpz_t(), val.get_mpz_t(), N * 8);
  if (low == 0) {
    return out;
  }
  size_t count = (mpz_sizeinbase(low.get_mpz_t(), 2) + 7) / 8;
  mpz_export(out.data() + (N - count), nullptr, 1, sizeof(uint8_t), 1, 0, low.get_mpz_t());
  return out;
}

/// Import a big-endian byte string of any length
///
/// @param bytes The big-endian encoding
/// @return mpz_class The decoded non-negative integer
inline mpz_class mpz_import_be(std::span<const uint8_t> bytes)
{
  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}
}
