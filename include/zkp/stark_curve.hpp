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
 * STARK curve: y^2 = x^3 + x + beta over the 252-bit STARK field
 */

#pragma once

#include <params.hpp>
#include <zkp/finite_field_gmp.hpp>
#include <zkp/weierstrass.hpp>

namespace cairo::vm::zkp {

struct stark_curve_def {
    using base_field_element = stark252_gmp;

    static constexpr size_t scalar_bits = params::scalar_bits;

    static const base_field_element& coeff_a();
    static const base_field_element& coeff_b();
    static const base_field_element& generator_x();
    static const base_field_element& generator_y();

    /** Prime order of the group generated by G */
    static const mpz_class& order();
};

using stark_curve = weierstrass_curve<stark_curve_def>;
using stark_point = stark_curve::point;

}  // namespace cairo::vm::zkp
