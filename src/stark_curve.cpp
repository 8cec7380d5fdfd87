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

#include <zkp/stark_curve.hpp>

namespace cairo::vm::zkp {

const stark252_gmp& stark_curve_def::coeff_a() {
    static const stark252_gmp alpha{ 1 };
    return alpha;
}

const stark252_gmp& stark_curve_def::coeff_b() {
    static const stark252_gmp beta = stark252_gmp::from_string(
        "0x6f21413efbe40de150e596d72f7a8c5609ad26c15c915c1f4cdfcb99cee9e89");
    return beta;
}

const stark252_gmp& stark_curve_def::generator_x() {
    static const stark252_gmp gx = stark252_gmp::from_string(
        "0x1ef15c18599971b7beced415a40f0c7deacfd9b0d1819e03d723d8bc943cfca");
    return gx;
}

const stark252_gmp& stark_curve_def::generator_y() {
    static const stark252_gmp gy = stark252_gmp::from_string(
        "0x5668060aa49730b7be4801df46ec62de53ecd11abe43a32873000c36e8dc1f");
    return gy;
}

const mpz_class& stark_curve_def::order() {
    static const mpz_class n(
        "3618502788666131213697322783095070105526743751716087489154079457884512865583");
    return n;
}

}  // namespace cairo::vm::zkp
