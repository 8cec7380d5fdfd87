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
 * Short Weierstrass curves in affine coordinates
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <utility>
#include <gmpxx.h>

namespace cairo::vm::zkp {

template <typename CurveDef>
concept WeierstrassCurveDef = requires {
    typename CurveDef::base_field_element;

    { CurveDef::coeff_a() } ->
        std::convertible_to<typename CurveDef::base_field_element>;

    { CurveDef::coeff_b() } ->
        std::convertible_to<typename CurveDef::base_field_element>;

    { CurveDef::generator_x() } ->
        std::convertible_to<typename CurveDef::base_field_element>;

    { CurveDef::generator_y() } ->
        std::convertible_to<typename CurveDef::base_field_element>;

    { CurveDef::order() } -> std::convertible_to<mpz_class>;

    { CurveDef::scalar_bits } -> std::convertible_to<size_t>;
};

template <typename Fp>
struct affine_point {
    affine_point() : x_(), y_(), infinity_(true) { }
    affine_point(Fp x, Fp y) : x_(std::move(x)), y_(std::move(y)), infinity_(false) { }

    static affine_point infinity() { return affine_point{}; }

    const Fp& x() const { return x_; }
    const Fp& y() const { return y_; }
    bool is_infinity() const { return infinity_; }

    bool operator==(const affine_point& o) const {
        if (infinity_ || o.infinity_)
            return infinity_ == o.infinity_;
        return x_ == o.x_ && y_ == o.y_;
    }

private:
    Fp x_, y_;
    bool infinity_;
};

template <WeierstrassCurveDef CurveDef>
struct weierstrass_curve {
    using base_field_element = typename CurveDef::base_field_element;
    using point              = affine_point<base_field_element>;

    static const point& generator() {
        static const point g { CurveDef::generator_x(), CurveDef::generator_y() };
        return g;
    }

    /** Right hand side of the curve equation, x^3 + a*x + b */
    static base_field_element eval_rhs(const base_field_element& x) {
        return x * x * x + CurveDef::coeff_a() * x + CurveDef::coeff_b();
    }

    static bool on_curve(const point& p) {
        if (p.is_infinity())
            return true;
        return p.y() * p.y() == eval_rhs(p.x());
    }

    static point negate(const point& p) {
        if (p.is_infinity())
            return p;
        return point{ p.x(), -p.y() };
    }

    static point point_double(const point& p) {
        if (p.is_infinity() || p.y().is_zero())
            return point::infinity();

        auto x12 = p.x() * p.x();
        auto u1 = x12 + x12 + x12;
        auto u2 = u1 + CurveDef::coeff_a();
        auto u3 = p.y() + p.y();
        auto lam = u2 / u3;
        auto lam2 = lam * lam;
        auto t1 = lam2 - p.x();
        auto x3 = t1 - p.x();
        auto t2 = p.x() - x3;
        auto t3 = lam * t2;
        auto y3 = t3 - p.y();
        return point{x3, y3};
    }

    static point point_add(const point& p1, const point& p2) {
        if (p1.is_infinity())
            return p2;
        if (p2.is_infinity())
            return p1;

        if (p1.x() == p2.x()) {
            if (p1.y() == p2.y())
                return point_double(p1);
            return point::infinity();
        }

        auto u1 = p2.y() - p1.y();
        auto u2 = p2.x() - p1.x();
        auto lam = u1 / u2;
        auto lam2 = lam * lam;
        auto t1 = lam2 - p1.x();
        auto x3 = t1 - p2.x();
        auto t2 = p1.x() - x3;
        auto t3 = lam * t2;
        auto y3 = t3 - p1.y();
        return point{x3, y3};
    }

    /** Double-and-add, the scalar is reduced modulo the group order */
    static point scalar_mul(const mpz_class& k, const point& p) {
        mpz_class e;
        mpz_fdiv_r(e.get_mpz_t(), k.get_mpz_t(), mpz_class(CurveDef::order()).get_mpz_t());

        point acc = point::infinity();
        const size_t nbits = mpz_sizeinbase(e.get_mpz_t(), 2);
        for (size_t i = nbits; i-- > 0; ) {
            acc = point_double(acc);
            if (mpz_tstbit(e.get_mpz_t(), i)) {
                acc = point_add(acc, p);
            }
        }
        return acc;
    }
};

}  // namespace cairo::vm::zkp
