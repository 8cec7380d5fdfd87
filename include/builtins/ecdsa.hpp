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

#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <params.hpp>
#include <types.hpp>
#include <builtins/air_private_input.hpp>
#include <builtins/allocation.hpp>
#include <builtins/builtin_runner.hpp>
#include <memory/segment.hpp>
#include <zkp/ecdsa.hpp>
#include <zkp/stark_curve.hpp>

namespace cairo::vm {

/************************************************************
 * Cells of one ECDSA instance: the public key x coordinate
 * followed by the message hash.
 ************************************************************/
struct ecdsa_instance {
    address_t x_cell;
    address_t msg_cell;

    static ecdsa_instance containing(address_t offset) {
        const address_t base = offset - offset % params::ecdsa_cells_per_instance;
        return { base, base + 1 };
    }

    address_t base()  const { return x_cell; }
    u64       index() const { return x_cell / params::ecdsa_cells_per_instance; }
};

/************************************************************
 * Signature verification builtin.
 *
 * Each instance occupies two input cells (pubkey x, message).
 * The signature itself never enters memory: a hint registers
 * (r, s) for the instance before its second cell is written,
 * and the write completing the instance triggers verification
 * against both candidate public keys (x, y) and (x, -y).
 ************************************************************/
struct ecdsa_builtin : public builtin_runner {
    using curve     = zkp::stark_curve;
    using point     = zkp::stark_point;
    using signature = zkp::ecdsa_signature;

    static constexpr auto builtin_name = params::ecdsa_builtin_name;

    explicit ecdsa_builtin(u64 ratio = params::default_ecdsa_ratio,
                           std::optional<u64> max_instances = std::nullopt,
                           std::shared_ptr<const allocation_policy> policy = default_allocation_policy())
        : ratio_(ratio),
          max_instances_(max_instances.value_or(params::max_ecdsa_instances)),
          policy_(std::move(policy))
        { }

    /**
     * Recover both y coordinates of the curve point with abscissa `x`.
     *
     * @return  (y, -y) where y is the canonical root
     * @throw   vm_error(invalid_public_key) if x is not on the curve
     */
    static std::pair<felt_type, felt_type> recover_y(const felt_type& x);

    /**
     * Register the signature of the instance starting at `base`,
     * replacing any previous one. Called by the signature hint.
     *
     * @throw vm_error(encoding) on an odd base, an instance past the
     *        bound (params::max_ecdsa_instances unless configured),
     *        or r / s outside [1, N)
     */
    void add_signature(address_t base, const felt_type& r, const felt_type& s);

    const signature* find_signature(address_t base) const noexcept;
    size_t signature_count() const noexcept { return num_signatures_; }

    std::string_view name() const override { return builtin_name; }

    check_result check_write(const memory_segment& segment,
                             address_t offset,
                             const felt_type& value) override;

    felt_type infer_value(const memory_segment& segment, address_t offset) override;

    u64 allocated_size(u64 used, u64 vm_step_count) const override;

    u64 cells_per_instance() const override { return params::ecdsa_cells_per_instance; }

    u64 ratio() const noexcept { return ratio_; }
    u64 max_instances() const noexcept { return max_instances_; }

    /** One record per registered signature, ordered by instance index */
    std::vector<air_private_ecdsa> air_private_input(const memory_segment& segment) const;

protected:
    u64 ratio_;
    u64 max_instances_;
    std::shared_ptr<const allocation_policy> policy_;

    // Indexed by instance index
    std::vector<std::optional<signature>> signatures_;
    size_t num_signatures_ = 0;
};

}  // namespace cairo::vm
