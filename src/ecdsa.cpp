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

#include <algorithm>
#include <iterator>
#include <string>
#include <tuple>

#include <boost/algorithm/hex.hpp>

#include <builtins/ecdsa.hpp>
#include <util/log.hpp>
#include <util/mpz_bytes.hpp>

namespace cairo::vm {

namespace {

[[noreturn]] void fail(error_kind kind, const std::string& msg) {
    CAIRO_LOG_ERROR << "ecdsa builtin: " << msg;
    throw vm_error(kind, msg);
}

}  // namespace

std::pair<ecdsa_builtin::felt_type, ecdsa_builtin::felt_type>
ecdsa_builtin::recover_y(const felt_type& x) {
    felt_type y_sq = curve::eval_rhs(x);

    felt_type y;
    if (!felt_type::sqrt(y.data(), y_sq.data())) {
        throw vm_error(error_kind::invalid_public_key,
                       "invalid public key: " + x.to_hex() + " is not the x coordinate of a curve point");
    }
    return { y, -y };
}

void ecdsa_builtin::add_signature(address_t base, const felt_type& r, const felt_type& s) {
    if (base % params::ecdsa_cells_per_instance != 0) {
        throw vm_error(error_kind::encoding,
                       "signature offset " + std::to_string(base) + " is not an instance start");
    }

    const u64 index = base / params::ecdsa_cells_per_instance;
    if (index >= max_instances_) {
        throw vm_error(error_kind::encoding,
                       "instance " + std::to_string(index) + " exceeds the bound of "
                       + std::to_string(max_instances_) + " instances");
    }

    signature::bytes_type bytes{};
    auto rb = r.to_bytes_be();
    auto sb = s.to_bytes_be();
    std::copy(rb.begin(), rb.end(), bytes.begin());
    std::copy(sb.begin(), sb.end(), bytes.begin() + params::felt_bytes);

    signature sig = signature::from_bytes(bytes, zkp::stark_curve_def::order());

    if (index >= signatures_.size()) {
        signatures_.resize(index + 1);
    }
    if (!signatures_[index]) {
        ++num_signatures_;
    }
    signatures_[index] = std::move(sig);

    if (logging::core::get()->get_logging_enabled()) {
        std::string hex;
        boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(hex));
        CAIRO_LOG_DEBUG << "ecdsa builtin: signature for instance " << index << ": " << hex;
    }
}

const ecdsa_builtin::signature* ecdsa_builtin::find_signature(address_t base) const noexcept {
    const u64 index = base / params::ecdsa_cells_per_instance;
    if (base % params::ecdsa_cells_per_instance != 0
        || index >= signatures_.size()
        || !signatures_[index]) {
        return nullptr;
    }
    return &*signatures_[index];
}

// verify_ecdsa_signature(message_hash, public_key, sig_r, sig_s)
check_result ecdsa_builtin::check_write(const memory_segment& segment,
                                        address_t offset,
                                        const felt_type&) {
    const auto inst = ecdsa_instance::containing(offset);

    const felt_type *pub = segment.peek(inst.x_cell);
    const felt_type *msg = segment.peek(inst.msg_cell);

    // Both must be known to check the signature
    if (!pub || !msg) {
        return check_result::awaiting_operands;
    }

    felt_type pos_y, neg_y;
    try {
        std::tie(pos_y, neg_y) = recover_y(*pub);
    }
    catch (const vm_error& e) {
        CAIRO_LOG_ERROR << "ecdsa builtin: " << e.what();
        throw;
    }

    point key{ *pub, pos_y };
    if (!curve::on_curve(key)) {
        fail(error_kind::key_not_on_curve,
             "public key " + pub->to_hex() + " is not on the curve");
    }

    const signature *sig = find_signature(inst.base());
    if (!sig) {
        fail(error_kind::missing_signature,
             "signature is missing for instance " + std::to_string(inst.index()));
    }

    const auto msg_bytes = msg->to_bytes_be();
    if (zkp::ecdsa_verify<zkp::stark_curve_def>(key, msg_bytes, *sig)) {
        CAIRO_LOG_DEBUG << "ecdsa builtin: instance " << inst.index() << " verified with y";
        return check_result::verified;
    }

    // (x, -y) is on the curve whenever (x, y) is
    key = point{ *pub, neg_y };
    if (zkp::ecdsa_verify<zkp::stark_curve_def>(key, msg_bytes, *sig)) {
        CAIRO_LOG_DEBUG << "ecdsa builtin: instance " << inst.index() << " verified with -y";
        return check_result::verified;
    }

    fail(error_kind::invalid_signature,
         "signature is not valid for instance " + std::to_string(inst.index())
         + " (pubkey " + pub->to_hex() + ", msg " + msg->to_hex() + ")");
}

ecdsa_builtin::felt_type ecdsa_builtin::infer_value(const memory_segment&, address_t offset) {
    throw vm_error(error_kind::cannot_infer,
                   "can't infer value of ecdsa cell at offset " + std::to_string(offset));
}

u64 ecdsa_builtin::allocated_size(u64 used, u64 vm_step_count) const {
    return policy_->allocated_size(used, vm_step_count, allocation_params {
            ratio_,
            params::ecdsa_input_cells_per_instance,
            params::ecdsa_instances_per_component,
            params::ecdsa_cells_per_instance });
}

std::vector<air_private_ecdsa>
ecdsa_builtin::air_private_input(const memory_segment& segment) const {
    const mpz_class& n = zkp::stark_curve_def::order();

    std::vector<air_private_ecdsa> values;
    values.reserve(num_signatures_);

    for (size_t index = 0; index < signatures_.size(); index++) {
        if (!signatures_[index]) {
            continue;
        }
        const signature& sig = *signatures_[index];
        const address_t base = index * params::ecdsa_cells_per_instance;

        const felt_type& pubkey = segment.read(base);
        const felt_type& msg    = segment.read(base + 1);

        mpz_class w = zkp::scalar_invert(sig.s, n);

        values.push_back(air_private_ecdsa {
            index,
            pubkey.to_hex(),
            msg.to_hex(),
            air_private_ecdsa_signature_input { mpz_to_hex(sig.r), mpz_to_hex(w) }
        });
    }

    CAIRO_LOG_INFO << "ecdsa builtin: exported " << values.size() << " signature(s)";
    return values;
}

}  // namespace cairo::vm
