/**
 * @file signature.cpp
 * @brief Implementation of signature utilities
 *
 * @date 2025-11-02
 */

#include <strata/ecs/signature.hpp>

#include <algorithm>

namespace strata::ecs {

auto make_signature(std::span<const TypeId> ids) -> Signature {
    Signature out(ids.begin(), ids.end());
    std::ranges::sort(out);
    const auto [first, last] = std::ranges::unique(out);
    out.erase(first, last);
    return out;
}

auto signature_key(std::span<const TypeId> signature) -> std::string {
    std::string key;
    for (std::size_t i = 0; i < signature.size(); ++i) {
        if (i > 0) {
            key += ',';
        }
        key += std::to_string(signature[i]);
    }
    return key;
}

auto merge_signature(std::span<const TypeId> signature, TypeId id) -> Signature {
    Signature out(signature.begin(), signature.end());
    const auto it = std::ranges::lower_bound(out, id);
    if (it == out.end() || *it != id) {
        out.insert(it, id);
    }
    return out;
}

auto merge_signature(std::span<const TypeId> signature, std::span<const TypeId> ids) -> Signature {
    Signature out(signature.begin(), signature.end());
    for (const TypeId id : ids) {
        const auto it = std::ranges::lower_bound(out, id);
        if (it == out.end() || *it != id) {
            out.insert(it, id);
        }
    }
    return out;
}

auto subtract_signature(std::span<const TypeId> signature, TypeId id) -> Signature {
    Signature out(signature.begin(), signature.end());
    if (const auto it = std::ranges::find(out, id); it != out.end()) {
        out.erase(it);
    }
    return out;
}

auto subtract_signature(std::span<const TypeId> signature, std::span<const TypeId> ids) -> Signature {
    Signature out;
    out.reserve(signature.size());
    for (const TypeId id : signature) {
        if (std::ranges::find(ids, id) == ids.end()) {
            out.push_back(id);
        }
    }
    return out;
}

auto signature_has_all(std::span<const TypeId> have, std::span<const TypeId> need) noexcept -> bool {
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < have.size() && j < need.size()) {
        if (have[i] == need[j]) {
            ++i;
            ++j;
        } else if (have[i] < need[j]) {
            ++i;
        } else {
            return false;  // have[i] > need[j]: need[j] is missing
        }
    }
    return j == need.size();
}

auto signature_contains(std::span<const TypeId> signature, TypeId id) noexcept -> bool {
    return std::ranges::binary_search(signature, id);
}

} // namespace strata::ecs
