/*
 * The core imports for revscope. Include this first so the export macro, the forward declarations and the
 * formatting support are always seen in the same order.
 */

#ifndef REVSCOPE_BASE_H
#define REVSCOPE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <revscope/revscope_export.h>
#include <revscope/revscope_forward_declarations.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace revscope {
    // Mixes a hash into a seed, used for composite keys in the subscription and object tables.
    inline void hash_combine(std::size_t &seed, std::size_t value) noexcept {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
} // namespace revscope

#endif  // REVSCOPE_BASE_H
