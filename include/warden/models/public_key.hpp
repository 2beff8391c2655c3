#pragma once

#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace warden::models {

class PublicKey {
public:
    /// Accepts only a valid encoded Ristretto255 point.
    static Result<PublicKey, WardenFailure> FromBytes(std::span<const uint8_t> point);

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return point_; }

    bool operator==(const PublicKey& other) const = default;

private:
    explicit PublicKey(std::vector<uint8_t> point)
        : point_(std::move(point)) {}

    std::vector<uint8_t> point_;
};

} // namespace warden::models
