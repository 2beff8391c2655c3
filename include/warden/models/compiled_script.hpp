#pragma once

#include "warden/core/constants.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"

#include <cstdint>
#include "warden/core/format.hpp"
#include <span>
#include <string_view>
#include <vector>

namespace warden::models {

enum class ScriptKind : uint8_t {
    Script,
    Covenant
};

/// Opaque compiled image of a script or covenant, produced by the wallet engine.
class CompiledScript {
public:
    static Result<CompiledScript, WardenFailure> FromBytes(const ScriptKind kind, std::span<const uint8_t> image) {
        if (image.empty()) {
            return Result<CompiledScript, WardenFailure>::Err(
                WardenFailure::InvalidArgument(compat::format("{} image is empty", KindName(kind))));
        }
        if (image.size() > Constants::MAX_BLOB_SIZE) {
            return Result<CompiledScript, WardenFailure>::Err(
                WardenFailure::InvalidArgument(
                    compat::format("{} image exceeds {} bytes", KindName(kind), Constants::MAX_BLOB_SIZE)));
        }
        return Result<CompiledScript, WardenFailure>::Ok(
            CompiledScript(kind, std::vector<uint8_t>(image.begin(), image.end())));
    }

    [[nodiscard]] ScriptKind Kind() const noexcept { return kind_; }
    [[nodiscard]] std::span<const uint8_t> Image() const noexcept { return image_; }
    [[nodiscard]] size_t Size() const noexcept { return image_.size(); }

    static constexpr std::string_view KindName(const ScriptKind kind) noexcept {
        return kind == ScriptKind::Script ? "Script" : "Covenant";
    }

private:
    CompiledScript(const ScriptKind kind, std::vector<uint8_t> image)
        : kind_(kind)
        , image_(std::move(image)) {}

    ScriptKind kind_;
    std::vector<uint8_t> image_;
};

} // namespace warden::models
