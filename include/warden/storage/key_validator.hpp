#pragma once
#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"
#include <string_view>
namespace warden::storage {
/// Storage keys and service names: 1..255 bytes of [A-Za-z0-9._-].
class KeyValidator {
public:
    static Result<Unit, WardenFailure> ValidateKey(std::string_view key);
    static Result<Unit, WardenFailure> ValidateServiceName(std::string_view service);
    [[nodiscard]] static bool IsAllowedCharacter(char c) noexcept;
private:
    static Result<Unit, WardenFailure> ValidateIdentifier(std::string_view value, std::string_view what);
    KeyValidator() = delete;
};
}
