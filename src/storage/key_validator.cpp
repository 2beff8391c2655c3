#include "warden/storage/key_validator.hpp"
#include "warden/core/constants.hpp"

#include <algorithm>
#include "warden/core/format.hpp"

namespace warden::storage {

bool KeyValidator::IsAllowedCharacter(const char c) noexcept {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

Result<Unit, WardenFailure> KeyValidator::ValidateKey(const std::string_view key) {
    if (key.empty()) {
        return Result<Unit, WardenFailure>::Err(
            WardenFailure::InvalidArgument(std::string(ErrorMessages::KEY_EMPTY)));
    }
    if (key.size() > StorageConstants::MAX_KEY_LENGTH) {
        return Result<Unit, WardenFailure>::Err(
            WardenFailure::InvalidArgument(std::string(ErrorMessages::KEY_TOO_LONG)));
    }
    if (!std::all_of(key.begin(), key.end(), IsAllowedCharacter)) {
        return Result<Unit, WardenFailure>::Err(
            WardenFailure::InvalidArgument(std::string(ErrorMessages::KEY_INVALID_CHARACTERS)));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> KeyValidator::ValidateServiceName(const std::string_view service) {
    return ValidateIdentifier(service, "Service name");
}

Result<Unit, WardenFailure> KeyValidator::ValidateIdentifier(const std::string_view value, const std::string_view what) {
    if (value.empty() || value.size() > StorageConstants::MAX_KEY_LENGTH ||
        !std::all_of(value.begin(), value.end(), IsAllowedCharacter)) {
        return Result<Unit, WardenFailure>::Err(WardenFailure::InvalidArgument(
            compat::format("{} '{}' must be 1 to {} characters of [A-Za-z0-9._-]",
                what, value, StorageConstants::MAX_KEY_LENGTH)));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

} // namespace warden::storage
