#pragma once

#include <ulid/result.hpp>
#include <ulid/types.hpp>
#include <string>

namespace ulid {

// 26 Crockford symbols -> 16 bytes. The 130 bits spelled by the text lose
// their top two bits; a leading symbol above '7' is accepted and truncated.
// Fails with InvalidLength or InvalidCharacter.
Result<RawUlid> decode_base32(const std::string& text);

// xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (hex digits in either case) -> 16 bytes.
// Fails with InvalidLength, InvalidFormat or InvalidCharacter.
Result<RawUlid> decode_uuid_hex(const std::string& text);

} // namespace ulid
