//
// UTF-8 well-formedness check
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngme {

    // Returns the offset of the first byte that starts an ill-formed
    // sequence, or nullopt when the whole range is well-formed UTF-8.
    // Overlong forms, UTF-16 surrogates, code points above U+10FFFF and
    // sequences cut off by the end of the range are ill-formed.
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);

}
