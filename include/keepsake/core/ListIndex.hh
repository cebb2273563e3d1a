#pragma once

#include <string_view>
#include <vector>

namespace keepsake {

// The List operation answers with a quoted text blob such as
// ["DLX_template_a","DLX_template_b"]. Existence is decided by splitting the
// blob on '"' and comparing each piece to the key. This is a compatibility
// contract with deployed stores: keep the splitting behaviour exact.

/// Split `data` on every '"'. Empty pieces are kept, so N quotes always
/// produce N + 1 tokens. Tokens view into `data`.
std::vector<std::string_view> tokenizeListResponse(std::string_view data);

/// True when some token equals `key` exactly. An empty key never matches.
bool listContainsKey(std::string_view data, std::string_view key);

} // namespace keepsake
