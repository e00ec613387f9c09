#pragma once

#include <optional>
#include <string>
#include <string_view>

std::string Base64Encode(std::string_view data);

// std::nullopt on malformed input.
std::optional<std::string> Base64Decode(std::string_view encoded);
