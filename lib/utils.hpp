#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Returns an empty string when the variable is unset
std::string GetEnvironmentValue(const std::string &name);

std::string HexString(const uint8_t *data, size_t size, size_t maxBytes = 16);
