#include <cstdlib>
#include <string>

#include "utils.hpp"

std::string GetEnvironmentValue(const std::string &name)
{
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
        return "";
    }

    return std::string(value);
}
