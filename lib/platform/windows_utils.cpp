#include "utils.hpp"
#include <windows.h>
#include <string>
#include <vector>

std::string GetEnvironmentValue(const std::string &name)
{
    DWORD size = GetEnvironmentVariableA(name.c_str(), nullptr, 0);
    if (size == 0)
    {
        return "";
    }

    std::vector<char> buffer(size);
    DWORD written = GetEnvironmentVariableA(name.c_str(), buffer.data(), size);
    if (written == 0 || written >= size)
    {
        return "";
    }

    return std::string(buffer.data(), written);
}
