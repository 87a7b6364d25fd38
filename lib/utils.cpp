#include <iomanip>
#include <sstream>

#include "utils.hpp"

std::string HexString(const uint8_t *data, size_t size, size_t maxBytes)
{
    std::ostringstream os;
    for (size_t i = 0; i < size && i < maxBytes; ++i) {
        if (i > 0) {
            os << " ";
        }
        os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    if (size > maxBytes) {
        os << " ...";
    }

    return os.str();
}
