/**
 * @file UuidGenerator.hpp
 * @brief Random (v4) UUIDs via libuuid.
 */

#pragma once

#include <string>

namespace draftlens::infrastructure {

class UuidGenerator {
public:
    /** @brief Lower-case canonical form, e.g. "1b4e28ba-2fa1-11d2-883f-0016d3cca427". */
    static std::string Generate();
};

} // namespace draftlens::infrastructure
