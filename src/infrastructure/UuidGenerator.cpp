#include "infrastructure/UuidGenerator.hpp"
#include <uuid/uuid.h>

namespace draftlens::infrastructure {

std::string UuidGenerator::Generate() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char buffer[37];
    uuid_unparse_lower(uuid, buffer);
    return std::string(buffer);
}

} // namespace draftlens::infrastructure
