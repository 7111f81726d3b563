#include "gridstore_client/collection.hpp"
#include <uuid/uuid.h>

namespace gridstore_client {

std::string IdGenerator::NewId() {
    uuid_t uuid;
    uuid_generate(uuid);

    char text[37];
    uuid_unparse_lower(uuid, text);
    return std::string(text);
}

}  // namespace gridstore_client
