#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace qm::util {

std::string generateUUIDv4();

// "<label> - <uuid>". Collisions are left to the odds of a v4 uuid.
std::string uniqueName(std::string_view label);

std::vector<uint8_t> randomContent(std::size_t size);

}
