#include "util/naming.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>
#include <random>

namespace qm::util {

std::string generateUUIDv4() {
    static boost::uuids::random_generator generator;
    const boost::uuids::uuid uuid = generator();
    return boost::uuids::to_string(uuid);
}

std::string uniqueName(const std::string_view label) {
    return fmt::format("{} - {}", label, generateUUIDv4());
}

std::vector<uint8_t> randomContent(const std::size_t size) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 255);
    std::vector<uint8_t> data(size);
    for (auto& b : data) b = static_cast<uint8_t>(dist(rng));
    return data;
}

}
