#include "utils.h"
#include "../Lib/GeneralUtils.h"
#include <fstream>
#include <iterator>
#include <stdexcept>

std::shared_ptr<std::default_random_engine> rng =
    nullptr;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

auto randomInt(uint64_t start, uint64_t end) -> uint64_t
{
    if (!rng)
    {
        rng = std::make_shared<std::default_random_engine>(std::chrono::system_clock::now().time_since_epoch().count());
    }

    std::uniform_int_distribution<uint64_t> rng_dist(start, end);
    return rng_dist(*rng);
}

auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>
{
    auto result = std::make_shared<std::vector<uint8_t>>();
    result->reserve(count);

    for (uint32_t i = 0; i < count; i++)
    {
        result->push_back(randomInt(0, std::numeric_limits<uint8_t>::max()));
    }

    return result;
}

auto writeTestFile(const std::string& directory, const std::vector<uint8_t>& data) -> std::string
{
    auto path = (std::filesystem::path(directory) / generateUUID()).string();

    std::ofstream file(path, std::ios::out | std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to create test file: " + path);
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));

    return path;
}

auto readTestFile(const std::string& path) -> std::vector<uint8_t>
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}
