#include "RandomId.hpp"

#include <mutex>
#include <random>

std::string GenerateRandomId(size_t length) {
    static const std::string letters = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static std::mt19937 generator{std::random_device{}()};
    static std::mutex generatorMutex;

    std::uniform_int_distribution<size_t> pick(0, letters.size() - 1);

    std::string id;
    id.reserve(length);

    std::lock_guard<std::mutex> lock(generatorMutex);
    for (size_t i = 0; i < length; ++i) {
        id += letters[pick(generator)];
    }
    return id;
}
