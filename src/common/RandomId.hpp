#pragma once

#include <string>

inline const size_t interaction_id_size = 16;

// Alphanumeric id used for interactions and dictionary items.
std::string GenerateRandomId(size_t length = interaction_id_size);
