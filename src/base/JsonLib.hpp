#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Title channel payloads and status dumps use `nlohmann::json`.
 */
using json = nlohmann::json;
