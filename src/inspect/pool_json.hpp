#pragma once
#include "nlohmann/json.hpp"
#include "pool/header.hpp"
#include <span>

namespace jsonmsg {
using namespace nlohmann;

json to_json(const pool::PoolHeader&);

// Decodes a raw pool storage dump. Markets and assets are only listed
// for initialized pools. Throws Error on storage that cannot hold the
// header or the tables it announces.
json pool_storage_json(std::span<uint8_t> storage);
}
