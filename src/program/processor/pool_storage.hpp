#pragma once
#include "host/host.hpp"
#include "pool/record.hpp"
#include <vector>

// Working copy of a pool's storage. Operations edit the copy and commit
// it once every external call has succeeded.
class PoolStorage {
public:
    PoolStorage(Host& host, Identity key)
        : host(host)
        , key(std::move(key))
    {
        auto s { host.storage(this->key) };
        bytes.assign(s.begin(), s.end());
    }
    pool::PoolRecord record() { return pool::PoolRecord(bytes); }
    void commit()
    {
        auto s { host.storage(key) };
        if (s.size() != bytes.size())
            throw Error(EBUG);
        std::copy(bytes.begin(), bytes.end(), s.begin());
    }

private:
    Host& host;
    Identity key;
    std::vector<uint8_t> bytes;
};
