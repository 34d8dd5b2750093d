#include "general/errors.hpp"
#include "general/hex.hpp"
#include "pool_json.hpp"
#include "spdlog/spdlog.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace {
std::vector<uint8_t> read_file(const std::string& path, bool hex)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file \"" + path + "\"");
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (hex)
        return hex_to_vec(content);
    return { content.begin(), content.end() };
}
}

int main(int argc, char** argv)
{
    bool hex { false };
    std::string path;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--hex")
            hex = true;
        else
            path = arg;
    }
    if (path.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--hex] <pool storage file>\n";
        return 2;
    }

    try {
        auto bytes { read_file(path, hex) };
        std::cout << jsonmsg::pool_storage_json(bytes).dump(1) << std::endl;
    } catch (const Error& e) {
        std::cerr << "Cannot decode pool storage: " << e.format() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
