#include "parsercraft_lib/Util.hpp"
#include <cstdio>

namespace parsercraft {

std::string readFile(const std::string& path) {
    auto file = fopen(path.c_str(), "rb");
    if(!file) {
        throw std::runtime_error{ "Couldn't open " + path };
    }
    DestructorWrapper destructor{
        [&] {
            fclose(file);
        }
    };
    fseek(file, 0, SEEK_END);
    auto fileSize = ftell(file);
    if(fileSize < 0) {
        throw std::runtime_error{ "Couldn't determine the size of " + path };
    }
    fseek(file, 0, SEEK_SET);
    std::string fileContents;
    fileContents.resize(static_cast<size_t>(fileSize));
    if(fread(fileContents.data(), 1, fileContents.size(), file) != fileContents.size()) {
        throw std::runtime_error{ "Couldn't read " + path };
    }
    return fileContents;
}

}
