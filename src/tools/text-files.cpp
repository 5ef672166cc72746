#include "text-files.h"

#include <fmt/format.h>
#include <utf8.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

using std::string;
using std::filesystem::path;

string readUtf8File(const path& filePath) {
    if (!exists(filePath)) {
        throw std::invalid_argument(fmt::format("File {} does not exist.", filePath.u8string()));
    }
    try {
        std::ifstream file;
        file.exceptions(std::ifstream::failbit | std::ifstream::badbit);
        file.open(filePath, std::ios::binary);
        string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (!utf8::is_valid(text.begin(), text.end())) {
            throw std::runtime_error("File encoding is not ASCII or UTF-8.");
        }

        // Skip byte order mark
        if (utf8::starts_with_bom(text.begin(), text.end())) {
            text.erase(0, 3);
        }

        return text;
    } catch (const std::exception&) {
        std::throw_with_nested(
            std::runtime_error(fmt::format("Error reading file {0}.", filePath.u8string()))
        );
    }
}
