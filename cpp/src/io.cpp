#include "transmute/io.hpp"

#include "transmute/constants.hpp"
#include "transmute/errors.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace transmute::io {

namespace {

[[noreturn]] void Fail(const std::string& detail, const std::filesystem::path& path) {
    ErrorContext ctx;
    ctx.field = path.string();
    throw IoError(detail, std::move(ctx));
}

}  // namespace

Bytes ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        Fail("failed to open file", path);
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        Fail("failed to read file size", path);
    }
    input.seekg(0, std::ios::beg);
    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            Fail("failed to read file", path);
        }
    }
    return data;
}

void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data) {
    std::filesystem::path temp = path;
    temp += std::string(constants::kTempSuffix);
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            Fail("failed to open output file", temp);
        }
        if (!data.empty()) {
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        output.flush();
        if (!output) {
            output.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            Fail("failed to write file", temp);
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        Fail("failed to move output file: " + ec.message(), path);
    }
}

}  // namespace transmute::io
