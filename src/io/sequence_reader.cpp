// =============================================================================
// nucpack - Sequence Reader Implementation
// =============================================================================

#include "nucpack/io/sequence_reader.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

#include <zlib.h>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"

namespace nucpack::io {

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

constexpr std::size_t kInflateBufferSize = 256 * 1024;

struct InflateDeleter {
    void operator()(z_stream* stream) const noexcept {
        inflateEnd(stream);
        delete stream;
    }
};

[[nodiscard]] bool isBlank(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void appendSymbols(std::string& out, std::string_view line) {
    for (char c : line) {
        if (!isBlank(c)) {
            out.push_back(c);
        }
    }
}

[[nodiscard]] std::string_view trimLine(std::string_view line) noexcept {
    while (!line.empty() && isBlank(line.back())) {
        line.remove_suffix(1);
    }
    while (!line.empty() && isBlank(line.front())) {
        line.remove_prefix(1);
    }
    return line;
}

}  // namespace

bool isGzipData(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= sizeof(kGzipMagic) &&
           std::memcmp(data.data(), kGzipMagic, sizeof(kGzipMagic)) == 0;
}

std::string gunzip(std::span<const std::uint8_t> data, std::size_t inputSlice) {
    if (inputSlice == 0 || inputSlice > kMaxInflateSlice) {
        inputSlice = kMaxInflateSlice;
    }

    std::unique_ptr<z_stream, InflateDeleter> stream(new z_stream{});

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream.get(), 16 + MAX_WBITS);
    if (ret != Z_OK) {
        throw IOError("Failed to initialize zlib: " + std::string(zError(ret)));
    }

    std::size_t fed = 0;
    auto refill = [&] {
        const std::size_t slice = std::min(inputSlice, data.size() - fed);
        stream->next_in = const_cast<Bytef*>(data.data() + fed);
        stream->avail_in = static_cast<uInt>(slice);
        fed += slice;
    };
    refill();

    std::string output;
    std::vector<char> buffer(kInflateBufferSize);
    while (true) {
        if (stream->avail_in == 0 && fed < data.size()) {
            refill();
        }

        stream->next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream->avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(stream.get(), Z_NO_FLUSH);
        output.append(buffer.data(), buffer.size() - stream->avail_out);

        if (ret == Z_STREAM_END) {
            // Concatenated members continue after the end of the first one
            if (stream->avail_in == 0 && fed == data.size()) {
                break;
            }
            ret = inflateReset(stream.get());
            if (ret != Z_OK) {
                throw IOError("Gzip decompression failed: " + std::string(zError(ret)));
            }
            continue;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw IOError("Gzip decompression failed: " + std::string(zError(ret)));
        }
        if (ret == Z_BUF_ERROR ||
            (stream->avail_in == 0 && fed == data.size() && stream->avail_out != 0)) {
            throw IOError("Gzip stream is truncated");
        }
    }

    return output;
}

ParsedSequence parseSequenceText(std::string_view text) {
    ParsedSequence parsed;

    std::size_t start = 0;
    while (start < text.size() && isBlank(text[start])) {
        ++start;
    }

    if (start >= text.size() || text[start] != '>') {
        parsed.sequence.reserve(text.size());
        appendSymbols(parsed.sequence, text);
        return parsed;
    }

    parsed.sequence.reserve(text.size());
    std::size_t pos = start;
    while (pos < text.size()) {
        std::size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;

        if (!line.empty() && line.front() == '>') {
            ++parsed.recordCount;
            if (parsed.recordCount == 1) {
                parsed.name = std::string(trimLine(line.substr(1)));
            }
            continue;
        }
        if (parsed.recordCount == 1) {
            appendSymbols(parsed.sequence, line);
        }
    }

    if (parsed.recordCount > 1) {
        NUCPACK_LOG_WARNING("Input has {} FASTA records; only '{}' is used", parsed.recordCount,
                            parsed.name);
    }
    return parsed;
}

std::vector<std::uint8_t> readAllBytes(const std::filesystem::path& path) {
    if (path == "-") {
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(std::cin)),
                                        std::istreambuf_iterator<char>());
        if (std::cin.bad()) {
            throw IOError("Failed to read from stdin");
        }
        return bytes;
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw IOError("Failed to open input file: " + path.string(), ErrorContext(path.string()));
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(stream)),
                                    std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw IOError("Failed to read input file: " + path.string(), ErrorContext(path.string()));
    }
    return bytes;
}

ParsedSequence readSequenceFile(const std::filesystem::path& path) {
    const std::vector<std::uint8_t> bytes = readAllBytes(path);

    if (isGzipData(bytes)) {
        NUCPACK_LOG_DEBUG("Input {} is gzip compressed ({} bytes)", path.string(), bytes.size());
        const std::string text = gunzip(bytes);
        return parseSequenceText(text);
    }

    return parseSequenceText(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

void writeSequenceFile(const std::filesystem::path& path, std::string_view name,
                       std::string_view sequence, std::size_t lineWidth) {
    std::ofstream file;
    std::ostream* out = &std::cout;
    if (path != "-") {
        file.open(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw IOError("Failed to create output file: " + path.string(),
                          ErrorContext(path.string()));
        }
        out = &file;
    }

    if (lineWidth == 0) {
        out->write(sequence.data(), static_cast<std::streamsize>(sequence.size()));
        *out << '\n';
    } else {
        *out << '>' << name << '\n';
        for (std::size_t i = 0; i < sequence.size(); i += lineWidth) {
            const auto line = sequence.substr(i, lineWidth);
            out->write(line.data(), static_cast<std::streamsize>(line.size()));
            *out << '\n';
        }
    }

    out->flush();
    if (!out->good()) {
        throw IOError("Failed to write output: " + path.string(), ErrorContext(path.string()));
    }
}

}  // namespace nucpack::io
