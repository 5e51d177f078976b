#include "operations/greper.hpp"

#include "operations/object_io.hpp"
#include "scanner/line_reader.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>

namespace Storify::Operations
{

using Storage::StorageErrc;
using Storage::StorageResult;

namespace
{

constexpr char32_t kReplacementChar = 0xFFFD;

bool IsAscii(std::string_view text)
{
    return std::ranges::all_of(text, [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
}

// Simple upper-to-lower case mapping for the cased scripts in the BMP. Each
// range either shifts by `delta` or, when `alternating`, pairs an upper-case
// code point at an even offset from `first` with the one after it.
struct CaseRange {
    char32_t first;
    char32_t last;
    std::int32_t delta;
    bool alternating;
};

constexpr std::array<CaseRange, 31> kCaseRanges{{
    {0x00C0, 0x00D6, 32, false},    // Latin-1
    {0x00D8, 0x00DE, 32, false},
    {0x0100, 0x012F, 1, true},      // Latin Extended-A
    {0x0130, 0x0130, -199, false},  // dotted I -> i
    {0x0132, 0x0137, 1, true},
    {0x0139, 0x0148, 1, true},
    {0x014A, 0x0177, 1, true},
    {0x0178, 0x0178, -121, false},  // Y diaeresis
    {0x0179, 0x017E, 1, true},
    {0x0386, 0x0386, 38, false},    // Greek
    {0x0388, 0x038A, 37, false},
    {0x038C, 0x038C, 64, false},
    {0x038E, 0x038F, 63, false},
    {0x0391, 0x03A1, 32, false},
    {0x03A3, 0x03AB, 32, false},
    {0x03D8, 0x03EF, 1, true},
    {0x0400, 0x040F, 80, false},    // Cyrillic
    {0x0410, 0x042F, 32, false},
    {0x0460, 0x0481, 1, true},
    {0x048A, 0x04BF, 1, true},
    {0x04C0, 0x04C0, 15, false},
    {0x04C1, 0x04CE, 1, true},
    {0x04D0, 0x052F, 1, true},
    {0x0531, 0x0556, 48, false},    // Armenian
    {0x10A0, 0x10C5, 7264, false},  // Georgian
    {0x1E00, 0x1E95, 1, true},      // Latin Extended Additional
    {0x1E9E, 0x1E9E, -7615, false}, // capital sharp s
    {0x1EA0, 0x1EFF, 1, true},
    {0x2160, 0x216F, 16, false},    // Roman numerals
    {0x24B6, 0x24CF, 26, false},    // circled letters
    {0xFF21, 0xFF3A, 32, false},    // fullwidth Latin
}};

char32_t SimpleLower(char32_t cp)
{
    for (const auto& range : kCaseRanges) {
        if (cp < range.first) {
            break;
        }
        if (cp > range.last) {
            continue;
        }
        if (range.alternating && (cp - range.first) % 2 != 0) {
            return cp;
        }
        return static_cast<char32_t>(static_cast<std::int32_t>(cp) + range.delta);
    }
    return cp;
}

char AsciiLower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

// needle is expected lower-case already.
bool AsciiContainsIgnoreCase(std::string_view haystack, std::string_view needle)
{
    if (needle.empty()) {
        return true;
    }
    if (needle.size() > haystack.size()) {
        return false;
    }
    const std::size_t last = haystack.size() - needle.size();
    for (std::size_t i = 0; i <= last; ++i) {
        std::size_t j = 0;
        while (j < needle.size() && AsciiLower(haystack[i + j]) == needle[j]) {
            ++j;
        }
        if (j == needle.size()) {
            return true;
        }
    }
    return false;
}

// Decodes one code point starting at text[pos] and advances pos.
char32_t DecodeUtf8(std::string_view text, std::size_t& pos)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length;
    char32_t cp;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp     = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp     = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp     = lead & 0x07;
    } else {
        ++pos;
        return kReplacementChar;
    }

    if (pos + length > text.size()) {
        ++pos;
        return kReplacementChar;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += length;
    return cp;
}

void EncodeUtf8(char32_t cp, std::string& out)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // namespace

std::string Utf8ToLower(std::string_view text)
{
    std::string lowered;
    lowered.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = DecodeUtf8(text, pos);
        if (cp < 0x80) {
            cp = static_cast<char32_t>(AsciiLower(static_cast<char>(cp)));
        } else {
            cp = SimpleLower(cp);
        }
        EncodeUtf8(cp, lowered);
    }
    return lowered;
}

bool LineMatches(std::string_view line, std::string_view needle, bool ignore_case)
{
    if (!ignore_case) {
        return line.find(needle) != std::string_view::npos;
    }
    if (IsAscii(line) && IsAscii(needle)) {
        return AsciiContainsIgnoreCase(line, needle);
    }
    return Utf8ToLower(line).find(needle) != std::string::npos;
}

Greper::Greper(Storage::IObjectStore& store, std::size_t chunk_size)
    : store_(store), chunk_size_(chunk_size)
{
}

StorageResult<std::uint64_t> Greper::Grep(
    const std::string& path, const std::string& pattern, const GrepOptions& options,
    std::ostream& out
)
{
    spdlog::debug(
        "Greper::Grep path={} pattern={} ignore_case={} line_number={}", path, pattern,
        options.ignore_case, options.line_number
    );

    auto meta = StatFile(store_, path);
    if (!meta) {
        return std::unexpected(meta.error());
    }

    const std::string needle = options.ignore_case ? Utf8ToLower(pattern) : pattern;
    Scanner::LineReader reader(
        Scanner::ChunkedScanner(store_, path, chunk_size_, Scanner::Direction::Forward, meta->size)
    );

    std::uint64_t matches = 0;
    std::string out_buf;
    while (true) {
        auto line = reader.NextLine();
        if (!line) {
            return std::unexpected(line.error());
        }
        if (!line->has_value()) {
            break;
        }

        const auto content = line->value().Content();
        if (!LineMatches(content, needle, options.ignore_case)) {
            continue;
        }
        ++matches;

        out_buf.clear();
        if (options.with_filename) {
            out_buf.append(path).push_back(':');
        }
        if (options.line_number) {
            out_buf.append(std::to_string(reader.LinesRead())).push_back(':');
        }
        out_buf.append(content).push_back('\n');
        if (auto res = EmitBytes(out, out_buf); !res) {
            return std::unexpected(res.error());
        }
    }
    out.flush();

    spdlog::trace("Greper::Grep '{}': {} matching lines", path, matches);
    return matches;
}

StorageResult<std::uint64_t> Greper::GrepPath(
    const std::string& path, const std::string& pattern, const GrepOptions& options,
    std::ostream& out
)
{
    auto meta = store_.Stat(path);
    if (!meta) {
        // Object stores have no real directories; a missing key may still be a prefix.
        if (options.recursive && Storage::IsErrc(meta.error(), StorageErrc::NotFound)) {
            return GrepTree(path, pattern, options, out);
        }
        return std::unexpected(meta.error());
    }

    if (!meta->is_directory) {
        return Grep(path, pattern, options, out);
    }
    if (!options.recursive) {
        spdlog::debug("Greper::GrepPath '{}' is a directory and recursion was not requested", path);
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }
    return GrepTree(path, pattern, options, out);
}

StorageResult<std::uint64_t> Greper::GrepTree(
    const std::string& path, const std::string& pattern, const GrepOptions& options,
    std::ostream& out
)
{
    auto entries = store_.List(path, true);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    GrepOptions file_options   = options;
    file_options.with_filename = true;

    std::uint64_t total = 0;
    for (const auto& entry : *entries) {
        if (entry.metadata.is_directory) {
            continue;
        }
        auto matched = Grep(entry.path, pattern, file_options, out);
        if (!matched) {
            return std::unexpected(matched.error());
        }
        total += *matched;
    }
    return total;
}

}  // namespace Storify::Operations
