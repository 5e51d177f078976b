#ifndef STORIFY_SRC_SCANNER_LINE_READER_HPP_
#define STORIFY_SRC_SCANNER_LINE_READER_HPP_

#include "scanner/chunked_scanner.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Storify::Scanner
{

struct Line {
    std::string raw;          ///< Bytes as stored, including any "\r\n" / "\n"
    bool terminated = false;  ///< false only for a final line without '\n'

    // Line body without the trailing "\n" and one accepted "\r".
    std::string_view Content() const;
};

// Splits a forward scan into lines, carrying the unterminated tail of each
// window over into the next one. The final unterminated line is emitted
// when the scanner is exhausted.
class LineReader
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit LineReader(ChunkedScanner scanner);
    ~LineReader() = default;

    LineReader(const LineReader&)            = delete;
    LineReader& operator=(const LineReader&) = delete;
    LineReader(LineReader&&)                 = default;
    LineReader& operator=(LineReader&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    Storage::StorageResult<std::optional<Line>> NextLine();

    // Number of lines produced so far.
    std::uint64_t LinesRead() const { return lines_read_; }

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    Storage::StorageResult<bool> Refill();

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    ChunkedScanner scanner_;
    std::string leftover_;
    std::size_t consumed_     = 0;  ///< Prefix of leftover_ already emitted
    std::size_t search_from_  = 0;  ///< Offset in leftover_ known to hold no '\n' before it
    bool source_done_         = false;
    std::uint64_t lines_read_ = 0;
};

}  // namespace Storify::Scanner

#endif  // STORIFY_SRC_SCANNER_LINE_READER_HPP_
