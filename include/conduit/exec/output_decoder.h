#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::exec {

/**
 * Splits a byte stream into text chunks that never end inside a UTF-8 sequence.
 * An incomplete trailing sequence is carried into the next call.
 */
class Utf8ChunkDecoder {
public:
    std::string decode(std::string_view bytes) {
        std::string out = std::move(carry_);
        carry_.clear();
        out.append(bytes.data(), bytes.size());
        std::size_t keep = incompleteTail(out);
        if (keep > 0) {
            carry_ = out.substr(out.size() - keep);
            out.resize(out.size() - keep);
        }
        return out;
    }

    /// Whatever is still carried; emitted as-is at end of stream.
    std::string flush() { return std::exchange(carry_, std::string{}); }

private:
    static std::size_t incompleteTail(const std::string& s) {
        // Look back at most 3 bytes for a lead byte whose sequence runs past the end.
        const std::size_t n = s.size();
        for (std::size_t back = 1; back <= 3 && back <= n; ++back) {
            auto c = static_cast<unsigned char>(s[n - back]);
            if ((c & 0xC0) == 0x80)
                continue; // continuation byte
            std::size_t need = 0;
            if ((c & 0xE0) == 0xC0)
                need = 2;
            else if ((c & 0xF0) == 0xE0)
                need = 3;
            else if ((c & 0xF8) == 0xF0)
                need = 4;
            return need > back ? back : 0;
        }
        return 0;
    }

    std::string carry_;
};

/**
 * Accumulates bytes and hands out complete lines (without the terminator, CR stripped).
 */
class LineSplitter {
public:
    std::vector<std::string> append(std::string_view bytes) {
        buffer_.append(bytes.data(), bytes.size());
        std::vector<std::string> lines;
        std::size_t start = 0;
        for (;;) {
            auto nl = buffer_.find('\n', start);
            if (nl == std::string::npos)
                break;
            std::size_t end = nl;
            if (end > start && buffer_[end - 1] == '\r')
                --end;
            lines.emplace_back(buffer_, start, end - start);
            start = nl + 1;
        }
        buffer_.erase(0, start);
        return lines;
    }

    /// Final unterminated line, if any.
    std::string remainder() { return std::exchange(buffer_, std::string{}); }

private:
    std::string buffer_;
};

} // namespace conduit::exec
