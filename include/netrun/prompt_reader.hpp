#pragma once

// prompt_reader.hpp - read loop that accumulates device output until a prompt shows up
// the transport feeds it chunks, the pattern decides when the device is done talking

#include "common.hpp"

#include <chrono>
#include <functional>
#include <regex>
#include <span>
#include <string>
#include <string_view>

namespace netrun
{

    // ============================================================================
    // prompt pattern - regex evaluated against the last line of the buffer
    // ============================================================================

    class prompt_pattern
    {
    private:
        std::string source_{};
        std::regex regex_{};

    public:
        prompt_pattern() = default;

        // throws std::regex_error on a malformed pattern; driver patterns are compile-time constants
        explicit prompt_pattern(std::string_view source);

        [[nodiscard]] auto source() const noexcept -> std::string_view { return source_; }

        // true when the trailing (possibly unterminated) line of output matches
        [[nodiscard]] auto matches_tail(std::string_view buffer) const -> bool;

        // true when the given line matches
        [[nodiscard]] auto matches_line(std::string_view line) const -> bool;
    };

    // ============================================================================
    // chunk source - returns bytes read, 0 when nothing arrived within the poll window
    // ============================================================================

    using chunk_source = std::function<result<std::size_t>(std::span<char> buffer, std::chrono::milliseconds poll)>;

    struct read_options
    {
        std::chrono::milliseconds timeout{std::chrono::seconds{120}};
        std::chrono::milliseconds poll_interval{100};
        // past this the unread rest is still on the channel, reported as a timeout
        std::size_t max_bytes{16 * 1024 * 1024};
    };

    // reads until `expect` matches the tail of the accumulated output or the deadline passes
    // on timeout the error detail carries the last line seen, which is usually the stuck prompt
    [[nodiscard]] auto read_until(chunk_source const &source, prompt_pattern const &expect,
                                  read_options const &options = {}) -> result<std::string>;

    // last line of a buffer without the line terminator
    [[nodiscard]] auto last_line(std::string_view buffer) noexcept -> std::string_view;

} // namespace netrun
