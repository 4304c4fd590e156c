// prompt_reader.cpp - prompt detection read loop
// waiting for a "#" at the end of a line and hoping it is the prompt, only with a deadline

#include "netrun/prompt_reader.hpp"

#include <algorithm>
#include <array>

namespace netrun
{

    prompt_pattern::prompt_pattern(std::string_view const source)
        : source_{source}, regex_{source_, std::regex::ECMAScript | std::regex::optimize}
    {
    }

    auto prompt_pattern::matches_tail(std::string_view const buffer) const -> bool
    {
        return matches_line(last_line(buffer));
    }

    auto prompt_pattern::matches_line(std::string_view const line) const -> bool
    {
        if (source_.empty())
        {
            return false;
        }
        return std::regex_search(line.begin(), line.end(), regex_);
    }

    auto last_line(std::string_view buffer) noexcept -> std::string_view
    {
        // a prompt never ends with a newline, but an echo might
        while (!buffer.empty() && (buffer.back() == '\n' || buffer.back() == '\r'))
        {
            buffer.remove_suffix(1);
        }

        auto const pos = buffer.find_last_of("\r\n");
        if (pos == std::string_view::npos)
        {
            return buffer;
        }
        return buffer.substr(pos + 1);
    }

    auto read_until(chunk_source const &source, prompt_pattern const &expect, read_options const &options)
        -> result<std::string>
    {
        using clock = std::chrono::steady_clock;

        auto const deadline = clock::now() + options.timeout;
        std::string output;
        std::array<char, 4096> chunk{};

        for (;;)
        {
            if (!output.empty() && expect.matches_tail(output))
            {
                return output;
            }

            auto const now = clock::now();
            if (now >= deadline)
            {
                return std::unexpected{make_error(error_code::timeout, "no prompt matching '{}' within {} ms, last line '{}'",
                                                  expect.source(), options.timeout.count(), last_line(output))};
            }

            auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            auto const poll = std::min(remaining, options.poll_interval);

            auto nbytes = source(chunk, poll);
            if (!nbytes.has_value())
            {
                return std::unexpected{nbytes.error()};
            }

            output.append(chunk.data(), *nbytes);
            if (output.size() > options.max_bytes)
            {
                return std::unexpected{make_error(error_code::timeout, "output exceeded {} bytes without a prompt",
                                                  options.max_bytes)};
            }
        }
    }

} // namespace netrun
