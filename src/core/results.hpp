#pragma once

#include <ctime>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace results
{
    /**
     * An append-only list of display lines, plus the subset of them that are
     * serialized card records waiting to be checked. Everything it holds is
     * dropped by `clear()` and nothing else.
     *
     * Not synchronized; callers sharing one across threads lock around it.
     */
    class ResultsCollection
    {
        std::vector<std::string> p_lines;
        std::vector<std::string> p_entries;
        std::size_t p_capacity = std::numeric_limits<std::size_t>::max();
    public:
        ResultsCollection() = default;

        /**
         * `capacity` is advisory: `append` never refuses a line, callers ask
         * `room()` before adding a batch.
         */
        explicit ResultsCollection(std::size_t capacity) : p_capacity(capacity) {}

        /**
         * Adds a display line. When `is_card_data` is set and the line looks
         * like a record (it holds a '|' and is not a "Generated" header), it is
         * also kept as a raw entry for `check_generated`.
         */
        void append(std::string text, bool is_card_data = false);

        void clear() noexcept;

        [[nodiscard]] inline const std::vector<std::string>& lines() const noexcept { return p_lines; }
        [[nodiscard]] inline const std::vector<std::string>& entries() const noexcept { return p_entries; }
        [[nodiscard]] inline bool has_entries() const noexcept { return !p_entries.empty(); }
        [[nodiscard]] inline std::size_t capacity() const noexcept { return p_capacity; }

        // Lines that still fit under the capacity, zero once it is reached.
        [[nodiscard]] inline std::size_t room() const noexcept
        {
            return p_lines.size() >= p_capacity ? 0 : p_capacity - p_lines.size();
        }

        // All lines, newline terminated.
        [[nodiscard]] std::string text() const;

        /**
         * Replaces the contents with a validation report over the current raw
         * entries.
         *
         * @return false, leaving everything untouched, when there is nothing
         *         to check
         */
        bool check_generated(std::time_t now);
        bool check_generated();
    };
}
