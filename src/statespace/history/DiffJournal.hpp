#pragma once

#include "history/StateDiff.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>

namespace STS::History {

struct JournalEntry {
    StateDiff     diff;
    std::uint64_t timestampMs = 0;
    std::uint64_t sequence    = 0;
    std::size_t   bytes       = 0;
};

/**
 * Undo and redo stacks as one journal with a cursor. Entries before the
 * cursor can be undone, entries at or after it can be redone. Appending drops
 * the redo side. Retention trims the oldest undo entries first.
 */
class DiffJournal {
public:
    struct RetentionPolicy {
        std::size_t maxEntries = 0; // 0 == unlimited
        std::size_t maxBytes   = 0; // 0 == unlimited
    };

    struct Stats {
        std::size_t totalEntries   = 0;
        std::size_t undoCount      = 0;
        std::size_t redoCount      = 0;
        std::size_t totalBytes     = 0;
        std::size_t trimmedEntries = 0;
        std::size_t trimmedBytes   = 0;
    };

    DiffJournal();
    explicit DiffJournal(RetentionPolicy policy);

    void clear();
    void setRetentionPolicy(RetentionPolicy policy);
    [[nodiscard]] auto policy() const -> RetentionPolicy const& { return retention; }

    void append(StateDiff diff, std::uint64_t timestampMs = 0);

    [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
    [[nodiscard]] auto cursor() const -> std::size_t { return cursorIndex; }

    [[nodiscard]] auto canUndo() const -> bool;
    [[nodiscard]] auto canRedo() const -> bool;

    [[nodiscard]] auto peekUndo() const -> std::optional<std::reference_wrapper<JournalEntry const>>;
    [[nodiscard]] auto peekRedo() const -> std::optional<std::reference_wrapper<JournalEntry const>>;

    // Move the cursor and return the entry that crossed it.
    [[nodiscard]] auto undo() -> std::optional<std::reference_wrapper<JournalEntry const>>;
    [[nodiscard]] auto redo() -> std::optional<std::reference_wrapper<JournalEntry const>>;

    [[nodiscard]] auto stats() const -> Stats;

private:
    void dropRedoTail();
    void enforceRetention();

    std::deque<JournalEntry> entries;
    std::size_t              cursorIndex    = 0;
    RetentionPolicy          retention      = {};
    std::size_t              totalBytes     = 0;
    std::size_t              trimmedEntries = 0;
    std::size_t              trimmedBytes   = 0;
    std::uint64_t            nextSequence   = 1;
};

} // namespace STS::History
