#include "history/DiffJournal.hpp"

#include <cstddef>

namespace STS::History {

DiffJournal::DiffJournal()
    : DiffJournal(RetentionPolicy{}) {}

DiffJournal::DiffJournal(RetentionPolicy policy)
    : retention(policy) {}

void DiffJournal::clear() {
    entries.clear();
    cursorIndex    = 0;
    totalBytes     = 0;
    trimmedEntries = 0;
    trimmedBytes   = 0;
}

void DiffJournal::setRetentionPolicy(RetentionPolicy policy) {
    retention = policy;
    enforceRetention();
}

void DiffJournal::append(StateDiff diff, std::uint64_t timestampMs) {
    dropRedoTail();
    JournalEntry entry;
    entry.bytes       = diff.approximateBytes();
    entry.diff        = std::move(diff);
    entry.timestampMs = timestampMs;
    entry.sequence    = nextSequence++;
    totalBytes += entry.bytes;
    entries.push_back(std::move(entry));
    cursorIndex = entries.size();
    enforceRetention();
}

auto DiffJournal::canUndo() const -> bool {
    return cursorIndex > 0;
}

auto DiffJournal::canRedo() const -> bool {
    return cursorIndex < entries.size();
}

auto DiffJournal::peekUndo() const -> std::optional<std::reference_wrapper<JournalEntry const>> {
    if (!canUndo())
        return std::nullopt;
    return entries[cursorIndex - 1];
}

auto DiffJournal::peekRedo() const -> std::optional<std::reference_wrapper<JournalEntry const>> {
    if (!canRedo())
        return std::nullopt;
    return entries[cursorIndex];
}

auto DiffJournal::undo() -> std::optional<std::reference_wrapper<JournalEntry const>> {
    if (!canUndo())
        return std::nullopt;
    cursorIndex -= 1;
    return entries[cursorIndex];
}

auto DiffJournal::redo() -> std::optional<std::reference_wrapper<JournalEntry const>> {
    if (!canRedo())
        return std::nullopt;
    auto& entry = entries[cursorIndex];
    cursorIndex += 1;
    return entry;
}

auto DiffJournal::stats() const -> Stats {
    Stats s;
    s.totalEntries   = entries.size();
    s.undoCount      = cursorIndex;
    s.redoCount      = entries.size() - cursorIndex;
    s.totalBytes     = totalBytes;
    s.trimmedEntries = trimmedEntries;
    s.trimmedBytes   = trimmedBytes;
    return s;
}

void DiffJournal::dropRedoTail() {
    while (entries.size() > cursorIndex) {
        totalBytes -= entries.back().bytes;
        entries.pop_back();
    }
}

void DiffJournal::enforceRetention() {
    auto exceedsLimits = [&] {
        bool overEntries = retention.maxEntries != 0 && entries.size() > retention.maxEntries;
        bool overBytes   = retention.maxBytes != 0 && totalBytes > retention.maxBytes;
        return overEntries || overBytes;
    };

    // Only undo entries are trimmed.
    while (cursorIndex > 0 && exceedsLimits()) {
        auto bytes = entries.front().bytes;
        entries.pop_front();
        totalBytes -= bytes;
        trimmedEntries += 1;
        trimmedBytes += bytes;
        cursorIndex -= 1;
    }
}

} // namespace STS::History
