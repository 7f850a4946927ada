#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Ordered download endpoints and the one currently in use. The index survives
// across artifacts, so the next artifact starts on the mirror that last worked.
class MirrorSelector {
public:
    // Throws HpiError for an empty list or a blank entry.
    explicit MirrorSelector(std::vector<std::string> mirrors);

    const std::string& current_base() const { return mirrors_[index_]; }
    size_t current_index() const { return index_; }
    size_t size() const { return mirrors_.size(); }

    // Starts a new attempt sequence at the current mirror.
    void begin_attempt();

    // Moves to the next mirror. Returns false once every mirror has been
    // tried since begin_attempt(), i.e. the index wrapped back to its start.
    bool advance();

private:
    std::vector<std::string> mirrors_;
    size_t index_ = 0;
    size_t attempt_start_ = 0;
};
