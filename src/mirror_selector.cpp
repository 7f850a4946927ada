#include "mirror_selector.hpp"
#include "exception.hpp"
#include "localization.hpp"

MirrorSelector::MirrorSelector(std::vector<std::string> mirrors)
    : mirrors_(std::move(mirrors)) {
    if (mirrors_.empty()) {
        throw HpiError(get_string("error.no_mirrors"));
    }
    for (const auto& base : mirrors_) {
        if (base.empty()) {
            throw HpiError(string_format("error.invalid_mirror_url", base));
        }
    }
}

void MirrorSelector::begin_attempt() {
    attempt_start_ = index_;
}

bool MirrorSelector::advance() {
    index_ = (index_ + 1) % mirrors_.size();
    return index_ != attempt_start_;
}
