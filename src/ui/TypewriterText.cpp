#include "TypewriterText.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Wildspirit {

namespace {

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

size_t colorTagLength(std::string_view text, size_t pos) {
    constexpr std::string_view prefix = "<color=#";
    if (text.substr(pos, prefix.size()) != prefix) return 0;

    size_t i = pos + prefix.size();
    size_t digits = 0;
    while (i < text.size() && isHexDigit(text[i])) {
        ++i;
        ++digits;
    }
    // #rgb, #rrggbb or #rrggbbaa
    if (digits != 3 && digits != 6 && digits != 8) return 0;
    if (i >= text.size() || text[i] != '>') return 0;
    return i + 1 - pos;
}

} // namespace

TypewriterText::TypewriterText(float charsPerSecond, size_t maxCharsPerFrame)
    : charsPerSecond_(charsPerSecond)
    , maxCharsPerFrame_(std::max<size_t>(1, maxCharsPerFrame)) {
}

void TypewriterText::setText(std::string text) {
    text_ = std::move(text);
    visibleLength_ = countVisibleChars(text_);
    revealed_ = 0;
    accumulator_ = 0.0f;
}

void TypewriterText::update(float deltaTime) {
    if (isComplete() || deltaTime <= 0.0f) return;

    accumulator_ += deltaTime * charsPerSecond_;
    float whole = std::floor(accumulator_);
    if (whole < 1.0f) return;

    size_t step = static_cast<size_t>(whole);
    if (step > maxCharsPerFrame_) {
        // Drop the backlog instead of catching up over the next frames
        step = maxCharsPerFrame_;
        accumulator_ = 0.0f;
    } else {
        accumulator_ -= whole;
    }

    revealed_ = std::min(visibleLength_, revealed_ + step);
}

void TypewriterText::skip() {
    revealed_ = visibleLength_;
    accumulator_ = 0.0f;
}

size_t TypewriterText::tagLengthAt(std::string_view text, size_t pos) {
    if (pos >= text.size() || text[pos] != '<') return 0;

    static constexpr std::string_view simpleTags[] = {"<b>", "</b>", "<i>", "</i>", "</color>"};
    for (auto tag : simpleTags) {
        if (text.substr(pos, tag.size()) == tag) return tag.size();
    }
    return colorTagLength(text, pos);
}

size_t TypewriterText::countVisibleChars(std::string_view text) {
    size_t count = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t tag = tagLengthAt(text, i);
        if (tag > 0) {
            i += tag;
        } else {
            ++count;
            ++i;
        }
    }
    return count;
}

std::string TypewriterText::stripMarkup(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t tag = tagLengthAt(text, i);
        if (tag > 0) {
            i += tag;
        } else {
            result += text[i++];
        }
    }
    return result;
}

std::string TypewriterText::getVisibleMarkup() const {
    std::string_view view(text_);
    std::string result;
    size_t shown = 0;
    size_t i = 0;
    while (i < view.size()) {
        size_t tag = tagLengthAt(view, i);
        if (tag > 0) {
            // Tags are always emitted so open styles get closed
            result.append(view.substr(i, tag));
            i += tag;
            continue;
        }
        if (shown >= revealed_) {
            ++i;
            continue;
        }
        result += view[i++];
        ++shown;
    }
    return result;
}

std::string TypewriterText::getVisibleText() const {
    return stripMarkup(getVisibleMarkup());
}

} // namespace Wildspirit
