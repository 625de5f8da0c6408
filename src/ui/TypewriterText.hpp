#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace Wildspirit {

/**
 * Progressive text reveal for dialogue boxes.
 *
 * Supports a small markup subset: <b>, </b>, <i>, </i>, <color=#rrggbb> and
 * </color>. Tags never count as visible characters and are emitted whole, so
 * a partially revealed message is always well formed.
 */
class TypewriterText {
public:
    static constexpr size_t DEFAULT_MAX_CHARS_PER_FRAME = 5;

    explicit TypewriterText(float charsPerSecond = 40.0f,
                            size_t maxCharsPerFrame = DEFAULT_MAX_CHARS_PER_FRAME);

    /**
     * Start revealing a new message from the beginning.
     */
    void setText(std::string text);

    void setCharsPerSecond(float charsPerSecond) { charsPerSecond_ = charsPerSecond; }
    float getCharsPerSecond() const { return charsPerSecond_; }

    /**
     * Advance the reveal. At most maxCharsPerFrame characters appear per call,
     * so a long frame doesn't dump the whole message at once.
     */
    void update(float deltaTime);

    // Reveal everything immediately (confirm while typing)
    void skip();

    bool isComplete() const { return revealed_ >= visibleLength_; }
    bool empty() const { return visibleLength_ == 0; }

    size_t getRevealedCount() const { return revealed_; }
    size_t getVisibleLength() const { return visibleLength_; }
    const std::string& getFullText() const { return text_; }

    /**
     * Revealed portion with markup intact.
     */
    std::string getVisibleMarkup() const;

    /**
     * Revealed portion with markup removed, for surfaces that draw plain text.
     */
    std::string getVisibleText() const;

    static size_t countVisibleChars(std::string_view text);
    static std::string stripMarkup(std::string_view text);

    /**
     * Length of a recognised tag starting at text[pos], or 0 if there is none.
     */
    static size_t tagLengthAt(std::string_view text, size_t pos);

private:
    std::string text_;
    size_t visibleLength_ = 0;
    size_t revealed_ = 0;
    float accumulator_ = 0.0f;
    float charsPerSecond_;
    size_t maxCharsPerFrame_;
};

} // namespace Wildspirit
