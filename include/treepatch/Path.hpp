/**
 * @file Path.hpp
 * @brief Path mini-language for addressing nodes in a document
 *
 * A path is a sequence of segments, each introduced by a separator:
 * - "/" introduces a mapping key
 * - ":" introduces a sequence index
 *
 * Grammar: ( "/" key | ":" index )+
 * - key is raw text where "~0" means "~", "~1" means "/", "~2" means ":"
 * - index is one of: 0 | [1-9][0-9]* | - (last) | + (append) | * (prepend)
 * - the text must start with a separator and must not end with one
 *
 * Examples:
 * - "/users:0/name" → key "users", index 0, key "name"
 * - "/log:+"        → key "log", append to the sequence
 * - "/a~1b"         → key "a/b"
 */

#ifndef TREEPATCH_PATH_HPP
#define TREEPATCH_PATH_HPP

#include "treepatch/Result.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace treepatch {

constexpr char KEY_SEPARATOR = '/';
constexpr char INDEX_SEPARATOR = ':';

/**
 * @brief One step of a path
 */
struct Segment {
    enum class Kind { Key, Index };

    /// How an Index segment picks its position
    enum class Selector { Position, Last, Append, Prepend };

    Kind kind = Kind::Key;
    std::string raw;                        ///< segment text without separator
    Selector selector = Selector::Position;
    std::size_t position = 0;               ///< valid when selector == Position

    bool is_key() const noexcept { return kind == Kind::Key; }
    bool is_index() const noexcept { return kind == Kind::Index; }

    /// Decoded mapping key (escapes resolved when called)
    std::string key() const;
};

class Path {
public:
    Path() = default;

    /**
     * @brief Parse path text
     *
     * @param text Raw path text
     * @param out Receives the parsed path on success
     * @return 200 on success, 400 with the reason on malformed text
     */
    static Result parse(const std::string& text, Path& out);

    const std::string& text() const noexcept { return text_; }
    const std::vector<Segment>& segments() const noexcept { return segments_; }
    std::size_t size() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }

private:
    std::string text_;
    std::vector<Segment> segments_;
};

/**
 * @brief Parse path text, throwing on malformed input
 * @throws PathError if the text does not satisfy the grammar
 */
Path parse_path(const std::string& text);

/**
 * @brief Check path text against the grammar without keeping the result
 */
bool is_valid_path(const std::string& text);

/**
 * @brief Decode "~0", "~1", "~2" escapes in a key
 *
 * Escapes are decoded left to right, so "~01" becomes "~1".
 */
std::string unescape_key(const std::string& raw);

/**
 * @brief Encode "~", "/", ":" in a key so it can be used as a key segment
 */
std::string escape_key(const std::string& key);

/**
 * @brief Build the path of a child node
 *
 * @param parent Parent path text
 * @param separator KEY_SEPARATOR or INDEX_SEPARATOR
 * @param child Child key (escaped here for key children) or index text
 */
std::string join_child(const std::string& parent, char separator,
                       const std::string& child);

} // namespace treepatch

#endif // TREEPATCH_PATH_HPP
